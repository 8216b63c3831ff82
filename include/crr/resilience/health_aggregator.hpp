#pragma once

/// @file health_aggregator.hpp
/// @brief System-wide breaker health, recommendations and periodic checks.

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crr/foundation/rpc_result.hpp"
#include "crr/foundation/task_scheduler.hpp"
#include "crr/foundation/types.hpp"
#include "crr/resilience/circuit_breaker_registry.hpp"

namespace crr::resilience {

enum class OverallStatus : uint8_t { Up, Down };

[[nodiscard]] constexpr std::string_view toString(OverallStatus s) {
    return s == OverallStatus::Up ? "up" : "down";
}

struct HealthSummary {
    std::size_t total = 0;
    std::size_t healthy = 0;
    std::size_t degraded = 0;
    std::size_t unhealthy = 0;
};

/// Count breakers per health status.
[[nodiscard]] HealthSummary summarizeHealth(const std::map<std::string, CircuitBreakerHealth>& all);

/// Health of every breaker. Down as soon as one breaker is unhealthy.
struct AggregatedHealth {
    OverallStatus status = OverallStatus::Up;
    HealthSummary summary;
    std::map<std::string, CircuitBreakerHealth> services;
    foundation::WallTime timestamp{};
};

/// Health-check style result: status, human message, per-breaker detail
/// with error rate rounded to two decimals and latency to whole ms.
struct BreakerHealthReport {
    OverallStatus status = OverallStatus::Up;
    std::string message;
    HealthSummary summary;
    std::map<std::string, CircuitBreakerHealth> breakers;
};

enum class RecommendationType : uint8_t { Info, Warning, Error };

[[nodiscard]] constexpr std::string_view toString(RecommendationType t) {
    switch (t) {
        case RecommendationType::Info:    return "info";
        case RecommendationType::Warning: return "warning";
        case RecommendationType::Error:   return "error";
    }
    return "unknown";
}

struct HealthRecommendation {
    RecommendationType type = RecommendationType::Info;
    /// Breaker key string, or "system" for cross-service findings.
    std::string service;
    std::string message;
    std::string action;
};

/// Read-mostly view of breaker health for operators.
///
/// Classification follows classifyHealth() with the configured alert
/// threshold. The periodic check runs every healthCheckInterval and only
/// logs; it never changes breaker state.
class HealthAggregator {
public:
    /// Average latency above which a healthy breaker gets a tuning hint.
    static constexpr double kSlowResponseMs = 5000.0;

    HealthAggregator(CircuitBreakerRegistry& registry,
                     foundation::TaskScheduler& scheduler,
                     foundation::WallClockFn wallClock = foundation::systemWallClock());

    ~HealthAggregator();

    HealthAggregator(const HealthAggregator&) = delete;
    HealthAggregator& operator=(const HealthAggregator&) = delete;

    [[nodiscard]] HealthStatus classify(const CircuitBreakerMetrics& metrics) const;

    [[nodiscard]] AggregatedHealth aggregate() const;

    /// Up/down verdict with summary; always up while breakers are disabled.
    [[nodiscard]] BreakerHealthReport checkCircuitBreakers() const;

    /// Health of one key. The service name is normalized.
    [[nodiscard]] std::optional<CircuitBreakerHealth> serviceHealth(
        std::string_view service, std::optional<OperationType> operation = std::nullopt) const;

    /// False for unknown keys.
    [[nodiscard]] bool isServiceHealthy(
        std::string_view service, std::optional<OperationType> operation = std::nullopt) const;

    [[nodiscard]] std::map<std::string, CircuitBreakerHealth> openBreakers() const;

    [[nodiscard]] std::map<std::string, CircuitBreakerHealth> degradedBreakers() const;

    [[nodiscard]] std::vector<HealthRecommendation> recommendations() const;

    /// Reset every breaker of @p service. @return Number reset.
    std::size_t resetService(std::string_view service);

    // ── Periodic check ──────────────────────────────────────────────────

    foundation::RpcResult<void> start();
    void stop();
    [[nodiscard]] bool running() const;

    /// One pass of the periodic check; logs unhealthy breakers.
    BreakerHealthReport runHealthCheck() const;

private:
    struct Guard {
        std::mutex mutex;
        bool alive = true;
    };

    CircuitBreakerRegistry& registry_;
    foundation::TaskScheduler& scheduler_;
    foundation::WallClockFn wallClock_;
    std::shared_ptr<Guard> guard_;

    mutable std::mutex mutex_;
    std::optional<foundation::TaskScheduler::TimerId> timer_;
};

} // namespace crr::resilience
