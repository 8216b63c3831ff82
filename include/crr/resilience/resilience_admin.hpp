#pragma once

/// @file resilience_admin.hpp
/// @brief Operator-facing reads and resets over the resilience components.

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crr/foundation/rpc_result.hpp"
#include "crr/foundation/types.hpp"
#include "crr/resilience/circuit_breaker_registry.hpp"
#include "crr/resilience/health_aggregator.hpp"
#include "crr/resilience/metrics_collector.hpp"
#include "crr/resilience/recovery_scheduler.hpp"
#include "crr/resilience/timeout_resolver.hpp"

namespace crr::resilience {

/// Everything an operator needs to see why a breaker behaves as it does.
struct ResilienceDebugInfo {
    bool enabled = true;
    std::vector<BreakerDebugInfo> breakers;
    TimeoutDebugInfo timeouts;
    MonitoringConfig monitoring;
    /// "key-attempt" for every pending recovery timer.
    std::vector<std::string> recoveryTimers;
};

/// Administrative surface, meant to sit behind a thin HTTP layer.
///
/// All calls are reads except resetService() and resetBreaker(), which
/// close breakers and clear their counters.
class ResilienceAdmin {
public:
    ResilienceAdmin(CircuitBreakerRegistry& registry,
                    MetricsCollector& metrics,
                    HealthAggregator& health,
                    const RecoveryScheduler& recovery,
                    const TimeoutResolver& timeouts);

    // ── Health ──────────────────────────────────────────────────────────

    [[nodiscard]] AggregatedHealth health() const;

    [[nodiscard]] BreakerHealthReport healthCheck() const;

    /// @return BreakerNotFound if no breaker exists for the key.
    [[nodiscard]] foundation::RpcResult<CircuitBreakerHealth> serviceHealth(
        std::string_view service, std::optional<OperationType> operation = std::nullopt) const;

    [[nodiscard]] std::map<std::string, CircuitBreakerHealth> openBreakers() const;
    [[nodiscard]] std::map<std::string, CircuitBreakerHealth> degradedBreakers() const;
    [[nodiscard]] std::vector<HealthRecommendation> recommendations() const;

    // ── Metrics ─────────────────────────────────────────────────────────

    [[nodiscard]] MetricsSnapshot currentMetrics() const;

    [[nodiscard]] std::vector<MetricsSnapshot> metricsHistory(
        std::optional<foundation::WallTime> start = std::nullopt,
        std::optional<foundation::WallTime> end = std::nullopt) const;

    /// @return NotFound when the window holds no latency samples for @p service.
    [[nodiscard]] foundation::RpcResult<ResponseTimePercentiles> responseTimePercentiles(
        std::string_view service,
        std::chrono::milliseconds window = MetricsCollector::kDefaultWindow) const;

    [[nodiscard]] std::map<std::string, ErrorRateTrend> errorRateTrends(
        std::chrono::milliseconds window = MetricsCollector::kDefaultWindow) const;

    [[nodiscard]] foundation::RpcResult<std::vector<MetricsBucket>> serviceMetricsOverTime(
        std::string_view service, std::chrono::milliseconds timeWindow,
        std::chrono::milliseconds bucketSize) const;

    /// @p severity must be "info", "warning" or "error" when given.
    /// @return InvalidArgument for any other severity.
    [[nodiscard]] foundation::RpcResult<std::vector<Alert>> alerts(
        std::size_t limit = 50,
        std::optional<std::string_view> severity = std::nullopt,
        std::optional<std::string> service = std::nullopt) const;

    [[nodiscard]] SummaryReport summaryReport() const;

    // ── Control ─────────────────────────────────────────────────────────

    /// Reset every breaker of @p service.
    /// @return Number reset; BreakerNotFound when the service has none.
    foundation::RpcResult<std::size_t> resetService(std::string_view service);

    /// @return BreakerNotFound if no breaker exists for the key.
    foundation::RpcResult<void> resetBreaker(std::string_view service,
                                             std::optional<OperationType> operation = std::nullopt);

    [[nodiscard]] ResilienceDebugInfo debugInfo() const;

private:
    CircuitBreakerRegistry& registry_;
    MetricsCollector& metrics_;
    HealthAggregator& health_;
    const RecoveryScheduler& recovery_;
    const TimeoutResolver& timeouts_;
};

} // namespace crr::resilience
