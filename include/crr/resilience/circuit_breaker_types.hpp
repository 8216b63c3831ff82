#pragma once

/// @file circuit_breaker_types.hpp
/// @brief Keys, configuration, metrics and results shared by the breaker components.

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "crr/foundation/rpc_result.hpp"
#include "crr/foundation/types.hpp"

namespace crr::resilience {

using foundation::ErrorCode;
using foundation::RpcError;
using foundation::RpcResult;

/// Opaque message body (JSON text on the wire).
using Payload = std::string;

// ── Enumerations ────────────────────────────────────────────────────────────

enum class CircuitBreakerState : uint8_t {
    Closed,   ///< Calls pass through; outcomes feed the rolling window.
    Open,     ///< Calls are rejected until the reset timeout elapses.
    HalfOpen  ///< One probe call decides between Closed and Open.
};

[[nodiscard]] constexpr std::string_view toString(CircuitBreakerState s) {
    switch (s) {
        case CircuitBreakerState::Closed:   return "CLOSED";
        case CircuitBreakerState::Open:     return "OPEN";
        case CircuitBreakerState::HalfOpen: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

enum class HealthStatus : uint8_t { Healthy, Degraded, Unhealthy };

[[nodiscard]] constexpr std::string_view toString(HealthStatus s) {
    switch (s) {
        case HealthStatus::Healthy:   return "healthy";
        case HealthStatus::Degraded:  return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

/// Kind of call being protected. Selects timeout and breaker overrides.
enum class OperationType : uint8_t {
    RpcCall,
    HealthCheck,
    DatabaseQuery,
    HttpRequest,
    EventPublish
};

[[nodiscard]] constexpr std::string_view toString(OperationType op) {
    switch (op) {
        case OperationType::RpcCall:       return "rpc_call";
        case OperationType::HealthCheck:   return "health_check";
        case OperationType::DatabaseQuery: return "database_query";
        case OperationType::HttpRequest:   return "http_request";
        case OperationType::EventPublish:  return "event_publish";
    }
    return "unknown";
}

[[nodiscard]] std::optional<OperationType> parseOperationType(std::string_view name);

// ── Identity ────────────────────────────────────────────────────────────────

/// Identity of one breaker. Without an operation the key covers every
/// operation of the service.
struct BreakerKey {
    std::string service;
    std::optional<OperationType> operation;

    /// "service" or "service:operation".
    [[nodiscard]] std::string toString() const;

    bool operator==(const BreakerKey&) const = default;
};

/// Canonical service name: "auth.register" and "auth" both become
/// "auth-service"; names already ending in "-service" are unchanged.
[[nodiscard]] std::string normalizeServiceName(std::string_view name);

// ── Callables ───────────────────────────────────────────────────────────────

/// The protected call. Runs on a pool thread.
using Operation = std::function<RpcResult<Payload>()>;

/// Substitute for a rejected or failed call. Returning an error means the
/// fallback itself failed; that error is what the caller sees.
using FallbackFn = std::function<RpcResult<Payload>(const RpcError& cause)>;

/// True when @p error should count against the callee.
using ErrorFilter = std::function<bool(const RpcError& error)>;

/// Counts everything except caller mistakes (validation, 400/401/403).
[[nodiscard]] bool countsAsFailure(const RpcError& error);

// ── Configuration ───────────────────────────────────────────────────────────

/// Effective configuration of one breaker.
struct CircuitBreakerConfig {
    /// Upper bound for a single call.
    std::chrono::milliseconds timeout{5000};

    /// Error rate in the rolling window at or above which the circuit opens.
    double errorThresholdPercentage = 50.0;

    /// Time spent Open before the next call is let through as a probe.
    std::chrono::milliseconds resetTimeout{60000};

    /// Minimum calls in the rolling window before the error rate is evaluated.
    uint32_t volumeThreshold = 10;

    std::chrono::milliseconds rollingCountTimeout{60000};
    uint32_t rollingCountBuckets = 10;

    bool enableMonitoring = true;

    /// A disabled breaker still bounds calls by the timeout but never opens.
    bool enabled = true;

    /// Calls of this key allowed to run at once, 0 for no cap. A call that
    /// outlives its timeout keeps its slot until the operation returns;
    /// calls beyond the cap are rejected like calls on an open circuit.
    uint32_t maxConcurrentCalls = 0;

    FallbackFn fallback;
    ErrorFilter errorFilter;
};

/// Partial configuration layered onto a CircuitBreakerConfig.
struct CircuitBreakerOverrides {
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<double> errorThresholdPercentage;
    std::optional<std::chrono::milliseconds> resetTimeout;
    std::optional<uint32_t> volumeThreshold;
    std::optional<std::chrono::milliseconds> rollingCountTimeout;
    std::optional<uint32_t> rollingCountBuckets;
    std::optional<bool> enabled;
    std::optional<uint32_t> maxConcurrentCalls;
    FallbackFn fallback;
    ErrorFilter errorFilter;

    /// Copy every set field onto @p config.
    void applyTo(CircuitBreakerConfig& config) const;

    [[nodiscard]] bool empty() const;
};

// ── Observed state ──────────────────────────────────────────────────────────

/// Failure share of completed calls in percent, 0 when nothing completed.
[[nodiscard]] constexpr double errorPercentageOf(uint64_t failures, uint64_t successes) {
    auto total = failures + successes;
    if (total == 0) {
        return 0.0;
    }
    auto pct = static_cast<double>(failures) / static_cast<double>(total) * 100.0;
    return pct > 100.0 ? 100.0 : pct;
}

/// Cumulative counters of one breaker since creation or the last reset.
struct CircuitBreakerMetrics {
    CircuitBreakerState state = CircuitBreakerState::Closed;
    uint64_t requestCount = 0;
    uint64_t successCount = 0;
    uint64_t failureCount = 0;
    uint64_t rejectionCount = 0;
    double errorPercentage = 0.0;
    /// Running mean of live call latency in milliseconds.
    double averageResponseTime = 0.0;
    foundation::WallTime lastStateChange{};
    std::optional<std::string> lastError;
    /// Remaining Open time; present only while Open.
    std::optional<std::chrono::milliseconds> timeToReset;
};

/// Derived health of one breaker. Never stored.
struct CircuitBreakerHealth {
    std::string service;
    CircuitBreakerState state = CircuitBreakerState::Closed;
    HealthStatus status = HealthStatus::Healthy;
    CircuitBreakerMetrics metrics;
    foundation::WallTime timestamp{};
};

/// Outcome of one protected call.
struct CircuitBreakerResult {
    std::optional<Payload> data;
    bool success = false;
    std::chrono::milliseconds executionTime{0};
    CircuitBreakerState circuitState = CircuitBreakerState::Closed;
    bool fromFallback = false;
    /// No live attempt was made because the circuit was open.
    bool rejected = false;
    /// The live attempt hit the timeout.
    bool timedOut = false;
    std::optional<RpcError> error;
};

/// Delivered to observers on every state transition of a breaker.
struct StateChangeEvent {
    BreakerKey key;
    CircuitBreakerState from = CircuitBreakerState::Closed;
    CircuitBreakerState to = CircuitBreakerState::Closed;
    foundation::WallTime timestamp{};
    /// Per-breaker transition counter; strictly increasing.
    uint64_t sequence = 0;
    std::string reason;
};

} // namespace crr::resilience

template <>
struct std::hash<crr::resilience::BreakerKey> {
    std::size_t operator()(const crr::resilience::BreakerKey& key) const noexcept {
        auto h = std::hash<std::string>{}(key.service);
        auto op = key.operation ? static_cast<std::size_t>(*key.operation) + 1 : 0;
        return h ^ (op + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};
