/// @file resilience_admin.cpp
/// @brief Administrative reads and resets.

#include "crr/resilience/resilience_admin.hpp"

#include "crr/foundation/resilience_logger.hpp"

namespace crr::resilience {

using foundation::LogCategory;

ResilienceAdmin::ResilienceAdmin(CircuitBreakerRegistry& registry,
                                 MetricsCollector& metrics,
                                 HealthAggregator& health,
                                 const RecoveryScheduler& recovery,
                                 const TimeoutResolver& timeouts)
    : registry_(registry),
      metrics_(metrics),
      health_(health),
      recovery_(recovery),
      timeouts_(timeouts) {}

// ── Health ──────────────────────────────────────────────────────────────────

AggregatedHealth ResilienceAdmin::health() const {
    return health_.aggregate();
}

BreakerHealthReport ResilienceAdmin::healthCheck() const {
    return health_.checkCircuitBreakers();
}

foundation::RpcResult<CircuitBreakerHealth> ResilienceAdmin::serviceHealth(
    std::string_view service, std::optional<OperationType> operation) const
{
    using Result = foundation::RpcResult<CircuitBreakerHealth>;
    auto health = health_.serviceHealth(service, operation);
    if (!health) {
        BreakerKey key{normalizeServiceName(service), operation};
        return Result::err(RpcError(ErrorCode::BreakerNotFound,
                                    "no circuit breaker for " + key.toString()));
    }
    return Result::ok(std::move(*health));
}

std::map<std::string, CircuitBreakerHealth> ResilienceAdmin::openBreakers() const {
    return health_.openBreakers();
}

std::map<std::string, CircuitBreakerHealth> ResilienceAdmin::degradedBreakers() const {
    return health_.degradedBreakers();
}

std::vector<HealthRecommendation> ResilienceAdmin::recommendations() const {
    return health_.recommendations();
}

// ── Metrics ─────────────────────────────────────────────────────────────────

MetricsSnapshot ResilienceAdmin::currentMetrics() const {
    return metrics_.currentSnapshot();
}

std::vector<MetricsSnapshot> ResilienceAdmin::metricsHistory(
    std::optional<foundation::WallTime> start, std::optional<foundation::WallTime> end) const
{
    return metrics_.history(start, end);
}

foundation::RpcResult<ResponseTimePercentiles> ResilienceAdmin::responseTimePercentiles(
    std::string_view service, std::chrono::milliseconds window) const
{
    using Result = foundation::RpcResult<ResponseTimePercentiles>;
    auto percentiles = metrics_.responseTimePercentiles(service, window);
    if (!percentiles) {
        return Result::err(RpcError(ErrorCode::NotFound,
                                    "no response time data for " + std::string(service)));
    }
    return Result::ok(*percentiles);
}

std::map<std::string, ErrorRateTrend> ResilienceAdmin::errorRateTrends(
    std::chrono::milliseconds window) const
{
    return metrics_.errorRateTrends(window);
}

foundation::RpcResult<std::vector<MetricsBucket>> ResilienceAdmin::serviceMetricsOverTime(
    std::string_view service, std::chrono::milliseconds timeWindow,
    std::chrono::milliseconds bucketSize) const
{
    return metrics_.serviceMetricsOverTime(service, timeWindow, bucketSize);
}

foundation::RpcResult<std::vector<Alert>> ResilienceAdmin::alerts(
    std::size_t limit, std::optional<std::string_view> severity,
    std::optional<std::string> service) const
{
    using Result = foundation::RpcResult<std::vector<Alert>>;
    std::optional<AlertSeverity> parsed;
    if (severity) {
        parsed = parseAlertSeverity(*severity);
        if (!parsed) {
            return Result::err(RpcError(ErrorCode::InvalidArgument,
                                        "unknown alert severity '" + std::string(*severity) + "'"));
        }
    }
    return Result::ok(metrics_.alerts(limit, parsed, std::move(service)));
}

SummaryReport ResilienceAdmin::summaryReport() const {
    return metrics_.summaryReport();
}

// ── Control ─────────────────────────────────────────────────────────────────

foundation::RpcResult<std::size_t> ResilienceAdmin::resetService(std::string_view service) {
    using Result = foundation::RpcResult<std::size_t>;
    auto count = health_.resetService(service);
    if (count == 0) {
        return Result::err(RpcError(ErrorCode::BreakerNotFound,
                                    "no circuit breakers for " + normalizeServiceName(service)));
    }
    return Result::ok(count);
}

foundation::RpcResult<void> ResilienceAdmin::resetBreaker(std::string_view service,
                                                          std::optional<OperationType> operation) {
    BreakerKey key{normalizeServiceName(service), operation};
    if (!registry_.reset(key)) {
        return foundation::RpcResult<void>::err(
            RpcError(ErrorCode::BreakerNotFound, "no circuit breaker for " + key.toString()));
    }
    return foundation::RpcResult<void>::ok();
}

ResilienceDebugInfo ResilienceAdmin::debugInfo() const {
    ResilienceDebugInfo info;
    info.enabled = registry_.configs().isEnabled();
    info.breakers = registry_.debugInfo();
    info.timeouts = timeouts_.debugInfo();
    info.monitoring = registry_.configs().monitoring();
    info.recoveryTimers = recovery_.pendingTimers();
    CRR_LOG_DEBUG(LogCategory::Core,
                  "debug dump of " + std::to_string(info.breakers.size()) + " breaker(s)");
    return info;
}

} // namespace crr::resilience
