/// @file health_aggregator.cpp
/// @brief Health summaries, operator recommendations and the periodic check.

#include "crr/resilience/health_aggregator.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

#include "crr/foundation/resilience_logger.hpp"
#include "crr/resilience/health_classifier.hpp"

namespace crr::resilience {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ResilienceLogger;

HealthSummary summarizeHealth(const std::map<std::string, CircuitBreakerHealth>& all) {
    HealthSummary summary;
    for (const auto& [key, health] : all) {
        ++summary.total;
        switch (health.status) {
            case HealthStatus::Healthy:   ++summary.healthy; break;
            case HealthStatus::Degraded:  ++summary.degraded; break;
            case HealthStatus::Unhealthy: ++summary.unhealthy; break;
        }
    }
    return summary;
}

HealthAggregator::HealthAggregator(CircuitBreakerRegistry& registry,
                                   foundation::TaskScheduler& scheduler,
                                   foundation::WallClockFn wallClock)
    : registry_(registry),
      scheduler_(scheduler),
      wallClock_(std::move(wallClock)),
      guard_(std::make_shared<Guard>()) {}

HealthAggregator::~HealthAggregator() {
    stop();
    std::lock_guard guard(guard_->mutex);
    guard_->alive = false;
}

HealthStatus HealthAggregator::classify(const CircuitBreakerMetrics& metrics) const {
    return classifyHealth(metrics, registry_.configs().monitoring().alertThreshold);
}

AggregatedHealth HealthAggregator::aggregate() const {
    AggregatedHealth out;
    out.services = registry_.allHealth();
    out.summary = summarizeHealth(out.services);
    out.status = out.summary.unhealthy == 0 ? OverallStatus::Up : OverallStatus::Down;
    out.timestamp = wallClock_();
    return out;
}

BreakerHealthReport HealthAggregator::checkCircuitBreakers() const {
    BreakerHealthReport report;
    if (!registry_.configs().isEnabled()) {
        report.message = "Circuit breakers are disabled";
        return report;
    }

    report.breakers = registry_.allHealth();
    for (auto& [key, health] : report.breakers) {
        auto& m = health.metrics;
        m.errorPercentage = std::round(m.errorPercentage * 100.0) / 100.0;
        m.averageResponseTime = std::round(m.averageResponseTime);
    }
    report.summary = summarizeHealth(report.breakers);
    if (report.summary.unhealthy == 0) {
        report.status = OverallStatus::Up;
        report.message = "All circuit breakers are healthy";
    } else {
        report.status = OverallStatus::Down;
        report.message = std::to_string(report.summary.unhealthy) +
                         " circuit breaker(s) are unhealthy";
    }
    return report;
}

std::optional<CircuitBreakerHealth> HealthAggregator::serviceHealth(
    std::string_view service, std::optional<OperationType> operation) const
{
    return registry_.health(BreakerKey{normalizeServiceName(service), operation});
}

bool HealthAggregator::isServiceHealthy(std::string_view service,
                                        std::optional<OperationType> operation) const {
    auto health = serviceHealth(service, operation);
    return health && health->status == HealthStatus::Healthy;
}

std::map<std::string, CircuitBreakerHealth> HealthAggregator::openBreakers() const {
    std::map<std::string, CircuitBreakerHealth> out;
    for (auto& [key, health] : registry_.allHealth()) {
        if (health.state == CircuitBreakerState::Open) {
            out.emplace(key, std::move(health));
        }
    }
    return out;
}

std::map<std::string, CircuitBreakerHealth> HealthAggregator::degradedBreakers() const {
    std::map<std::string, CircuitBreakerHealth> out;
    for (auto& [key, health] : registry_.allHealth()) {
        if (health.status == HealthStatus::Degraded) {
            out.emplace(key, std::move(health));
        }
    }
    return out;
}

std::vector<HealthRecommendation> HealthAggregator::recommendations() const {
    std::vector<HealthRecommendation> out;
    std::size_t openCount = 0;

    for (const auto& [key, health] : registry_.allHealth()) {
        switch (health.state) {
            case CircuitBreakerState::Open:
                ++openCount;
                out.push_back({RecommendationType::Error, health.service,
                               "Circuit breaker is OPEN - service is failing fast",
                               "Check service logs and health. Consider manual reset if "
                               "service is recovered."});
                break;

            case CircuitBreakerState::HalfOpen:
                out.push_back({RecommendationType::Warning, health.service,
                               "Circuit breaker is HALF_OPEN - service is being tested for recovery",
                               "Monitor closely. Service is attempting recovery."});
                break;

            case CircuitBreakerState::Closed:
                if (health.status == HealthStatus::Degraded) {
                    std::ostringstream msg;
                    msg << "Circuit breaker is CLOSED but service is degraded ("
                        << std::fixed << std::setprecision(1) << health.metrics.errorPercentage
                        << "% error rate)";
                    out.push_back({RecommendationType::Warning, health.service, msg.str(),
                                   "Monitor error rates. Service may trip to OPEN soon."});
                } else if (health.metrics.averageResponseTime > kSlowResponseMs) {
                    out.push_back({RecommendationType::Info, health.service,
                                   "Service has high response times (" +
                                       std::to_string(std::llround(health.metrics.averageResponseTime)) +
                                       "ms average)",
                                   "Consider performance optimization or timeout adjustments."});
                }
                break;
        }
    }

    if (openCount > 1) {
        out.push_back({RecommendationType::Error, "system",
                       "Multiple services (" + std::to_string(openCount) +
                           ") have circuit breakers in OPEN state",
                       "This may indicate a systemic issue. Check infrastructure, network, "
                       "and dependencies."});
    }
    return out;
}

std::size_t HealthAggregator::resetService(std::string_view service) {
    return registry_.resetService(service);
}

// ── Periodic check ──────────────────────────────────────────────────────────

foundation::RpcResult<void> HealthAggregator::start() {
    const auto& monitoring = registry_.configs().monitoring();
    if (!monitoring.enabled) {
        return foundation::RpcResult<void>::ok();
    }

    std::lock_guard lock(mutex_);
    if (timer_) {
        return foundation::RpcResult<void>::ok();
    }
    auto timer = scheduler_.scheduleEvery(monitoring.healthCheckInterval, [this, guard = guard_] {
        std::lock_guard alive(guard->mutex);
        if (guard->alive) {
            runHealthCheck();
        }
    });
    if (!timer) {
        return foundation::RpcResult<void>::err(timer.error());
    }
    timer_ = timer.value();
    CRR_LOG_INFO(LogCategory::Health,
                 "periodic health check every " +
                     std::to_string(monitoring.healthCheckInterval.count()) + "ms");
    return foundation::RpcResult<void>::ok();
}

void HealthAggregator::stop() {
    std::optional<foundation::TaskScheduler::TimerId> timer;
    {
        std::lock_guard lock(mutex_);
        timer = std::exchange(timer_, std::nullopt);
    }
    if (!timer) {
        return;
    }
    auto cancelled = scheduler_.cancel(*timer);
    if (!cancelled && cancelled.error().code() != ErrorCode::TimerNotFound) {
        CRR_LOG_WARN(LogCategory::Health, std::string(cancelled.error().message()));
    }
}

bool HealthAggregator::running() const {
    std::lock_guard lock(mutex_);
    return timer_.has_value();
}

BreakerHealthReport HealthAggregator::runHealthCheck() const {
    auto report = checkCircuitBreakers();
    if (report.status == OverallStatus::Up) {
        CRR_LOG_DEBUG(LogCategory::Health, report.message);
        return report;
    }

    for (const auto& [key, health] : report.breakers) {
        if (health.status != HealthStatus::Unhealthy) {
            continue;
        }
        LogContext ctx;
        ctx.breakerKey = key;
        ctx.extra["state"] = std::string(toString(health.state));
        ctx.extra["error_pct"] = std::to_string(health.metrics.errorPercentage);
        if (health.metrics.timeToReset) {
            ctx.extra["time_to_reset_ms"] = std::to_string(health.metrics.timeToReset->count());
        }
        ResilienceLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Health,
                                                    "unhealthy circuit breaker", ctx);
    }
    CRR_LOG_WARN(LogCategory::Health, report.message);
    return report;
}

} // namespace crr::resilience
