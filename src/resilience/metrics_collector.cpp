/// @file metrics_collector.cpp
/// @brief Snapshot history, alert rules and derived analytics.

#include "crr/resilience/metrics_collector.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

#include "crr/foundation/resilience_logger.hpp"

namespace crr::resilience {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ResilienceLogger;
using foundation::WallTime;

std::optional<AlertSeverity> parseAlertSeverity(std::string_view name) {
    if (name == "info") {
        return AlertSeverity::Info;
    }
    if (name == "warning") {
        return AlertSeverity::Warning;
    }
    if (name == "error") {
        return AlertSeverity::Error;
    }
    return std::nullopt;
}

namespace {

std::string fixed1(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value;
    return oss.str();
}

std::string alertId(const std::string& service, std::string_view type, WallTime now) {
    std::string kind(type);
    std::replace(kind.begin(), kind.end(), '_', '-');
    return service + "-" + kind + "-" + std::to_string(foundation::epochMillis(now));
}

LogLevel logLevelFor(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::Error:   return LogLevel::Error;
        case AlertSeverity::Warning: return LogLevel::Warning;
        case AlertSeverity::Info:    break;
    }
    return LogLevel::Info;
}

uint64_t roundedMean(uint64_t sum, std::size_t count) {
    return static_cast<uint64_t>(std::llround(static_cast<double>(sum) / static_cast<double>(count)));
}

/// Latest state and error, mean counters, newest lastStateChange.
CircuitBreakerMetrics averageMetrics(const std::vector<CircuitBreakerMetrics>& samples) {
    auto count = samples.size();
    uint64_t requests = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
    uint64_t rejections = 0;
    double errorPct = 0.0;
    double latency = 0.0;
    WallTime lastChange{};
    for (const auto& m : samples) {
        requests += m.requestCount;
        successes += m.successCount;
        failures += m.failureCount;
        rejections += m.rejectionCount;
        errorPct += m.errorPercentage;
        latency += m.averageResponseTime;
        lastChange = std::max(lastChange, m.lastStateChange);
    }

    CircuitBreakerMetrics out;
    out.state = samples.back().state;
    out.requestCount = roundedMean(requests, count);
    out.successCount = roundedMean(successes, count);
    out.failureCount = roundedMean(failures, count);
    out.rejectionCount = roundedMean(rejections, count);
    out.errorPercentage = errorPct / static_cast<double>(count);
    out.averageResponseTime = latency / static_cast<double>(count);
    out.lastStateChange = lastChange;
    out.lastError = samples.back().lastError;
    return out;
}

} // namespace

MetricsCollector::MetricsCollector(CircuitBreakerRegistry& registry,
                                   foundation::TaskScheduler& scheduler,
                                   MonitoringConfig monitoring,
                                   foundation::WallClockFn wallClock)
    : registry_(registry),
      scheduler_(scheduler),
      monitoring_(monitoring),
      wallClock_(std::move(wallClock)),
      guard_(std::make_shared<Guard>()),
      subscription_(registry.stateChanges().scopedSubscribe(
          [this](const StateChangeEvent& event) { onStateChange(event); })) {}

MetricsCollector::~MetricsCollector() {
    subscription_.reset();
    stop();
    std::lock_guard guard(guard_->mutex);
    guard_->alive = false;
}

// ── Lifecycle ───────────────────────────────────────────────────────────────

foundation::RpcResult<void> MetricsCollector::start() {
    if (!monitoring_.enabled) {
        CRR_LOG_INFO(LogCategory::Metrics, "metrics collection disabled");
        return foundation::RpcResult<void>::ok();
    }

    std::lock_guard lock(mutex_);
    if (timer_) {
        return foundation::RpcResult<void>::ok();
    }
    auto timer = scheduler_.scheduleEvery(monitoring_.metricsInterval, [this, guard = guard_] {
        std::lock_guard alive(guard->mutex);
        if (guard->alive) {
            collect();
        }
    });
    if (!timer) {
        return foundation::RpcResult<void>::err(timer.error());
    }
    timer_ = timer.value();

    LogContext ctx;
    ctx.extra["interval_ms"] = std::to_string(monitoring_.metricsInterval.count());
    ResilienceLogger::instance().logWithContext(LogLevel::Info, LogCategory::Metrics,
                                                "metrics collection started", ctx);
    return foundation::RpcResult<void>::ok();
}

void MetricsCollector::stop() {
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
        CRR_LOG_WARN(LogCategory::Metrics, std::string(cancelled.error().message()));
    }
    CRR_LOG_INFO(LogCategory::Metrics, "metrics collection stopped");
}

bool MetricsCollector::running() const {
    std::lock_guard lock(mutex_);
    return timer_.has_value();
}

// ── Collection ──────────────────────────────────────────────────────────────

MetricsSnapshot MetricsCollector::collect() {
    return record(buildSnapshot());
}

MetricsSnapshot MetricsCollector::record(MetricsSnapshot snapshot) {
    std::vector<Alert> raised;
    {
        std::lock_guard lock(mutex_);
        if (!history_.empty() && snapshot.timestamp <= history_.back().timestamp) {
            snapshot.timestamp = history_.back().timestamp + std::chrono::milliseconds(1);
        }
        evaluateLocked(snapshot, raised);
        history_.push(snapshot);
    }
    publish(raised);
    CRR_LOG_DEBUG(LogCategory::Metrics,
                  "snapshot of " + std::to_string(snapshot.totalCircuitBreakers) + " breaker(s)");
    return snapshot;
}

MetricsSnapshot MetricsCollector::currentSnapshot() const {
    return buildSnapshot();
}

std::optional<MetricsSnapshot> MetricsCollector::latestSnapshot() const {
    std::lock_guard lock(mutex_);
    if (history_.empty()) {
        return std::nullopt;
    }
    return history_.back();
}

std::vector<MetricsSnapshot> MetricsCollector::history(std::optional<WallTime> start,
                                                       std::optional<WallTime> end) const {
    std::vector<MetricsSnapshot> out;
    std::lock_guard lock(mutex_);
    for (const auto& snapshot : history_) {
        if (start && snapshot.timestamp < *start) {
            continue;
        }
        if (end && snapshot.timestamp > *end) {
            continue;
        }
        out.push_back(snapshot);
    }
    return out;
}

std::size_t MetricsCollector::historySize() const {
    std::lock_guard lock(mutex_);
    return history_.size();
}

MetricsSnapshot MetricsCollector::buildSnapshot() const {
    MetricsSnapshot snapshot;
    snapshot.timestamp = wallClock_();

    double latencySum = 0.0;
    std::size_t withLatency = 0;
    auto& totals = snapshot.aggregated;

    for (auto& [key, health] : registry_.allHealth()) {
        switch (health.state) {
            case CircuitBreakerState::Closed:   ++snapshot.stateDistribution.closed; break;
            case CircuitBreakerState::Open:     ++snapshot.stateDistribution.open; break;
            case CircuitBreakerState::HalfOpen: ++snapshot.stateDistribution.halfOpen; break;
        }
        switch (health.status) {
            case HealthStatus::Healthy:   ++snapshot.healthDistribution.healthy; break;
            case HealthStatus::Degraded:  ++snapshot.healthDistribution.degraded; break;
            case HealthStatus::Unhealthy: ++snapshot.healthDistribution.unhealthy; break;
        }

        const auto& m = health.metrics;
        totals.totalRequests += m.requestCount;
        totals.totalSuccesses += m.successCount;
        totals.totalFailures += m.failureCount;
        totals.totalRejections += m.rejectionCount;
        if (m.averageResponseTime > 0.0) {
            latencySum += m.averageResponseTime;
            ++withLatency;
        }
        snapshot.services.emplace(key, ServiceSnapshot{m, std::move(health)});
    }

    snapshot.totalCircuitBreakers = snapshot.services.size();
    totals.overallErrorPercentage = errorPercentageOf(totals.totalFailures, totals.totalSuccesses);
    totals.averageResponseTime =
        withLatency > 0 ? latencySum / static_cast<double>(withLatency) : 0.0;
    return snapshot;
}

// ── Alerts ──────────────────────────────────────────────────────────────────

void MetricsCollector::evaluateLocked(const MetricsSnapshot& snapshot, std::vector<Alert>& raised) {
    const MetricsSnapshot* previous = history_.empty() ? nullptr : &history_.back();
    auto now = snapshot.timestamp;

    for (const auto& [name, data] : snapshot.services) {
        const auto& m = data.metrics;

        if (previous) {
            auto it = previous->services.find(name);
            if (it != previous->services.end() && it->second.health.state != data.health.state) {
                auto from = it->second.health.state;
                auto to = data.health.state;
                Alert alert;
                alert.id = alertId(name, "state-change", now);
                alert.type = AlertType::StateChange;
                alert.severity = to == CircuitBreakerState::Open       ? AlertSeverity::Error
                                 : to == CircuitBreakerState::HalfOpen ? AlertSeverity::Warning
                                                                       : AlertSeverity::Info;
                alert.service = name;
                alert.message = "Circuit breaker state changed from " + std::string(toString(from)) +
                                " to " + std::string(toString(to));
                alert.metadata["previousState"] = std::string(toString(from));
                alert.metadata["currentState"] = std::string(toString(to));
                alert.metadata["errorPercentage"] = fixed1(m.errorPercentage);
                alert.timestamp = now;
                addAlertLocked(std::move(alert), raised);
            }
        }

        if (m.errorPercentage > monitoring_.alertThreshold) {
            Alert alert;
            alert.id = alertId(name, toString(AlertType::HighErrorRate), now);
            alert.type = AlertType::HighErrorRate;
            alert.severity = m.errorPercentage > kHighErrorRateSeverity ? AlertSeverity::Error
                                                                        : AlertSeverity::Warning;
            alert.service = name;
            alert.message = "High error rate: " + fixed1(m.errorPercentage) + "%";
            alert.metadata["errorPercentage"] = fixed1(m.errorPercentage);
            alert.metadata["threshold"] = fixed1(monitoring_.alertThreshold);
            alert.metadata["requestCount"] = std::to_string(m.requestCount);
            alert.timestamp = now;
            addAlertLocked(std::move(alert), raised);
        }

        if (m.averageResponseTime > kHighResponseTimeMs) {
            auto rounded = std::to_string(std::llround(m.averageResponseTime));
            Alert alert;
            alert.id = alertId(name, toString(AlertType::HighResponseTime), now);
            alert.type = AlertType::HighResponseTime;
            alert.severity = m.averageResponseTime > kCriticalResponseTimeMs
                                 ? AlertSeverity::Error
                                 : AlertSeverity::Warning;
            alert.service = name;
            alert.message = "High response time: " + rounded + "ms";
            alert.metadata["averageResponseTime"] = rounded;
            alert.metadata["requestCount"] = std::to_string(m.requestCount);
            alert.timestamp = now;
            addAlertLocked(std::move(alert), raised);
        }
    }
}

void MetricsCollector::addAlertLocked(Alert alert, std::vector<Alert>& raised) {
    LogContext ctx;
    ctx.service = alert.service;
    ctx.extra = alert.metadata;
    ctx.extra["type"] = std::string(toString(alert.type));
    ResilienceLogger::instance().logWithContext(logLevelFor(alert.severity), LogCategory::Metrics,
                                                "circuit breaker alert: " + alert.message, ctx);
    raised.push_back(alert);
    alerts_.push(std::move(alert));
}

void MetricsCollector::publish(const std::vector<Alert>& raised) {
    for (const auto& alert : raised) {
        alertRaised_.notify(alert);
    }
}

void MetricsCollector::onStateChange(const StateChangeEvent& event) {
    if (event.to != CircuitBreakerState::Closed || event.from == CircuitBreakerState::Closed) {
        return;
    }

    auto name = event.key.toString();
    Alert alert;
    alert.id = alertId(name, toString(AlertType::Recovery), event.timestamp);
    alert.type = AlertType::Recovery;
    alert.severity = AlertSeverity::Info;
    alert.service = name;
    alert.message = "Circuit breaker recovered from " + std::string(toString(event.from));
    alert.metadata["previousState"] = std::string(toString(event.from));
    alert.metadata["reason"] = event.reason;
    alert.timestamp = event.timestamp;

    std::vector<Alert> raised;
    {
        std::lock_guard lock(mutex_);
        addAlertLocked(std::move(alert), raised);
    }
    publish(raised);
}

std::vector<Alert> MetricsCollector::alerts(std::size_t limit,
                                            std::optional<AlertSeverity> severity,
                                            std::optional<std::string> service) const {
    std::vector<Alert> out;
    std::lock_guard lock(mutex_);
    for (auto it = alerts_.rbegin(); it != alerts_.rend() && out.size() < limit; ++it) {
        if (severity && it->severity != *severity) {
            continue;
        }
        if (service && it->service != *service) {
            continue;
        }
        out.push_back(*it);
    }
    return out;
}

// ── Analytics ───────────────────────────────────────────────────────────────

std::vector<MetricsSnapshot> MetricsCollector::windowLocked(std::chrono::milliseconds window) const {
    auto start = wallClock_() - window;
    std::vector<MetricsSnapshot> out;
    for (const auto& snapshot : history_) {
        if (snapshot.timestamp >= start) {
            out.push_back(snapshot);
        }
    }
    return out;
}

std::map<std::string, ErrorRateTrend> MetricsCollector::errorRateTrends(
    std::chrono::milliseconds window) const
{
    std::vector<MetricsSnapshot> recent;
    {
        std::lock_guard lock(mutex_);
        recent = windowLocked(window);
    }

    std::map<std::string, ErrorRateTrend> trends;
    if (recent.size() < 2) {
        return trends;
    }

    std::vector<std::string> names;
    for (const auto& snapshot : recent) {
        for (const auto& [name, data] : snapshot.services) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());

    for (const auto& name : names) {
        ErrorRateTrend trend;
        for (const auto& snapshot : recent) {
            auto it = snapshot.services.find(name);
            auto rate = it != snapshot.services.end() ? it->second.metrics.errorPercentage : 0.0;
            trend.history.push_back(ErrorRatePoint{snapshot.timestamp, rate});
        }
        trend.current = trend.history.back().errorRate;
        trend.change = trend.current - trend.history[trend.history.size() - 2].errorRate;
        if (std::abs(trend.change) > kTrendThreshold) {
            trend.trend = trend.change > 0 ? Trend::Increasing : Trend::Decreasing;
        }
        trends.emplace(name, std::move(trend));
    }
    return trends;
}

std::optional<ResponseTimePercentiles> MetricsCollector::responseTimePercentiles(
    std::string_view service, std::chrono::milliseconds window) const
{
    std::vector<double> samples;
    {
        std::lock_guard lock(mutex_);
        auto start = wallClock_() - window;
        for (const auto& snapshot : history_) {
            if (snapshot.timestamp < start) {
                continue;
            }
            auto it = snapshot.services.find(std::string(service));
            if (it != snapshot.services.end() && it->second.metrics.averageResponseTime > 0.0) {
                samples.push_back(it->second.metrics.averageResponseTime);
            }
        }
    }
    if (samples.empty()) {
        return std::nullopt;
    }

    std::sort(samples.begin(), samples.end());
    auto count = samples.size();
    auto at = [&](double p) {
        auto index = static_cast<std::size_t>(std::floor(static_cast<double>(count) * p));
        return samples[std::min(index, count - 1)];
    };

    ResponseTimePercentiles out;
    out.p50 = at(0.50);
    out.p95 = at(0.95);
    out.p99 = at(0.99);
    double sum = 0.0;
    for (auto v : samples) {
        sum += v;
    }
    out.average = sum / static_cast<double>(count);
    out.count = count;
    return out;
}

foundation::RpcResult<std::vector<MetricsBucket>> MetricsCollector::serviceMetricsOverTime(
    std::string_view service, std::chrono::milliseconds timeWindow,
    std::chrono::milliseconds bucketSize) const
{
    using Result = foundation::RpcResult<std::vector<MetricsBucket>>;
    if (bucketSize.count() <= 0) {
        return Result::err(RpcError(ErrorCode::InvalidArgument, "bucket size must be positive"));
    }

    auto now = wallClock_();
    auto start = now - timeWindow;
    std::vector<MetricsBucket> buckets;

    std::lock_guard lock(mutex_);
    for (auto bucketStart = start; bucketStart < now; bucketStart += bucketSize) {
        auto bucketEnd = bucketStart + bucketSize;
        std::vector<CircuitBreakerMetrics> samples;
        for (const auto& snapshot : history_) {
            if (snapshot.timestamp < bucketStart || snapshot.timestamp >= bucketEnd) {
                continue;
            }
            auto it = snapshot.services.find(std::string(service));
            if (it != snapshot.services.end()) {
                samples.push_back(it->second.metrics);
            }
        }
        if (samples.empty()) {
            continue;
        }
        buckets.push_back(MetricsBucket{bucketStart, bucketEnd, averageMetrics(samples)});
    }
    return Result::ok(std::move(buckets));
}

SummaryReport MetricsCollector::summaryReport() const {
    auto snapshot = currentSnapshot();

    SummaryReport report;
    report.overview.totalServices = snapshot.totalCircuitBreakers;
    report.overview.healthyServices = snapshot.healthDistribution.healthy;
    report.overview.degradedServices = snapshot.healthDistribution.degraded;
    report.overview.unhealthyServices = snapshot.healthDistribution.unhealthy;
    report.overview.openCircuitBreakers = snapshot.stateDistribution.open;

    for (const auto& [name, data] : snapshot.services) {
        const auto& m = data.metrics;
        if (m.errorPercentage > 50.0) {
            report.topIssues.push_back(SummaryIssue{
                name, "High error rate: " + fixed1(m.errorPercentage) + "%", IssueSeverity::High,
                "Check service logs and dependencies. Consider circuit breaker reset if "
                "service is recovered."});
        }
        if (m.averageResponseTime > kHighResponseTimeMs) {
            report.topIssues.push_back(SummaryIssue{
                name, "High response time: " + std::to_string(std::llround(m.averageResponseTime)) + "ms",
                IssueSeverity::Medium,
                "Investigate performance issues. Consider timeout adjustments."});
        }
        if (data.health.state == CircuitBreakerState::Open) {
            report.topIssues.push_back(SummaryIssue{
                name, "Circuit breaker is OPEN", IssueSeverity::High,
                "Service is failing fast. Investigate and fix underlying issues before resetting."});
        }
    }
    std::stable_sort(report.topIssues.begin(), report.topIssues.end(),
                     [](const SummaryIssue& a, const SummaryIssue& b) {
                         return a.severity > b.severity;
                     });
    if (report.topIssues.size() > 10) {
        report.topIssues.resize(10);
    }

    report.recentAlerts = alerts(10);
    for (const auto& [name, trend] : errorRateTrends()) {
        report.trends.emplace(name, TrendSummary{trend.trend, trend.change});
    }
    return report;
}

} // namespace crr::resilience
