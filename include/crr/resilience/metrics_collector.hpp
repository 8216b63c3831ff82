#pragma once

/// @file metrics_collector.hpp
/// @brief Periodic breaker snapshots, alert evaluation and on-demand analytics.

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crr/foundation/notifier.hpp"
#include "crr/foundation/rpc_result.hpp"
#include "crr/foundation/task_scheduler.hpp"
#include "crr/foundation/types.hpp"
#include "crr/resilience/circuit_breaker_registry.hpp"
#include "crr/resilience/metrics_types.hpp"
#include "crr/resilience/resilience_settings.hpp"
#include "crr/resilience/ring_buffer.hpp"

namespace crr::resilience {

/// Snapshot history and alert log for every breaker of a registry.
///
/// Every metricsInterval the collector snapshots all breakers, compares
/// the snapshot with the previous one and raises alerts:
///
/// | Alert              | Condition                          | Severity                         |
/// |--------------------|------------------------------------|----------------------------------|
/// | state_change       | state differs from last snapshot   | error (OPEN), warning (HALF_OPEN), info |
/// | high_error_rate    | errorPercentage > alertThreshold   | error above 80 %, else warning   |
/// | high_response_time | averageResponseTime > 10000 ms     | error above 30000 ms, else warning |
/// | recovery           | breaker transitioned to CLOSED     | info                             |
///
/// History keeps the last 1000 snapshots and the alert log the last 500
/// alerts, both oldest-first. Trends, percentiles and bucketed views are
/// computed from the history on request.
///
/// Snapshots are built without holding the collector lock, so a
/// state-change notification arriving from a breaker never waits on a
/// collection pass.
class MetricsCollector {
public:
    static constexpr std::size_t kMaxHistory = 1000;
    static constexpr std::size_t kMaxAlerts = 500;
    static constexpr std::chrono::milliseconds kDefaultWindow{300000};
    static constexpr double kHighErrorRateSeverity = 80.0;
    static constexpr double kHighResponseTimeMs = 10000.0;
    static constexpr double kCriticalResponseTimeMs = 30000.0;
    static constexpr double kTrendThreshold = 5.0;

    MetricsCollector(CircuitBreakerRegistry& registry,
                     foundation::TaskScheduler& scheduler,
                     MonitoringConfig monitoring,
                     foundation::WallClockFn wallClock = foundation::systemWallClock());

    /// Stops periodic collection.
    ~MetricsCollector();

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    // ── Lifecycle ───────────────────────────────────────────────────────

    /// Begin collecting every metricsInterval. Does nothing when monitoring
    /// is disabled or collection already runs.
    foundation::RpcResult<void> start();

    void stop();

    [[nodiscard]] bool running() const;

    // ── Collection ──────────────────────────────────────────────────────

    /// Snapshot every breaker, evaluate alerts and append to history.
    /// @return The snapshot as stored.
    MetricsSnapshot collect();

    /// Evaluate alerts for @p snapshot and append it to history.
    /// A timestamp not after the newest stored one is moved 1 ms past it.
    MetricsSnapshot record(MetricsSnapshot snapshot);

    /// Fresh snapshot; history is not touched.
    [[nodiscard]] MetricsSnapshot currentSnapshot() const;

    [[nodiscard]] std::optional<MetricsSnapshot> latestSnapshot() const;

    /// Stored snapshots with timestamp in [@p start, @p end], oldest first.
    [[nodiscard]] std::vector<MetricsSnapshot> history(
        std::optional<foundation::WallTime> start = std::nullopt,
        std::optional<foundation::WallTime> end = std::nullopt) const;

    [[nodiscard]] std::size_t historySize() const;

    // ── Alerts ──────────────────────────────────────────────────────────

    /// Most recent first, optionally filtered, at most @p limit.
    [[nodiscard]] std::vector<Alert> alerts(std::size_t limit = 50,
                                            std::optional<AlertSeverity> severity = std::nullopt,
                                            std::optional<std::string> service = std::nullopt) const;

    /// Raised after an alert is stored, outside the collector lock and any
    /// breaker lock, so observers may query the registry.
    [[nodiscard]] foundation::Notifier<const Alert&>& alertRaised() noexcept { return alertRaised_; }

    /// Entry point for state-change notifications; raises recovery alerts.
    void onStateChange(const StateChangeEvent& event);

    // ── Analytics ───────────────────────────────────────────────────────

    /// Per key: latest error rate and its change against the previous
    /// snapshot inside @p window. Empty with fewer than two snapshots.
    [[nodiscard]] std::map<std::string, ErrorRateTrend> errorRateTrends(
        std::chrono::milliseconds window = kDefaultWindow) const;

    /// p50/p95/p99 of the non-zero average latencies of @p service inside
    /// @p window; nullopt when there are none.
    [[nodiscard]] std::optional<ResponseTimePercentiles> responseTimePercentiles(
        std::string_view service, std::chrono::milliseconds window = kDefaultWindow) const;

    /// Metrics of @p service averaged per bucket over the last @p timeWindow.
    /// Buckets without data are skipped.
    /// @return InvalidArgument if @p bucketSize is not positive.
    [[nodiscard]] foundation::RpcResult<std::vector<MetricsBucket>> serviceMetricsOverTime(
        std::string_view service, std::chrono::milliseconds timeWindow,
        std::chrono::milliseconds bucketSize) const;

    [[nodiscard]] SummaryReport summaryReport() const;

    [[nodiscard]] const MonitoringConfig& monitoring() const noexcept { return monitoring_; }

private:
    struct Guard {
        std::mutex mutex;
        bool alive = true;
    };

    [[nodiscard]] MetricsSnapshot buildSnapshot() const;
    void evaluateLocked(const MetricsSnapshot& snapshot, std::vector<Alert>& raised);
    void addAlertLocked(Alert alert, std::vector<Alert>& raised);
    void publish(const std::vector<Alert>& raised);
    [[nodiscard]] std::vector<MetricsSnapshot> windowLocked(std::chrono::milliseconds window) const;

    CircuitBreakerRegistry& registry_;
    foundation::TaskScheduler& scheduler_;
    MonitoringConfig monitoring_;
    foundation::WallClockFn wallClock_;
    std::shared_ptr<Guard> guard_;

    mutable std::mutex mutex_;
    RingBuffer<MetricsSnapshot> history_{kMaxHistory};
    RingBuffer<Alert> alerts_{kMaxAlerts};
    std::optional<foundation::TaskScheduler::TimerId> timer_;

    foundation::Notifier<const Alert&> alertRaised_;
    foundation::Notifier<const StateChangeEvent&>::Subscription subscription_;
};

} // namespace crr::resilience
