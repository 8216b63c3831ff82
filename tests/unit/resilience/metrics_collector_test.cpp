#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "crr/foundation/task_scheduler.hpp"
#include "crr/resilience/metrics_collector.hpp"

using namespace crr::resilience;
using namespace std::chrono_literals;
using crr::foundation::epochMillis;
using crr::foundation::TaskScheduler;
using crr::foundation::WallClockFn;
using crr::foundation::WallTime;

namespace {

/// Wall clock pinned to a fixed instant until advanced.
class ManualWallClock {
public:
    WallClockFn fn() const {
        return [now = now_] { return WallTime{} + std::chrono::milliseconds(now->load()); };
    }
    [[nodiscard]] WallTime now() const { return WallTime{} + std::chrono::milliseconds(now_->load()); }
    void advance(std::chrono::milliseconds d) { now_->fetch_add(d.count()); }

private:
    std::shared_ptr<std::atomic<int64_t>> now_ =
        std::make_shared<std::atomic<int64_t>>(1700000000000);
};

ServiceSnapshot serviceWith(CircuitBreakerState state, double errorPct, double latencyMs = 0.0,
                            uint64_t requests = 0) {
    ServiceSnapshot s;
    s.metrics.state = state;
    s.metrics.errorPercentage = errorPct;
    s.metrics.averageResponseTime = latencyMs;
    s.metrics.requestCount = requests;
    s.health.state = state;
    return s;
}

MetricsSnapshot snapshotAt(WallTime at, std::string name, ServiceSnapshot service) {
    MetricsSnapshot snapshot;
    snapshot.timestamp = at;
    snapshot.services.emplace(std::move(name), std::move(service));
    snapshot.totalCircuitBreakers = snapshot.services.size();
    return snapshot;
}

const BreakerKey kAuth{"auth-service", OperationType::RpcCall};
const BreakerKey kBilling{"billing-service", std::nullopt};

} // namespace

class MetricsCollectorTest : public ::testing::Test {
protected:
    MetricsCollector& collector(MonitoringConfig monitoring = {}) {
        collector_ = std::make_unique<MetricsCollector>(registry_, scheduler_, monitoring,
                                                        wall_.fn());
        return *collector_;
    }

    void TearDown() override { collector_.reset(); }

    TaskScheduler scheduler_{2};
    ManualWallClock wall_;
    BreakerConfigProvider configs_;
    CircuitBreakerRegistry registry_{configs_, scheduler_,
                                     crr::foundation::systemSteadyClock(), wall_.fn()};
    std::unique_ptr<MetricsCollector> collector_;
};

// ---------------------------------------------------------------------------
// History
// ---------------------------------------------------------------------------

TEST_F(MetricsCollectorTest, HistoryKeepsLastThousandSnapshots) {
    auto& c = collector();
    auto t0 = wall_.now();
    for (int i = 0; i < 1005; ++i) {
        c.record(snapshotAt(t0 + std::chrono::milliseconds(i), "auth-service",
                            serviceWith(CircuitBreakerState::Closed, 0.0)));
    }

    EXPECT_EQ(c.historySize(), MetricsCollector::kMaxHistory);
    auto history = c.history();
    ASSERT_EQ(history.size(), 1000u);
    EXPECT_EQ(epochMillis(history.front().timestamp), epochMillis(t0) + 5);
    EXPECT_EQ(epochMillis(history.back().timestamp), epochMillis(t0) + 1004);
}

TEST_F(MetricsCollectorTest, TimestampsStrictlyIncrease) {
    auto& c = collector();
    auto t0 = wall_.now();

    auto first = c.record(snapshotAt(t0, "auth-service", serviceWith(CircuitBreakerState::Closed, 0)));
    auto second = c.record(snapshotAt(t0, "auth-service", serviceWith(CircuitBreakerState::Closed, 0)));
    auto third = c.record(snapshotAt(t0 - 5s, "auth-service", serviceWith(CircuitBreakerState::Closed, 0)));

    EXPECT_EQ(epochMillis(second.timestamp), epochMillis(first.timestamp) + 1);
    EXPECT_EQ(epochMillis(third.timestamp), epochMillis(first.timestamp) + 2);
    ASSERT_TRUE(c.latestSnapshot().has_value());
    EXPECT_EQ(epochMillis(c.latestSnapshot()->timestamp), epochMillis(third.timestamp));
}

TEST_F(MetricsCollectorTest, HistoryFiltersByRange) {
    auto& c = collector();
    auto t0 = wall_.now();
    for (int i = 0; i < 5; ++i) {
        c.record(snapshotAt(t0 + std::chrono::seconds(i), "auth-service",
                            serviceWith(CircuitBreakerState::Closed, 0)));
    }

    EXPECT_EQ(c.history(t0 + 1s, t0 + 3s).size(), 3u);
    EXPECT_EQ(c.history(t0 + 4s).size(), 1u);
    EXPECT_EQ(c.history(std::nullopt, t0).size(), 1u);
}

TEST_F(MetricsCollectorTest, CollectSummarizesRegistry) {
    auto& c = collector();
    auto ok = [] { return RpcResult<Payload>::ok("{}"); };
    auto bad = [] { return RpcResult<Payload>::err(RpcError(ErrorCode::RemoteError, "boom")); };
    registry_.execute(kBilling, ok);
    registry_.execute(kBilling, ok);
    registry_.execute(kBilling, bad);
    registry_.getOrCreate(kAuth)->forceState(CircuitBreakerState::Open);

    auto snapshot = c.collect();

    EXPECT_EQ(snapshot.totalCircuitBreakers, 2u);
    EXPECT_EQ(snapshot.stateDistribution.closed, 1u);
    EXPECT_EQ(snapshot.stateDistribution.open, 1u);
    EXPECT_EQ(snapshot.healthDistribution.unhealthy, 1u);
    EXPECT_EQ(snapshot.aggregated.totalRequests, 3u);
    EXPECT_EQ(snapshot.aggregated.totalSuccesses, 2u);
    EXPECT_EQ(snapshot.aggregated.totalFailures, 1u);
    EXPECT_NEAR(snapshot.aggregated.overallErrorPercentage, 33.33, 0.01);
    EXPECT_EQ(c.historySize(), 1u);
}

TEST_F(MetricsCollectorTest, EmptyRegistryHasZeroErrorRate) {
    auto snapshot = collector().collect();
    EXPECT_EQ(snapshot.totalCircuitBreakers, 0u);
    EXPECT_DOUBLE_EQ(snapshot.aggregated.overallErrorPercentage, 0.0);
    EXPECT_DOUBLE_EQ(snapshot.aggregated.averageResponseTime, 0.0);
}

// ---------------------------------------------------------------------------
// Alerts
// ---------------------------------------------------------------------------

TEST_F(MetricsCollectorTest, StateChangeAlertSeverityFollowsNewState) {
    auto& c = collector();
    auto t0 = wall_.now();

    c.record(snapshotAt(t0, "auth-service", serviceWith(CircuitBreakerState::Closed, 0)));
    c.record(snapshotAt(t0 + 1s, "auth-service", serviceWith(CircuitBreakerState::Open, 0)));
    c.record(snapshotAt(t0 + 2s, "auth-service", serviceWith(CircuitBreakerState::HalfOpen, 0)));
    c.record(snapshotAt(t0 + 3s, "auth-service", serviceWith(CircuitBreakerState::Closed, 0)));

    auto alerts = c.alerts();
    ASSERT_EQ(alerts.size(), 3u);
    EXPECT_EQ(alerts[0].severity, AlertSeverity::Info);
    EXPECT_EQ(alerts[1].severity, AlertSeverity::Warning);
    EXPECT_EQ(alerts[2].severity, AlertSeverity::Error);
    EXPECT_EQ(alerts[2].type, AlertType::StateChange);
    EXPECT_EQ(alerts[2].message, "Circuit breaker state changed from CLOSED to OPEN");
    EXPECT_EQ(alerts[2].metadata.at("previousState"), "CLOSED");
    EXPECT_EQ(alerts[2].metadata.at("currentState"), "OPEN");
}

TEST_F(MetricsCollectorTest, FirstSnapshotRaisesNoStateChange) {
    auto& c = collector();
    c.record(snapshotAt(wall_.now(), "auth-service", serviceWith(CircuitBreakerState::Open, 0)));
    EXPECT_TRUE(c.alerts().empty());
}

TEST_F(MetricsCollectorTest, HighErrorRateAlert) {
    MonitoringConfig monitoring;
    monitoring.alertThreshold = 50.0;
    auto& c = collector(monitoring);
    auto t0 = wall_.now();

    c.record(snapshotAt(t0, "auth-service", serviceWith(CircuitBreakerState::Closed, 60.0, 0, 10)));
    c.record(snapshotAt(t0 + 1s, "billing-service",
                        serviceWith(CircuitBreakerState::Closed, 85.0, 0, 20)));
    c.record(snapshotAt(t0 + 2s, "deploy-service",
                        serviceWith(CircuitBreakerState::Closed, 50.0, 0, 20)));

    auto alerts = c.alerts();
    ASSERT_EQ(alerts.size(), 2u);
    EXPECT_EQ(alerts[0].service, "billing-service");
    EXPECT_EQ(alerts[0].severity, AlertSeverity::Error);
    EXPECT_EQ(alerts[0].message, "High error rate: 85.0%");
    EXPECT_EQ(alerts[1].severity, AlertSeverity::Warning);
    EXPECT_EQ(alerts[1].metadata.at("threshold"), "50.0");
    EXPECT_EQ(alerts[1].metadata.at("requestCount"), "10");
    EXPECT_EQ(alerts[1].id, "auth-service-high-error-rate-" + std::to_string(epochMillis(t0)));
}

TEST_F(MetricsCollectorTest, AlertsKeepLastFiveHundred) {
    MonitoringConfig monitoring;
    monitoring.alertThreshold = 50.0;
    auto& c = collector(monitoring);
    auto t0 = wall_.now();
    for (int i = 0; i < 505; ++i) {
        c.record(snapshotAt(t0 + std::chrono::seconds(i), "auth-service",
                            serviceWith(CircuitBreakerState::Closed, 60.0, 0, 10)));
    }

    auto alerts = c.alerts(1000);
    ASSERT_EQ(alerts.size(), MetricsCollector::kMaxAlerts);
    EXPECT_EQ(alerts.size(), 500u);
    EXPECT_EQ(epochMillis(alerts.front().timestamp), epochMillis(t0) + 504000);
    EXPECT_EQ(epochMillis(alerts.back().timestamp), epochMillis(t0) + 5000);
}

TEST_F(MetricsCollectorTest, HighResponseTimeAlert) {
    auto& c = collector();
    auto t0 = wall_.now();

    c.record(snapshotAt(t0, "deploy-service", serviceWith(CircuitBreakerState::Closed, 0, 12000.4)));
    c.record(snapshotAt(t0 + 1s, "deploy-service",
                        serviceWith(CircuitBreakerState::Closed, 0, 31000.0)));
    c.record(snapshotAt(t0 + 2s, "deploy-service",
                        serviceWith(CircuitBreakerState::Closed, 0, 9000.0)));

    auto alerts = c.alerts();
    ASSERT_EQ(alerts.size(), 2u);
    EXPECT_EQ(alerts[0].severity, AlertSeverity::Error);
    EXPECT_EQ(alerts[1].severity, AlertSeverity::Warning);
    EXPECT_EQ(alerts[1].type, AlertType::HighResponseTime);
    EXPECT_EQ(alerts[1].message, "High response time: 12000ms");
}

TEST_F(MetricsCollectorTest, RecoveryAlertOnTransitionToClosed) {
    auto& c = collector();
    std::mutex mutex;
    std::vector<Alert> published;
    auto sub = c.alertRaised().scopedSubscribe([&](const Alert& a) {
        std::lock_guard lock(mutex);
        published.push_back(a);
    });

    auto breaker = registry_.getOrCreate(kAuth);
    breaker->forceState(CircuitBreakerState::Open);
    EXPECT_TRUE(c.alerts().empty());

    breaker->reset();

    auto alerts = c.alerts();
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].type, AlertType::Recovery);
    EXPECT_EQ(alerts[0].severity, AlertSeverity::Info);
    EXPECT_EQ(alerts[0].service, "auth-service:rpc_call");
    EXPECT_EQ(alerts[0].message, "Circuit breaker recovered from OPEN");

    std::lock_guard lock(mutex);
    ASSERT_EQ(published.size(), 1u);
    EXPECT_EQ(published[0].type, AlertType::Recovery);
}

TEST_F(MetricsCollectorTest, AlertObserversMayReadRegistryHealth) {
    auto& c = collector();
    std::vector<CircuitBreakerState> seen;
    auto sub = c.alertRaised().scopedSubscribe([&](const Alert& a) {
        auto health = registry_.allHealth();
        auto it = health.find(a.service);
        if (it != health.end()) {
            seen.push_back(it->second.state);
        }
    });

    auto breaker = registry_.getOrCreate(kAuth);
    breaker->forceState(CircuitBreakerState::Open);
    EXPECT_TRUE(registry_.reset(kAuth));

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], CircuitBreakerState::Closed);
}

TEST_F(MetricsCollectorTest, AlertQueryFiltersAndLimits) {
    auto& c = collector();
    auto t0 = wall_.now();
    for (int i = 0; i < 4; ++i) {
        auto state = i % 2 == 0 ? CircuitBreakerState::Closed : CircuitBreakerState::Open;
        auto snapshot = snapshotAt(t0 + std::chrono::seconds(i), "auth-service",
                                   serviceWith(state, 0));
        snapshot.services.emplace("billing-service",
                                  serviceWith(CircuitBreakerState::Closed, 90.0));
        c.record(std::move(snapshot));
    }

    EXPECT_EQ(c.alerts(2).size(), 2u);
    EXPECT_EQ(c.alerts(50, std::nullopt, std::string("billing-service")).size(), 4u);

    auto errors = c.alerts(50, AlertSeverity::Error);
    ASSERT_FALSE(errors.empty());
    EXPECT_TRUE(std::all_of(errors.begin(), errors.end(),
                            [](const Alert& a) { return a.severity == AlertSeverity::Error; }));
    for (std::size_t i = 1; i < errors.size(); ++i) {
        EXPECT_GE(errors[i - 1].timestamp, errors[i].timestamp);
    }

    auto info = c.alerts(50, AlertSeverity::Info, std::string("auth-service"));
    ASSERT_EQ(info.size(), 1u);
    EXPECT_EQ(info[0].metadata.at("currentState"), "CLOSED");
}

// ---------------------------------------------------------------------------
// Analytics
// ---------------------------------------------------------------------------

TEST_F(MetricsCollectorTest, ErrorRateTrends) {
    auto& c = collector();
    auto now = wall_.now();

    EXPECT_TRUE(c.errorRateTrends().empty());

    MetricsSnapshot first = snapshotAt(now - 2s, "auth-service",
                                       serviceWith(CircuitBreakerState::Closed, 10.0));
    first.services.emplace("billing-service", serviceWith(CircuitBreakerState::Closed, 50.0));
    MetricsSnapshot second = snapshotAt(now - 1s, "auth-service",
                                        serviceWith(CircuitBreakerState::Closed, 30.0));
    second.services.emplace("billing-service", serviceWith(CircuitBreakerState::Closed, 48.0));
    c.record(first);
    EXPECT_TRUE(c.errorRateTrends().empty());
    c.record(second);

    auto trends = c.errorRateTrends();
    ASSERT_EQ(trends.size(), 2u);
    EXPECT_EQ(trends.at("auth-service").trend, Trend::Increasing);
    EXPECT_DOUBLE_EQ(trends.at("auth-service").change, 20.0);
    EXPECT_DOUBLE_EQ(trends.at("auth-service").current, 30.0);
    EXPECT_EQ(trends.at("auth-service").history.size(), 2u);
    EXPECT_EQ(trends.at("billing-service").trend, Trend::Stable);
}

TEST_F(MetricsCollectorTest, TrendsIgnoreSnapshotsOutsideWindow) {
    auto& c = collector();
    auto now = wall_.now();
    c.record(snapshotAt(now - 10min, "auth-service", serviceWith(CircuitBreakerState::Closed, 90.0)));
    c.record(snapshotAt(now - 2s, "auth-service", serviceWith(CircuitBreakerState::Closed, 10.0)));
    c.record(snapshotAt(now - 1s, "auth-service", serviceWith(CircuitBreakerState::Closed, 4.0)));

    auto trends = c.errorRateTrends();
    ASSERT_EQ(trends.size(), 1u);
    EXPECT_EQ(trends.at("auth-service").trend, Trend::Decreasing);
    EXPECT_EQ(trends.at("auth-service").history.size(), 2u);
}

TEST_F(MetricsCollectorTest, ResponseTimePercentiles) {
    auto& c = collector();
    auto start = wall_.now() - 60s;
    for (int i = 1; i <= 10; ++i) {
        c.record(snapshotAt(start + std::chrono::seconds(i), "auth-service",
                            serviceWith(CircuitBreakerState::Closed, 0, 100.0 * (11 - i))));
    }
    c.record(snapshotAt(start + 20s, "auth-service", serviceWith(CircuitBreakerState::Closed, 0, 0.0)));

    auto p = c.responseTimePercentiles("auth-service");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->count, 10u);
    EXPECT_DOUBLE_EQ(p->p50, 600.0);
    EXPECT_DOUBLE_EQ(p->p95, 1000.0);
    EXPECT_DOUBLE_EQ(p->p99, 1000.0);
    EXPECT_DOUBLE_EQ(p->average, 550.0);

    EXPECT_FALSE(c.responseTimePercentiles("billing-service").has_value());
}

TEST_F(MetricsCollectorTest, ServiceMetricsOverTimeBucketsAndAverages) {
    auto& c = collector();
    auto now = wall_.now();
    c.record(snapshotAt(now - 55s, "auth-service", serviceWith(CircuitBreakerState::Closed, 10.0, 0, 10)));
    c.record(snapshotAt(now - 52s, "auth-service", serviceWith(CircuitBreakerState::Open, 30.0, 0, 20)));
    c.record(snapshotAt(now - 15s, "auth-service", serviceWith(CircuitBreakerState::Closed, 0.0, 0, 40)));

    auto buckets = c.serviceMetricsOverTime("auth-service", 60s, 10s);
    ASSERT_TRUE(buckets.hasValue());
    ASSERT_EQ(buckets.value().size(), 2u);

    const auto& early = buckets.value()[0];
    EXPECT_EQ(epochMillis(early.bucketStart), epochMillis(now - 60s));
    EXPECT_EQ(early.metrics.requestCount, 15u);
    EXPECT_DOUBLE_EQ(early.metrics.errorPercentage, 20.0);
    EXPECT_EQ(early.metrics.state, CircuitBreakerState::Open);

    const auto& late = buckets.value()[1];
    EXPECT_EQ(epochMillis(late.bucketStart), epochMillis(now - 20s));
    EXPECT_EQ(late.metrics.requestCount, 40u);
}

TEST_F(MetricsCollectorTest, ServiceMetricsOverTimeRejectsEmptyBuckets) {
    auto result = collector().serviceMetricsOverTime("auth-service", 60s, 0ms);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(MetricsCollectorTest, SummaryReportListsIssues) {
    auto& c = collector();
    registry_.getOrCreate(kAuth)->forceState(CircuitBreakerState::Open);
    registry_.getOrCreate(kBilling);

    auto report = c.summaryReport();

    EXPECT_EQ(report.overview.totalServices, 2u);
    EXPECT_EQ(report.overview.openCircuitBreakers, 1u);
    EXPECT_EQ(report.overview.unhealthyServices, 1u);
    EXPECT_EQ(report.overview.healthyServices, 1u);
    ASSERT_EQ(report.topIssues.size(), 1u);
    EXPECT_EQ(report.topIssues[0].service, "auth-service:rpc_call");
    EXPECT_EQ(report.topIssues[0].issue, "Circuit breaker is OPEN");
    EXPECT_EQ(report.topIssues[0].severity, IssueSeverity::High);
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

TEST_F(MetricsCollectorTest, StartAndStop) {
    MonitoringConfig monitoring;
    monitoring.metricsInterval = 10000ms;
    auto& c = collector(monitoring);

    ASSERT_TRUE(c.start().hasValue());
    EXPECT_TRUE(c.running());
    EXPECT_TRUE(c.start().hasValue());
    EXPECT_EQ(scheduler_.pendingTimers(), 1u);

    c.stop();
    EXPECT_FALSE(c.running());
    EXPECT_EQ(scheduler_.pendingTimers(), 0u);
}

TEST_F(MetricsCollectorTest, DisabledMonitoringNeverStarts) {
    MonitoringConfig monitoring;
    monitoring.enabled = false;
    auto& c = collector(monitoring);

    EXPECT_TRUE(c.start().hasValue());
    EXPECT_FALSE(c.running());
}
