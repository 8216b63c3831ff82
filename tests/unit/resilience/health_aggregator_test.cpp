#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include "crr/foundation/task_scheduler.hpp"
#include "crr/resilience/health_aggregator.hpp"
#include "crr/resilience/health_classifier.hpp"

using namespace crr::resilience;
using namespace std::chrono_literals;
using crr::foundation::SteadyClockFn;
using crr::foundation::SteadyTime;
using crr::foundation::TaskScheduler;

namespace {

class ManualClock {
public:
    SteadyClockFn fn() const {
        return [now = now_] { return SteadyTime{} + std::chrono::milliseconds(now->load()); };
    }
    void advance(std::chrono::milliseconds d) { now_->fetch_add(d.count()); }

private:
    std::shared_ptr<std::atomic<int64_t>> now_ = std::make_shared<std::atomic<int64_t>>(0);
};

const BreakerKey kAuth{"auth-service", OperationType::RpcCall};
const BreakerKey kBilling{"billing-service", OperationType::RpcCall};
const BreakerKey kDeploy{"deploy-service", OperationType::RpcCall};

} // namespace

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

static_assert(classifyHealth(CircuitBreakerState::Open, 0.0, 80.0) == HealthStatus::Unhealthy);
static_assert(classifyHealth(CircuitBreakerState::HalfOpen, 0.0, 80.0) == HealthStatus::Degraded);
static_assert(classifyHealth(CircuitBreakerState::Closed, 80.0, 80.0) == HealthStatus::Healthy);
static_assert(classifyHealth(CircuitBreakerState::Closed, 80.1, 80.0) == HealthStatus::Degraded);

TEST(HealthClassifierTest, OpenIsUnhealthyAtAnyErrorRate) {
    for (double pct : {0.0, 10.0, 50.0, 99.9, 100.0}) {
        EXPECT_EQ(classifyHealth(CircuitBreakerState::Open, pct, 80.0), HealthStatus::Unhealthy);
        EXPECT_EQ(classifyHealth(CircuitBreakerState::HalfOpen, pct, 80.0), HealthStatus::Degraded);
    }
}

TEST(HealthClassifierTest, ClosedDependsOnThreshold) {
    CircuitBreakerMetrics m;
    m.errorPercentage = 45.0;
    EXPECT_EQ(classifyHealth(m, 80.0), HealthStatus::Healthy);
    EXPECT_EQ(classifyHealth(m, 40.0), HealthStatus::Degraded);
}

// ---------------------------------------------------------------------------
// Aggregation
// ---------------------------------------------------------------------------

class HealthAggregatorTest : public ::testing::Test {
protected:
    void build(ResilienceSettings settings = ResilienceSettings::defaults()) {
        configs_ = std::make_unique<BreakerConfigProvider>(std::move(settings));
        registry_ = std::make_unique<CircuitBreakerRegistry>(*configs_, scheduler_, clock_.fn());
        health_ = std::make_unique<HealthAggregator>(*registry_, scheduler_);
    }

    void TearDown() override {
        health_.reset();
        registry_.reset();
    }

    /// Closed breaker at 90 % errors: the volume threshold keeps it from tripping.
    void makeDegraded(const BreakerKey& key) {
        CircuitBreakerOverrides overrides;
        overrides.volumeThreshold = 1000u;
        registry_->getOrCreate(key, overrides);
        for (int i = 0; i < 9; ++i) {
            registry_->execute(key, [] {
                return RpcResult<Payload>::err(RpcError(ErrorCode::RemoteError, "down"));
            });
        }
        registry_->execute(key, [] { return RpcResult<Payload>::ok("{}"); });
    }

    TaskScheduler scheduler_{2};
    ManualClock clock_;
    std::unique_ptr<BreakerConfigProvider> configs_;
    std::unique_ptr<CircuitBreakerRegistry> registry_;
    std::unique_ptr<HealthAggregator> health_;
};

TEST_F(HealthAggregatorTest, EmptyRegistryIsUp) {
    build();
    auto agg = health_->aggregate();
    EXPECT_EQ(agg.status, OverallStatus::Up);
    EXPECT_EQ(agg.summary.total, 0u);

    auto report = health_->checkCircuitBreakers();
    EXPECT_EQ(report.status, OverallStatus::Up);
    EXPECT_EQ(report.message, "All circuit breakers are healthy");
}

TEST_F(HealthAggregatorTest, OneOpenBreakerMakesSystemDown) {
    build();
    registry_->getOrCreate(kAuth)->forceState(CircuitBreakerState::Open);
    registry_->getOrCreate(kBilling);
    registry_->getOrCreate(kDeploy)->forceState(CircuitBreakerState::HalfOpen);

    auto agg = health_->aggregate();
    EXPECT_EQ(agg.status, OverallStatus::Down);
    EXPECT_EQ(agg.summary.total, 3u);
    EXPECT_EQ(agg.summary.healthy, 1u);
    EXPECT_EQ(agg.summary.degraded, 1u);
    EXPECT_EQ(agg.summary.unhealthy, 1u);

    auto report = health_->checkCircuitBreakers();
    EXPECT_EQ(report.status, OverallStatus::Down);
    EXPECT_EQ(report.message, "1 circuit breaker(s) are unhealthy");
    EXPECT_EQ(report.breakers.size(), 3u);
}

TEST_F(HealthAggregatorTest, DisabledBreakersReportUp) {
    auto settings = ResilienceSettings::defaults();
    settings.enabled = false;
    build(settings);
    registry_->getOrCreate(kAuth)->forceState(CircuitBreakerState::Open);

    auto report = health_->checkCircuitBreakers();
    EXPECT_EQ(report.status, OverallStatus::Up);
    EXPECT_EQ(report.message, "Circuit breakers are disabled");
    EXPECT_TRUE(report.breakers.empty());
}

TEST_F(HealthAggregatorTest, ReportRoundsErrorRate) {
    build();
    CircuitBreakerOverrides overrides;
    overrides.volumeThreshold = 1000u;
    registry_->getOrCreate(kBilling, overrides);
    registry_->execute(kBilling, [] {
        return RpcResult<Payload>::err(RpcError(ErrorCode::RemoteError, "down"));
    });
    for (int i = 0; i < 2; ++i) {
        registry_->execute(kBilling, [] { return RpcResult<Payload>::ok("{}"); });
    }

    auto report = health_->checkCircuitBreakers();
    EXPECT_DOUBLE_EQ(report.breakers.at("billing-service:rpc_call").metrics.errorPercentage, 33.33);
}

TEST_F(HealthAggregatorTest, ServiceLookupsNormalizeNames) {
    build();
    registry_->getOrCreate(kAuth);
    registry_->getOrCreate(kBilling)->forceState(CircuitBreakerState::Open);

    auto auth = health_->serviceHealth("auth", OperationType::RpcCall);
    ASSERT_TRUE(auth.has_value());
    EXPECT_EQ(auth->service, "auth-service:rpc_call");
    EXPECT_TRUE(health_->isServiceHealthy("auth.login", OperationType::RpcCall));
    EXPECT_FALSE(health_->isServiceHealthy("billing", OperationType::RpcCall));
    EXPECT_FALSE(health_->isServiceHealthy("unknown", OperationType::RpcCall));
    EXPECT_FALSE(health_->serviceHealth("auth").has_value());
}

TEST_F(HealthAggregatorTest, OpenAndDegradedViews) {
    build();
    registry_->getOrCreate(kAuth)->forceState(CircuitBreakerState::Open);
    makeDegraded(kBilling);
    registry_->getOrCreate(kDeploy);

    auto open = health_->openBreakers();
    ASSERT_EQ(open.size(), 1u);
    EXPECT_EQ(open.begin()->first, "auth-service:rpc_call");

    auto degraded = health_->degradedBreakers();
    ASSERT_EQ(degraded.size(), 1u);
    EXPECT_EQ(degraded.begin()->first, "billing-service:rpc_call");
    EXPECT_EQ(degraded.begin()->second.state, CircuitBreakerState::Closed);
}

TEST_F(HealthAggregatorTest, ResetServiceClosesItsBreakers) {
    build();
    registry_->getOrCreate(kAuth)->forceState(CircuitBreakerState::Open);
    registry_->getOrCreate(BreakerKey{"auth-service", OperationType::HealthCheck})
        ->forceState(CircuitBreakerState::Open);

    EXPECT_EQ(health_->resetService("auth"), 2u);
    EXPECT_TRUE(health_->openBreakers().empty());
}

// ---------------------------------------------------------------------------
// Recommendations
// ---------------------------------------------------------------------------

TEST_F(HealthAggregatorTest, RecommendationPerUnhealthyState) {
    build();
    registry_->getOrCreate(kAuth)->forceState(CircuitBreakerState::Open);
    registry_->getOrCreate(kDeploy)->forceState(CircuitBreakerState::HalfOpen);
    makeDegraded(kBilling);

    auto recs = health_->recommendations();
    ASSERT_EQ(recs.size(), 3u);

    auto find = [&](const std::string& service) {
        return std::find_if(recs.begin(), recs.end(),
                            [&](const HealthRecommendation& r) { return r.service == service; });
    };

    auto open = find("auth-service:rpc_call");
    ASSERT_NE(open, recs.end());
    EXPECT_EQ(open->type, RecommendationType::Error);
    EXPECT_EQ(open->message, "Circuit breaker is OPEN - service is failing fast");

    auto half = find("deploy-service:rpc_call");
    ASSERT_NE(half, recs.end());
    EXPECT_EQ(half->type, RecommendationType::Warning);

    auto degraded = find("billing-service:rpc_call");
    ASSERT_NE(degraded, recs.end());
    EXPECT_EQ(degraded->message,
              "Circuit breaker is CLOSED but service is degraded (90.0% error rate)");

    EXPECT_EQ(find("system"), recs.end());
}

TEST_F(HealthAggregatorTest, SystemRecommendationWhenSeveralOpen) {
    build();
    registry_->getOrCreate(kAuth)->forceState(CircuitBreakerState::Open);
    registry_->getOrCreate(kBilling)->forceState(CircuitBreakerState::Open);

    auto recs = health_->recommendations();
    ASSERT_EQ(recs.size(), 3u);
    EXPECT_EQ(recs.back().service, "system");
    EXPECT_EQ(recs.back().type, RecommendationType::Error);
    EXPECT_EQ(recs.back().message, "Multiple services (2) have circuit breakers in OPEN state");
}

TEST_F(HealthAggregatorTest, SlowHealthyServiceGetsTuningHint) {
    build();
    auto clock = clock_;
    registry_->execute(kDeploy, [clock]() mutable {
        clock.advance(6000ms);
        return RpcResult<Payload>::ok("{}");
    });

    auto recs = health_->recommendations();
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0].type, RecommendationType::Info);
    EXPECT_EQ(recs[0].message, "Service has high response times (6000ms average)");
}

// ---------------------------------------------------------------------------
// Periodic check
// ---------------------------------------------------------------------------

TEST_F(HealthAggregatorTest, PeriodicCheckLifecycle) {
    build();
    ASSERT_TRUE(health_->start().hasValue());
    EXPECT_TRUE(health_->running());
    EXPECT_EQ(scheduler_.pendingTimers(), 1u);

    registry_->getOrCreate(kAuth)->forceState(CircuitBreakerState::Open);
    auto report = health_->runHealthCheck();
    EXPECT_EQ(report.status, OverallStatus::Down);
    EXPECT_EQ(registry_->find(kAuth)->state(), CircuitBreakerState::Open);

    health_->stop();
    EXPECT_FALSE(health_->running());
    EXPECT_EQ(scheduler_.pendingTimers(), 0u);
}
