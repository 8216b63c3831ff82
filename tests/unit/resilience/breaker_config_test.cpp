#include <gtest/gtest.h>

#include <chrono>

#include "crr/resilience/breaker_config.hpp"

using namespace crr::resilience;
using namespace std::chrono_literals;

// --- Key and name helpers ---

TEST(BreakerKeyTest, ToString) {
    EXPECT_EQ((BreakerKey{"auth-service", std::nullopt}).toString(), "auth-service");
    EXPECT_EQ((BreakerKey{"auth-service", OperationType::HealthCheck}).toString(),
              "auth-service:health_check");
}

TEST(BreakerKeyTest, NormalizeServiceName) {
    EXPECT_EQ(normalizeServiceName("auth"), "auth-service");
    EXPECT_EQ(normalizeServiceName("auth.register"), "auth-service");
    EXPECT_EQ(normalizeServiceName("auth-service"), "auth-service");
    EXPECT_EQ(normalizeServiceName("auth-service.login"), "auth-service");
    EXPECT_EQ(normalizeServiceName(""), "");
}

TEST(BreakerKeyTest, OperationNames) {
    EXPECT_EQ(parseOperationType("rpc_call"), OperationType::RpcCall);
    EXPECT_EQ(parseOperationType("event_publish"), OperationType::EventPublish);
    EXPECT_FALSE(parseOperationType("batch").has_value());
}

TEST(BreakerKeyTest, ErrorPercentageFormula) {
    EXPECT_DOUBLE_EQ(errorPercentageOf(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(errorPercentageOf(1, 3), 25.0);
    EXPECT_DOUBLE_EQ(errorPercentageOf(3, 2), 60.0);
    EXPECT_DOUBLE_EQ(errorPercentageOf(5, 0), 100.0);
}

TEST(BreakerKeyTest, OverridesApplyOnlySetFields) {
    CircuitBreakerConfig config;
    CircuitBreakerOverrides overrides;
    EXPECT_TRUE(overrides.empty());

    overrides.volumeThreshold = 3u;
    EXPECT_FALSE(overrides.empty());
    overrides.applyTo(config);

    EXPECT_EQ(config.volumeThreshold, 3u);
    EXPECT_EQ(config.timeout, 5000ms);
    EXPECT_DOUBLE_EQ(config.errorThresholdPercentage, 50.0);
    EXPECT_EQ(config.maxConcurrentCalls, 0u);

    CircuitBreakerOverrides capped;
    capped.maxConcurrentCalls = 8u;
    EXPECT_FALSE(capped.empty());
    capped.applyTo(config);
    EXPECT_EQ(config.maxConcurrentCalls, 8u);
    EXPECT_EQ(config.volumeThreshold, 3u);
}

// --- BreakerConfigProvider ---

TEST(BreakerConfigProviderTest, GlobalDefaultsForUnknownService) {
    BreakerConfigProvider provider;
    auto config = provider.configFor("inventory-service");

    EXPECT_EQ(config.timeout, 5000ms);
    EXPECT_DOUBLE_EQ(config.errorThresholdPercentage, 50.0);
    EXPECT_EQ(config.resetTimeout, 60000ms);
    EXPECT_EQ(config.volumeThreshold, 10u);
    EXPECT_TRUE(config.enabled);
}

TEST(BreakerConfigProviderTest, ServiceOverridesApply) {
    BreakerConfigProvider provider;
    auto config = provider.configFor("auth");

    EXPECT_EQ(config.timeout, 2000ms);
    EXPECT_DOUBLE_EQ(config.errorThresholdPercentage, 40.0);
    EXPECT_EQ(config.resetTimeout, 30000ms);
    EXPECT_EQ(config.volumeThreshold, 5u);
}

TEST(BreakerConfigProviderTest, ServiceLayerWinsOverOperationLayer) {
    BreakerConfigProvider provider;
    auto config = provider.configFor("auth-service", OperationType::HealthCheck);

    EXPECT_EQ(config.timeout, 2000ms);
    EXPECT_DOUBLE_EQ(config.errorThresholdPercentage, 40.0);

    auto unknown = provider.configFor("inventory-service", OperationType::HealthCheck);
    EXPECT_EQ(unknown.timeout, 3000ms);
    EXPECT_DOUBLE_EQ(unknown.errorThresholdPercentage, 30.0);
    EXPECT_EQ(unknown.resetTimeout, 15000ms);
}

TEST(BreakerConfigProviderTest, CallerOverridesWinLast) {
    BreakerConfigProvider provider;
    CircuitBreakerOverrides caller;
    caller.timeout = 1234ms;
    auto config = provider.configFor("auth-service", OperationType::RpcCall, caller);

    EXPECT_EQ(config.timeout, 1234ms);
    EXPECT_DOUBLE_EQ(config.errorThresholdPercentage, 40.0);
}

TEST(BreakerConfigProviderTest, GlobalSwitchDisablesEveryBreaker) {
    auto settings = ResilienceSettings::defaults();
    settings.enabled = false;
    BreakerConfigProvider provider(settings);

    CircuitBreakerOverrides caller;
    caller.enabled = true;
    EXPECT_FALSE(provider.configFor("auth-service", std::nullopt, caller).enabled);
    EXPECT_FALSE(provider.isEnabled());
    EXPECT_FALSE(provider.isEnabled("auth-service"));
}

TEST(BreakerConfigProviderTest, ServiceSwitch) {
    auto settings = ResilienceSettings::defaults();
    settings.services["deploy-service"].enabled = false;
    BreakerConfigProvider provider(settings);

    EXPECT_TRUE(provider.isEnabled());
    EXPECT_TRUE(provider.isEnabled("auth"));
    EXPECT_FALSE(provider.isEnabled("deploy"));
    EXPECT_FALSE(provider.configFor("deploy").enabled);
}

TEST(BreakerConfigProviderTest, MonitoringFlagReachesConfig) {
    auto settings = ResilienceSettings::defaults();
    settings.monitoring.enabled = false;
    BreakerConfigProvider provider(settings);
    EXPECT_FALSE(provider.configFor("auth").enableMonitoring);
}

TEST(BreakerConfigProviderTest, RecoveryStrategyLookup) {
    BreakerConfigProvider provider;

    auto auth = provider.recoveryStrategy("auth");
    EXPECT_EQ(auth.type, RecoveryType::ExponentialBackoff);
    EXPECT_EQ(auth.baseDelay, 500ms);
    EXPECT_EQ(auth.maxAttempts, 3u);

    EXPECT_EQ(provider.recoveryStrategy("billing").type, RecoveryType::LinearBackoff);
    EXPECT_EQ(provider.recoveryStrategy("monitor").type, RecoveryType::Immediate);

    auto fallback = provider.recoveryStrategy("inventory-service");
    EXPECT_EQ(fallback.type, RecoveryType::ExponentialBackoff);
    EXPECT_EQ(fallback.baseDelay, 1000ms);
    EXPECT_EQ(fallback.maxAttempts, 5u);
}

TEST(BreakerConfigProviderTest, ConfiguredServicesAreSorted) {
    BreakerConfigProvider provider;
    auto names = provider.configuredServices();
    ASSERT_EQ(names.size(), 4u);
    EXPECT_EQ(names.front(), "auth-service");
    EXPECT_EQ(names.back(), "monitor-service");
}
