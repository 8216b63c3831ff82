#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "crr/foundation/config_manager.hpp"
#include "crr/resilience/resilience_settings.hpp"

using namespace crr::resilience;
using namespace std::chrono_literals;
using crr::foundation::ConfigManager;

// --- Defaults ---

TEST(ResilienceSettingsTest, StockDefaults) {
    auto s = ResilienceSettings::defaults();

    EXPECT_TRUE(s.enabled);
    EXPECT_EQ(s.services.size(), 4u);
    EXPECT_EQ(*s.services.at("billing-service").volumeThreshold, 3u);
    EXPECT_EQ(*s.operations.at(OperationType::HealthCheck).timeout, 3000ms);
    EXPECT_EQ(s.recovery.at("default").maxAttempts, 5u);
    EXPECT_EQ(s.monitoring.metricsInterval, 60000ms);
    EXPECT_EQ(s.monitoring.healthCheckInterval, 30000ms);
    EXPECT_DOUBLE_EQ(s.monitoring.alertThreshold, 80.0);
    EXPECT_EQ(s.timeouts.services.at("auth-service").tier, ServiceTier::Critical);
}

TEST(ResilienceSettingsTest, EnvironmentBindingsCoverGlobalKnobs) {
    auto bindings = environmentBindings();
    auto has = [&](std::string_view variable, std::string_view key) {
        for (const auto& b : bindings) {
            if (b.variable == variable && b.key == key) {
                return true;
            }
        }
        return false;
    };
    EXPECT_TRUE(has("CIRCUIT_BREAKER_ENABLED", "circuit_breaker.enabled"));
    EXPECT_TRUE(has("CIRCUIT_BREAKER_ALERT_THRESHOLD", "monitoring.alert_threshold"));
    EXPECT_TRUE(has("ENABLE_TIMEOUT_SCALING", "timeouts.enable_scaling"));
    EXPECT_TRUE(has("NODE_ENV", "environment"));
}

// --- settingsFromConfig ---

TEST(SettingsFromConfigTest, EmptyConfigYieldsDefaults) {
    ConfigManager config;
    auto s = settingsFromConfig(config);
    ASSERT_TRUE(s.hasValue());
    EXPECT_EQ(s.value().services.size(), 4u);
    EXPECT_EQ(s.value().defaults.timeout, 5000ms);
}

TEST(SettingsFromConfigTest, OverlaysYaml) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString(R"(
environment: production
circuit_breaker:
  enabled: true
  error_threshold_percentage: 45
  reset_timeout_ms: 20000
  volume_threshold: 8
monitoring:
  enabled: false
  alert_threshold: 70
timeouts:
  default_ms: 4000
  enable_scaling: false
services:
  auth:
    timeout_ms: 1500
  search-service:
    tier: non-critical
    error_threshold_percentage: 90
    max_concurrent_calls: 4
operations:
  database_query:
    timeout_ms: 12000
recovery:
  search:
    type: linear
    base_delay_ms: 250
)").hasValue());

    auto loaded = settingsFromConfig(config);
    ASSERT_TRUE(loaded.hasValue());
    const auto& s = loaded.value();

    EXPECT_DOUBLE_EQ(s.defaults.errorThresholdPercentage, 45.0);
    EXPECT_EQ(s.defaults.resetTimeout, 20000ms);
    EXPECT_EQ(s.defaults.volumeThreshold, 8u);
    EXPECT_EQ(s.defaults.timeout, 4000ms);
    EXPECT_FALSE(s.defaults.enableMonitoring);
    EXPECT_FALSE(s.monitoring.enabled);
    EXPECT_DOUBLE_EQ(s.monitoring.alertThreshold, 70.0);

    EXPECT_EQ(s.timeouts.environment, DeploymentEnvironment::Production);
    EXPECT_FALSE(s.timeouts.enableScaling);
    EXPECT_EQ(s.timeouts.defaultTimeout, 4000ms);

    EXPECT_EQ(*s.services.at("auth-service").timeout, 1500ms);
    EXPECT_DOUBLE_EQ(*s.services.at("auth-service").errorThresholdPercentage, 40.0);
    EXPECT_EQ(*s.timeouts.services.at("auth-service").timeout, 1500ms);

    EXPECT_DOUBLE_EQ(*s.services.at("search-service").errorThresholdPercentage, 90.0);
    EXPECT_EQ(*s.services.at("search-service").maxConcurrentCalls, 4u);
    EXPECT_FALSE(s.services.at("auth-service").maxConcurrentCalls.has_value());
    EXPECT_EQ(s.timeouts.services.at("search-service").tier, ServiceTier::NonCritical);

    EXPECT_EQ(*s.operations.at(OperationType::DatabaseQuery).timeout, 12000ms);

    const auto& search = s.recovery.at("search-service");
    EXPECT_EQ(search.type, RecoveryType::LinearBackoff);
    EXPECT_EQ(search.baseDelay, 250ms);
    EXPECT_EQ(search.maxAttempts, 5u);
}

TEST(SettingsFromConfigTest, ThresholdOutOfRangeIsRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("circuit_breaker:\n  error_threshold_percentage: 140\n").hasValue());

    auto s = settingsFromConfig(config);
    ASSERT_TRUE(s.hasError());
    EXPECT_EQ(s.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(SettingsFromConfigTest, NegativeDurationIsRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("monitoring:\n  metrics_interval_ms: -5\n").hasValue());

    auto s = settingsFromConfig(config);
    ASSERT_TRUE(s.hasError());
    EXPECT_EQ(s.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(SettingsFromConfigTest, WrongTypeIsRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("circuit_breaker:\n  volume_threshold: many\n").hasValue());

    auto s = settingsFromConfig(config);
    ASSERT_TRUE(s.hasError());
    EXPECT_EQ(s.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(SettingsFromConfigTest, UnknownNamesAreRejected) {
    {
        ConfigManager config;
        ASSERT_TRUE(config.loadString("services:\n  auth:\n    tier: platinum\n").hasValue());
        EXPECT_TRUE(settingsFromConfig(config).hasError());
    }
    {
        ConfigManager config;
        ASSERT_TRUE(config.loadString("operations:\n  batch_job:\n    timeout_ms: 10\n").hasValue());
        EXPECT_TRUE(settingsFromConfig(config).hasError());
    }
    {
        ConfigManager config;
        ASSERT_TRUE(config.loadString("recovery:\n  default:\n    type: random\n").hasValue());
        EXPECT_TRUE(settingsFromConfig(config).hasError());
    }
}

// --- loadSettings ---

class LoadSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = std::filesystem::temp_directory_path() / (std::string("crr_test_") + info->name());
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
        ::unsetenv("CIRCUIT_BREAKER_RESET_TIMEOUT");
        ::unsetenv("CIRCUIT_BREAKER_ENABLED");
    }

    std::filesystem::path tmpDir_;
};

TEST_F(LoadSettingsTest, MissingFileGivesDefaults) {
    auto s = loadSettings(tmpDir_ / "absent.yaml");
    ASSERT_TRUE(s.hasValue());
    EXPECT_TRUE(s.value().enabled);
}

TEST_F(LoadSettingsTest, EnvironmentWinsOverFile) {
    auto path = tmpDir_ / "resilience.yaml";
    {
        std::ofstream ofs(path);
        ofs << "circuit_breaker:\n  reset_timeout_ms: 30000\n  enabled: true\n";
    }
    ::setenv("CIRCUIT_BREAKER_RESET_TIMEOUT", "45000", 1);
    ::setenv("CIRCUIT_BREAKER_ENABLED", "false", 1);

    auto s = loadSettings(path);
    ASSERT_TRUE(s.hasValue());
    EXPECT_EQ(s.value().defaults.resetTimeout, 45000ms);
    EXPECT_FALSE(s.value().enabled);
}
