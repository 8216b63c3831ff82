#pragma once

/// @file resilience_settings.hpp
/// @brief Complete configuration of the resilience layer and its loaders.

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "crr/foundation/config_manager.hpp"
#include "crr/resilience/circuit_breaker_types.hpp"
#include "crr/resilience/recovery_strategy.hpp"
#include "crr/resilience/timeout_resolver.hpp"

namespace crr::resilience {

struct MonitoringConfig {
    bool enabled = true;
    std::chrono::milliseconds metricsInterval{60000};
    std::chrono::milliseconds healthCheckInterval{30000};
    /// Error percentage above which a closed breaker is degraded and
    /// a high-error-rate alert is raised.
    double alertThreshold = 80.0;
};

/// Name under which the fallback recovery strategy is stored.
inline constexpr std::string_view kDefaultRecoveryKey = "default";

struct ResilienceSettings {
    /// Global switch. When false every breaker runs disabled.
    bool enabled = true;
    CircuitBreakerConfig defaults;
    /// Keyed by normalized service name.
    std::map<std::string, CircuitBreakerOverrides> services;
    std::map<OperationType, CircuitBreakerOverrides> operations;
    /// Keyed by normalized service name, plus kDefaultRecoveryKey.
    std::map<std::string, RecoveryStrategy> recovery;
    MonitoringConfig monitoring;
    TimeoutConfig timeouts;

    /// Built-in settings of the stock deployment.
    [[nodiscard]] static ResilienceSettings defaults();
};

/// Environment variables recognized by loadSettings().
[[nodiscard]] std::vector<foundation::EnvBinding> environmentBindings();

/// Overlay every recognized key in @p config onto the built-in defaults.
/// @return ConfigTypeMismatch or ConfigInvalidValue on bad input.
foundation::RpcResult<ResilienceSettings> settingsFromConfig(
    const foundation::ConfigManager& config);

/// Read the YAML file (CRR_CONFIG_PATH wins over @p defaultPath), apply
/// environment overrides, and build settings.
foundation::RpcResult<ResilienceSettings> loadSettings(const std::filesystem::path& defaultPath);

} // namespace crr::resilience
