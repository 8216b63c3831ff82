#pragma once

/// @file breaker_config.hpp
/// @brief Merges layered settings into the effective config of one breaker key.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crr/resilience/circuit_breaker_types.hpp"
#include "crr/resilience/recovery_strategy.hpp"
#include "crr/resilience/resilience_settings.hpp"

namespace crr::resilience {

/// Read-only view over ResilienceSettings.
///
/// Merge order for a key, later layers winning:
///   global defaults -> operation overrides -> service overrides -> caller overrides
class BreakerConfigProvider {
public:
    explicit BreakerConfigProvider(ResilienceSettings settings = ResilienceSettings::defaults());

    /// Effective configuration for (@p service, @p operation).
    /// The service name is normalized before lookup.
    [[nodiscard]] CircuitBreakerConfig configFor(
        std::string_view service,
        std::optional<OperationType> operation = std::nullopt,
        const CircuitBreakerOverrides& caller = {}) const;

    /// Strategy for @p service, or the default strategy.
    [[nodiscard]] RecoveryStrategy recoveryStrategy(std::string_view service) const;

    /// Global switch combined with the service's own `enabled` override.
    [[nodiscard]] bool isEnabled(std::string_view service = {}) const;

    [[nodiscard]] const MonitoringConfig& monitoring() const noexcept {
        return settings_.monitoring;
    }

    [[nodiscard]] const ResilienceSettings& settings() const noexcept { return settings_; }

    /// Services with explicit overrides, sorted.
    [[nodiscard]] std::vector<std::string> configuredServices() const;

private:
    ResilienceSettings settings_;
};

} // namespace crr::resilience
