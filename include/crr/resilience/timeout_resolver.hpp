#pragma once

/// @file timeout_resolver.hpp
/// @brief Effective call timeout per (service, operation).

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "crr/resilience/circuit_breaker_types.hpp"

namespace crr::resilience {

enum class ServiceTier : uint8_t { Critical, Standard, NonCritical };

[[nodiscard]] constexpr std::string_view toString(ServiceTier tier) {
    switch (tier) {
        case ServiceTier::Critical:    return "critical";
        case ServiceTier::Standard:    return "standard";
        case ServiceTier::NonCritical: return "non-critical";
    }
    return "unknown";
}

[[nodiscard]] std::optional<ServiceTier> parseServiceTier(std::string_view name);

/// Which rule produced a resolved timeout.
enum class TimeoutSource : uint8_t {
    CallOverride,
    OperationOverride,
    ServiceOverride,
    TierDefault,
    GlobalDefault
};

[[nodiscard]] constexpr std::string_view toString(TimeoutSource source) {
    switch (source) {
        case TimeoutSource::CallOverride:      return "call-override";
        case TimeoutSource::OperationOverride: return "operation-override";
        case TimeoutSource::ServiceOverride:   return "service-override";
        case TimeoutSource::TierDefault:       return "tier-default";
        case TimeoutSource::GlobalDefault:     return "global-default";
    }
    return "unknown";
}

enum class DeploymentEnvironment : uint8_t {
    Test,
    Local,
    Development,
    Staging,
    Production,
    Canary
};

[[nodiscard]] constexpr std::string_view toString(DeploymentEnvironment env) {
    switch (env) {
        case DeploymentEnvironment::Test:        return "test";
        case DeploymentEnvironment::Local:       return "local";
        case DeploymentEnvironment::Development: return "development";
        case DeploymentEnvironment::Staging:     return "staging";
        case DeploymentEnvironment::Production:  return "production";
        case DeploymentEnvironment::Canary:      return "canary";
    }
    return "development";
}

/// "prod", "stage", "dev" and the full names; anything else is Development.
[[nodiscard]] DeploymentEnvironment parseEnvironment(std::string_view name);

/// Known service: its tier and, optionally, a service-specific timeout.
struct ServiceTimeoutEntry {
    ServiceTier tier = ServiceTier::Standard;
    std::optional<std::chrono::milliseconds> timeout;
};

struct TimeoutConfig {
    std::chrono::milliseconds defaultTimeout{5000};

    std::chrono::milliseconds healthCheckTimeout{3000};
    std::chrono::milliseconds databaseTimeout{10000};
    std::chrono::milliseconds httpTimeout{30000};

    std::chrono::milliseconds criticalTimeout{2000};
    std::chrono::milliseconds standardTimeout{5000};
    std::chrono::milliseconds nonCriticalTimeout{10000};

    std::map<std::string, ServiceTimeoutEntry> services;

    bool enableScaling = true;
    double productionScale = 1.5;
    double developmentScale = 0.8;
    double testScale = 0.5;
    /// Floor applied to scaled timeouts.
    std::chrono::milliseconds minimumTimeout{500};
    DeploymentEnvironment environment = DeploymentEnvironment::Development;

    /// Stock deployment: auth (critical, 2s), billing (standard, 8s),
    /// deploy (standard, 15s), monitor (non-critical, 10s).
    [[nodiscard]] static TimeoutConfig defaults();
};

struct TimeoutResolution {
    std::chrono::milliseconds timeout{5000};
    TimeoutSource source = TimeoutSource::GlobalDefault;
    ServiceTier tier = ServiceTier::Standard;
    bool scaled = false;
    double scaleFactor = 1.0;
    /// Timeout before scaling.
    std::chrono::milliseconds originalTimeout{5000};
};

struct TimeoutDebugInfo {
    DeploymentEnvironment environment = DeploymentEnvironment::Development;
    bool scalingEnabled = false;
    double scaleFactor = 1.0;
    std::map<std::string, std::chrono::milliseconds> timeouts;
    std::map<std::string, ServiceTier> tiers;
};

/// Resolves call timeouts. Precedence, highest first:
///   1. explicit per-call override
///   2. operation override (health check, database query, http request)
///   3. service-specific timeout
///   4. tier default of a known service
///   5. global default
/// Scaling by environment applies to 2-5. resolve() never fails: a
/// non-positive configured value falls through to the global default.
class TimeoutResolver {
public:
    explicit TimeoutResolver(TimeoutConfig config = TimeoutConfig::defaults());

    [[nodiscard]] TimeoutResolution resolve(
        std::string_view serviceName,
        std::optional<OperationType> operation = std::nullopt,
        std::optional<std::chrono::milliseconds> callOverride = std::nullopt) const;

    /// Tier of a service; unknown services are Standard.
    [[nodiscard]] ServiceTier tierOf(std::string_view serviceName) const;

    /// Factor for the configured environment, 1.0 when scaling is off.
    [[nodiscard]] double scaleFactor() const;

    [[nodiscard]] TimeoutDebugInfo debugInfo() const;

    [[nodiscard]] const TimeoutConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::chrono::milliseconds globalDefault() const;
    [[nodiscard]] std::chrono::milliseconds tierTimeout(ServiceTier tier) const;

    TimeoutConfig config_;
};

} // namespace crr::resilience
