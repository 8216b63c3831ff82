/// @file timeout_resolver.cpp
/// @brief Timeout precedence, tiers and environment scaling.

#include "crr/resilience/timeout_resolver.hpp"

#include <algorithm>
#include <cmath>

#include "crr/foundation/resilience_logger.hpp"

namespace crr::resilience {

using namespace std::chrono_literals;
using foundation::LogCategory;

std::optional<ServiceTier> parseServiceTier(std::string_view name) {
    if (name == "critical") return ServiceTier::Critical;
    if (name == "standard") return ServiceTier::Standard;
    if (name == "non-critical" || name == "non_critical") return ServiceTier::NonCritical;
    return std::nullopt;
}

DeploymentEnvironment parseEnvironment(std::string_view name) {
    if (name == "test") return DeploymentEnvironment::Test;
    if (name == "local") return DeploymentEnvironment::Local;
    if (name == "stage" || name == "staging") return DeploymentEnvironment::Staging;
    if (name == "prod" || name == "production") return DeploymentEnvironment::Production;
    if (name == "canary") return DeploymentEnvironment::Canary;
    return DeploymentEnvironment::Development;
}

TimeoutConfig TimeoutConfig::defaults() {
    TimeoutConfig config;
    config.services = {
        {"auth-service", {ServiceTier::Critical, 2000ms}},
        {"billing-service", {ServiceTier::Standard, 8000ms}},
        {"deploy-service", {ServiceTier::Standard, 15000ms}},
        {"monitor-service", {ServiceTier::NonCritical, 10000ms}},
    };
    return config;
}

TimeoutResolver::TimeoutResolver(TimeoutConfig config) : config_(std::move(config)) {}

TimeoutResolution TimeoutResolver::resolve(
    std::string_view serviceName,
    std::optional<OperationType> operation,
    std::optional<std::chrono::milliseconds> callOverride) const
{
    auto service = normalizeServiceName(serviceName);
    auto known = config_.services.find(service);

    TimeoutResolution out;
    out.tier = known != config_.services.end() ? known->second.tier : ServiceTier::Standard;

    if (callOverride && callOverride->count() > 0) {
        out.timeout = *callOverride;
        out.originalTimeout = *callOverride;
        out.source = TimeoutSource::CallOverride;
        return out;
    }

    std::optional<std::chrono::milliseconds> operationTimeout;
    if (operation) {
        switch (*operation) {
            case OperationType::HealthCheck:   operationTimeout = config_.healthCheckTimeout; break;
            case OperationType::DatabaseQuery: operationTimeout = config_.databaseTimeout; break;
            case OperationType::HttpRequest:   operationTimeout = config_.httpTimeout; break;
            case OperationType::RpcCall:
            case OperationType::EventPublish:  break;
        }
    }

    auto base = globalDefault();
    out.source = TimeoutSource::GlobalDefault;
    if (operationTimeout && operationTimeout->count() > 0) {
        base = *operationTimeout;
        out.source = TimeoutSource::OperationOverride;
    } else if (known != config_.services.end()) {
        const auto& entry = known->second;
        if (entry.timeout && entry.timeout->count() > 0) {
            base = *entry.timeout;
            out.source = TimeoutSource::ServiceOverride;
        } else if (tierTimeout(entry.tier).count() > 0) {
            base = tierTimeout(entry.tier);
            out.source = TimeoutSource::TierDefault;
        }
    }

    out.originalTimeout = base;
    out.timeout = base;

    auto factor = scaleFactor();
    if (factor != 1.0) {
        auto scaled = static_cast<std::chrono::milliseconds::rep>(
            std::llround(static_cast<double>(base.count()) * factor));
        out.timeout = std::max(config_.minimumTimeout, std::chrono::milliseconds{scaled});
        out.scaled = true;
        out.scaleFactor = factor;
    }

    CRR_LOG_DEBUG(LogCategory::Timeout,
                  service + " -> " + std::to_string(out.timeout.count()) + "ms (" +
                      std::string(toString(out.source)) + ")");
    return out;
}

ServiceTier TimeoutResolver::tierOf(std::string_view serviceName) const {
    auto it = config_.services.find(normalizeServiceName(serviceName));
    return it != config_.services.end() ? it->second.tier : ServiceTier::Standard;
}

double TimeoutResolver::scaleFactor() const {
    if (!config_.enableScaling) {
        return 1.0;
    }
    switch (config_.environment) {
        case DeploymentEnvironment::Production:
        case DeploymentEnvironment::Staging:
        case DeploymentEnvironment::Canary:
            return config_.productionScale;
        case DeploymentEnvironment::Development:
        case DeploymentEnvironment::Local:
            return config_.developmentScale;
        case DeploymentEnvironment::Test:
            return config_.testScale;
    }
    return 1.0;
}

TimeoutDebugInfo TimeoutResolver::debugInfo() const {
    TimeoutDebugInfo info;
    info.environment = config_.environment;
    info.scalingEnabled = config_.enableScaling;
    info.scaleFactor = scaleFactor();
    info.timeouts = {
        {"default", config_.defaultTimeout},
        {"health_check", config_.healthCheckTimeout},
        {"database_query", config_.databaseTimeout},
        {"http_request", config_.httpTimeout},
        {"tier.critical", config_.criticalTimeout},
        {"tier.standard", config_.standardTimeout},
        {"tier.non-critical", config_.nonCriticalTimeout},
    };
    for (const auto& [name, entry] : config_.services) {
        info.tiers[name] = entry.tier;
        if (entry.timeout) {
            info.timeouts[name] = *entry.timeout;
        }
    }
    return info;
}

std::chrono::milliseconds TimeoutResolver::globalDefault() const {
    return config_.defaultTimeout.count() > 0 ? config_.defaultTimeout : 5000ms;
}

std::chrono::milliseconds TimeoutResolver::tierTimeout(ServiceTier tier) const {
    switch (tier) {
        case ServiceTier::Critical:    return config_.criticalTimeout;
        case ServiceTier::Standard:    return config_.standardTimeout;
        case ServiceTier::NonCritical: return config_.nonCriticalTimeout;
    }
    return config_.standardTimeout;
}

} // namespace crr::resilience
