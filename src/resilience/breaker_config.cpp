/// @file breaker_config.cpp
/// @brief Layered breaker configuration lookup.

#include "crr/resilience/breaker_config.hpp"

namespace crr::resilience {

BreakerConfigProvider::BreakerConfigProvider(ResilienceSettings settings)
    : settings_(std::move(settings)) {}

CircuitBreakerConfig BreakerConfigProvider::configFor(
    std::string_view service,
    std::optional<OperationType> operation,
    const CircuitBreakerOverrides& caller) const
{
    CircuitBreakerConfig config = settings_.defaults;
    config.enableMonitoring = settings_.monitoring.enabled;

    if (operation) {
        if (auto op = settings_.operations.find(*operation); op != settings_.operations.end()) {
            op->second.applyTo(config);
        }
    }
    if (auto svc = settings_.services.find(normalizeServiceName(service));
        svc != settings_.services.end()) {
        svc->second.applyTo(config);
    }
    caller.applyTo(config);

    if (!settings_.enabled) {
        config.enabled = false;
    }
    return config;
}

RecoveryStrategy BreakerConfigProvider::recoveryStrategy(std::string_view service) const {
    if (auto it = settings_.recovery.find(normalizeServiceName(service));
        it != settings_.recovery.end()) {
        return it->second;
    }
    if (auto it = settings_.recovery.find(std::string(kDefaultRecoveryKey));
        it != settings_.recovery.end()) {
        return it->second;
    }
    return RecoveryStrategy{};
}

bool BreakerConfigProvider::isEnabled(std::string_view service) const {
    if (!settings_.enabled) {
        return false;
    }
    if (service.empty()) {
        return true;
    }
    auto it = settings_.services.find(normalizeServiceName(service));
    if (it == settings_.services.end() || !it->second.enabled) {
        return true;
    }
    return *it->second.enabled;
}

std::vector<std::string> BreakerConfigProvider::configuredServices() const {
    std::vector<std::string> names;
    names.reserve(settings_.services.size());
    for (const auto& [name, overrides] : settings_.services) {
        names.push_back(name);
    }
    return names;
}

} // namespace crr::resilience
