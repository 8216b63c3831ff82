/// @file circuit_breaker_types.cpp
/// @brief Key formatting, service-name normalization and override merging.

#include "crr/resilience/circuit_breaker_types.hpp"

namespace crr::resilience {

namespace {

constexpr std::string_view kServiceSuffix = "-service";

bool endsWith(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.substr(text.size() - suffix.size()) == suffix;
}

} // namespace

std::optional<OperationType> parseOperationType(std::string_view name) {
    for (auto op : {OperationType::RpcCall, OperationType::HealthCheck,
                    OperationType::DatabaseQuery, OperationType::HttpRequest,
                    OperationType::EventPublish}) {
        if (toString(op) == name) {
            return op;
        }
    }
    return std::nullopt;
}

std::string BreakerKey::toString() const {
    if (!operation) {
        return service;
    }
    std::string key = service;
    key += ':';
    key += resilience::toString(*operation);
    return key;
}

std::string normalizeServiceName(std::string_view name) {
    auto head = name.substr(0, name.find('.'));
    if (head.empty() || endsWith(head, kServiceSuffix)) {
        return std::string(head);
    }
    std::string normalized(head);
    normalized += kServiceSuffix;
    return normalized;
}

bool countsAsFailure(const RpcError& error) {
    return !error.isCallerError();
}

void CircuitBreakerOverrides::applyTo(CircuitBreakerConfig& config) const {
    if (timeout) config.timeout = *timeout;
    if (errorThresholdPercentage) config.errorThresholdPercentage = *errorThresholdPercentage;
    if (resetTimeout) config.resetTimeout = *resetTimeout;
    if (volumeThreshold) config.volumeThreshold = *volumeThreshold;
    if (rollingCountTimeout) config.rollingCountTimeout = *rollingCountTimeout;
    if (rollingCountBuckets) config.rollingCountBuckets = *rollingCountBuckets;
    if (enabled) config.enabled = *enabled;
    if (maxConcurrentCalls) config.maxConcurrentCalls = *maxConcurrentCalls;
    if (fallback) config.fallback = fallback;
    if (errorFilter) config.errorFilter = errorFilter;
}

bool CircuitBreakerOverrides::empty() const {
    return !timeout && !errorThresholdPercentage && !resetTimeout && !volumeThreshold &&
           !rollingCountTimeout && !rollingCountBuckets && !enabled && !maxConcurrentCalls &&
           !fallback &&
           !errorFilter;
}

} // namespace crr::resilience
