/// @file circuit_breaker_registry.cpp
/// @brief Get-or-create breaker map and cross-key queries.

#include "crr/resilience/circuit_breaker_registry.hpp"

#include <algorithm>
#include <mutex>

#include "crr/foundation/resilience_logger.hpp"
#include "crr/resilience/health_classifier.hpp"

namespace crr::resilience {

using foundation::LogCategory;

CircuitBreakerRegistry::CircuitBreakerRegistry(const BreakerConfigProvider& configs,
                                               foundation::TaskScheduler& scheduler,
                                               foundation::SteadyClockFn clock,
                                               foundation::WallClockFn wallClock)
    : configs_(configs),
      scheduler_(scheduler),
      clock_(std::move(clock)),
      wallClock_(std::move(wallClock)) {}

CircuitBreakerRegistry::~CircuitBreakerRegistry() = default;

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::getOrCreate(
    const BreakerKey& key, const CircuitBreakerOverrides& overrides)
{
    {
        std::shared_lock lock(mutex_);
        if (auto it = breakers_.find(key); it != breakers_.end()) {
            return it->second;
        }
    }

    // Merge outside the exclusive lock.
    auto config = configs_.configFor(key.service, key.operation, overrides);

    std::unique_lock lock(mutex_);
    auto [it, inserted] = breakers_.try_emplace(key, nullptr);
    if (inserted) {
        it->second = std::make_shared<CircuitBreaker>(key, std::move(config), scheduler_,
                                                      clock_, wallClock_);
        forwarders_.push_back(it->second->stateChanged().scopedSubscribe(
            [this](const StateChangeEvent& event) { stateChanges_.notify(event); }));
        CRR_LOG_DEBUG(LogCategory::Breaker, "created breaker " + key.toString());
    }
    return it->second;
}

CircuitBreakerResult CircuitBreakerRegistry::execute(const BreakerKey& key,
                                                     const Operation& operation,
                                                     const CircuitBreakerOverrides& overrides) {
    return getOrCreate(key, overrides)->execute(operation, overrides.fallback);
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(const BreakerKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = breakers_.find(key);
    return it != breakers_.end() ? it->second : nullptr;
}

std::optional<CircuitBreakerMetrics> CircuitBreakerRegistry::metrics(const BreakerKey& key) const {
    if (auto breaker = find(key)) {
        return breaker->metrics();
    }
    return std::nullopt;
}

std::optional<CircuitBreakerHealth> CircuitBreakerRegistry::health(const BreakerKey& key) const {
    if (auto breaker = find(key)) {
        return healthOf(*breaker);
    }
    return std::nullopt;
}

std::map<std::string, CircuitBreakerHealth> CircuitBreakerRegistry::allHealth() const {
    std::map<std::string, CircuitBreakerHealth> out;
    for (const auto& breaker : breakers()) {
        out.emplace(breaker->key().toString(), healthOf(*breaker));
    }
    return out;
}

std::vector<std::shared_ptr<CircuitBreaker>> CircuitBreakerRegistry::breakers() const {
    std::vector<std::shared_ptr<CircuitBreaker>> out;
    {
        std::shared_lock lock(mutex_);
        out.reserve(breakers_.size());
        for (const auto& [key, breaker] : breakers_) {
            out.push_back(breaker);
        }
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a->key().toString() < b->key().toString();
    });
    return out;
}

bool CircuitBreakerRegistry::reset(const BreakerKey& key) {
    auto breaker = find(key);
    if (!breaker) {
        return false;
    }
    breaker->reset();
    CRR_LOG_INFO(LogCategory::Breaker, "reset breaker " + key.toString());
    return true;
}

std::size_t CircuitBreakerRegistry::resetService(std::string_view service) {
    auto name = normalizeServiceName(service);
    std::size_t count = 0;
    for (const auto& breaker : breakers()) {
        if (breaker->key().service == name) {
            breaker->reset();
            ++count;
        }
    }
    CRR_LOG_INFO(LogCategory::Breaker,
                 "reset " + std::to_string(count) + " breaker(s) of " + name);
    return count;
}

std::vector<BreakerDebugInfo> CircuitBreakerRegistry::debugInfo() const {
    std::vector<BreakerDebugInfo> out;
    for (const auto& breaker : breakers()) {
        out.push_back(BreakerDebugInfo{breaker->key().toString(), breaker->config(),
                                       breaker->metrics(), breaker->windowStats()});
    }
    return out;
}

std::size_t CircuitBreakerRegistry::size() const {
    std::shared_lock lock(mutex_);
    return breakers_.size();
}

CircuitBreakerHealth CircuitBreakerRegistry::healthOf(const CircuitBreaker& breaker) const {
    CircuitBreakerHealth h;
    h.service = breaker.key().toString();
    h.metrics = breaker.metrics();
    h.state = h.metrics.state;
    h.status = classifyHealth(h.metrics, configs_.monitoring().alertThreshold);
    h.timestamp = wallClock_();
    return h;
}

} // namespace crr::resilience
