#pragma once

/// @file circuit_breaker_registry.hpp
/// @brief Lazily created breakers keyed by (service, operation).

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "crr/foundation/notifier.hpp"
#include "crr/foundation/task_scheduler.hpp"
#include "crr/foundation/types.hpp"
#include "crr/resilience/breaker_config.hpp"
#include "crr/resilience/circuit_breaker.hpp"

namespace crr::resilience {

/// Configuration, state and counters of one breaker for the debug dump.
struct BreakerDebugInfo {
    std::string key;
    CircuitBreakerConfig config;
    CircuitBreakerMetrics metrics;
    WindowStats window;
};

/// Owns every breaker of the process.
///
/// Breakers are created on first use with the configuration merged for
/// their key (caller overrides only matter for that first call) and live
/// until the registry is destroyed. The map is guarded by a shared_mutex
/// held only for lookups and inserts; each breaker has its own lock, so
/// a snapshot pass never blocks calls for its whole duration.
///
/// Every breaker's transitions are forwarded to stateChanges().
class CircuitBreakerRegistry {
public:
    CircuitBreakerRegistry(const BreakerConfigProvider& configs,
                           foundation::TaskScheduler& scheduler,
                           foundation::SteadyClockFn clock = foundation::systemSteadyClock(),
                           foundation::WallClockFn wallClock = foundation::systemWallClock());
    ~CircuitBreakerRegistry();

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    /// Existing breaker for @p key, or a new one.
    std::shared_ptr<CircuitBreaker> getOrCreate(const BreakerKey& key,
                                                const CircuitBreakerOverrides& overrides = {});

    /// Run @p operation under the breaker for @p key. The fallback in
    /// @p overrides applies to this call even when the breaker exists.
    CircuitBreakerResult execute(const BreakerKey& key, const Operation& operation,
                                 const CircuitBreakerOverrides& overrides = {});

    [[nodiscard]] std::shared_ptr<CircuitBreaker> find(const BreakerKey& key) const;

    [[nodiscard]] std::optional<CircuitBreakerMetrics> metrics(const BreakerKey& key) const;

    [[nodiscard]] std::optional<CircuitBreakerHealth> health(const BreakerKey& key) const;

    /// Health of every breaker keyed by "service[:operation]".
    [[nodiscard]] std::map<std::string, CircuitBreakerHealth> allHealth() const;

    /// Copy of the breaker list, sorted by key string.
    [[nodiscard]] std::vector<std::shared_ptr<CircuitBreaker>> breakers() const;

    /// Reset one breaker. @return false if it does not exist.
    bool reset(const BreakerKey& key);

    /// Reset every breaker of @p service, whatever its operation.
    /// @return Number of breakers reset.
    std::size_t resetService(std::string_view service);

    [[nodiscard]] std::vector<BreakerDebugInfo> debugInfo() const;

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] const BreakerConfigProvider& configs() const noexcept { return configs_; }

    [[nodiscard]] foundation::Notifier<const StateChangeEvent&>& stateChanges() noexcept {
        return stateChanges_;
    }

private:
    [[nodiscard]] CircuitBreakerHealth healthOf(const CircuitBreaker& breaker) const;

    const BreakerConfigProvider& configs_;
    foundation::TaskScheduler& scheduler_;
    foundation::SteadyClockFn clock_;
    foundation::WallClockFn wallClock_;

    foundation::Notifier<const StateChangeEvent&> stateChanges_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<BreakerKey, std::shared_ptr<CircuitBreaker>> breakers_;
    // Forwarding from each breaker; released before stateChanges_ goes away.
    std::vector<foundation::Notifier<const StateChangeEvent&>::Subscription> forwarders_;
};

} // namespace crr::resilience
