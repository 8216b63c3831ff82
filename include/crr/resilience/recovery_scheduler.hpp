#pragma once

/// @file recovery_scheduler.hpp
/// @brief Backoff-driven recovery probes for open breakers.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "crr/foundation/notifier.hpp"
#include "crr/foundation/task_scheduler.hpp"
#include "crr/resilience/circuit_breaker_registry.hpp"
#include "crr/resilience/recovery_strategy.hpp"

namespace crr::resilience {

/// Starts a recovery sequence whenever a breaker opens.
///
/// Each sequence schedules at most maxAttempts timers, one at a time, with
/// delays from recoveryDelay(). When a timer fires:
///   - custom strategies ask their predicate and force-close on "yes";
///   - other strategies move the breaker to HalfOpen once its reset
///     timeout has elapsed, leaving the verdict to the next live call.
/// A sequence continues only while the breaker stays Open. Closing a
/// breaker cancels its timers at once; re-opening replaces the sequence.
///
/// Timers are tracked per key and attempt ("auth-service:rpc_call-2"), so
/// two sequences never hold timers for the same key.
class RecoveryScheduler {
public:
    RecoveryScheduler(CircuitBreakerRegistry& registry, foundation::TaskScheduler& scheduler);

    /// Cancels every pending timer.
    ~RecoveryScheduler();

    RecoveryScheduler(const RecoveryScheduler&) = delete;
    RecoveryScheduler& operator=(const RecoveryScheduler&) = delete;

    /// Entry point for state-change notifications.
    void onStateChange(const StateChangeEvent& event);

    /// Attempts fired in the current sequence of @p key.
    [[nodiscard]] uint32_t attempts(const BreakerKey& key) const;

    /// True while a sequence for @p key still has a timer pending.
    [[nodiscard]] bool isRecovering(const BreakerKey& key) const;

    /// Pending timers as "key-attempt" strings, sorted.
    [[nodiscard]] std::vector<std::string> pendingTimers() const;

private:
    struct Sequence {
        uint64_t generation = 0;
        uint32_t attempt = 0;
        RecoveryStrategy strategy;
        /// attempt -> timer
        std::map<uint32_t, foundation::TaskScheduler::TimerId> timers;
    };

    /// Held by timer callbacks while they run; cleared on destruction.
    struct Guard {
        std::mutex mutex;
        bool alive = true;
    };

    void scheduleNextLocked(const BreakerKey& key, Sequence& sequence);
    void runAttempt(const BreakerKey& key, uint64_t generation, uint32_t attempt);
    void cancelLocked(Sequence& sequence);

    CircuitBreakerRegistry& registry_;
    foundation::TaskScheduler& scheduler_;
    std::shared_ptr<Guard> guard_;

    mutable std::mutex mutex_;
    std::unordered_map<BreakerKey, Sequence> sequences_;
    uint64_t nextGeneration_{1};

    foundation::Notifier<const StateChangeEvent&>::Subscription subscription_;
};

} // namespace crr::resilience
