#pragma once

/// @file circuit_breaker.hpp
/// @brief Per-key circuit breaker with a rolling error-rate window.
///
/// Closed -> Open when, after any counted outcome, the rolling window holds
/// at least volumeThreshold calls and their error rate reaches
/// errorThresholdPercentage.
/// Open -> HalfOpen on the first call after resetTimeout.
/// HalfOpen admits exactly one probe; its outcome closes or re-opens.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "crr/foundation/notifier.hpp"
#include "crr/foundation/task_scheduler.hpp"
#include "crr/foundation/types.hpp"
#include "crr/resilience/circuit_breaker_types.hpp"
#include "crr/resilience/rolling_window.hpp"

namespace crr::resilience {

/// Circuit breaker guarding calls to one BreakerKey.
///
/// @code
///   CircuitBreaker breaker(BreakerKey{"auth-service", OperationType::RpcCall},
///                          CircuitBreakerConfig{.timeout = 2000ms,
///                                               .errorThresholdPercentage = 40,
///                                               .volumeThreshold = 5},
///                          scheduler);
///   auto result = breaker.execute([body] { return transport->send(...); });
///   if (result.rejected) { ... }
/// @endcode
///
/// Thread-safe. State, counters and the rolling window are guarded by one
/// mutex per breaker; the wrapped operation runs outside it on a thread of
/// its own (TaskScheduler::spawn), so calls on the same key are in flight
/// concurrently while their outcomes are applied one at a time, and a hung
/// key never delays calls on another key.
///
/// Transitions are queued under the mutex and delivered to state-change
/// observers after it is released, one delivery at a time and in
/// transition order. Observers may query or reset the breaker.
class CircuitBreaker {
public:
    /// Ticket returned by allowRequest() and handed back with the outcome.
    struct Admission {
        bool allowed = false;
        /// This call is the HalfOpen probe.
        bool probe = false;
        /// Transition count at admission; outcomes from an older epoch
        /// update counters but never the window or the state.
        uint64_t epoch = 0;
        /// Rejected because maxConcurrentCalls calls are still running.
        bool saturated = false;
        /// A concurrency slot was reserved and must be handed to the call.
        bool holdsSlot = false;
    };

    CircuitBreaker(BreakerKey key, CircuitBreakerConfig config,
                   foundation::TaskScheduler& scheduler,
                   foundation::SteadyClockFn clock = foundation::systemSteadyClock(),
                   foundation::WallClockFn wallClock = foundation::systemWallClock());

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /// Run @p operation under the breaker, bounded by config().timeout.
    ///
    /// The operation is copied onto a spawned thread and the timeout starts
    /// when that thread is started. When the timeout wins the race the call
    /// is recorded as a failure and its late result is dropped, so the
    /// operation must own everything it captures.
    ///
    /// @p fallback, when set, replaces config().fallback for this call.
    CircuitBreakerResult execute(const Operation& operation, const FallbackFn& fallback = {});

    /// Decide admission. Rejections are counted here. No concurrency slot
    /// is reserved; execute() does that itself.
    [[nodiscard]] Admission allowRequest();

    void recordSuccess(const Admission& admission, std::chrono::milliseconds latency);

    void recordFailure(const Admission& admission, const RpcError& error,
                       std::chrono::milliseconds latency);

    /// Outcome excluded by the error filter: the callee answered, the
    /// request was at fault. Counts as a completed call only.
    void recordIgnored(const Admission& admission, std::chrono::milliseconds latency);

    /// Open -> HalfOpen if resetTimeout has elapsed. Used by recovery probes.
    /// @return true if the breaker is HalfOpen afterwards.
    bool tryHalfOpen();

    /// Force a state (administrative override). No-op if already in it.
    void forceState(CircuitBreakerState state, std::string reason = "forced");

    /// Zero all counters and return to Closed.
    void reset();

    // ── Queries ──────────────────────────────────────────────────────────

    [[nodiscard]] CircuitBreakerState state() const;
    [[nodiscard]] CircuitBreakerMetrics metrics() const;
    [[nodiscard]] WindowStats windowStats() const;

    /// Calls currently running, including timed-out calls not yet returned.
    [[nodiscard]] uint32_t inFlight() const noexcept { return inFlight_->load(); }
    [[nodiscard]] const BreakerKey& key() const noexcept { return key_; }
    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

    /// Fired on every transition, in transition order.
    [[nodiscard]] foundation::Notifier<const StateChangeEvent&>& stateChanged() noexcept {
        return stateChanged_;
    }

private:
    Admission admit(bool reserveSlot);
    RpcResult<Payload> runBounded(const Operation& operation);
    CircuitBreakerResult rejectedResult(const Admission& admission,
                                        std::chrono::milliseconds elapsed,
                                        const FallbackFn& fallback);
    void deliverEvents();
    void trackLatency(std::chrono::milliseconds latency);
    void tripIfNeeded();
    void transitionTo(CircuitBreakerState next, std::string reason);
    void clearCounters();

    const BreakerKey key_;
    const std::string keyName_;
    const CircuitBreakerConfig config_;
    foundation::TaskScheduler& scheduler_;
    foundation::SteadyClockFn clock_;
    foundation::WallClockFn wallClock_;

    mutable std::mutex mutex_;
    CircuitBreakerState state_{CircuitBreakerState::Closed};
    RollingWindow window_;
    uint64_t epoch_{0};
    uint64_t sequence_{0};
    bool probeInFlight_{false};
    foundation::SteadyTime openedAt_{};
    foundation::WallTime lastStateChange_{};

    uint64_t requests_{0};
    uint64_t successes_{0};
    uint64_t failures_{0};
    uint64_t rejections_{0};
    uint64_t completed_{0};
    double averageLatency_{0.0};
    std::optional<std::string> lastError_;

    std::vector<StateChangeEvent> pendingEvents_;
    bool delivering_{false};

    /// Shared with spawned calls, which release their slot on return.
    std::shared_ptr<std::atomic<uint32_t>> inFlight_ =
        std::make_shared<std::atomic<uint32_t>>(0);

    foundation::Notifier<const StateChangeEvent&> stateChanged_;
};

} // namespace crr::resilience
