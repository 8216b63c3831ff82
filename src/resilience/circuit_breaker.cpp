/// @file circuit_breaker.cpp
/// @brief CircuitBreaker state machine and bounded execution.

#include "crr/resilience/circuit_breaker.hpp"

#include <exception>
#include <future>
#include <memory>

#include "crr/foundation/resilience_logger.hpp"

namespace crr::resilience {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ResilienceLogger;
using foundation::toMillis;

namespace {

RpcResult<Payload> invokeGuarded(const Operation& operation) {
    try {
        return operation();
    } catch (const std::exception& e) {
        return RpcResult<Payload>::err(
            RpcError(ErrorCode::TransportError, std::string("operation threw: ") + e.what()));
    } catch (...) {
        return RpcResult<Payload>::err(
            RpcError(ErrorCode::TransportError, "operation threw a non-standard exception"));
    }
}

} // namespace

CircuitBreaker::CircuitBreaker(BreakerKey key, CircuitBreakerConfig config,
                               foundation::TaskScheduler& scheduler,
                               foundation::SteadyClockFn clock,
                               foundation::WallClockFn wallClock)
    : key_(std::move(key)),
      keyName_(key_.toString()),
      config_(std::move(config)),
      scheduler_(scheduler),
      clock_(std::move(clock)),
      wallClock_(std::move(wallClock)),
      window_(config_.rollingCountTimeout, config_.rollingCountBuckets, clock_),
      lastStateChange_(wallClock_()) {}

// ── Execution ───────────────────────────────────────────────────────────────

CircuitBreakerResult CircuitBreaker::execute(const Operation& operation,
                                             const FallbackFn& fallback) {
    const auto& substituteFn = fallback ? fallback : config_.fallback;
    auto started = clock_();
    auto admission = admit(true);
    if (!admission.allowed) {
        return rejectedResult(admission, toMillis(clock_() - started), substituteFn);
    }

    auto outcome = runBounded(operation);
    auto latency = toMillis(clock_() - started);

    CircuitBreakerResult result;
    result.executionTime = latency;

    if (outcome) {
        recordSuccess(admission, latency);
        result.success = true;
        result.data = std::move(outcome).value();
        result.circuitState = state();
        return result;
    }

    auto error = outcome.error();
    result.timedOut = error.code() == ErrorCode::Timeout;
    bool counts = config_.errorFilter ? config_.errorFilter(error) : countsAsFailure(error);
    if (!counts) {
        recordIgnored(admission, latency);
        result.error = std::move(error);
        result.circuitState = state();
        return result;
    }

    recordFailure(admission, error, latency);
    result.circuitState = state();

    if (!substituteFn) {
        result.error = std::move(error);
        return result;
    }

    auto substitute = substituteFn(error);
    if (substitute) {
        CRR_LOG_INFO(LogCategory::Breaker, keyName_ + " call failed, fallback served");
        result.success = true;
        result.fromFallback = true;
        result.data = std::move(substitute).value();
    } else {
        result.error = substitute.error();
    }
    return result;
}

RpcResult<Payload> CircuitBreaker::runBounded(const Operation& operation) {
    auto promise = std::make_shared<std::promise<RpcResult<Payload>>>();
    auto future = promise->get_future();

    // The slot reserved at admission travels with the call.
    auto spawned = scheduler_.spawn([operation, promise, slot = inFlight_] {
        promise->set_value(invokeGuarded(operation));
        slot->fetch_sub(1, std::memory_order_acq_rel);
    });
    if (!spawned) {
        inFlight_->fetch_sub(1, std::memory_order_acq_rel);
        return RpcResult<Payload>::err(spawned.error());
    }

    if (future.wait_for(config_.timeout) != std::future_status::ready) {
        // The spawned thread still owns the promise; its value is never read.
        return RpcResult<Payload>::err(
            RpcError(ErrorCode::Timeout,
                     keyName_ + " timed out after " + std::to_string(config_.timeout.count()) +
                         "ms"));
    }
    return future.get();
}

CircuitBreakerResult CircuitBreaker::rejectedResult(const Admission& admission,
                                                    std::chrono::milliseconds elapsed,
                                                    const FallbackFn& fallback) {
    CircuitBreakerResult result;
    result.rejected = true;
    result.executionTime = elapsed;
    result.circuitState = state();

    RpcError cause(ErrorCode::ServiceUnavailable,
                   admission.saturated
                       ? "circuit breaker for " + keyName_ + " has " +
                             std::to_string(config_.maxConcurrentCalls) + " calls in flight"
                       : "circuit breaker for " + keyName_ + " is " +
                             std::string(toString(result.circuitState)));
    CRR_LOG_DEBUG(LogCategory::Breaker, "rejected call: " + std::string(cause.message()));

    if (!fallback) {
        result.error = std::move(cause);
        return result;
    }
    auto substitute = fallback(cause);
    if (substitute) {
        result.success = true;
        result.fromFallback = true;
        result.data = std::move(substitute).value();
    } else {
        result.error = substitute.error();
    }
    return result;
}

// ── Admission and outcomes ──────────────────────────────────────────────────

CircuitBreaker::Admission CircuitBreaker::allowRequest() {
    return admit(false);
}

CircuitBreaker::Admission CircuitBreaker::admit(bool reserveSlot) {
    Admission admission;
    {
        std::lock_guard lock(mutex_);
        ++requests_;

        bool saturated = reserveSlot && config_.maxConcurrentCalls > 0 &&
                         inFlight_->load(std::memory_order_acquire) >= config_.maxConcurrentCalls;
        switch (state_) {
            case CircuitBreakerState::Closed:
                admission.allowed = !saturated;
                admission.saturated = saturated;
                break;

            case CircuitBreakerState::Open:
                if (clock_() - openedAt_ >= config_.resetTimeout) {
                    if (saturated) {
                        admission.saturated = true;
                        break;
                    }
                    transitionTo(CircuitBreakerState::HalfOpen, "reset timeout elapsed");
                    probeInFlight_ = true;
                    admission.allowed = true;
                    admission.probe = true;
                }
                break;

            case CircuitBreakerState::HalfOpen:
                if (!probeInFlight_) {
                    if (saturated) {
                        admission.saturated = true;
                        break;
                    }
                    probeInFlight_ = true;
                    admission.allowed = true;
                    admission.probe = true;
                }
                break;
        }
        admission.epoch = epoch_;

        if (!admission.allowed) {
            ++rejections_;
        } else if (reserveSlot) {
            inFlight_->fetch_add(1, std::memory_order_acq_rel);
            admission.holdsSlot = true;
        }
    }
    deliverEvents();
    return admission;
}

void CircuitBreaker::recordSuccess(const Admission& admission,
                                   std::chrono::milliseconds latency) {
    {
        std::lock_guard lock(mutex_);
        ++successes_;
        trackLatency(latency);

        if (admission.epoch == epoch_) {
            if (admission.probe && state_ == CircuitBreakerState::HalfOpen) {
                transitionTo(CircuitBreakerState::Closed, "probe succeeded");
            } else if (state_ == CircuitBreakerState::Closed) {
                window_.recordSuccess();
                tripIfNeeded();
            }
        }
    }
    deliverEvents();
}

void CircuitBreaker::recordFailure(const Admission& admission, const RpcError& error,
                                   std::chrono::milliseconds latency) {
    {
        std::lock_guard lock(mutex_);
        ++failures_;
        trackLatency(latency);
        lastError_ = std::string(error.message());

        LogContext ctx;
        ctx.breakerKey = keyName_;
        ctx.extra["code"] = std::string(error.subsystem());
        ctx.extra["latency_ms"] = std::to_string(latency.count());
        ResilienceLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Breaker,
                                                    "call failed: " + *lastError_, ctx);

        if (admission.epoch == epoch_) {
            if (admission.probe && state_ == CircuitBreakerState::HalfOpen) {
                transitionTo(CircuitBreakerState::Open, "probe failed");
            } else if (state_ == CircuitBreakerState::Closed) {
                window_.recordFailure();
                tripIfNeeded();
            }
        }
    }
    deliverEvents();
}

void CircuitBreaker::recordIgnored(const Admission& admission,
                                   std::chrono::milliseconds latency) {
    {
        std::lock_guard lock(mutex_);
        trackLatency(latency);

        if (admission.epoch == epoch_ && admission.probe &&
            state_ == CircuitBreakerState::HalfOpen) {
            transitionTo(CircuitBreakerState::Closed, "probe answered with a caller error");
        }
    }
    deliverEvents();
}

bool CircuitBreaker::tryHalfOpen() {
    bool halfOpen = false;
    {
        std::lock_guard lock(mutex_);
        if (state_ == CircuitBreakerState::Open &&
            clock_() - openedAt_ >= config_.resetTimeout) {
            transitionTo(CircuitBreakerState::HalfOpen, "recovery probe");
        }
        halfOpen = state_ == CircuitBreakerState::HalfOpen;
    }
    deliverEvents();
    return halfOpen;
}

void CircuitBreaker::forceState(CircuitBreakerState next, std::string reason) {
    {
        std::lock_guard lock(mutex_);
        transitionTo(next, std::move(reason));
    }
    deliverEvents();
}

void CircuitBreaker::reset() {
    {
        std::lock_guard lock(mutex_);
        transitionTo(CircuitBreakerState::Closed, "manual reset");
        clearCounters();
    }
    deliverEvents();
}

// ── Queries ─────────────────────────────────────────────────────────────────

CircuitBreakerState CircuitBreaker::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

CircuitBreakerMetrics CircuitBreaker::metrics() const {
    std::lock_guard lock(mutex_);
    CircuitBreakerMetrics m;
    m.state = state_;
    m.requestCount = requests_;
    m.successCount = successes_;
    m.failureCount = failures_;
    m.rejectionCount = rejections_;
    m.errorPercentage = errorPercentageOf(failures_, successes_);
    m.averageResponseTime = averageLatency_;
    m.lastStateChange = lastStateChange_;
    m.lastError = lastError_;
    if (state_ == CircuitBreakerState::Open) {
        auto remaining = config_.resetTimeout - toMillis(clock_() - openedAt_);
        m.timeToReset = remaining.count() > 0 ? remaining : std::chrono::milliseconds{0};
    }
    return m;
}

WindowStats CircuitBreaker::windowStats() const {
    std::lock_guard lock(mutex_);
    return window_.stats();
}

// ── Internals (mutex_ held) ─────────────────────────────────────────────────

void CircuitBreaker::trackLatency(std::chrono::milliseconds latency) {
    ++completed_;
    auto n = static_cast<double>(completed_);
    averageLatency_ = (averageLatency_ * (n - 1.0) + static_cast<double>(latency.count())) / n;
}

void CircuitBreaker::tripIfNeeded() {
    if (!config_.enabled) {
        return;
    }
    auto stats = window_.stats();
    if (stats.total() >= config_.volumeThreshold &&
        stats.errorPercentage() >= config_.errorThresholdPercentage) {
        transitionTo(CircuitBreakerState::Open,
                     "error rate " + std::to_string(static_cast<int>(stats.errorPercentage())) +
                         "% over " + std::to_string(stats.total()) + " calls");
    }
}

void CircuitBreaker::transitionTo(CircuitBreakerState next, std::string reason) {
    if (next == state_) {
        return;
    }
    auto previous = state_;
    state_ = next;
    ++epoch_;
    probeInFlight_ = false;
    lastStateChange_ = wallClock_();

    switch (next) {
        case CircuitBreakerState::Open:
            openedAt_ = clock_();
            break;
        case CircuitBreakerState::Closed:
            clearCounters();
            break;
        case CircuitBreakerState::HalfOpen:
            break;
    }

    LogContext ctx;
    ctx.breakerKey = keyName_;
    ctx.extra["from"] = std::string(toString(previous));
    ctx.extra["to"] = std::string(toString(next));
    ctx.extra["reason"] = reason;
    ResilienceLogger::instance().logWithContext(
        next == CircuitBreakerState::Open ? LogLevel::Warning : LogLevel::Info,
        LogCategory::Breaker, "state transition", ctx);

    pendingEvents_.push_back(StateChangeEvent{key_, previous, next, lastStateChange_,
                                              ++sequence_, std::move(reason)});
}

void CircuitBreaker::clearCounters() {
    window_.clear();
    requests_ = 0;
    successes_ = 0;
    failures_ = 0;
    rejections_ = 0;
    completed_ = 0;
    averageLatency_ = 0.0;
    lastError_.reset();
}

// ── Delivery ────────────────────────────────────────────────────────────────

void CircuitBreaker::deliverEvents() {
    std::unique_lock lock(mutex_);
    if (delivering_) {
        return; // the delivering thread drains what was just queued
    }
    delivering_ = true;
    while (!pendingEvents_.empty()) {
        std::vector<StateChangeEvent> batch;
        batch.swap(pendingEvents_);
        lock.unlock();
        for (const auto& event : batch) {
            try {
                stateChanged_.notify(event);
            } catch (const std::exception& e) {
                CRR_LOG_ERROR(LogCategory::Breaker,
                              keyName_ + " state-change observer threw: " + e.what());
            }
        }
        lock.lock();
    }
    delivering_ = false;
}

} // namespace crr::resilience
