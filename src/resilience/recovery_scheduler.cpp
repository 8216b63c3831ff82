/// @file recovery_scheduler.cpp
/// @brief Recovery sequences and their cancellable timers.

#include "crr/resilience/recovery_scheduler.hpp"

#include <algorithm>
#include <exception>

#include "crr/foundation/resilience_logger.hpp"

namespace crr::resilience {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ResilienceLogger;

namespace {

foundation::RpcResult<bool> askPredicate(const RecoveryStrategy& strategy, const BreakerKey& key) {
    try {
        return strategy.customRecovery(key);
    } catch (const std::exception& e) {
        return foundation::RpcResult<bool>::err(
            RpcError(ErrorCode::RecoveryFailed, std::string("recovery predicate threw: ") + e.what()));
    }
}

} // namespace

RecoveryScheduler::RecoveryScheduler(CircuitBreakerRegistry& registry,
                                     foundation::TaskScheduler& scheduler)
    : registry_(registry),
      scheduler_(scheduler),
      guard_(std::make_shared<Guard>()),
      subscription_(registry.stateChanges().scopedSubscribe(
          [this](const StateChangeEvent& event) { onStateChange(event); })) {}

RecoveryScheduler::~RecoveryScheduler() {
    subscription_.reset();
    {
        std::lock_guard guard(guard_->mutex);
        guard_->alive = false;
    }
    std::lock_guard lock(mutex_);
    for (auto& [key, sequence] : sequences_) {
        cancelLocked(sequence);
    }
}

void RecoveryScheduler::onStateChange(const StateChangeEvent& event) {
    std::lock_guard lock(mutex_);

    if (event.to == CircuitBreakerState::Closed) {
        if (auto it = sequences_.find(event.key); it != sequences_.end()) {
            cancelLocked(it->second);
            sequences_.erase(it);
        }
        return;
    }
    if (event.to != CircuitBreakerState::Open) {
        return;
    }

    auto strategy = registry_.configs().recoveryStrategy(event.key.service);
    if (strategy.type == RecoveryType::Immediate) {
        CRR_LOG_DEBUG(LogCategory::Recovery,
                      event.key.toString() + " uses immediate recovery; nothing scheduled");
        return;
    }

    auto& sequence = sequences_[event.key];
    cancelLocked(sequence);
    sequence = Sequence{nextGeneration_++, 0, std::move(strategy), {}};
    scheduleNextLocked(event.key, sequence);
}

void RecoveryScheduler::scheduleNextLocked(const BreakerKey& key, Sequence& sequence) {
    if (sequence.attempt >= sequence.strategy.maxAttempts) {
        LogContext ctx;
        ctx.breakerKey = key.toString();
        ctx.extra["attempts"] = std::to_string(sequence.attempt);
        ResilienceLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Recovery, "max recovery attempts reached", ctx);
        return;
    }

    auto attempt = sequence.attempt;
    auto delay = recoveryDelay(sequence.strategy, attempt);
    auto timer = scheduler_.scheduleDelayed(
        delay,
        [this, guard = guard_, key, generation = sequence.generation, attempt] {
            std::lock_guard alive(guard->mutex);
            if (guard->alive) {
                runAttempt(key, generation, attempt);
            }
        });
    if (!timer) {
        CRR_LOG_ERROR(LogCategory::Recovery,
                      "could not schedule recovery for " + key.toString() + ": " +
                          std::string(timer.error().message()));
        return;
    }
    sequence.timers[attempt] = timer.value();
    CRR_LOG_DEBUG(LogCategory::Recovery,
                  key.toString() + " recovery attempt " + std::to_string(attempt + 1) + " in " +
                      std::to_string(delay.count()) + "ms");
}

void RecoveryScheduler::runAttempt(const BreakerKey& key, uint64_t generation, uint32_t attempt) {
    RecoveryStrategy strategy;
    {
        std::lock_guard lock(mutex_);
        auto it = sequences_.find(key);
        if (it == sequences_.end() || it->second.generation != generation) {
            return;
        }
        it->second.timers.erase(attempt);
        it->second.attempt = attempt + 1;
        strategy = it->second.strategy;
    }

    auto breaker = registry_.find(key);
    if (!breaker) {
        return;
    }

    LogContext ctx;
    ctx.breakerKey = key.toString();
    ctx.extra["attempt"] = std::to_string(attempt + 1);
    ctx.extra["strategy"] = std::string(toString(strategy.type));
    ResilienceLogger::instance().logWithContext(LogLevel::Info, LogCategory::Recovery,
                                                "recovery attempt", ctx);

    // No scheduler lock below: closing the breaker re-enters onStateChange.
    if (strategy.type == RecoveryType::Custom && strategy.customRecovery) {
        auto verdict = askPredicate(strategy, key);
        if (verdict && verdict.value()) {
            breaker->reset();
            return;
        }
        if (!verdict) {
            CRR_LOG_WARN(LogCategory::Recovery,
                         key.toString() + " custom recovery failed: " +
                             std::string(verdict.error().message()));
        }
    } else {
        breaker->tryHalfOpen();
    }

    if (breaker->state() != CircuitBreakerState::Open) {
        return;
    }
    std::lock_guard lock(mutex_);
    auto it = sequences_.find(key);
    if (it != sequences_.end() && it->second.generation == generation) {
        scheduleNextLocked(key, it->second);
    }
}

void RecoveryScheduler::cancelLocked(Sequence& sequence) {
    for (const auto& [attempt, timer] : sequence.timers) {
        auto cancelled = scheduler_.cancel(timer);
        if (!cancelled && cancelled.error().code() != ErrorCode::TimerNotFound) {
            CRR_LOG_WARN(LogCategory::Recovery, std::string(cancelled.error().message()));
        }
    }
    sequence.timers.clear();
}

uint32_t RecoveryScheduler::attempts(const BreakerKey& key) const {
    std::lock_guard lock(mutex_);
    auto it = sequences_.find(key);
    return it != sequences_.end() ? it->second.attempt : 0;
}

bool RecoveryScheduler::isRecovering(const BreakerKey& key) const {
    std::lock_guard lock(mutex_);
    auto it = sequences_.find(key);
    return it != sequences_.end() && !it->second.timers.empty();
}

std::vector<std::string> RecoveryScheduler::pendingTimers() const {
    std::vector<std::string> out;
    std::lock_guard lock(mutex_);
    for (const auto& [key, sequence] : sequences_) {
        for (const auto& [attempt, timer] : sequence.timers) {
            out.push_back(key.toString() + "-" + std::to_string(attempt));
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace crr::resilience
