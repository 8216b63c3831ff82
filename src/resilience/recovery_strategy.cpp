/// @file recovery_strategy.cpp
/// @brief Backoff delay formulas.

#include "crr/resilience/recovery_strategy.hpp"

#include <algorithm>
#include <cmath>

namespace crr::resilience {

std::optional<RecoveryType> parseRecoveryType(std::string_view name) {
    if (name == "immediate") return RecoveryType::Immediate;
    if (name == "linear_backoff" || name == "linear") return RecoveryType::LinearBackoff;
    if (name == "exponential_backoff" || name == "exponential") {
        return RecoveryType::ExponentialBackoff;
    }
    if (name == "custom") return RecoveryType::Custom;
    return std::nullopt;
}

std::chrono::milliseconds recoveryDelay(const RecoveryStrategy& strategy, uint32_t attempt) {
    auto base = static_cast<double>(strategy.baseDelay.count());
    auto cap = static_cast<double>(strategy.maxDelay.count());
    double delay = base;

    switch (strategy.type) {
        case RecoveryType::ExponentialBackoff:
            // multiplier < 1 is treated as 1
            delay = base * std::pow(std::max(1.0, strategy.multiplier), attempt);
            break;
        case RecoveryType::LinearBackoff:
            delay = base + base * static_cast<double>(attempt);
            break;
        case RecoveryType::Immediate:
            return std::chrono::milliseconds{0};
        case RecoveryType::Custom:
            break;
    }
    return std::chrono::milliseconds{
        static_cast<std::chrono::milliseconds::rep>(std::min(delay, cap))};
}

} // namespace crr::resilience
