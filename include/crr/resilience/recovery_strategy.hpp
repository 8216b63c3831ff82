#pragma once

/// @file recovery_strategy.hpp
/// @brief Backoff policies used while a breaker is open.

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

#include "crr/foundation/rpc_result.hpp"

namespace crr::resilience {

struct BreakerKey;

enum class RecoveryType : uint8_t {
    Immediate,          ///< Nothing scheduled; the breaker's own probe suffices.
    LinearBackoff,
    ExponentialBackoff,
    Custom              ///< A predicate decides whether to force-close.
};

[[nodiscard]] constexpr std::string_view toString(RecoveryType type) {
    switch (type) {
        case RecoveryType::Immediate:          return "immediate";
        case RecoveryType::LinearBackoff:      return "linear_backoff";
        case RecoveryType::ExponentialBackoff: return "exponential_backoff";
        case RecoveryType::Custom:             return "custom";
    }
    return "unknown";
}

/// Accepts the canonical names plus "linear" and "exponential".
[[nodiscard]] std::optional<RecoveryType> parseRecoveryType(std::string_view name);

/// Asks whether the dependency is back. Returning an error counts as "no".
using RecoveryPredicate = std::function<foundation::RpcResult<bool>(const BreakerKey& key)>;

struct RecoveryStrategy {
    RecoveryType type = RecoveryType::ExponentialBackoff;
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds maxDelay{60000};
    double multiplier = 2.0;
    uint32_t maxAttempts = 5;
    RecoveryPredicate customRecovery;
};

/// Delay before probe number @p attempt (0-based).
///
///   exponential: min(base * multiplier^attempt, max)
///   linear:      min(base + base * attempt, max)
///   immediate:   0
///   custom:      base
[[nodiscard]] std::chrono::milliseconds recoveryDelay(const RecoveryStrategy& strategy,
                                                      uint32_t attempt);

} // namespace crr::resilience
