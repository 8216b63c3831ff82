#pragma once

/// @file health_classifier.hpp
/// @brief Health status as a pure function of breaker state and error rate.

#include "crr/resilience/circuit_breaker_types.hpp"

namespace crr::resilience {

/// Open -> unhealthy; HalfOpen -> degraded; Closed above @p alertThreshold
/// -> degraded; otherwise healthy.
[[nodiscard]] constexpr HealthStatus classifyHealth(CircuitBreakerState state,
                                                    double errorPercentage,
                                                    double alertThreshold) noexcept {
    switch (state) {
        case CircuitBreakerState::Open:
            return HealthStatus::Unhealthy;
        case CircuitBreakerState::HalfOpen:
            return HealthStatus::Degraded;
        case CircuitBreakerState::Closed:
            break;
    }
    return errorPercentage > alertThreshold ? HealthStatus::Degraded : HealthStatus::Healthy;
}

[[nodiscard]] constexpr HealthStatus classifyHealth(const CircuitBreakerMetrics& metrics,
                                                    double alertThreshold) noexcept {
    return classifyHealth(metrics.state, metrics.errorPercentage, alertThreshold);
}

} // namespace crr::resilience
