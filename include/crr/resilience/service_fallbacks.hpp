#pragma once

/// @file service_fallbacks.hpp
/// @brief Per-service substitutes for rejected or failed broker calls.

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "crr/foundation/types.hpp"
#include "crr/resilience/circuit_breaker_types.hpp"
#include "crr/resilience/timeout_resolver.hpp"

namespace crr::resilience {

/// Builds the fallback for one dispatched call.
///
/// | Call                      | Fallback result                                     |
/// |---------------------------|-----------------------------------------------------|
/// | health_check              | `{"status":"unhealthy",...}` for the service        |
/// | non-critical service      | last cached reply for the routing key, else default |
/// | critical/standard service | ServiceUnavailable "... temporarily unavailable"    |
///
/// Successful replies of non-critical services are cached per routing key
/// through remember().
class ServiceFallbacks {
public:
    static constexpr std::string_view kDefaultNonCriticalReply =
        R"({"message":"Monitoring data temporarily unavailable"})";

    explicit ServiceFallbacks(const TimeoutResolver& timeouts,
                              foundation::WallClockFn wallClock = foundation::systemWallClock());

    /// Fallback for a request to @p service on @p routingKey.
    [[nodiscard]] FallbackFn forRequest(const std::string& service, OperationType operation,
                                        const std::string& routingKey);

    /// Fallback for a publish: logs and drops the event.
    [[nodiscard]] FallbackFn forPublish(const std::string& service,
                                        const std::string& routingKey) const;

    /// Keep @p reply as the substitute for @p routingKey when @p service
    /// is non-critical. Other services are ignored.
    void remember(const std::string& service, const std::string& routingKey, const Payload& reply);

    [[nodiscard]] std::optional<Payload> cached(const std::string& routingKey) const;

    /// Message of the ServiceUnavailable error raised for @p service.
    [[nodiscard]] static std::string unavailableMessage(std::string_view service);

    /// Synthetic health reply for @p service.
    [[nodiscard]] std::string unhealthyReply(std::string_view service) const;

private:
    const TimeoutResolver& timeouts_;
    foundation::WallClockFn wallClock_;

    mutable std::mutex mutex_;
    std::map<std::string, Payload> cache_;
};

} // namespace crr::resilience
