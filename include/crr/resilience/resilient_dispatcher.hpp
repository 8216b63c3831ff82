#pragma once

/// @file resilient_dispatcher.hpp
/// @brief Breaker-protected request, publish and health-check entry points.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "crr/foundation/rpc_result.hpp"
#include "crr/foundation/types.hpp"
#include "crr/resilience/circuit_breaker_registry.hpp"
#include "crr/resilience/message_transport.hpp"
#include "crr/resilience/service_fallbacks.hpp"
#include "crr/resilience/timeout_resolver.hpp"

namespace crr::resilience {

struct RequestOptions {
    std::string exchange;
    std::string routingKey;
    Payload payload;
    /// Defaults to the routing key's first segment ("auth.login" -> "auth-service").
    std::optional<std::string> serviceName;
    /// Defaults to OperationType::RpcCall.
    std::optional<OperationType> operation;
    /// Explicit timeout; wins over every configured value.
    std::optional<std::chrono::milliseconds> timeout;
};

struct PublishOptions {
    std::string exchange;
    std::string routingKey;
    Payload payload;
    std::optional<std::string> serviceName;
};

/// Reply of a protected request plus what the resilience layer did.
struct DispatchResponse {
    Payload data;
    std::chrono::milliseconds timeout{0};
    std::chrono::milliseconds actualDuration{0};
    /// Diagnostic only: the call timed out, or failed after 90 % of its timeout.
    bool timedOut = false;
    std::string serviceName;
    OperationType operation = OperationType::RpcCall;
    TimeoutSource timeoutSource = TimeoutSource::GlobalDefault;
    CircuitBreakerState circuitState = CircuitBreakerState::Closed;
    bool fromFallback = false;
    CircuitBreakerResult breakerResult;
};

/// Context attached to errors returned by request() and publish().
///
/// @code
///   auto reply = dispatcher.request(options);
///   if (!reply) {
///       if (auto* failure = reply.error().context<DispatchFailure>()) {
///           log(failure->breakerResult.circuitState);
///       }
///   }
/// @endcode
struct DispatchFailure {
    std::string serviceName;
    std::string routingKey;
    CircuitBreakerResult breakerResult;
};

/// Sends broker traffic through per-key circuit breakers.
///
/// Each request resolves its timeout, runs under the breaker for
/// (service, operation) with a fallback chosen by ServiceFallbacks and
/// reports the outcome. An error is returned only when no fallback
/// produced a value; caller errors come back unmodified, every other
/// error carries a DispatchFailure context.
class ResilientDispatcher {
public:
    static constexpr std::string_view kCommandsExchange = "capsule.commands";
    static constexpr std::chrono::milliseconds kPublishTimeout{5000};
    static constexpr uint32_t kPublishVolumeThreshold = 5;

    ResilientDispatcher(std::shared_ptr<IMessageTransport> transport,
                        CircuitBreakerRegistry& registry,
                        const TimeoutResolver& timeouts,
                        ServiceFallbacks& fallbacks,
                        foundation::SteadyClockFn clock = foundation::systemSteadyClock());

    ResilientDispatcher(const ResilientDispatcher&) = delete;
    ResilientDispatcher& operator=(const ResilientDispatcher&) = delete;

    foundation::RpcResult<DispatchResponse> request(const RequestOptions& options);

    /// Best effort: a failed publish is logged and dropped by its fallback,
    /// so an error comes back only when the breaker had no way to substitute.
    foundation::RpcResult<void> publish(const PublishOptions& options);

    /// Request on kCommandsExchange with OperationType::HealthCheck and an
    /// empty JSON body.
    foundation::RpcResult<DispatchResponse> healthCheck(std::string_view service,
                                                        std::string_view routingKey);

    [[nodiscard]] TimeoutResolution resolveTimeout(
        std::string_view service, std::optional<OperationType> operation = std::nullopt) const;

    /// "auth.register" -> "auth-service"; empty keys give "unknown-service".
    [[nodiscard]] static std::string serviceFromRoutingKey(std::string_view routingKey);

private:
    std::shared_ptr<IMessageTransport> transport_;
    CircuitBreakerRegistry& registry_;
    const TimeoutResolver& timeouts_;
    ServiceFallbacks& fallbacks_;
    foundation::SteadyClockFn clock_;
};

} // namespace crr::resilience
