/// @file resilient_dispatcher.cpp
/// @brief Timeout resolution, breaker execution and outcome reporting per call.

#include "crr/resilience/resilient_dispatcher.hpp"

#include "crr/foundation/resilience_logger.hpp"

namespace crr::resilience {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ResilienceLogger;
using foundation::toMillis;

namespace {

RpcError annotate(const RpcError& error, const std::string& service, const std::string& routingKey,
                  const CircuitBreakerResult& result) {
    if (error.isCallerError()) {
        return error;
    }
    return error.withContext(DispatchFailure{service, routingKey, result});
}

} // namespace

ResilientDispatcher::ResilientDispatcher(std::shared_ptr<IMessageTransport> transport,
                                         CircuitBreakerRegistry& registry,
                                         const TimeoutResolver& timeouts,
                                         ServiceFallbacks& fallbacks,
                                         foundation::SteadyClockFn clock)
    : transport_(std::move(transport)),
      registry_(registry),
      timeouts_(timeouts),
      fallbacks_(fallbacks),
      clock_(std::move(clock)) {}

std::string ResilientDispatcher::serviceFromRoutingKey(std::string_view routingKey) {
    auto service = normalizeServiceName(routingKey);
    return service.empty() ? std::string("unknown-service") : service;
}

TimeoutResolution ResilientDispatcher::resolveTimeout(std::string_view service,
                                                      std::optional<OperationType> operation) const {
    return timeouts_.resolve(service, operation);
}

// ── Request ─────────────────────────────────────────────────────────────────

foundation::RpcResult<DispatchResponse> ResilientDispatcher::request(const RequestOptions& options) {
    using Result = foundation::RpcResult<DispatchResponse>;

    auto started = clock_();
    auto operation = options.operation.value_or(OperationType::RpcCall);
    auto service = options.serviceName ? normalizeServiceName(*options.serviceName)
                                       : serviceFromRoutingKey(options.routingKey);
    auto resolution = timeouts_.resolve(service, operation, options.timeout);
    auto timeout = resolution.timeout;
    BreakerKey key{service, operation};

    LogContext ctx;
    ctx.breakerKey = key.toString();
    ctx.service = service;
    ctx.correlationId = foundation::generateCorrelationId();
    ctx.extra["routing_key"] = options.routingKey;
    ctx.extra["timeout_ms"] = std::to_string(timeout.count());
    ctx.extra["timeout_source"] = std::string(toString(resolution.source));
    ctx.extra["tier"] = std::string(toString(resolution.tier));
    ctx.extra["scaled"] = resolution.scaled ? "true" : "false";
    ResilienceLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Dispatch,
                                                "protected request", ctx);

    CircuitBreakerOverrides overrides;
    overrides.timeout = timeout;
    overrides.fallback = fallbacks_.forRequest(service, operation, options.routingKey);

    auto call = [transport = transport_, exchange = options.exchange,
                 routingKey = options.routingKey, payload = options.payload, timeout] {
        return transport->send(exchange, routingKey, payload, timeout);
    };
    auto result = registry_.execute(key, call, overrides);

    auto duration = toMillis(clock_() - started);
    bool timedOut = result.timedOut || (!result.success && duration.count() * 10 >= timeout.count() * 9);

    ctx.extra["duration_ms"] = std::to_string(duration.count());
    ctx.extra["circuit_state"] = std::string(toString(result.circuitState));
    ctx.extra["from_fallback"] = result.fromFallback ? "true" : "false";

    if (!result.success) {
        ctx.extra["timed_out"] = timedOut ? "true" : "false";
        RpcError error = result.error.value_or(
            RpcError(ErrorCode::TransportError, "circuit breaker operation failed"));
        ctx.extra["error"] = std::string(error.message());
        ResilienceLogger::instance().logWithContext(LogLevel::Error, LogCategory::Dispatch,
                                                    "protected request failed", ctx);
        return Result::err(annotate(error, service, options.routingKey, result));
    }

    ResilienceLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Dispatch,
                                                "protected request completed", ctx);

    DispatchResponse response;
    response.data = result.data.value_or(Payload{});
    if (!result.fromFallback) {
        fallbacks_.remember(service, options.routingKey, response.data);
    }
    response.timeout = timeout;
    response.actualDuration = duration;
    response.timedOut = timedOut;
    response.serviceName = service;
    response.operation = operation;
    response.timeoutSource = resolution.source;
    response.circuitState = result.circuitState;
    response.fromFallback = result.fromFallback;
    response.breakerResult = std::move(result);
    return Result::ok(std::move(response));
}

// ── Publish ─────────────────────────────────────────────────────────────────

foundation::RpcResult<void> ResilientDispatcher::publish(const PublishOptions& options) {
    auto service = options.serviceName ? normalizeServiceName(*options.serviceName)
                                       : serviceFromRoutingKey(options.routingKey);
    BreakerKey key{service, OperationType::EventPublish};

    LogContext ctx;
    ctx.breakerKey = key.toString();
    ctx.service = service;
    ctx.extra["routing_key"] = options.routingKey;
    ctx.extra["exchange"] = options.exchange;

    CircuitBreakerOverrides overrides;
    overrides.timeout = kPublishTimeout;
    overrides.volumeThreshold = kPublishVolumeThreshold;
    overrides.fallback = fallbacks_.forPublish(service, options.routingKey);

    auto call = [transport = transport_, exchange = options.exchange,
                 routingKey = options.routingKey, payload = options.payload]() -> RpcResult<Payload> {
        auto published = transport->publish(exchange, routingKey, payload);
        if (!published) {
            return RpcResult<Payload>::err(published.error());
        }
        return RpcResult<Payload>::ok(Payload{});
    };
    auto result = registry_.execute(key, call, overrides);

    ctx.extra["circuit_state"] = std::string(toString(result.circuitState));
    if (result.success) {
        ctx.extra["from_fallback"] = result.fromFallback ? "true" : "false";
        ResilienceLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Dispatch,
                                                    "event published", ctx);
        return foundation::RpcResult<void>::ok();
    }

    RpcError error = result.error.value_or(
        RpcError(ErrorCode::PublishFailed, "event publishing failed"));
    ctx.extra["error"] = std::string(error.message());
    ResilienceLogger::instance().logWithContext(LogLevel::Error, LogCategory::Dispatch,
                                                "event publishing failed", ctx);
    return foundation::RpcResult<void>::err(annotate(error, service, options.routingKey, result));
}

foundation::RpcResult<DispatchResponse> ResilientDispatcher::healthCheck(std::string_view service,
                                                                         std::string_view routingKey) {
    RequestOptions options;
    options.exchange = std::string(kCommandsExchange);
    options.routingKey = std::string(routingKey);
    options.payload = "{}";
    options.serviceName = std::string(service);
    options.operation = OperationType::HealthCheck;
    return request(options);
}

} // namespace crr::resilience
