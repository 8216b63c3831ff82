/// @file service_fallbacks.cpp
/// @brief Fallback selection by operation and service tier.

#include "crr/resilience/service_fallbacks.hpp"

#include "crr/foundation/resilience_logger.hpp"

namespace crr::resilience {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ResilienceLogger;

namespace {

void logTriggered(const std::string& service, const std::string& routingKey, std::string_view what) {
    LogContext ctx;
    ctx.service = service;
    ctx.extra["routing_key"] = routingKey;
    ResilienceLogger::instance().logWithContext(LogLevel::Warning, LogCategory::Dispatch,
                                                std::string(what) + " fallback triggered", ctx);
}

} // namespace

ServiceFallbacks::ServiceFallbacks(const TimeoutResolver& timeouts, foundation::WallClockFn wallClock)
    : timeouts_(timeouts), wallClock_(std::move(wallClock)) {}

FallbackFn ServiceFallbacks::forRequest(const std::string& service, OperationType operation,
                                        const std::string& routingKey) {
    if (operation == OperationType::HealthCheck) {
        return [this, service, routingKey](const RpcError&) -> RpcResult<Payload> {
            logTriggered(service, routingKey, "health check");
            return RpcResult<Payload>::ok(unhealthyReply(service));
        };
    }

    if (timeouts_.tierOf(service) == ServiceTier::NonCritical) {
        return [this, service, routingKey](const RpcError&) -> RpcResult<Payload> {
            logTriggered(service, routingKey, "non-critical service");
            if (auto reply = cached(routingKey)) {
                return RpcResult<Payload>::ok(std::move(*reply));
            }
            return RpcResult<Payload>::ok(Payload(kDefaultNonCriticalReply));
        };
    }

    return [service, routingKey](const RpcError& cause) -> RpcResult<Payload> {
        logTriggered(service, routingKey, "service");
        return RpcResult<Payload>::err(
            RpcError(ErrorCode::ServiceUnavailable, unavailableMessage(service), cause));
    };
}

FallbackFn ServiceFallbacks::forPublish(const std::string& service,
                                        const std::string& routingKey) const {
    return [service, routingKey](const RpcError&) -> RpcResult<Payload> {
        logTriggered(service, routingKey, "event publishing");
        return RpcResult<Payload>::ok(Payload{});
    };
}

void ServiceFallbacks::remember(const std::string& service, const std::string& routingKey,
                                const Payload& reply) {
    if (timeouts_.tierOf(service) != ServiceTier::NonCritical) {
        return;
    }
    std::lock_guard lock(mutex_);
    cache_[routingKey] = reply;
}

std::optional<Payload> ServiceFallbacks::cached(const std::string& routingKey) const {
    std::lock_guard lock(mutex_);
    auto it = cache_.find(routingKey);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ServiceFallbacks::unavailableMessage(std::string_view service) {
    if (service == "auth-service") {
        return "Auth service temporarily unavailable";
    }
    if (service == "billing-service") {
        return "Billing service temporarily unavailable - operation queued for retry";
    }
    if (service == "deploy-service") {
        return "Deploy service temporarily unavailable";
    }
    if (service == "monitor-service") {
        return "Monitor service temporarily unavailable";
    }
    return "Service temporarily unavailable";
}

std::string ServiceFallbacks::unhealthyReply(std::string_view service) const {
    const auto& known = timeouts_.config().services;
    std::string name = known.count(std::string(service)) ? std::string(service) : "unknown";
    return R"({"status":"unhealthy","service":")" + name + R"(","timestamp":")" +
           foundation::formatIso8601(wallClock_()) +
           R"(","error":"Circuit breaker fallback"})";
}

} // namespace crr::resilience
