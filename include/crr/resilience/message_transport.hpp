#pragma once

/// @file message_transport.hpp
/// @brief Broker operations the dispatcher protects.

#include <chrono>
#include <string_view>

#include "crr/foundation/rpc_result.hpp"
#include "crr/resilience/circuit_breaker_types.hpp"

namespace crr::resilience {

/// Request/response and fire-and-forget messaging over a broker.
///
/// Implementations are called from pool threads and may be called
/// concurrently. A call abandoned by the breaker after its timeout keeps
/// running; the implementation must not reference the caller's stack.
class IMessageTransport {
public:
    virtual ~IMessageTransport() = default;

    /// Send @p payload and wait up to @p timeout for the reply.
    virtual RpcResult<Payload> send(std::string_view exchange,
                                    std::string_view routingKey,
                                    const Payload& payload,
                                    std::chrono::milliseconds timeout) = 0;

    /// Publish @p payload without waiting for consumers.
    virtual RpcResult<void> publish(std::string_view exchange,
                                    std::string_view routingKey,
                                    const Payload& payload) = 0;
};

} // namespace crr::resilience
