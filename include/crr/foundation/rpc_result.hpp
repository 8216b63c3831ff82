#pragma once

/// @file rpc_result.hpp
/// @brief RpcResult<T> alias binding Result to RpcError.

#include "crr/core/result.hpp"
#include "crr/foundation/rpc_error.hpp"

namespace crr::foundation {

/// Result specialized with RpcError.
///
/// @code
///   RpcResult<Payload> reply = transport.send(exchange, key, body, timeout);
///   if (!reply) {
///       return RpcResult<Payload>::err(
///           RpcError(ErrorCode::SendFailed, "broker rejected message"));
///   }
/// @endcode
template <typename T>
using RpcResult = crr::Result<T, RpcError>;

} // namespace crr::foundation
