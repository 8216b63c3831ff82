#pragma once

/// @file rpc_error.hpp
/// @brief Error type carried by every RpcResult.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "crr/foundation/error_code.hpp"

namespace crr::foundation {

/// Error code, human-readable message and optional type-erased context.
///
/// The dispatcher stores the circuit-breaker outcome of a failed call in
/// the context so callers can inspect state and timing after the fact.
class RpcError {
public:
    RpcError() = default;

    explicit RpcError(ErrorCode code)
        : code_(code) {}

    RpcError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    RpcError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Typed context access, nullptr when empty or of another type.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// Copy of this error with the context replaced.
    [[nodiscard]] RpcError withContext(std::any context) const {
        return RpcError(code_, message_, std::move(context));
    }

    [[nodiscard]] bool isCallerError() const noexcept {
        return foundation::isCallerError(code_);
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace crr::foundation
