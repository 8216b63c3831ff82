#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the RPC resilience layer.

#include <cstdint>
#include <string_view>

namespace crr::foundation {

/// Error codes grouped by subsystem in 256-value hex ranges.
///
/// The range alone tells where an error came from, which is what the
/// default breaker error filter relies on: everything in the Caller range
/// is the caller's fault and never counts against the callee.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Transport (0x0100 - 0x01FF)
    TransportError = 0x0100,
    ConnectionFailed = 0x0101,
    ConnectionLost = 0x0102,
    Timeout = 0x0103,
    SendFailed = 0x0104,
    PublishFailed = 0x0105,
    InvalidMessage = 0x0106,
    RemoteError = 0x0107,

    // Caller (0x0200 - 0x02FF)
    ValidationFailed = 0x0200,
    BadRequest = 0x0201,
    Unauthorized = 0x0202,
    Forbidden = 0x0203,

    // Breaker (0x0300 - 0x03FF)
    ServiceUnavailable = 0x0300,
    FallbackFailed = 0x0301,
    BreakerNotFound = 0x0302,
    RecoveryFailed = 0x0303,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,
    TimerNotFound = 0x0703,
    SchedulerStopped = 0x0704,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    switch (static_cast<uint32_t>(code) & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Transport";
        case 0x0200: return "Caller";
        case 0x0300: return "Breaker";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// True for validation and authorization failures raised because of
/// the request itself rather than the service handling it.
constexpr bool isCallerError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFF00) == 0x0200;
}

/// Map an HTTP-style status carried by a remote reply onto an error code.
constexpr ErrorCode errorCodeFromStatus(int status) {
    switch (status) {
        case 400: return ErrorCode::BadRequest;
        case 401: return ErrorCode::Unauthorized;
        case 403: return ErrorCode::Forbidden;
        case 408:
        case 504: return ErrorCode::Timeout;
        case 422: return ErrorCode::ValidationFailed;
        case 503: return ErrorCode::ServiceUnavailable;
        default: return ErrorCode::RemoteError;
    }
}

} // namespace crr::foundation
