#pragma once

/// @file resilience_logger.hpp
/// @brief Category-filtered logger over the kcenon common logger registry.
///
/// Every component of the resilience layer logs through one category so
/// that, for example, breaker transitions can be traced at Debug while
/// periodic metrics collection stays at Warning.

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "crr/foundation/rpc_result.hpp"

namespace crr::foundation {

/// Log severity. Mirrors kcenon::common::interfaces::log_level one to one.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Subsystem a log line belongs to.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Wiring, runtime start/stop
    Config   = 1, ///< Settings loading and merging
    Timeout  = 2, ///< Timeout resolution
    Breaker  = 3, ///< Admission, outcomes, transitions
    Recovery = 4, ///< Backoff probes
    Metrics  = 5, ///< Snapshots and alerts
    Health   = 6, ///< Health classification and periodic checks
    Dispatch = 7  ///< Request/publish entry points and fallbacks
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Config", "Timeout", "Breaker", "Recovery", "Metrics", "Health", "Dispatch"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured fields appended to a log line as `{key=value, ...}`.
///
/// @code
///   LogContext ctx;
///   ctx.breakerKey = "auth-service:rpc_call";
///   ctx.extra["elapsed_ms"] = "2004";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Breaker,
///                         "call timed out", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> breakerKey;
    std::optional<std::string> service;
    std::optional<std::string> correlationId;
    std::map<std::string, std::string> extra;
};

/// Process-wide logger for the resilience layer.
///
/// Lines go to the logger registered in GlobalLoggerRegistry under
/// "crr.<Category>" when one exists, otherwise to the default logger.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Config   | Info          |
/// | Timeout  | Info          |
/// | Breaker  | Info          |
/// | Recovery | Info          |
/// | Metrics  | Info          |
/// | Health   | Info          |
/// | Dispatch | Info          |
class ResilienceLogger {
public:
    ResilienceLogger();
    ~ResilienceLogger();

    ResilienceLogger(const ResilienceLogger&) = delete;
    ResilienceLogger& operator=(const ResilienceLogger&) = delete;
    ResilienceLogger(ResilienceLogger&&) noexcept;
    ResilienceLogger& operator=(ResilienceLogger&&) noexcept;

    /// Write `[Category] msg`. No-op below the category's level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Write `[Category] msg {k=v, ...}`.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply @p minLevel to every category.
    void setAllLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    RpcResult<void> flush();

    static ResilienceLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse "trace", "debug", "info", "warning"/"warn", "error", "critical",
/// "off" (case-insensitive). Unknown names yield std::nullopt.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace crr::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// @name CRR_LOG Macros
/// @brief Logging macros with a compile-time floor and a runtime category check.
///
/// Define CRR_MIN_LOG_LEVEL (0=Trace ... 6=Off) before including this
/// header to compile out calls below the threshold.
/// @{

#ifndef CRR_MIN_LOG_LEVEL
    #define CRR_MIN_LOG_LEVEL 0
#endif

#define CRR_LOG(level, cat, msg)                                                        \
    do {                                                                                \
        _Pragma("GCC diagnostic push")                                                  \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                             \
        if (static_cast<int>(level) >= CRR_MIN_LOG_LEVEL &&                             \
            ::crr::foundation::ResilienceLogger::instance().isEnabled((level), (cat)))  \
        {                                                                               \
            ::crr::foundation::ResilienceLogger::instance().log((level), (cat), (msg)); \
        }                                                                               \
        _Pragma("GCC diagnostic pop")                                                   \
    } while (0)

#define CRR_LOG_DEBUG(cat, msg) \
    CRR_LOG(::crr::foundation::LogLevel::Debug, (cat), (msg))

#define CRR_LOG_INFO(cat, msg) \
    CRR_LOG(::crr::foundation::LogLevel::Info, (cat), (msg))

#define CRR_LOG_WARN(cat, msg) \
    CRR_LOG(::crr::foundation::LogLevel::Warning, (cat), (msg))

#define CRR_LOG_ERROR(cat, msg) \
    CRR_LOG(::crr::foundation::LogLevel::Error, (cat), (msg))

/// @}
