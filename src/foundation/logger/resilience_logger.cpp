/// @file resilience_logger.cpp
/// @brief ResilienceLogger on top of the kcenon logger registry.

#include "crr/foundation/resilience_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <cctype>
#include <string>

namespace crr::foundation {

namespace kci = kcenon::common::interfaces;

namespace {

kci::log_level toKcenon(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

std::string renderContext(const LogContext& ctx) {
    std::string out;
    auto field = [&out](std::string_view key, std::string_view value) {
        if (!out.empty()) {
            out += ", ";
        }
        out.append(key).append("=").append(value);
    };

    if (ctx.breakerKey) {
        field("breaker", *ctx.breakerKey);
    }
    if (ctx.service) {
        field("service", *ctx.service);
    }
    if (ctx.correlationId && !ctx.correlationId->empty()) {
        field("correlation_id", *ctx.correlationId);
    }
    for (const auto& [key, value] : ctx.extra) {
        field(key, value);
    }
    return out;
}

std::string prefixed(LogCategory cat, std::string_view msg, std::size_t extra = 0) {
    std::string line;
    line.reserve(msg.size() + extra + 16);
    line += '[';
    line += logCategoryName(cat);
    line += "] ";
    line += msg;
    return line;
}

} // namespace

struct ResilienceLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> levels;
    std::array<std::string, kLogCategoryCount> names;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            levels[i].store(LogLevel::Info, std::memory_order_relaxed);
            names[i] = "crr." + std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    // A category logger that reports nothing enabled, even Off, is the
    // registry's null logger: route to the default logger instead.
    std::shared_ptr<kci::ILogger> resolve(LogCategory cat) const {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto named = registry.get_logger(names[static_cast<std::size_t>(cat)]);
        if (named->is_enabled(kci::log_level::off)) {
            return named;
        }
        return registry.get_default_logger();
    }
};

ResilienceLogger::ResilienceLogger() : impl_(std::make_unique<Impl>()) {}

ResilienceLogger::~ResilienceLogger() = default;

ResilienceLogger::ResilienceLogger(ResilienceLogger&&) noexcept = default;
ResilienceLogger& ResilienceLogger::operator=(ResilienceLogger&&) noexcept = default;

void ResilienceLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->resolve(cat)->log(toKcenon(level), prefixed(cat, msg));
}

void ResilienceLogger::logWithContext(LogLevel level, LogCategory cat,
                                      std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    auto fields = renderContext(ctx);
    auto line = prefixed(cat, msg, fields.size() + 4);
    if (!fields.empty()) {
        line += " {";
        line += fields;
        line += '}';
    }
    impl_->resolve(cat)->log(toKcenon(level), line);
}

void ResilienceLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->levels[idx].store(minLevel, std::memory_order_release);
    }
}

void ResilienceLogger::setAllLevels(LogLevel minLevel) {
    for (auto& level : impl_->levels) {
        level.store(minLevel, std::memory_order_release);
    }
}

LogLevel ResilienceLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->levels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool ResilienceLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->levels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

RpcResult<void> ResilienceLogger::flush() {
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    auto flushed = logger->flush();
    if (flushed.is_err()) {
        return RpcResult<void>::err(
            RpcError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return RpcResult<void>::ok();
}

ResilienceLogger& ResilienceLogger::instance() {
    static ResilienceLogger inst;
    return inst;
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

} // namespace crr::foundation
