#pragma once

/// @file types.hpp
/// @brief Clock sources and time helpers shared across the resilience layer.

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace crr::foundation {

using SteadyTime = std::chrono::steady_clock::time_point;
using WallTime = std::chrono::system_clock::time_point;

/// Injectable monotonic clock. Breakers measure reset timeouts, rolling
/// buckets and call latency with it; tests substitute a manual clock.
using SteadyClockFn = std::function<SteadyTime()>;

/// Injectable wall clock for report timestamps (snapshots, alerts).
using WallClockFn = std::function<WallTime()>;

inline SteadyClockFn systemSteadyClock() {
    return [] { return std::chrono::steady_clock::now(); };
}

inline WallClockFn systemWallClock() {
    return [] { return std::chrono::system_clock::now(); };
}

/// Milliseconds since the Unix epoch.
[[nodiscard]] inline int64_t epochMillis(WallTime t) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

/// Whole milliseconds in a duration, truncated.
template <typename Rep, typename Period>
[[nodiscard]] constexpr std::chrono::milliseconds toMillis(std::chrono::duration<Rep, Period> d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d);
}

/// ISO 8601 UTC with millisecond precision, e.g. "2024-05-01T12:00:00.250Z".
[[nodiscard]] std::string formatIso8601(WallTime t);

/// Random UUID v4 used to correlate the log lines of one dispatched call.
[[nodiscard]] std::string generateCorrelationId();

} // namespace crr::foundation
