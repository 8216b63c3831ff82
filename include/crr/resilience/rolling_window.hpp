#pragma once

/// @file rolling_window.hpp
/// @brief Bucketed success/failure counts over a sliding time span.

#include <chrono>
#include <cstdint>
#include <vector>

#include "crr/foundation/types.hpp"

namespace crr::resilience {

/// Aggregate over the buckets still inside the window.
struct WindowStats {
    uint64_t successes = 0;
    uint64_t failures = 0;

    [[nodiscard]] uint64_t total() const noexcept { return successes + failures; }
    [[nodiscard]] double errorPercentage() const noexcept;
};

/// Sliding window of @p buckets buckets spanning @p span.
///
/// Time is cut into fixed slots of span/buckets; a bucket is recycled as
/// soon as its slot falls out of the window, so stats() only ever sees the
/// most recent `buckets` slots. Not synchronized: the owning breaker
/// serializes access.
class RollingWindow {
public:
    RollingWindow(std::chrono::milliseconds span, uint32_t buckets,
                  foundation::SteadyClockFn clock = foundation::systemSteadyClock());

    void recordSuccess();
    void recordFailure();

    [[nodiscard]] WindowStats stats() const;

    /// Drop every bucket.
    void clear();

    [[nodiscard]] std::chrono::milliseconds bucketWidth() const noexcept { return width_; }

private:
    struct Bucket {
        int64_t slot = -1;
        uint64_t successes = 0;
        uint64_t failures = 0;
    };

    [[nodiscard]] int64_t currentSlot() const;
    Bucket& bucketForNow();

    foundation::SteadyClockFn clock_;
    foundation::SteadyTime origin_;
    std::chrono::milliseconds width_;
    std::vector<Bucket> buckets_;
};

} // namespace crr::resilience
