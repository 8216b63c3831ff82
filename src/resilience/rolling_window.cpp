/// @file rolling_window.cpp
/// @brief RollingWindow bucket bookkeeping.

#include "crr/resilience/rolling_window.hpp"

#include <algorithm>

#include "crr/resilience/circuit_breaker_types.hpp"

namespace crr::resilience {

double WindowStats::errorPercentage() const noexcept {
    return errorPercentageOf(failures, successes);
}

RollingWindow::RollingWindow(std::chrono::milliseconds span, uint32_t buckets,
                             foundation::SteadyClockFn clock)
    : clock_(std::move(clock)),
      origin_(clock_()),
      width_(std::max<std::chrono::milliseconds::rep>(
          1, span.count() / std::max<uint32_t>(1, buckets))),
      buckets_(std::max<uint32_t>(1, buckets)) {}

void RollingWindow::recordSuccess() {
    ++bucketForNow().successes;
}

void RollingWindow::recordFailure() {
    ++bucketForNow().failures;
}

WindowStats RollingWindow::stats() const {
    auto now = currentSlot();
    auto oldest = now - static_cast<int64_t>(buckets_.size()) + 1;
    WindowStats out;
    for (const auto& bucket : buckets_) {
        if (bucket.slot >= oldest && bucket.slot <= now) {
            out.successes += bucket.successes;
            out.failures += bucket.failures;
        }
    }
    return out;
}

void RollingWindow::clear() {
    std::fill(buckets_.begin(), buckets_.end(), Bucket{});
}

int64_t RollingWindow::currentSlot() const {
    auto elapsed = foundation::toMillis(clock_() - origin_);
    if (elapsed.count() < 0) {
        return 0;
    }
    return elapsed.count() / width_.count();
}

RollingWindow::Bucket& RollingWindow::bucketForNow() {
    auto slot = currentSlot();
    auto& bucket = buckets_[static_cast<std::size_t>(slot) % buckets_.size()];
    if (bucket.slot != slot) {
        bucket = Bucket{slot, 0, 0};
    }
    return bucket;
}

} // namespace crr::resilience
