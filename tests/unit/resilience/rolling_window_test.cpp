#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>

#include "crr/resilience/rolling_window.hpp"

using namespace crr::resilience;
using namespace std::chrono_literals;
using crr::foundation::SteadyClockFn;
using crr::foundation::SteadyTime;

namespace {

class ManualClock {
public:
    SteadyClockFn fn() const {
        return [now = now_] { return SteadyTime{} + std::chrono::milliseconds(now->load()); };
    }
    void advance(std::chrono::milliseconds d) { now_->fetch_add(d.count()); }

private:
    std::shared_ptr<std::atomic<int64_t>> now_ = std::make_shared<std::atomic<int64_t>>(0);
};

} // namespace

// --- WindowStats tests ---

TEST(WindowStatsTest, ErrorPercentage) {
    WindowStats stats{3, 1};
    EXPECT_EQ(stats.total(), 4u);
    EXPECT_DOUBLE_EQ(stats.errorPercentage(), 25.0);
}

TEST(WindowStatsTest, EmptyWindowHasZeroErrorRate) {
    WindowStats stats;
    EXPECT_DOUBLE_EQ(stats.errorPercentage(), 0.0);
}

// --- RollingWindow tests ---

TEST(RollingWindowTest, CountsWithinOneBucket) {
    ManualClock clock;
    RollingWindow window(60000ms, 10, clock.fn());

    window.recordSuccess();
    window.recordSuccess();
    window.recordFailure();

    auto stats = window.stats();
    EXPECT_EQ(stats.successes, 2u);
    EXPECT_EQ(stats.failures, 1u);
    EXPECT_EQ(window.bucketWidth(), 6000ms);
}

TEST(RollingWindowTest, SpreadsAcrossBuckets) {
    ManualClock clock;
    RollingWindow window(10000ms, 10, clock.fn());

    for (int i = 0; i < 5; ++i) {
        window.recordFailure();
        clock.advance(1000ms);
    }
    EXPECT_EQ(window.stats().failures, 5u);
}

TEST(RollingWindowTest, OldBucketsFallOutOfWindow) {
    ManualClock clock;
    RollingWindow window(10000ms, 10, clock.fn());

    window.recordFailure();
    window.recordFailure();
    clock.advance(5000ms);
    window.recordSuccess();

    clock.advance(5000ms);
    auto stats = window.stats();
    EXPECT_EQ(stats.failures, 0u);
    EXPECT_EQ(stats.successes, 1u);

    clock.advance(5000ms);
    EXPECT_EQ(window.stats().total(), 0u);
}

TEST(RollingWindowTest, RecycledBucketStartsEmpty) {
    ManualClock clock;
    RollingWindow window(4000ms, 4, clock.fn());

    window.recordFailure();
    clock.advance(4000ms); // same ring position, next lap
    window.recordSuccess();

    auto stats = window.stats();
    EXPECT_EQ(stats.failures, 0u);
    EXPECT_EQ(stats.successes, 1u);
}

TEST(RollingWindowTest, ClearDropsEverything) {
    ManualClock clock;
    RollingWindow window(10000ms, 10, clock.fn());
    window.recordFailure();
    window.recordSuccess();

    window.clear();
    EXPECT_EQ(window.stats().total(), 0u);
}

TEST(RollingWindowTest, DegenerateConfigurationStillWorks) {
    ManualClock clock;
    RollingWindow window(0ms, 0, clock.fn());
    window.recordFailure();
    EXPECT_EQ(window.stats().failures, 1u);
    EXPECT_EQ(window.bucketWidth(), 1ms);
}
