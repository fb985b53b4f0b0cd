#include <gtest/gtest.h>
#include <chrono>
#include "debounce_timer.hpp"

using namespace savekeeper;
using std::chrono::milliseconds;

namespace {

const DebounceTimer::Clock::time_point T0{};

} // namespace

TEST(DebounceTimerTest, StartsDisarmed) {
    DebounceTimer timer(milliseconds(2000));
    EXPECT_FALSE(timer.armed());
    EXPECT_FALSE(timer.expired(T0 + milliseconds(10000)));
    EXPECT_EQ(timer.remaining(T0), milliseconds::max());
}

TEST(DebounceTimerTest, BurstOfEventsFiresOnceAfterLastEvent) {
    DebounceTimer timer(milliseconds(2000));
    timer.reset(T0);
    timer.reset(T0 + milliseconds(500));
    timer.reset(T0 + milliseconds(1000));

    EXPECT_FALSE(timer.take_expired(T0 + milliseconds(2500)));
    EXPECT_FALSE(timer.take_expired(T0 + milliseconds(2999)));
    EXPECT_TRUE(timer.take_expired(T0 + milliseconds(3000)));
    EXPECT_FALSE(timer.take_expired(T0 + milliseconds(3001)));
    EXPECT_FALSE(timer.armed());
}

TEST(DebounceTimerTest, RemainingShrinksTowardsDeadline) {
    DebounceTimer timer(milliseconds(1000));
    timer.reset(T0);
    EXPECT_EQ(timer.remaining(T0), milliseconds(1000));
    EXPECT_EQ(timer.remaining(T0 + milliseconds(400)), milliseconds(600));
    EXPECT_EQ(timer.remaining(T0 + milliseconds(1500)), milliseconds(0));
}

TEST(DebounceTimerTest, RemainingRoundsUpPartialMilliseconds) {
    DebounceTimer timer(milliseconds(10));
    timer.reset(T0);
    auto now = T0 + std::chrono::microseconds(2500);
    EXPECT_EQ(timer.remaining(now), milliseconds(8));
}

TEST(DebounceTimerTest, CancelDropsPendingDeadline) {
    DebounceTimer timer(milliseconds(100));
    timer.reset(T0);
    timer.cancel();
    EXPECT_FALSE(timer.expired(T0 + milliseconds(200)));

    timer.reset(T0 + milliseconds(300));
    EXPECT_TRUE(timer.expired(T0 + milliseconds(400)));
}
