#include "spill/core/TimerQueue.hh"

#include <gtest/gtest.h>

#include <vector>

using namespace spill;

class TimerQueueTest : public ::testing::Test {
  protected:
    TimerQueue timers;
    std::vector<int> fired;
};

TEST_F(TimerQueueTest, FiresWhenDue) {
    timers.schedule(1.0, [this] { fired.push_back(1); });
    timers.advance(0.5);
    EXPECT_TRUE(fired.empty());
    timers.advance(0.5);
    EXPECT_EQ(fired, std::vector<int>{1});
    EXPECT_EQ(timers.pendingCount(), 0u);
}

TEST_F(TimerQueueTest, FiresInDueOrderThenScheduleOrder) {
    timers.schedule(2.0, [this] { fired.push_back(3); });
    timers.schedule(1.0, [this] { fired.push_back(1); });
    timers.schedule(1.0, [this] { fired.push_back(2); });
    timers.advance(5.0);
    EXPECT_EQ(fired, (std::vector<int>{1, 2, 3}));
}

TEST_F(TimerQueueTest, ZeroDelayFlushesOnZeroAdvance) {
    timers.schedule(0.0, [this] { fired.push_back(1); });
    timers.advance(0.0);
    EXPECT_EQ(fired, std::vector<int>{1});
}

TEST_F(TimerQueueTest, NegativeDelayClampsToNow) {
    timers.advance(3.0);
    timers.schedule(-1.0, [this] { fired.push_back(1); });
    timers.advance(0.0);
    EXPECT_EQ(fired.size(), 1u);
}

TEST_F(TimerQueueTest, TimersScheduledWhileFiringRunWhenDue) {
    timers.schedule(0.5, [this] {
        fired.push_back(1);
        timers.schedule(0.0, [this] { fired.push_back(2); });
        timers.schedule(10.0, [this] { fired.push_back(3); });
    });
    timers.advance(1.0);
    EXPECT_EQ(fired, (std::vector<int>{1, 2}));
    EXPECT_EQ(timers.pendingCount(), 1u);
}

TEST_F(TimerQueueTest, CancelPreventsFiring) {
    TimerId id = timers.schedule(1.0, [this] { fired.push_back(1); });
    EXPECT_TRUE(timers.cancel(id));
    EXPECT_FALSE(timers.cancel(id));
    timers.advance(2.0);
    EXPECT_TRUE(fired.empty());
}

TEST_F(TimerQueueTest, CallbackCanCancelLaterTimer) {
    TimerId later = kInvalidTimer;
    timers.schedule(1.0, [&] { timers.cancel(later); });
    later = timers.schedule(1.5, [this] { fired.push_back(2); });
    timers.advance(2.0);
    EXPECT_TRUE(fired.empty());
}

TEST_F(TimerQueueTest, EmptyCallbackIsRejected) {
    EXPECT_EQ(timers.schedule(1.0, nullptr), kInvalidTimer);
    EXPECT_EQ(timers.pendingCount(), 0u);
}

TEST_F(TimerQueueTest, PauseStopsTime) {
    timers.schedule(1.0, [this] { fired.push_back(1); });
    timers.pause();
    EXPECT_TRUE(timers.isPaused());
    timers.advance(5.0);
    EXPECT_TRUE(fired.empty());
    EXPECT_DOUBLE_EQ(timers.getCurrentTime(), 0.0);

    timers.resume();
    timers.advance(1.0);
    EXPECT_EQ(fired.size(), 1u);
}

TEST_F(TimerQueueTest, TimeScaleStretchesAdvance) {
    timers.setTimeScale(2.0);
    timers.schedule(1.0, [this] { fired.push_back(1); });
    timers.advance(0.5);
    EXPECT_EQ(fired.size(), 1u);
    EXPECT_DOUBLE_EQ(timers.getCurrentTime(), 1.0);

    timers.setTimeScale(-3.0);
    EXPECT_DOUBLE_EQ(timers.getTimeScale(), 0.0);
}

TEST_F(TimerQueueTest, ClearDropsPending) {
    timers.schedule(1.0, [this] { fired.push_back(1); });
    timers.schedule(2.0, [this] { fired.push_back(2); });
    timers.clear();
    timers.advance(5.0);
    EXPECT_TRUE(fired.empty());
    EXPECT_EQ(timers.pendingCount(), 0u);
}
