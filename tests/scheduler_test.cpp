#include "core/scheduler.h"
#include <gtest/gtest.h>
#include <vector>

using namespace paddleball;

TEST(FrameScheduler, DispatchRunsPendingCallbackOnce) {
    FrameScheduler frames;
    std::vector<double> stamps;
    frames.request([&](double t){ stamps.push_back(t); });
    EXPECT_TRUE(frames.pending());
    EXPECT_TRUE(frames.dispatch(16.0));
    EXPECT_FALSE(frames.dispatch(32.0));
    ASSERT_EQ(stamps.size(), 1u);
    EXPECT_DOUBLE_EQ(stamps[0], 16.0);
}

TEST(FrameScheduler, CallbackMayRequestTheNextFrame) {
    FrameScheduler frames;
    int ticks = 0;
    std::function<void(double)> loop = [&](double) { ++ticks; frames.request(loop); };
    frames.request(loop);
    for (int i = 0; i < 5; ++i) frames.dispatch(i * 16.0);
    EXPECT_EQ(ticks, 5);
    EXPECT_TRUE(frames.pending());
}

TEST(FrameScheduler, CancelOnlyDropsTheNamedRequest) {
    FrameScheduler frames;
    int a = 0, b = 0;
    auto first = frames.request([&](double){ ++a; });
    auto second = frames.request([&](double){ ++b; });
    EXPECT_NE(first, second);

    frames.cancel(first);
    EXPECT_TRUE(frames.pending());
    frames.cancel(second);
    EXPECT_FALSE(frames.pending());
    EXPECT_FALSE(frames.dispatch(0));
    EXPECT_EQ(a + b, 0);
}

TEST(TimerQueue, FiresDueActionsInFireTimeOrder) {
    TimerQueue timers;
    std::vector<int> order;
    timers.schedule(300, [&]{ order.push_back(3); });
    timers.schedule(100, [&]{ order.push_back(1); });
    timers.schedule(200, [&]{ order.push_back(2); });
    timers.schedule(100, [&]{ order.push_back(11); });

    EXPECT_EQ(timers.advance_to(99), 0);
    EXPECT_EQ(timers.advance_to(250), 3);
    EXPECT_EQ(order, (std::vector<int>{1, 11, 2}));
    EXPECT_EQ(timers.size(), 1u);
}

TEST(TimerQueue, CancelledActionsNeverRun) {
    TimerQueue timers;
    int fired = 0;
    TimerToken t = timers.schedule(10, [&]{ ++fired; });
    EXPECT_TRUE(timers.cancel(t));
    EXPECT_FALSE(timers.cancel(t));
    timers.advance_to(100);
    EXPECT_EQ(fired, 0);
}

TEST(TimerQueue, ActionCanCancelAnotherDueAction) {
    TimerQueue timers;
    int fired = 0;
    TimerToken later;
    timers.schedule(10, [&]{ ++fired; timers.cancel(later); });
    later = timers.schedule(20, [&]{ ++fired; });
    timers.advance_to(50);
    EXPECT_EQ(fired, 1);
}

TEST(TimerQueue, TimersScheduledWhileFiringRunLater) {
    TimerQueue timers;
    int outer = 0, inner = 0;
    timers.schedule(10, [&]{
        ++outer;
        timers.schedule(0, [&]{ ++inner; });
    });
    timers.advance_to(10);
    EXPECT_EQ(outer, 1);
    EXPECT_EQ(inner, 0);
    timers.advance_to(10);
    EXPECT_EQ(inner, 1);
}

TEST(TimerQueue, DelayIsMeasuredFromTheQueueClock) {
    TimerQueue timers;
    timers.advance_to(5000);
    int fired = 0;
    timers.schedule(1000, [&]{ ++fired; });
    timers.advance_to(5999);
    EXPECT_EQ(fired, 0);
    timers.advance_to(6000);
    EXPECT_EQ(fired, 1);
}

TEST(TimerQueue, CancelAllEmptiesTheQueue) {
    TimerQueue timers;
    int fired = 0;
    timers.schedule(1, [&]{ ++fired; });
    timers.schedule(2, [&]{ ++fired; });
    timers.cancel_all();
    EXPECT_TRUE(timers.empty());
    timers.advance_to(10);
    EXPECT_EQ(fired, 0);
}
