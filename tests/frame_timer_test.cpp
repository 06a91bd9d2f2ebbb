#include "core/frame_timer.h"
#include <gtest/gtest.h>

using namespace paddleball;

TEST(FrameTimer, SurfaceScaleAveragesTheSides) {
    EXPECT_DOUBLE_EQ(surface_scale(800, 600), 2.1);
    EXPECT_DOUBLE_EQ(surface_scale(1000, 1000), 3.0);
}

TEST(FrameTimer, FirstTickHasZeroDelta) {
    FrameTimer t(2.0);
    const FrameTiming &ft = t.tick(5000);
    EXPECT_DOUBLE_EQ(ft.delta_ms, 0.0);
    EXPECT_DOUBLE_EQ(ft.scale, 0.0);
    EXPECT_EQ(ft.sequence, 1u);
}

TEST(FrameTimer, ScaleFollowsDelta) {
    FrameTimer t(2.0);
    t.tick(1000);
    const FrameTiming &ft = t.tick(1016);
    EXPECT_DOUBLE_EQ(ft.delta_ms, 16.0);
    EXPECT_DOUBLE_EQ(ft.scale, 2.0 * 16.0 * 0.01);
    EXPECT_DOUBLE_EQ(t.timing().last_timestamp, 1016.0);
}

TEST(FrameTimer, ResumeRestartsFromZeroDelta) {
    FrameTimer t(1.0);
    t.tick(0);
    t.tick(16);
    t.mark_resumed();
    EXPECT_DOUBLE_EQ(t.tick(10000).delta_ms, 0.0);
    EXPECT_DOUBLE_EQ(t.tick(10020).delta_ms, 20.0);
}

TEST(FrameTimer, MonotonicClockDoesNotGoBackwards) {
    double a = monotonic_ms();
    double b = monotonic_ms();
    EXPECT_GE(b, a);
}
