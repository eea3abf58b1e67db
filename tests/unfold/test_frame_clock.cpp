/**
 * @file test_frame_clock.cpp
 * @brief Unit tests for the frame clock
 */

#include <gtest/gtest.h>

#include "core/FrameClock.hpp"

#include "utils/TestHelpers.hpp"

using namespace Unfold;
using namespace Unfold::Test;

TEST(FrameClockTest, StoppedByDefault) {
    FrameClock clock;
    EXPECT_FALSE(clock.IsRunning());
    EXPECT_FLOAT_EQ(0.0f, clock.Advance(At(1.0f)));
    EXPECT_EQ(0u, clock.GetFrameCount());
}

TEST(FrameClockTest, MeasuresFromStart) {
    FrameClock clock;
    clock.Start(At(10.0f));

    EXPECT_NEAR(0.016f, clock.Advance(At(10.016f)), 1e-4f);
    EXPECT_NEAR(0.020f, clock.Advance(At(10.036f)), 1e-4f);
    EXPECT_EQ(2u, clock.GetFrameCount());
}

TEST(FrameClockTest, ClampsLongStalls) {
    FrameClock clock;
    clock.Start(At(0.0f));
    EXPECT_FLOAT_EQ(FrameClock::kDefaultMaxDeltaSeconds, clock.Advance(At(5.0f)));

    clock.SetMaxDeltaTime(1.0f);
    EXPECT_FLOAT_EQ(1.0f, clock.Advance(At(9.0f)));
}

TEST(FrameClockTest, IgnoresNonPositiveMaxDelta) {
    FrameClock clock(0.5f);
    clock.SetMaxDeltaTime(0.0f);
    clock.SetMaxDeltaTime(-1.0f);
    EXPECT_FLOAT_EQ(0.5f, clock.GetMaxDeltaTime());
}

TEST(FrameClockTest, BackwardsTimeYieldsZero) {
    FrameClock clock;
    clock.Start(At(2.0f));
    EXPECT_FLOAT_EQ(0.0f, clock.Advance(At(1.0f)));

    // The later timestamp is kept as the reference
    EXPECT_NEAR(0.1f, clock.Advance(At(2.1f)), 1e-4f);
}

TEST(FrameClockTest, StopAndRestartDropsStaleTime) {
    FrameClock clock;
    clock.Start(At(0.0f));
    EXPECT_NEAR(0.1f, clock.Advance(At(0.1f)), 1e-4f);
    clock.Stop();

    EXPECT_FLOAT_EQ(0.0f, clock.Advance(At(0.2f)));

    clock.Start(At(60.0f));
    EXPECT_NEAR(0.05f, clock.Advance(At(60.05f)), 1e-4f);
    EXPECT_EQ(1u, clock.GetFrameCount());
}
