#include "AnimationClock.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

TEST(AnimationClockTest, SubStepDeltasAccumulateWithoutTicking) {
    AnimationClock clock;
    EXPECT_EQ(clock.advance(0.01), 0u);
    EXPECT_EQ(clock.advance(0.01), 0u);
    EXPECT_NEAR(clock.pending(), 0.02, 1e-12);
}

TEST(AnimationClockTest, LeftoverTimeCarriesOver) {
    AnimationClock clock;
    EXPECT_EQ(clock.advance(0.05), 1u);
    EXPECT_NEAR(clock.pending(), 0.05 - ANIMATION_STEP, 1e-12);
    // 0.0167 left + 0.02 crosses the next step.
    EXPECT_EQ(clock.advance(0.02), 1u);
    EXPECT_NEAR(clock.pending(), 0.07 - 2 * ANIMATION_STEP, 1e-12);
}

TEST(AnimationClockTest, ExactStepTicksOnce) {
    AnimationClock clock;
    EXPECT_EQ(clock.advance(ANIMATION_STEP), 1u);
    EXPECT_NEAR(clock.pending(), 0.0, 1e-9);
}

TEST(AnimationClockTest, OneLargeDeltaAppliesEveryStep) {
    AnimationClock clock;
    EXPECT_EQ(clock.advance(10 * ANIMATION_STEP), 10u);

    AnimationClock paused;
    EXPECT_EQ(paused.advance(60.0), 1800u);
}

TEST(AnimationClockTest, FloatDeltasStillCountWholeSteps) {
    AnimationClock clock;
    EXPECT_EQ(clock.advance(static_cast<float>(10 * ANIMATION_STEP)), 10u);
}

TEST(AnimationClockTest, TickCountTracksWallClockAtHighRefreshRate) {
    AnimationClock clock;
    const double frame = 1.0 / 144.0;
    std::size_t ticks = 0;
    double total = 0.0;
    for (int i = 0; i < 1000; ++i) {
        ticks += clock.advance(frame);
        total += frame;
    }
    double expected = std::floor(total / ANIMATION_STEP);
    EXPECT_NEAR(static_cast<double>(ticks), expected, 1.0);
}

TEST(AnimationClockTest, NeverTicksMoreThanOncePerStepOfTime) {
    AnimationClock clock;
    std::size_t ticks = 0;
    for (int i = 0; i < 10; ++i)
        ticks += clock.advance(0.02);
    // 0.2 s holds six whole steps.
    EXPECT_EQ(ticks, 6u);
}

TEST(AnimationClockTest, IgnoresNegativeAndNonFiniteDeltas) {
    AnimationClock clock;
    EXPECT_EQ(clock.advance(-1.0), 0u);
    EXPECT_EQ(clock.advance(std::numeric_limits<double>::quiet_NaN()), 0u);
    EXPECT_EQ(clock.advance(std::numeric_limits<double>::infinity()), 0u);
    EXPECT_EQ(clock.pending(), 0.0);
}

TEST(AnimationClockTest, RejectsNonPositiveStep) {
    EXPECT_THROW(AnimationClock(0.0), std::invalid_argument);
    EXPECT_THROW(AnimationClock(-0.5), std::invalid_argument);
}
