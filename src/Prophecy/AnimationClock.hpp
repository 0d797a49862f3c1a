#pragma once

#include <cstddef>

// Fixed animation cadence, independent of the render rate.
const double ANIMATION_STEP = 1.0 / 30.0;

// Accumulates raw frame deltas and hands out whole animation ticks.
// Leftover time is carried to the next call, so over wall-clock time T the
// number of ticks is floor(T / step) and ticks never come faster than step.
class AnimationClock {
public:
    explicit AnimationClock(double step = ANIMATION_STEP);

    // Adds delta seconds and returns how many ticks are now due.
    // Negative or non-finite deltas add nothing.
    std::size_t advance(double deltaSeconds);

    double pending() const { return pendingTime; }
    double step() const { return stepTime; }

private:
    double stepTime;
    double pendingTime;
};
