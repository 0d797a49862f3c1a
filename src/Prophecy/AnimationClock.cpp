#include "AnimationClock.hpp"

#include <cmath>
#include <stdexcept>

// Absorbs float rounding when a delta is a whole multiple of the step.
static const double STEP_TOLERANCE = 1e-6;

AnimationClock::AnimationClock(double step)
    : stepTime(step), pendingTime(0.0)
{
    if (!(step > 0.0))
        throw std::invalid_argument("AnimationClock: step must be positive");
}

std::size_t AnimationClock::advance(double deltaSeconds) {
    if (!std::isfinite(deltaSeconds) || deltaSeconds < 0.0)
        return 0;

    pendingTime += deltaSeconds;

    std::size_t ticks = 0;
    while (pendingTime + STEP_TOLERANCE >= stepTime) {
        pendingTime -= stepTime;
        ++ticks;
    }
    return ticks;
}
