#include "Panel.hpp"

#include <glm/gtc/constants.hpp>

#include <cmath>
#include <utility>

float drawAnimPhase(std::mt19937& rng) {
    const float twoPi = glm::two_pi<float>();
    std::uniform_real_distribution<float> distribution(0.0f, twoPi);
    float phase = distribution(rng);
    // uniform_real_distribution<float> may round up to the upper bound.
    return phase < twoPi ? phase : 0.0f;
}

Panel::Panel(ImageHandle panelImage, ImageHandle backgroundImage,
    float baseSize, float tintLevel, const glm::vec3& pos, float phase)
    : aspectRatio(aspectRatioOf(panelImage)),
      size(aspectRatio * baseSize, baseSize),
      position(pos),
      initialY(pos.y),
      animPhase(phase),
      elapsedAnimTime(0.0),
      ticksApplied(0)
{
    uniformBlock.panelImage = std::move(panelImage);
    uniformBlock.backgroundImage = std::move(backgroundImage);
    uniformBlock.scrollOffset = glm::vec2(0.0f, 0.0f);
    uniformBlock.tint = tintLevel;
}

Panel::Panel(ImageHandle panelImage, ImageHandle backgroundImage,
    float baseSize, float tintLevel, const glm::vec3& pos, std::mt19937& rng)
    : Panel(std::move(panelImage), std::move(backgroundImage), baseSize, tintLevel, pos, drawAnimPhase(rng))
{
}

std::size_t Panel::onFrame(float rawDeltaTime) {
    std::size_t ticks = clock.advance(rawDeltaTime);
    if (ticks > 0)
        applyTicks(ticks);
    return ticks;
}

void Panel::applyTicks(std::size_t ticks) {
    ticksApplied += ticks;

    // Recomputed from the tick count in double; summing float steps stalls
    // after a few days.
    elapsedAnimTime = static_cast<double>(ticksApplied) * clock.step();
    const double scroll = elapsedAnimTime * SCROLL_SPEED;
    uniformBlock.scrollOffset = glm::vec2(static_cast<float>(scroll), static_cast<float>(-scroll));

    // Assigned rather than accumulated so the bob never drifts.
    position.y = initialY + static_cast<float>(std::sin(elapsedAnimTime * BOB_SPEED + animPhase)) * BOB_AMPLITUDE;
}
