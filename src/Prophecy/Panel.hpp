#pragma once

#include "AnimationClock.hpp"
#include "Image.hpp"
#include "PanelShader.hpp"

#include <glm/glm.hpp>

#include <cstddef>
#include <random>

const float BOB_AMPLITUDE = 0.1f;
const float BOB_SPEED = 4.0f;       // rad/s
const float SCROLL_SPEED = 0.1f;    // uv units/s on each axis

// One floating billboard. Geometry is sized from the panel image's aspect
// ratio; animation advances in fixed ticks driven by its own clock.
class Panel {
public:
    Panel(ImageHandle panelImage, ImageHandle backgroundImage,
        float baseSize, float tintLevel, const glm::vec3& position, float animPhase);

    // Draws animPhase uniformly from [0, 2*pi).
    Panel(ImageHandle panelImage, ImageHandle backgroundImage,
        float baseSize, float tintLevel, const glm::vec3& position, std::mt19937& rng);

    // Called once per rendered frame with the wall-clock time since the last
    // call. Returns the number of animation ticks applied.
    std::size_t onFrame(float rawDeltaTime);

    const PanelUniforms& uniforms() const { return uniformBlock; }
    const glm::vec3& getPosition() const { return position; }
    glm::vec2 getSize() const { return size; }
    float getAspectRatio() const { return aspectRatio; }
    float getInitialY() const { return initialY; }
    float getAnimPhase() const { return animPhase; }
    double getElapsedAnimTime() const { return elapsedAnimTime; }
    std::size_t getTicksApplied() const { return ticksApplied; }
    const AnimationClock& getClock() const { return clock; }

private:
    void applyTicks(std::size_t ticks);

    PanelUniforms uniformBlock;
    float aspectRatio;
    glm::vec2 size;
    glm::vec3 position;
    float initialY;
    float animPhase;
    double elapsedAnimTime;
    std::size_t ticksApplied;
    AnimationClock clock;
};

float drawAnimPhase(std::mt19937& rng);
