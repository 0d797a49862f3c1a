#pragma once

#include "Shader.hpp"

#include <glad/glad.h>
#include <glm/glm.hpp>

#include <random>
#include <vector>

struct Star {
    glm::vec3 position;
    float size;
};

// Stars scattered through a spherical shell. Radii shrink from
// radius + depth toward radius as stars are generated.
std::vector<Star> generateStars(int count, float radius, float depth, float sizeFactor, std::mt19937& rng);

// Point-sprite backdrop drawn behind everything else.
class Starfield {
public:
    Starfield(int count, float radius, float depth, float sizeFactor, unsigned int seed = std::random_device{}());
    ~Starfield();

    Starfield(const Starfield&) = delete;
    Starfield& operator=(const Starfield&) = delete;

    void render(const glm::mat4& view, const glm::mat4& projection, float time);

private:
    Shader shader;
    GLuint VAO, VBO;
    GLsizei starCount;
};
