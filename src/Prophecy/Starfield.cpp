#include "Starfield.hpp"

#include <glm/gtc/constants.hpp>

#include <cmath>
#include <cstddef>

// --- Star Vertex Shader ---
static const char* starVertexShaderSource = R"(
#version 330 core
layout (location = 0) in vec3 aPos;
layout (location = 1) in float aSize;
uniform mat4 view;
uniform mat4 projection;
uniform float time;
void main(){
    vec4 viewPos = view * vec4(aPos, 1.0);
    gl_PointSize = aSize * (30.0 / -viewPos.z) * (3.0 + sin(time + 100.0));
    gl_Position = projection * viewPos;
}
)";

// --- Star Fragment Shader ---
static const char* starFragmentShaderSource = R"(
#version 330 core
out vec4 FragColor;
void main(){
    // Soft round sprite fading toward its edge.
    float dist = distance(gl_PointCoord, vec2(0.5));
    float opacity = 1.0 / (1.0 + exp(16.0 * (dist - 0.25)));
    FragColor = vec4(vec3(0.9), opacity);
}
)";

std::vector<Star> generateStars(int count, float radius, float depth, float sizeFactor, std::mt19937& rng) {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    std::vector<Star> stars;
    stars.reserve(count);

    float r = radius + depth;
    const float increment = depth / count;
    for (int i = 0; i < count; i++) {
        r -= increment * unit(rng);
        // Uniform direction on the sphere.
        float theta = unit(rng) * glm::two_pi<float>();
        float phi = std::acos(1.0f - 2.0f * unit(rng));
        glm::vec3 dir(std::sin(phi) * std::cos(theta), std::sin(phi) * std::sin(theta), std::cos(phi));
        stars.push_back({ dir * r, (0.5f + 0.5f * unit(rng)) * sizeFactor });
    }
    return stars;
}

Starfield::Starfield(int count, float radius, float depth, float sizeFactor, unsigned int seed)
    : shader(starVertexShaderSource, starFragmentShaderSource), starCount(count)
{
    std::mt19937 rng(seed);
    std::vector<Star> stars = generateStars(count, radius, depth, sizeFactor, rng);

    glGenVertexArrays(1, &VAO);
    glGenBuffers(1, &VBO);

    glBindVertexArray(VAO);
    glBindBuffer(GL_ARRAY_BUFFER, VBO);
    glBufferData(GL_ARRAY_BUFFER, stars.size() * sizeof(Star), stars.data(), GL_STATIC_DRAW);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(Star), (void*)0);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 1, GL_FLOAT, GL_FALSE, sizeof(Star), (void*)offsetof(Star, size));
    glEnableVertexAttribArray(1);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);
}

Starfield::~Starfield() {
    glDeleteVertexArrays(1, &VAO);
    glDeleteBuffers(1, &VBO);
}

void Starfield::render(const glm::mat4& view, const glm::mat4& projection, float time) {
    glDepthMask(GL_FALSE); // So stars always render in the background
    shader.use();
    shader.setMat4("view", view);
    shader.setMat4("projection", projection);
    shader.setFloat("time", time);
    glBindVertexArray(VAO);
    glDrawArrays(GL_POINTS, 0, starCount);
    glBindVertexArray(0);
    glDepthMask(GL_TRUE);
}
