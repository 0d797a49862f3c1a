#include "PanelShader.hpp"

#include <stdexcept>

namespace PanelShader {

const char* const VERTEX_SOURCE = R"(
#version 330 core
layout (location = 0) in vec3 aPos;
layout (location = 1) in vec2 aTexCoord;
uniform mat4 model;
uniform mat4 view;
uniform mat4 projection;
out vec2 vUv;
void main(){
    vUv = aTexCoord;
    gl_Position = projection * view * model * vec4(aPos, 1.0);
}
)";

const char* const FRAGMENT_SOURCE = R"(
#version 330 core
in vec2 vUv;
out vec4 FragColor;
uniform sampler2D uPanel;
uniform sampler2D uBackground;
uniform vec2 uOffset;
uniform float uTint;
void main(){
    vec4 panelColor = texture(uPanel, vUv);
    if (panelColor.a >= 0.5)
        discard;
    vec4 backgroundColor = texture(uBackground, vUv + uOffset);
    vec3 blueTint = vec3(0.0, 0.1, 0.6);
    vec3 grayTint = vec3(0.1 * uTint);
    FragColor = vec4(backgroundColor.rgb + blueTint + grayTint, backgroundColor.a);
}
)";

Fragment shade(const glm::vec4& panelColor, const glm::vec4& backgroundColor, float tint) {
    if (panelColor.a >= CUTOUT_ALPHA)
        return { true, glm::vec4(0.0f) };
    glm::vec3 rgb = glm::vec3(backgroundColor) + BLUE_TINT + glm::vec3(GRAY_PER_TINT * tint);
    return { false, glm::vec4(rgb, backgroundColor.a) };
}

Fragment shadeAt(const PanelUniforms& uniforms, const glm::vec2& uv) {
    if (!uniforms.panelImage || !uniforms.backgroundImage)
        throw std::logic_error("PanelShader: images are not bound");
    glm::vec4 panelColor = uniforms.panelImage->sample(uv, WrapMode::CLAMP_TO_EDGE);
    glm::vec4 backgroundColor = uniforms.backgroundImage->sample(uv + uniforms.scrollOffset, WrapMode::REPEAT);
    return shade(panelColor, backgroundColor, uniforms.tint);
}

std::vector<Fragment> rasterize(const PanelUniforms& uniforms, int width, int height) {
    std::vector<Fragment> out;
    out.reserve(static_cast<size_t>(width) * height);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            glm::vec2 uv((x + 0.5f) / width, (y + 0.5f) / height);
            out.push_back(shadeAt(uniforms, uv));
        }
    }
    return out;
}

} // namespace PanelShader
