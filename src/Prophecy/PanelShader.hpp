#pragma once

#include "Image.hpp"

#include <glm/glm.hpp>

#include <vector>

// Per-panel shader inputs. Each Panel owns one of these exclusively; only the
// image handles point at shared (read-only) data.
struct PanelUniforms {
    ImageHandle panelImage;
    ImageHandle backgroundImage;
    glm::vec2 scrollOffset = glm::vec2(0.0f);
    float tint = 0.0f;
};

// Result of shading one fragment.
struct Fragment {
    bool discarded;
    glm::vec4 color;
};

// The panel compositing rule. The opaque part of the panel image is cut out;
// where the panel image is transparent the scrolled background shows through,
// pushed toward deep blue and shifted by a gray tint.
namespace PanelShader {

extern const char* const VERTEX_SOURCE;
extern const char* const FRAGMENT_SOURCE;

// Panel alpha at or above this is treated as ink and discarded.
const float CUTOUT_ALPHA = 0.5f;
const glm::vec3 BLUE_TINT(0.0f, 0.1f, 0.6f);
const float GRAY_PER_TINT = 0.1f;

Fragment shade(const glm::vec4& panelColor, const glm::vec4& backgroundColor, float tint);

// Evaluates the rule for the fragment at surface coordinate uv.
Fragment shadeAt(const PanelUniforms& uniforms, const glm::vec2& uv);

// Runs the rule over a width x height grid of texel centers, row-major,
// bottom row first. Both images in uniforms must be loaded.
std::vector<Fragment> rasterize(const PanelUniforms& uniforms, int width, int height);

} // namespace PanelShader
