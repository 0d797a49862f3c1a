#include "PanelShader.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

ImageHandle makeImage(int w, int h, const std::vector<glm::vec4>& colors) {
    return std::make_shared<Image>(Image::fromColors(w, h, colors));
}

void expectColor(const glm::vec4& actual, const glm::vec4& expected, float tolerance = 1.0f / 255.0f) {
    for (int i = 0; i < 4; ++i)
        EXPECT_NEAR(actual[i], expected[i], tolerance) << "channel " << i;
}

} // namespace

TEST(PanelShaderTest, OpaqueInkIsCutOutAndPaperShowsTintedBackground) {
    const glm::vec4 ocean(0.2f, 0.3f, 0.1f, 0.8f);
    PanelUniforms uniforms;
    uniforms.panelImage = makeImage(2, 2, {
        glm::vec4(0.1f, 0.2f, 0.3f, 0.9f),
        glm::vec4(0.4f, 0.5f, 0.6f, 0.3f),
        glm::vec4(0.7f, 0.8f, 0.9f, 0.5f),
        glm::vec4(1.0f, 1.0f, 1.0f, 0.49f),
    });
    uniforms.backgroundImage = makeImage(2, 2, std::vector<glm::vec4>(4, ocean));
    uniforms.tint = -5.0f;

    std::vector<Fragment> out = PanelShader::rasterize(uniforms, 2, 2);
    ASSERT_EQ(out.size(), 4u);

    EXPECT_TRUE(out[0].discarded);
    EXPECT_TRUE(out[2].discarded);
    ASSERT_FALSE(out[1].discarded);
    ASSERT_FALSE(out[3].discarded);

    const glm::vec4 expected(0.2f - 0.5f, 0.3f + 0.1f - 0.5f, 0.1f + 0.6f - 0.5f, 0.8f);
    expectColor(out[1].color, expected);
    expectColor(out[3].color, expected);
}

TEST(PanelShaderTest, CutoutThresholdIsInclusive) {
    const glm::vec4 background(0.0f, 0.0f, 0.0f, 1.0f);
    EXPECT_TRUE(PanelShader::shade(glm::vec4(0.0f, 0.0f, 0.0f, 0.5f), background, 0.0f).discarded);
    EXPECT_TRUE(PanelShader::shade(glm::vec4(1.0f), background, 0.0f).discarded);
    EXPECT_FALSE(PanelShader::shade(glm::vec4(0.0f, 0.0f, 0.0f, 0.4999f), background, 0.0f).discarded);
    EXPECT_FALSE(PanelShader::shade(glm::vec4(0.0f), background, 0.0f).discarded);
}

TEST(PanelShaderTest, OutputIsNotClamped) {
    Fragment f = PanelShader::shade(glm::vec4(0.0f), glm::vec4(1.0f, 1.0f, 1.0f, 0.25f), 2.0f);
    ASSERT_FALSE(f.discarded);
    expectColor(f.color, glm::vec4(1.2f, 1.3f, 1.8f, 0.25f), 1e-6f);
}

TEST(PanelShaderTest, ScrollOffsetShiftsBackgroundWithWrap) {
    const glm::vec4 red(1, 0, 0, 1), green(0, 1, 0, 1);
    PanelUniforms uniforms;
    uniforms.panelImage = makeImage(1, 1, { glm::vec4(0.0f) });
    uniforms.backgroundImage = makeImage(2, 1, { red, green });

    const glm::vec2 left(0.25f, 0.5f);
    expectColor(PanelShader::shadeAt(uniforms, left).color, red + glm::vec4(PanelShader::BLUE_TINT, 0.0f));

    uniforms.scrollOffset = glm::vec2(0.5f, 0.0f);
    expectColor(PanelShader::shadeAt(uniforms, left).color, green + glm::vec4(PanelShader::BLUE_TINT, 0.0f));

    uniforms.scrollOffset = glm::vec2(1.5f, -3.0f);
    expectColor(PanelShader::shadeAt(uniforms, left).color, green + glm::vec4(PanelShader::BLUE_TINT, 0.0f));

    uniforms.scrollOffset = glm::vec2(-1.0f, 0.0f);
    expectColor(PanelShader::shadeAt(uniforms, left).color, red + glm::vec4(PanelShader::BLUE_TINT, 0.0f));
}

TEST(PanelShaderTest, UnboundImagesAreRejected) {
    PanelUniforms uniforms;
    EXPECT_THROW(PanelShader::shadeAt(uniforms, glm::vec2(0.5f)), std::logic_error);
}

TEST(PanelShaderTest, GpuProgramDeclaresTheRendererUniforms) {
    const std::string vertex = PanelShader::VERTEX_SOURCE;
    const std::string fragment = PanelShader::FRAGMENT_SOURCE;
    for (const char* name : { "model", "view", "projection" })
        EXPECT_NE(vertex.find(std::string("uniform mat4 ") + name), std::string::npos) << name;
    for (const char* name : { "sampler2D uPanel", "sampler2D uBackground", "vec2 uOffset", "float uTint" })
        EXPECT_NE(fragment.find(name), std::string::npos) << name;
    EXPECT_NE(fragment.find("discard"), std::string::npos);
}
