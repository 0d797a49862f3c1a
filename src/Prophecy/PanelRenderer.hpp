#pragma once

#include "Image.hpp"
#include "ProphecyField.hpp"
#include "Shader.hpp"
#include "TextureCache.hpp"

#include <glad/glad.h>
#include <glm/glm.hpp>

// Draws every panel of a field as a textured quad with the panel shader.
// Each distinct Image is uploaded to the GPU once per wrap mode it is drawn with.
class PanelRenderer {
public:
    PanelRenderer();
    ~PanelRenderer();

    PanelRenderer(const PanelRenderer&) = delete;
    PanelRenderer& operator=(const PanelRenderer&) = delete;

    void render(const ProphecyField& field, const glm::mat4& view, const glm::mat4& projection);

private:
    GLuint textureFor(const ImageHandle& image, WrapMode wrap);

    Shader shader;
    GLuint quadVAO, quadVBO;
    TextureCache textures;
};
