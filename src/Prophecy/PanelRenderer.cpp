#include "PanelRenderer.hpp"
#include "PanelShader.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <stdexcept>
#include <vector>

PanelRenderer::PanelRenderer()
    : shader(PanelShader::VERTEX_SOURCE, PanelShader::FRAGMENT_SOURCE)
{
    // Unit quad centered on the origin, scaled per panel.
    float quadVertices[] = {
        // positions           // texCoords
        -0.5f,  0.5f, 0.0f,    0.0f, 1.0f,
        -0.5f, -0.5f, 0.0f,    0.0f, 0.0f,
         0.5f, -0.5f, 0.0f,    1.0f, 0.0f,

        -0.5f,  0.5f, 0.0f,    0.0f, 1.0f,
         0.5f, -0.5f, 0.0f,    1.0f, 0.0f,
         0.5f,  0.5f, 0.0f,    1.0f, 1.0f
    };
    glGenVertexArrays(1, &quadVAO);
    glGenBuffers(1, &quadVBO);

    glBindVertexArray(quadVAO);
    glBindBuffer(GL_ARRAY_BUFFER, quadVBO);
    glBufferData(GL_ARRAY_BUFFER, sizeof(quadVertices), quadVertices, GL_STATIC_DRAW);

    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, 5 * sizeof(float), (void*)0);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, 5 * sizeof(float), (void*)(3 * sizeof(float)));
    glEnableVertexAttribArray(1);

    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);
}

PanelRenderer::~PanelRenderer() {
    for (const auto& entry : textures.entries()) {
        GLuint tex = entry.second;
        glDeleteTextures(1, &tex);
    }
    glDeleteVertexArrays(1, &quadVAO);
    glDeleteBuffers(1, &quadVBO);
}

GLuint PanelRenderer::textureFor(const ImageHandle& image, WrapMode wrap) {
    if (!image || !image->hasMetadata())
        throw std::logic_error("PanelRenderer: panel has no loaded image");

    return textures.getOrCreate(image.get(), wrap, [](const Image* source, WrapMode mode) {
        GLint glWrap = mode == WrapMode::REPEAT ? GL_REPEAT : GL_CLAMP_TO_EDGE;
        GLuint tex = 0;
        glGenTextures(1, &tex);
        glBindTexture(GL_TEXTURE_2D, tex);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, glWrap);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, glWrap);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR_MIPMAP_LINEAR);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, source->getWidth(), source->getHeight(),
            0, GL_RGBA, GL_UNSIGNED_BYTE, source->data());
        glGenerateMipmap(GL_TEXTURE_2D);
        glBindTexture(GL_TEXTURE_2D, 0);
        return tex;
    });
}

void PanelRenderer::render(const ProphecyField& field, const glm::mat4& view, const glm::mat4& projection) {
    // Far layers first so blending sees what lies behind.
    std::vector<const Layer*> order;
    for (const auto& layer : field.getLayers())
        order.push_back(&layer);
    std::sort(order.begin(), order.end(), [](const Layer* a, const Layer* b) {
        return a->offset.z < b->offset.z;
    });

    shader.use();
    shader.setMat4("view", view);
    shader.setMat4("projection", projection);
    shader.setInt("uPanel", 0);
    shader.setInt("uBackground", 1);

    glBindVertexArray(quadVAO);
    for (const Layer* layer : order) {
        for (const auto& panel : layer->panels) {
            const PanelUniforms& u = panel.uniforms();

            glActiveTexture(GL_TEXTURE0);
            glBindTexture(GL_TEXTURE_2D, textureFor(u.panelImage, WrapMode::CLAMP_TO_EDGE));
            glActiveTexture(GL_TEXTURE1);
            glBindTexture(GL_TEXTURE_2D, textureFor(u.backgroundImage, WrapMode::REPEAT));

            glm::mat4 model = glm::translate(glm::mat4(1.0f), layer->offset + panel.getPosition());
            model = glm::scale(model, glm::vec3(panel.getSize(), 1.0f));
            shader.setMat4("model", model);
            shader.setVec2("uOffset", u.scrollOffset);
            shader.setFloat("uTint", u.tint);

            glDrawArrays(GL_TRIANGLES, 0, 6);
        }
    }
    glBindVertexArray(0);
    glActiveTexture(GL_TEXTURE0);
}
