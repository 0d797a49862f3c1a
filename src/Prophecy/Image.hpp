#pragma once

#include <glm/glm.hpp>

#include <cstdint>
#include <memory>
#include <vector>

enum class WrapMode { CLAMP_TO_EDGE, REPEAT };

// Decoded RGBA8 pixel buffer. Row 0 is the bottom row, so texel (x, y)
// matches GL texture coordinates without a flip at upload time.
class Image {
public:
    Image() : width(0), height(0) {}
    Image(int w, int h, std::vector<std::uint8_t> rgba);

    // Builds an image from normalized colors given in row-major order.
    static Image fromColors(int w, int h, const std::vector<glm::vec4>& colors);

    int getWidth() const { return width; }
    int getHeight() const { return height; }
    bool hasMetadata() const { return width > 0 && height > 0; }
    const std::uint8_t* data() const { return pixels.data(); }

    glm::vec4 texel(int x, int y) const;

    // Nearest-neighbour lookup at uv in [0,1]^2 (outside that range the wrap
    // mode decides).
    glm::vec4 sample(const glm::vec2& uv, WrapMode wrap) const;

private:
    int width;
    int height;
    std::vector<std::uint8_t> pixels;
};

using ImageHandle = std::shared_ptr<const Image>;

// Width over height, or 1 when the image is missing or has no size yet.
float aspectRatioOf(const ImageHandle& image);
