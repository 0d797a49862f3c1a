#include "Image.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

Image::Image(int w, int h, std::vector<std::uint8_t> rgba)
    : width(w), height(h), pixels(std::move(rgba))
{
    if (w < 0 || h < 0)
        throw std::invalid_argument("Image: negative dimensions");
    if (pixels.size() != static_cast<size_t>(w) * h * 4)
        throw std::invalid_argument("Image: pixel buffer does not match dimensions");
}

Image Image::fromColors(int w, int h, const std::vector<glm::vec4>& colors) {
    if (colors.size() != static_cast<size_t>(w) * h)
        throw std::invalid_argument("Image: color count does not match dimensions");

    std::vector<std::uint8_t> rgba;
    rgba.reserve(colors.size() * 4);
    for (const auto& c : colors) {
        for (int i = 0; i < 4; ++i) {
            float v = glm::clamp(c[i], 0.0f, 1.0f);
            rgba.push_back(static_cast<std::uint8_t>(std::lround(v * 255.0f)));
        }
    }
    return Image(w, h, std::move(rgba));
}

glm::vec4 Image::texel(int x, int y) const {
    if (x < 0 || y < 0 || x >= width || y >= height)
        throw std::out_of_range("Image: texel outside image");
    size_t idx = (static_cast<size_t>(y) * width + x) * 4;
    return glm::vec4(pixels[idx + 0], pixels[idx + 1],
        pixels[idx + 2], pixels[idx + 3]) / 255.0f;
}

static int wrapCoord(float t, int size, WrapMode wrap) {
    if (wrap == WrapMode::REPEAT)
        t -= std::floor(t);
    else
        t = glm::clamp(t, 0.0f, 1.0f);
    int i = static_cast<int>(std::floor(t * size));
    return std::min(std::max(i, 0), size - 1);
}

glm::vec4 Image::sample(const glm::vec2& uv, WrapMode wrap) const {
    if (!hasMetadata())
        throw std::logic_error("Image: sampling an empty image");
    return texel(wrapCoord(uv.x, width, wrap), wrapCoord(uv.y, height, wrap));
}

float aspectRatioOf(const ImageHandle& image) {
    if (!image || !image->hasMetadata())
        return 1.0f;
    return static_cast<float>(image->getWidth()) / static_cast<float>(image->getHeight());
}
