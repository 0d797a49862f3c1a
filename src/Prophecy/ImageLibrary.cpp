#include "ImageLibrary.hpp"
#include "SceneConfig.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <iostream>
#include <memory>
#include <utility>
#include <vector>

ImageLibrary::ImageLibrary(std::string assetRoot)
    : root(std::move(assetRoot))
{
}

static std::string joinPath(const std::string& root, const std::string& relative) {
    if (root.empty())
        return relative;
    if (root.back() == '/')
        return root + relative;
    return root + "/" + relative;
}

ImageHandle ImageLibrary::load(const std::string& relativePath) {
    auto it = cache.find(relativePath);
    if (it != cache.end())
        return it->second;

    std::string fullPath = joinPath(root, relativePath);

    // GL expects the bottom row first.
    stbi_set_flip_vertically_on_load(true);
    int width = 0, height = 0, channels = 0;
    unsigned char* data = stbi_load(fullPath.c_str(), &width, &height, &channels, 4);
    if (!data) {
        const char* reason = stbi_failure_reason();
        throw AssetLoadError(fullPath, reason ? reason : "unknown error");
    }

    std::vector<std::uint8_t> rgba(data, data + static_cast<size_t>(width) * height * 4);
    stbi_image_free(data);

    std::cout << "Loaded image: " << fullPath << ", width:" << width
        << ", height:" << height << ", channels:" << channels << std::endl;

    ImageHandle image = std::make_shared<Image>(width, height, std::move(rgba));
    cache.emplace(relativePath, image);
    return image;
}

std::string ImageLibrary::panelImagePath(int imageIndex) {
    if (imageIndex < 1 || imageIndex > IMAGE_POOL_SIZE)
        throw std::out_of_range("ImageLibrary: panel image index " + std::to_string(imageIndex) + " outside 1.." + std::to_string(IMAGE_POOL_SIZE));
    return std::string(PANEL_IMAGE_DIR) + "/" + std::to_string(imageIndex) + ".png";
}

ImageHandle ImageLibrary::panelImage(int imageIndex) {
    return load(panelImagePath(imageIndex));
}

ImageHandle ImageLibrary::backgroundImage() {
    return load(BACKGROUND_IMAGE_PATH);
}
