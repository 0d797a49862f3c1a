#pragma once

#include "Image.hpp"
#include "LayoutEngine.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <unordered_map>

class AssetLoadError : public std::runtime_error {
public:
    AssetLoadError(const std::string& path, const std::string& reason)
        : std::runtime_error("Failed to load image " + path + ": " + reason), assetPath(path) {}

    const std::string& path() const { return assetPath; }

private:
    std::string assetPath;
};

// Decodes images from disk once per path and hands out shared handles.
class ImageLibrary : public ImageSource {
public:
    explicit ImageLibrary(std::string assetRoot);

    // Path is relative to the asset root. Throws AssetLoadError.
    ImageHandle load(const std::string& relativePath);

    // img/prophecies/<index>.png, index in 1..IMAGE_POOL_SIZE.
    ImageHandle panelImage(int imageIndex) override;
    ImageHandle backgroundImage() override;

    static std::string panelImagePath(int imageIndex);

    std::size_t cachedCount() const { return cache.size(); }
    const std::string& getAssetRoot() const { return root; }

private:
    std::string root;
    std::unordered_map<std::string, ImageHandle> cache;
};
