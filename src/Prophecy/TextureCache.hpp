#pragma once

#include "Image.hpp"

#include <cstddef>
#include <map>
#include <utility>

// GPU texture names keyed by source image and wrap mode. The same Image drawn
// with two wrap modes gets two textures, since wrap is texture state.
class TextureCache {
public:
    using Key = std::pair<const Image*, WrapMode>;

    // Returns the cached name for (image, wrap), calling create(image, wrap)
    // to make it on first use.
    template <typename Create>
    unsigned int getOrCreate(const Image* image, WrapMode wrap, Create create) {
        const Key key(image, wrap);
        auto it = textures.find(key);
        if (it != textures.end())
            return it->second;
        unsigned int name = create(image, wrap);
        textures.emplace(key, name);
        return name;
    }

    std::size_t size() const { return textures.size(); }
    const std::map<Key, unsigned int>& entries() const { return textures; }

private:
    std::map<Key, unsigned int> textures;
};
