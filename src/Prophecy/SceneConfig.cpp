#include "SceneConfig.hpp"

#include <stdexcept>

std::vector<LayerSpec> defaultLayers() {
    return {
        // count  depth  tint    columns
        { 150,    6.0f,   0.0f,  7 },
        { 100,    2.0f,  -5.0f,  8 },
        { 100,   -3.0f,  -8.0f,  9 },
        { 100,   -8.0f, -12.0f,  9 },
    };
}

SceneConfig configFromArgs(int argc, char* argv[]) {
    if (argc > 2)
        throw std::invalid_argument("usage: prophecy_field [assetRoot]");

    SceneConfig config;
    if (argc == 2)
        config.assetRoot = argv[1];
    config.layers = defaultLayers();
    return config;
}
