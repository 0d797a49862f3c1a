#include "SceneConfig.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(SceneConfigTest, DefaultLayersMatchReferenceScene) {
    std::vector<LayerSpec> layers = defaultLayers();
    ASSERT_EQ(layers.size(), 4u);

    const LayerSpec expected[] = {
        { 150,  6.0f,   0.0f, 7 },
        { 100,  2.0f,  -5.0f, 8 },
        { 100, -3.0f,  -8.0f, 9 },
        { 100, -8.0f, -12.0f, 9 },
    };
    for (size_t i = 0; i < layers.size(); ++i) {
        EXPECT_EQ(layers[i].panelCount, expected[i].panelCount) << "layer " << i;
        EXPECT_FLOAT_EQ(layers[i].depth, expected[i].depth) << "layer " << i;
        EXPECT_FLOAT_EQ(layers[i].tintLevel, expected[i].tintLevel) << "layer " << i;
        EXPECT_EQ(layers[i].columns, expected[i].columns) << "layer " << i;
    }
}

TEST(SceneConfigTest, AssetRootDefaultsAndOverrides) {
    char program[] = "prophecy_field";
    char root[] = "/srv/prophecy";

    char* bare[] = { program };
    SceneConfig defaults = configFromArgs(1, bare);
    EXPECT_EQ(defaults.assetRoot, DEFAULT_ASSET_ROOT);
    EXPECT_EQ(defaults.layers.size(), 4u);

    char* withRoot[] = { program, root };
    EXPECT_EQ(configFromArgs(2, withRoot).assetRoot, "/srv/prophecy");
}

TEST(SceneConfigTest, RejectsExtraArguments) {
    char program[] = "prophecy_field";
    char a[] = "a";
    char b[] = "b";
    char* args[] = { program, a, b };
    EXPECT_THROW(configFromArgs(3, args), std::invalid_argument);
}
