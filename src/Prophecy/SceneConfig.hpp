#pragma once

#include "LayoutEngine.hpp"

#include <glm/glm.hpp>

#include <string>
#include <vector>

// ---------------------- Window & Camera ----------------------
const int WINDOW_WIDTH = 1280;
const int WINDOW_HEIGHT = 720;
const char* const WINDOW_TITLE = "Prophecy Field";
const glm::vec3 CAMERA_POSITION(0.0f, 0.0f, 10.0f);
const float CAMERA_FOV = 50.0f;     // vertical, degrees
const float CAMERA_NEAR = 0.1f;
const float CAMERA_FAR = 1000.0f;

// ---------------------- Assets ----------------------
const char* const DEFAULT_ASSET_ROOT = "assets";
const char* const PANEL_IMAGE_DIR = "img/prophecies";
const char* const BACKGROUND_IMAGE_PATH = "img/ocean.png";

// ---------------------- Starfield ----------------------
const int STAR_COUNT = 3000;
const float STAR_RADIUS = 100.0f;
const float STAR_DEPTH = 50.0f;
const float STAR_SIZE_FACTOR = 4.0f;

struct SceneConfig {
    std::string assetRoot = DEFAULT_ASSET_ROOT;
    std::vector<LayerSpec> layers;
};

// The four stacked layers of the reference scene, nearest first.
std::vector<LayerSpec> defaultLayers();

// prophecy_field [assetRoot]
SceneConfig configFromArgs(int argc, char* argv[]);
