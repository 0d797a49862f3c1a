#pragma once

#include "Image.hpp"
#include "Panel.hpp"

#include <glm/glm.hpp>

#include <random>
#include <stdexcept>
#include <string>
#include <vector>

// One depth layer of the field.
struct LayerSpec {
    int panelCount;
    float depth;
    float tintLevel;
    int columns;
};

struct PanelPlacement {
    int row;
    int col;
    float x;
    float y;
};

class InvalidLayoutError : public std::invalid_argument {
public:
    explicit InvalidLayoutError(const std::string& what) : std::invalid_argument(what) {}
};

// Where panel images come from. The layout never cares how they are stored.
class ImageSource {
public:
    virtual ImageHandle panelImage(int imageIndex) = 0;
    virtual ImageHandle backgroundImage() = 0;
    virtual ~ImageSource() {}
};

// A built layer: its panels sit at z = 0 in layer space, the group offset
// carries the layer depth.
struct Layer {
    LayerSpec spec;
    glm::vec3 offset;
    std::vector<Panel> panels;
};

const int IMAGE_POOL_SIZE = 20;
const float DEFAULT_BASE_SIZE = 1.2f;
const float DEFAULT_SPACING = 2.5f;

int rowCount(int panelCount, int columns);

// Centered grid cell of panel `index`. Requires columns > 0, panelCount > 0.
PanelPlacement placePanel(int index, int columns, int panelCount,
    float spacingX = DEFAULT_SPACING, float spacingY = DEFAULT_SPACING);

// Cycles panel indices through images 1..IMAGE_POOL_SIZE.
int imageIndexFor(int panelIndex);

class LayoutEngine {
public:
    LayoutEngine(ImageSource& images, float baseSize = DEFAULT_BASE_SIZE,
        glm::vec2 spacing = glm::vec2(DEFAULT_SPACING), unsigned int seed = std::random_device{}());

    // Throws InvalidLayoutError when panelCount or columns is not positive.
    Layer buildLayer(const LayerSpec& spec);
    std::vector<Layer> buildField(const std::vector<LayerSpec>& specs);

    float getBaseSize() const { return baseSize; }
    glm::vec2 getSpacing() const { return spacing; }

private:
    ImageSource& images;
    float baseSize;
    glm::vec2 spacing;
    std::mt19937 rng;
};
