#include "LayoutEngine.hpp"

#include <sstream>
#include <utility>

int rowCount(int panelCount, int columns) {
    return (panelCount + columns - 1) / columns;
}

PanelPlacement placePanel(int index, int columns, int panelCount, float spacingX, float spacingY) {
    int rows = rowCount(panelCount, columns);
    PanelPlacement p;
    p.row = index / columns;
    p.col = index % columns;
    p.x = (p.col - (columns - 1) / 2.0f) * spacingX;
    p.y = ((rows - 1) / 2.0f - p.row) * spacingY;
    return p;
}

int imageIndexFor(int panelIndex) {
    return (panelIndex % IMAGE_POOL_SIZE) + 1;
}

LayoutEngine::LayoutEngine(ImageSource& imageSource, float size, glm::vec2 gridSpacing, unsigned int seed)
    : images(imageSource), baseSize(size), spacing(gridSpacing), rng(seed)
{
}

static void validate(const LayerSpec& spec) {
    if (spec.panelCount > 0 && spec.columns > 0)
        return;
    std::ostringstream oss;
    oss << "LayoutEngine: invalid layer (panelCount=" << spec.panelCount
        << ", columns=" << spec.columns << ")";
    throw InvalidLayoutError(oss.str());
}

Layer LayoutEngine::buildLayer(const LayerSpec& spec) {
    validate(spec);

    Layer layer;
    layer.spec = spec;
    layer.offset = glm::vec3(0.0f, 0.0f, spec.depth);
    layer.panels.reserve(spec.panelCount);

    ImageHandle background = images.backgroundImage();
    for (int i = 0; i < spec.panelCount; ++i) {
        PanelPlacement p = placePanel(i, spec.columns, spec.panelCount, spacing.x, spacing.y);
        layer.panels.emplace_back(images.panelImage(imageIndexFor(i)), background,
            baseSize, spec.tintLevel, glm::vec3(p.x, p.y, 0.0f), rng);
    }
    return layer;
}

std::vector<Layer> LayoutEngine::buildField(const std::vector<LayerSpec>& specs) {
    std::vector<Layer> layers;
    layers.reserve(specs.size());
    for (const auto& spec : specs)
        layers.push_back(buildLayer(spec));
    return layers;
}
