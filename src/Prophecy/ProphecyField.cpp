#include "ProphecyField.hpp"

#include <utility>

ProphecyField::ProphecyField(std::vector<Layer> builtLayers)
    : layers(std::move(builtLayers))
{
}

void ProphecyField::onFrame(float deltaSeconds) {
    for (auto& layer : layers)
        for (auto& panel : layer.panels)
            panel.onFrame(deltaSeconds);
}

std::size_t ProphecyField::panelCount() const {
    std::size_t total = 0;
    for (const auto& layer : layers)
        total += layer.panels.size();
    return total;
}
