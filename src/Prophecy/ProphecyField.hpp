#pragma once

#include "LayoutEngine.hpp"

#include <cstddef>
#include <vector>

// All layers of the scene. The host calls onFrame once per rendered frame.
class ProphecyField {
public:
    explicit ProphecyField(std::vector<Layer> layers);

    void onFrame(float deltaSeconds);

    const std::vector<Layer>& getLayers() const { return layers; }
    std::size_t panelCount() const;

private:
    std::vector<Layer> layers;
};
