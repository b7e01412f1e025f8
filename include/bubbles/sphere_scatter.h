#pragma once

#include "bubbles/node.h"

#include <cstddef>

namespace bubbles {

struct ScatterPosition {
    double x, y, z; // unit sphere
    double depth;   // z remapped into the depth range
    double x2d, y2d; // golden-angle spiral, radius <= 0.9
};

// Fibonacci lattice placement of item `index` out of `total`.
// Deterministic: depends only on the arguments.
ScatterPosition scatterPosition(size_t index, size_t total, DepthRange depth_range = {});

} // namespace bubbles
