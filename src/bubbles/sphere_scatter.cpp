#include "bubbles/sphere_scatter.h"

#include <cmath>

namespace bubbles {

namespace {
constexpr double SPIRAL_EXTENT = 0.9;
} // namespace

ScatterPosition scatterPosition(size_t index, size_t total, DepthRange depth_range) {
    double const n = static_cast<double>(total == 0 ? 1 : total);
    double const i = static_cast<double>(index) + 0.5;

    // Sphere: polar angle spaced evenly in cos, azimuth stepped by the golden angle
    double const phi = std::acos(2.0 * i / n - 1.0);
    double const theta = M_PI * (1.0 + std::sqrt(5.0)) * i;

    ScatterPosition pos;
    pos.x = std::cos(theta) * std::sin(phi);
    pos.y = std::sin(theta) * std::sin(phi);
    pos.z = std::cos(phi);
    pos.depth = depth_range.min + (depth_range.max - depth_range.min) * ((pos.z + 1.0) / 2.0);

    // Sunflower spiral
    double const golden = M_PI * (3.0 - std::sqrt(5.0));
    double const angle = golden * i;
    double const r2d = std::sqrt(i / n) * SPIRAL_EXTENT;
    pos.x2d = std::cos(angle) * r2d;
    pos.y2d = std::sin(angle) * r2d;

    return pos;
}

} // namespace bubbles
