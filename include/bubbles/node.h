#pragma once

#include "instrument.h"

#include <algorithm>
#include <optional>
#include <random>
#include <vector>

namespace bubbles {

// Radius range in pixels before anchor and coverage scaling
constexpr double MIN_RADIUS = 18.0;
constexpr double MAX_RADIUS = 54.0;

// The top-ranked bubble in cap/volume mode is this much larger than MAX_RADIUS
constexpr double ANCHOR_SCALE = 1.55;

// Viewports smaller than this collapse the geometry
constexpr double MIN_VIEWPORT = 200.0;

// All layout and physics randomness goes through an explicitly seeded generator
using Rng = std::mt19937;

struct Viewport {
    double width = 0.0;
    double height = 0.0;

    // Both dimensions raised to MIN_VIEWPORT
    Viewport floored() const { return {std::max(MIN_VIEWPORT, width), std::max(MIN_VIEWPORT, height)}; }
};

struct DepthRange {
    double min = -1.0;
    double max = 1.0;
};

// On-screen 2D state, created by the pack layout and mutated by the physics
struct Layout2D {
    double x = 0.0;
    double y = 0.0;
    double scale = 1.0; // area-coverage correction, multiplies radius
    double vx = 0.0;    // px/s
    double vy = 0.0;
    double seed = 0.0;  // wander phase offset
    double t = 0.0;     // wander phase accumulator
};

struct Node {
    InstrumentPtr instrument;

    double radius = MIN_RADIUS;
    double size_factor = 0.0;

    // Unit-sphere scatter position for the pseudo-3D view
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    double depth = 0.0;

    // Spiral fallback position in [-0.9, 0.9] before a pack layout exists
    double x2d = 0.0;
    double y2d = 0.0;

    std::optional<Layout2D> layout;

    // Radius in pixels as drawn (radius * scale); plain radius without layout
    double scaledRadius() const { return layout ? radius * layout->scale : radius; }
};

using NodeList = std::vector<Node>;

// Unlike std::clamp, well defined when hi < lo (lo wins)
inline double clamp(double value, double lo, double hi) {
    return std::max(lo, std::min(hi, value));
}

} // namespace bubbles
