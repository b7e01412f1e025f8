#include "bubbles/pack_layout.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace bubbles {

namespace {

constexpr double BASE_SCALE = 0.75;
constexpr double SIZE_FACTOR_SCALE = 0.45;

// Coverage targets by batch size
constexpr double COVERAGE_SMALL = 0.82;  // <= 60 nodes
constexpr double COVERAGE_MEDIUM = 0.78; // <= 80 nodes
constexpr double COVERAGE_LARGE = 0.75;
constexpr double COVERAGE_FLOOR = 0.62;

// Average radius above which coverage is reduced
constexpr double CROWDED_RADIUS = 30.0;
constexpr double CROWDED_RADIUS_RANGE = 18.0;
constexpr double CROWDED_COVERAGE_CUT = 0.12;

constexpr double AREA_SCALE_MIN = 0.85;
constexpr double AREA_SCALE_MAX = 1.35;

constexpr double INITIAL_SPEED = 10.0; // velocity components in [-5, 5]

} // namespace

double effectiveScale(double size_factor) {
    return BASE_SCALE + size_factor * SIZE_FACTOR_SCALE;
}

CoverageInfo computeCoverage(NodeList const& nodes, Viewport viewport) {
    CoverageInfo info;
    if (nodes.empty()) {
        return info;
    }
    Viewport const vp = viewport.floored();
    double const count = static_cast<double>(nodes.size());

    double radius_sum = 0.0;
    for (auto const& node : nodes) {
        double r = node.radius * effectiveScale(node.size_factor);
        info.footprint_area += M_PI * r * r;
        radius_sum += node.radius;
    }
    double const avg_radius = radius_sum / count;

    double base = COVERAGE_SMALL;
    if (nodes.size() > 80) {
        base = COVERAGE_LARGE;
    } else if (nodes.size() > 60) {
        base = COVERAGE_MEDIUM;
    }
    // Closely spaced large radii crowd the canvas; leave more room
    double inflation = clamp((avg_radius - CROWDED_RADIUS) / CROWDED_RADIUS_RANGE, 0.0, 1.0);
    info.target_coverage = clamp(base - inflation * CROWDED_COVERAGE_CUT, COVERAGE_FLOOR, base);

    double target_area = vp.width * vp.height * info.target_coverage;
    double footprint = info.footprint_area > 0.0 ? info.footprint_area : 1.0;
    info.area_scale = clamp(std::sqrt(target_area / footprint), AREA_SCALE_MIN, AREA_SCALE_MAX);
    return info;
}

CoverageInfo packLayout(NodeList& nodes, Viewport viewport, Rng& rng, LayoutParams const& params) {
    CoverageInfo info = computeCoverage(nodes, viewport);
    if (nodes.empty()) {
        return info;
    }
    Viewport const vp = viewport.floored();

    // Largest first
    std::vector<size_t> order(nodes.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&nodes](size_t a, size_t b) {
        return nodes[a].radius > nodes[b].radius;
    });

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    double const margin = params.placement_margin;

    for (size_t idx : order) {
        Node& node = nodes[idx];
        double scale = effectiveScale(node.size_factor) * info.area_scale;
        if (node.layout) {
            node.layout->scale = scale;
            continue;
        }

        double r_px = node.radius * scale;
        Layout2D layout;
        layout.x = margin + r_px + unit(rng) * (vp.width - 2.0 * (margin + r_px));
        layout.y = margin + r_px + unit(rng) * (vp.height - 2.0 * (margin + r_px));
        layout.scale = scale;
        layout.vx = (unit(rng) - 0.5) * INITIAL_SPEED;
        layout.vy = (unit(rng) - 0.5) * INITIAL_SPEED;
        layout.seed = unit(rng) * 2.0 * M_PI;
        layout.t = unit(rng) * 2.0 * M_PI;
        node.layout = layout;
    }
    return info;
}

} // namespace bubbles
