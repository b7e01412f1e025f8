#include "bubbles/overlap_resolver.h"

#include <cmath>

namespace bubbles {

namespace {
constexpr double MIN_DIST_SQ = 0.0001;
} // namespace

std::optional<Contact> separatePair(Layout2D& a, double a_radius, Layout2D& b, double b_radius,
                                    double gap) {
    double const dx = b.x - a.x;
    double const dy = b.y - a.y;
    double const dist_sq = dx * dx + dy * dy;
    double const min_dist = a_radius + b_radius + gap;

    if (dist_sq >= min_dist * min_dist || dist_sq <= MIN_DIST_SQ) {
        return std::nullopt;
    }

    double const dist = std::sqrt(dist_sq);
    double const push = (min_dist - dist) * 0.5;
    Contact c{dx / dist, dy / dist};
    a.x -= c.nx * push;
    a.y -= c.ny * push;
    b.x += c.nx * push;
    b.y += c.ny * push;
    return c;
}

bool clampToBounds(Node& node, Viewport viewport, double margin) {
    if (!node.layout) {
        return false;
    }
    Viewport const vp = viewport.floored();
    Layout2D& p = *node.layout;
    double const r = node.radius * p.scale;

    double x = clamp(p.x, margin + r, vp.width - margin - r);
    double y = clamp(p.y, margin + r, vp.height - margin - r);
    bool moved = x != p.x || y != p.y;
    p.x = x;
    p.y = y;
    return moved;
}

void resolveOverlaps(NodeList& nodes, Viewport viewport, LayoutParams const& params) {
    for (int iter = 0; iter < params.overlap_iterations; ++iter) {
        for (size_t i = 0; i < nodes.size(); ++i) {
            for (size_t j = i + 1; j < nodes.size(); ++j) {
                Node& a = nodes[i];
                Node& b = nodes[j];
                if (!a.layout || !b.layout) {
                    continue;
                }
                separatePair(*a.layout, a.scaledRadius(), *b.layout, b.scaledRadius(), params.overlap_gap);
            }
        }

        for (auto& node : nodes) {
            clampToBounds(node, viewport, params.bounds_margin);
        }
    }
}

double separatedPairFraction(NodeList const& nodes, double gap, double tolerance) {
    size_t pairs = 0;
    size_t separated = 0;
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (!nodes[i].layout) {
            continue;
        }
        for (size_t j = i + 1; j < nodes.size(); ++j) {
            if (!nodes[j].layout) {
                continue;
            }
            auto const& a = *nodes[i].layout;
            auto const& b = *nodes[j].layout;
            double dist = std::hypot(b.x - a.x, b.y - a.y);
            double needed = nodes[i].scaledRadius() + nodes[j].scaledRadius() + gap;
            ++pairs;
            if (dist >= needed - tolerance) {
                ++separated;
            }
        }
    }
    return pairs == 0 ? 1.0 : static_cast<double>(separated) / static_cast<double>(pairs);
}

} // namespace bubbles
