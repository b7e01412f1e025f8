#include "bubbles/bubble_builder.h"

#include "bubbles/metric_extractor.h"
#include "bubbles/overlap_resolver.h"
#include "bubbles/pack_layout.h"
#include "bubbles/sphere_scatter.h"

#include <string>
#include <unordered_map>

namespace bubbles {

namespace {

size_t carryOverLayouts(NodeList& nodes, NodeList const& previous) {
    if (previous.empty()) {
        return 0;
    }
    std::unordered_map<std::string, Layout2D const*> by_id;
    for (auto const& old : previous) {
        if (old.instrument && old.layout) {
            by_id.emplace(old.instrument->id, &*old.layout);
        }
    }

    size_t carried = 0;
    for (auto& node : nodes) {
        auto it = by_id.find(node.instrument->id);
        if (it != by_id.end()) {
            node.layout = *it->second;
            ++carried;
            // A duplicate id later in the batch gets a fresh position
            by_id.erase(it);
        }
    }
    return carried;
}

} // namespace

NodeList buildNodes(InstrumentList const& instruments, BuildOptions const& options, Rng& rng,
                    NodeList const& previous, BuildStats* stats) {
    NodeList nodes;
    if (instruments.empty()) {
        if (stats) {
            *stats = BuildStats{};
        }
        return nodes;
    }

    auto metrics = computeMetrics(instruments, options.timeframe);
    auto radii = computeRadii(metrics, options.size_mode);

    size_t const total = instruments.size();
    nodes.reserve(total);
    for (size_t i = 0; i < total; ++i) {
        Node node;
        node.instrument = instruments[i];
        node.radius = radii[i];
        node.size_factor = sizeFactorFor(node.radius);

        auto pos = scatterPosition(i, total, options.depth_range);
        node.x = pos.x;
        node.y = pos.y;
        node.z = pos.z;
        node.depth = pos.depth;
        node.x2d = pos.x2d;
        node.y2d = pos.y2d;
        nodes.push_back(std::move(node));
    }

    size_t carried = carryOverLayouts(nodes, previous);

    Viewport const viewport = Viewport{options.width, options.height}.floored();
    CoverageInfo coverage = packLayout(nodes, viewport, rng, options.layout);
    if (carried < nodes.size()) {
        resolveOverlaps(nodes, viewport, options.layout);
    }

    if (stats) {
        stats->node_count = nodes.size();
        stats->carried_layouts = carried;
        stats->area_scale = coverage.area_scale;
        stats->target_coverage = coverage.target_coverage;
    }
    return nodes;
}

} // namespace bubbles
