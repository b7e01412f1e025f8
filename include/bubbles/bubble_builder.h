#pragma once

#include "bubbles/node.h"
#include "bubbles/params.h"
#include "bubbles/radius_model.h"

namespace bubbles {

struct BuildOptions {
    Timeframe timeframe = Timeframe::Hour24;
    SizeMode size_mode = SizeMode::Cap;
    double width = 0.0;  // floored to MIN_VIEWPORT
    double height = 0.0; // floored to MIN_VIEWPORT
    DepthRange depth_range;
    LayoutParams layout;
};

// Summary of a build, for logging
struct BuildStats {
    size_t node_count = 0;
    size_t carried_layouts = 0; // nodes whose layout came from `previous`
    double area_scale = 1.0;
    double target_coverage = 0.0;
};

// Build the node set for a batch of instruments, in input order.
//
// Nodes in `previous` with layout state hand it to the new node for the same instrument
// id, so bubbles keep their place across data refreshes. If every node was carried over
// only the scales are refreshed; otherwise the overlap resolver settles the new arrivals.
NodeList buildNodes(InstrumentList const& instruments, BuildOptions const& options, Rng& rng,
                    NodeList const& previous = {}, BuildStats* stats = nullptr);

} // namespace bubbles
