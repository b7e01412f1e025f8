#pragma once

#include "bubbles/node.h"
#include "bubbles/params.h"

namespace bubbles {

// Result of the coverage computation, exposed for diagnostics and tests
struct CoverageInfo {
    double footprint_area = 0.0; // sum of pi * (radius * effective_scale)^2
    double target_coverage = 0.0; // fraction of the viewport to fill
    double area_scale = 1.0;      // uniform correction, in [0.85, 1.35]
};

// Base scale before coverage correction: larger size_factor fills more area
double effectiveScale(double size_factor);

// Coverage target and uniform area scale for a batch in a viewport
CoverageInfo computeCoverage(NodeList const& nodes, Viewport viewport);

// Assign every node a scale and, if it has no layout yet, a random position,
// velocity in [-5, 5] px/s and random wander phases. Nodes that already have
// layout state only get their scale recomputed.
CoverageInfo packLayout(NodeList& nodes, Viewport viewport, Rng& rng,
                        LayoutParams const& params = {});

} // namespace bubbles
