#pragma once

#include "bubbles/node.h"
#include "bubbles/params.h"

#include <optional>

namespace bubbles {

// Contact normal from a to b after a separation
struct Contact {
    double nx, ny;
};

// Push a and b apart symmetrically (half the overlap each) if circles of the given
// on-screen radii are closer than the gap allows. Coincident centers are left alone.
// Returns the contact normal when a push happened.
std::optional<Contact> separatePair(Layout2D& a, double a_radius, Layout2D& b, double b_radius,
                                    double gap);

// Keep a node inside the viewport, inset by its scaled radius plus margin.
// Returns true if the position was changed.
bool clampToBounds(Node& node, Viewport viewport, double margin);

// Positional relaxation run once after packing. Best effort: a fixed number of
// Gauss-Seidel passes, each followed by clamping back into the viewport.
// Nodes without layout are ignored.
void resolveOverlaps(NodeList& nodes, Viewport viewport, LayoutParams const& params = {});

// Fraction of node pairs (both with layout) at least gap - tolerance apart. 1 when fewer
// than two nodes have layout.
double separatedPairFraction(NodeList const& nodes, double gap, double tolerance = 1e-6);

} // namespace bubbles
