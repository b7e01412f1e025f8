#pragma once

#include "bubbles/node.h"
#include "bubbles/params.h"

namespace bubbles {

// Advance every node with layout state by one frame of dt seconds:
// integrate, bounce off the viewport edges, resolve pairwise contacts with a soft
// impulse, then damp and add the wander steering force.
//
// dt is not clamped here. Callers cap it (0.05s) so a long pause does not tunnel
// bubbles through the walls.
void stepPhysics(NodeList& nodes, Viewport viewport, double dt, Rng& rng,
                 PhysicsParams const& params = {});

// Stop a node where it is, e.g. while the host drags it
void pinNode(Node& node, double x, double y);

} // namespace bubbles
