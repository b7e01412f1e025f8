#include "bubbles/physics_stepper.h"

#include "bubbles/overlap_resolver.h"

#include <cmath>

namespace bubbles {

namespace {

void integrate(Node& node, Viewport vp, double dt, PhysicsParams const& params) {
    Layout2D& p = *node.layout;
    double const r = node.radius * p.scale;
    p.x += p.vx * dt;
    p.y += p.vy * dt;

    double const min_x = params.bounds_margin + r;
    double const max_x = vp.width - params.bounds_margin - r;
    double const min_y = params.bounds_margin + r;
    double const max_y = vp.height - params.bounds_margin - r;

    if (p.x < min_x) {
        p.x = min_x;
        p.vx = std::abs(p.vx) * params.boundary_restitution;
    } else if (p.x > max_x) {
        p.x = max_x;
        p.vx = -std::abs(p.vx) * params.boundary_restitution;
    }
    if (p.y < min_y) {
        p.y = min_y;
        p.vy = std::abs(p.vy) * params.boundary_restitution;
    } else if (p.y > max_y) {
        p.y = max_y;
        p.vy = -std::abs(p.vy) * params.boundary_restitution;
    }
}

void collide(Node& a_node, Node& b_node, PhysicsParams const& params) {
    Layout2D& a = *a_node.layout;
    Layout2D& b = *b_node.layout;
    auto contact = separatePair(a, a_node.scaledRadius(), b, b_node.scaledRadius(), params.collision_gap);
    if (!contact) {
        return;
    }

    double const rel_vel = (b.vx - a.vx) * contact->nx + (b.vy - a.vy) * contact->ny;
    if (rel_vel < 0.0) {
        double const impulse = -rel_vel * params.collision_impulse;
        a.vx -= impulse * contact->nx;
        a.vy -= impulse * contact->ny;
        b.vx += impulse * contact->nx;
        b.vy += impulse * contact->ny;
    }
}

void wander(Layout2D& p, double dt, Rng& rng, PhysicsParams const& params) {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    p.t += dt;
    // Per frame, not per second
    p.vx *= params.velocity_damping;
    p.vy *= params.velocity_damping;
    p.vx += std::cos(p.seed + p.t * params.wander_freq_x) * params.wander_strength * dt;
    p.vy += std::sin(p.seed + p.t * params.wander_freq_y) * params.wander_strength * dt;
    p.vx += (unit(rng) - 0.5) * params.jitter_strength * dt;
    p.vy += (unit(rng) - 0.5) * params.jitter_strength * dt;
}

} // namespace

void stepPhysics(NodeList& nodes, Viewport viewport, double dt, Rng& rng, PhysicsParams const& params) {
    Viewport const vp = viewport.floored();

    for (auto& node : nodes) {
        if (node.layout) {
            integrate(node, vp, dt, params);
        }
    }

    for (size_t i = 0; i < nodes.size(); ++i) {
        for (size_t j = i + 1; j < nodes.size(); ++j) {
            if (nodes[i].layout && nodes[j].layout) {
                collide(nodes[i], nodes[j], params);
            }
        }
    }

    for (auto& node : nodes) {
        if (node.layout) {
            wander(*node.layout, dt, rng, params);
        }
    }
}

void pinNode(Node& node, double x, double y) {
    if (!node.layout) {
        return;
    }
    node.layout->x = x;
    node.layout->y = y;
    node.layout->vx = 0.0;
    node.layout->vy = 0.0;
}

} // namespace bubbles
