#pragma once

#include "bubbles/node.h"
#include "bubbles/params.h"
#include "bubbles/radius_model.h"
#include "instrument.h"

#include <cmath>
#include <memory>
#include <string>

namespace test_helpers {

inline InstrumentPtr makeInstrument(std::string const& id, double cap, double volume = 1e6,
                                    double change_24h = 0.0) {
    auto inst = std::make_shared<Instrument>();
    inst->id = id;
    inst->symbol = id;
    inst->name = id;
    inst->market_cap = cap;
    inst->total_volume = volume;
    inst->change_24h = change_24h;
    return inst;
}

// n instruments with random caps, volumes and changes
inline InstrumentList randomBatch(size_t n, uint32_t seed) {
    bubbles::Rng rng(seed);
    std::uniform_real_distribution<double> log_value(3.0, 12.0);
    std::uniform_real_distribution<double> change(-20.0, 20.0);
    InstrumentList batch;
    for (size_t i = 0; i < n; ++i) {
        batch.push_back(makeInstrument("coin" + std::to_string(i), std::pow(10.0, log_value(rng)),
                                       std::pow(10.0, log_value(rng)), change(rng)));
    }
    return batch;
}

// Bare node with a given radius, no layout
inline bubbles::Node makeNode(double radius, std::string const& id = "n") {
    bubbles::Node node;
    node.instrument = makeInstrument(id, 1.0);
    node.radius = radius;
    node.size_factor = bubbles::sizeFactorFor(radius);
    return node;
}

// Node with layout at (x, y), scale 1
inline bubbles::Node makePlacedNode(double radius, double x, double y, double vx = 0.0,
                                    double vy = 0.0, std::string const& id = "n") {
    bubbles::Node node = makeNode(radius, id);
    bubbles::Layout2D layout;
    layout.x = x;
    layout.y = y;
    layout.vx = vx;
    layout.vy = vy;
    layout.scale = 1.0;
    node.layout = layout;
    return node;
}

// Physics with the steering noise switched off, for exact expectations
inline bubbles::PhysicsParams quietPhysics() {
    bubbles::PhysicsParams params;
    params.wander_strength = 0.0;
    params.jitter_strength = 0.0;
    params.velocity_damping = 1.0;
    return params;
}

} // namespace test_helpers
