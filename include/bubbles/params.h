#pragma once

namespace bubbles {

// Initial placement and overlap relaxation
struct LayoutParams {
    double placement_margin = 8.0; // inset for random initial placement (px)
    double bounds_margin = 12.0;   // inset for clamping against the viewport (px)
    double overlap_gap = 8.0;      // minimum free space between two bubbles (px)
    int overlap_iterations = 14;
};

// Per-frame motion
struct PhysicsParams {
    double bounds_margin = 12.0;
    double collision_gap = 8.0;
    double boundary_restitution = 0.85; // velocity kept after a wall bounce
    double collision_impulse = 0.45;    // fraction of closing speed exchanged on contact
    double velocity_damping = 0.992;    // applied once per frame, independent of dt
    double wander_strength = 14.0;      // px/s^2
    double wander_freq_x = 1.2;
    double wander_freq_y = 1.35;
    double jitter_strength = 4.0;       // px/s^2, uniform noise
};

} // namespace bubbles
