#pragma once

#include "bubbles/bubble_builder.h"
#include "bubbles/params.h"
#include "instrument.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

// Sizing and 3D depth
struct DisplayParams {
    Timeframe timeframe = Timeframe::Hour24;
    bubbles::SizeMode size_mode = bubbles::SizeMode::Cap;
    double depth_min = -1.0;
    double depth_max = 1.0;
};

struct ViewportParams {
    int width = 1280;
    int height = 800;
};

struct SimulationParams {
    double duration_seconds = 20.0; // animated time
    int fps = 60;                   // frame clock of the driver
    double max_dt = 0.05;           // ceiling on a single physics step (seconds)
    uint32_t seed = 0;              // 0 = seed from std::random_device

    int totalFrames() const {
        return std::max(1, static_cast<int>(std::lround(duration_seconds * fps)));
    }

    double frameDuration() const { return 1.0 / fps; }

    // dt handed to the physics, after the pause guard
    double stepDt() const { return std::min(frameDuration(), max_dt); }
};

// Output directory mode (not configurable via TOML; set by the caller)
enum class OutputMode {
    Timestamped, // Create run_YYYYMMDD_HHMMSS subdirectory
    Direct       // Write directly to output.directory
};

struct OutputParams {
    std::string directory = "output";
    bool save_trajectory = false; // compressed per-frame positions
    OutputMode mode = OutputMode::Timestamped;
};

struct Config {
    DisplayParams display;
    ViewportParams viewport;
    bubbles::LayoutParams layout;
    bubbles::PhysicsParams physics;
    SimulationParams simulation;
    OutputParams output;

    // Options for bubbles::buildNodes derived from this config
    bubbles::BuildOptions buildOptions() const;

    // Load from TOML file
    static Config load(std::string const& path);

    // Load with defaults
    static Config defaults();

    // Reset out-of-range values to defaults, with a warning for each
    void validate();

    // Save resolved parameters to a TOML file
    bool save(std::string const& path) const;

    // Apply a parameter override from CLI (e.g., "physics.wander_strength", "20")
    // Returns true if the key was recognized and applied
    bool applyOverride(std::string const& key, std::string const& value);
};
