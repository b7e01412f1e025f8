#pragma once

#include "bubbles/node.h"
#include "config.h"
#include "instrument.h"

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Progress callback: (current_frame, total_frames)
using ProgressCallback = std::function<void(int, int)>;

// Timing results for profiling
struct TimingStats {
    double total_seconds = 0.0;
    double build_seconds = 0.0;   // metrics, radii, packing, overlap relaxation
    double physics_seconds = 0.0;
    double io_seconds = 0.0;
};

// One applied instrument snapshot
struct RefreshRecord {
    int frame = 0;
    size_t node_count = 0;
    size_t carried_layouts = 0; // bubbles that kept their position
    size_t price_changes = 0;   // bubbles whose displayed price data changed
    double area_scale = 1.0;
};

struct SimulationResults {
    int frames_completed = 0;
    TimingStats timing;
    std::vector<RefreshRecord> refreshes;
    size_t final_node_count = 0;
    double separated_pair_fraction = 1.0; // pairs respecting the collision gap at the end
    std::string output_directory;
};

// Node state as written to nodes.json
nlohmann::json nodesToJson(bubbles::NodeList const& nodes, Timeframe timeframe);

// Headless host for the bubble engine: owns the node set, rebuilds it when a new
// instrument snapshot arrives and steps the physics on a fixed frame clock.
class Simulation {
public:
    explicit Simulation(Config const& config);

    // Run the full animation. snapshots[0] is the initial batch; later snapshots are
    // applied as refreshes spaced evenly over the run. Writes outputs to a run directory.
    // If config_path is given, the resolved config is saved next to the outputs.
    SimulationResults run(std::vector<InstrumentList> const& snapshots,
                          ProgressCallback progress = nullptr,
                          std::string const& config_path = "");

    // Replace the instrument batch, keeping positions of bubbles that stay
    RefreshRecord applySnapshot(InstrumentList const& instruments, int frame = 0);

    // One frame. dt is capped at simulation.max_dt.
    void advance(double dt);

    bubbles::NodeList const& nodes() const { return nodes_; }
    bubbles::Viewport viewport() const;
    uint32_t seed() const { return seed_; }

private:
    Config config_;
    uint32_t seed_;
    bubbles::Rng rng_;
    bubbles::NodeList nodes_;
    std::string run_directory_;

    std::string createRunDirectory();
    void saveNodes() const;
    void saveMetadata(SimulationResults const& results) const;
};
