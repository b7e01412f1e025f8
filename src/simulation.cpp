#include "simulation.h"

#include "bubbles/bubble_builder.h"
#include "bubbles/metric_extractor.h"
#include "bubbles/overlap_resolver.h"
#include "bubbles/physics_stepper.h"
#include "color.h"
#include "display_format.h"
#include "enum_strings.h"
#include "trajectory_data.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <unordered_map>

using Clock = std::chrono::steady_clock;
using Duration = std::chrono::duration<double>;
using json = nlohmann::json;

namespace {

uint32_t resolveSeed(uint32_t configured) {
    if (configured != 0) {
        return configured;
    }
    return std::random_device{}();
}

std::string timestamp(char const* format) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time);
    std::ostringstream out;
    out << std::put_time(&tm, format);
    return out.str();
}

// Frame at which snapshot k (k >= 1) of count replaces the batch
int refreshFrame(size_t k, size_t count, int total_frames) {
    return static_cast<int>(k * static_cast<size_t>(total_frames) / count);
}

} // namespace

json nodesToJson(bubbles::NodeList const& nodes, Timeframe timeframe) {
    json out = json::array();
    for (auto const& node : nodes) {
        auto const& inst = *node.instrument;
        double change = bubbles::selectChange(inst, timeframe);
        BubbleTone tone = classifyChange(change);

        json j;
        j["id"] = inst.id;
        j["symbol"] = inst.symbol;
        j["name"] = inst.name;
        j["price"] = formatPrice(inst.current_price);
        j["change"] = change;
        j["change_text"] = formatPercent(change);
        j["tone"] = toString(tone);
        j["color"] = toneColor(tone).toCss();
        j["radius"] = node.radius;
        j["size_factor"] = node.size_factor;
        j["depth"] = node.depth;
        j["sphere"] = {{"x", node.x}, {"y", node.y}, {"z", node.z}};
        j["spiral"] = {{"x", node.x2d}, {"y", node.y2d}};
        if (node.layout) {
            auto const& p = *node.layout;
            j["layout"] = {{"x", p.x},   {"y", p.y},   {"scale", p.scale},
                           {"vx", p.vx}, {"vy", p.vy}};
        } else {
            j["layout"] = nullptr;
        }
        out.push_back(std::move(j));
    }
    return out;
}

Simulation::Simulation(Config const& config)
    : config_(config), seed_(resolveSeed(config.simulation.seed)), rng_(seed_) {
    config_.validate();
}

bubbles::Viewport Simulation::viewport() const {
    return bubbles::Viewport{static_cast<double>(config_.viewport.width),
                             static_cast<double>(config_.viewport.height)}
        .floored();
}

RefreshRecord Simulation::applySnapshot(InstrumentList const& instruments, int frame) {
    std::unordered_map<std::string, Instrument const*> previous_by_id;
    for (auto const& node : nodes_) {
        previous_by_id.emplace(node.instrument->id, node.instrument.get());
    }

    RefreshRecord record;
    record.frame = frame;
    for (auto const& inst : instruments) {
        auto it = previous_by_id.find(inst->id);
        Instrument const* prev = it != previous_by_id.end() ? it->second : nullptr;
        if (hasPriceChanged(prev, *inst)) {
            ++record.price_changes;
        }
    }

    bubbles::BuildStats stats;
    nodes_ = bubbles::buildNodes(instruments, config_.buildOptions(), rng_, nodes_, &stats);

    record.node_count = stats.node_count;
    record.carried_layouts = stats.carried_layouts;
    record.area_scale = stats.area_scale;
    return record;
}

void Simulation::advance(double dt) {
    dt = std::min(dt, config_.simulation.max_dt);
    bubbles::stepPhysics(nodes_, viewport(), dt, rng_, config_.physics);
}

std::string Simulation::createRunDirectory() {
    std::string path;
    if (config_.output.mode == OutputMode::Direct) {
        path = config_.output.directory;
    } else {
        path = config_.output.directory + "/run_" + timestamp("%Y%m%d_%H%M%S");
    }
    std::filesystem::create_directories(path);
    return path;
}

void Simulation::saveNodes() const {
    std::ofstream out(run_directory_ + "/nodes.json");
    if (!out) {
        std::cerr << "Failed to write nodes.json\n";
        return;
    }
    out << nodesToJson(nodes_, config_.display.timeframe).dump(2) << "\n";
}

void Simulation::saveMetadata(SimulationResults const& results) const {
    std::ofstream out(run_directory_ + "/metadata.json");
    if (!out) {
        std::cerr << "Failed to write metadata.json\n";
        return;
    }

    json refreshes = json::array();
    for (auto const& r : results.refreshes) {
        refreshes.push_back({{"frame", r.frame},
                             {"node_count", r.node_count},
                             {"carried_layouts", r.carried_layouts},
                             {"price_changes", r.price_changes},
                             {"area_scale", r.area_scale}});
    }

    json meta = {
        {"version", "1.0"},
        {"created_at", timestamp("%Y-%m-%dT%H:%M:%S")},
        {"config",
         {{"timeframe", toString(config_.display.timeframe)},
          {"size_mode", toString(config_.display.size_mode)},
          {"width", config_.viewport.width},
          {"height", config_.viewport.height},
          {"duration_seconds", config_.simulation.duration_seconds},
          {"fps", config_.simulation.fps},
          {"max_dt", config_.simulation.max_dt},
          {"step_dt", config_.simulation.stepDt()},
          {"seed", seed_}}},
        {"results",
         {{"frames_completed", results.frames_completed},
          {"final_node_count", results.final_node_count},
          {"separated_pair_fraction", results.separated_pair_fraction},
          {"refreshes", refreshes}}},
        {"timing",
         {{"total_seconds", results.timing.total_seconds},
          {"build_seconds", results.timing.build_seconds},
          {"physics_seconds", results.timing.physics_seconds},
          {"io_seconds", results.timing.io_seconds}}},
    };
    out << meta.dump(2) << "\n";
}

SimulationResults Simulation::run(std::vector<InstrumentList> const& snapshots,
                                  ProgressCallback progress, std::string const& config_path) {
    SimulationResults results;
    if (snapshots.empty()) {
        std::cerr << "No instrument snapshots to simulate\n";
        return results;
    }

    run_directory_ = createRunDirectory();
    results.output_directory = run_directory_;
    std::cout << "Output directory: " << run_directory_ << "\n";
    if (!config_path.empty() && !config_.save(run_directory_ + "/config.toml")) {
        std::cerr << "Warning: could not save resolved config\n";
    }

    int const total_frames = config_.simulation.totalFrames();
    double const dt = config_.simulation.stepDt();

    Duration build_time{0};
    Duration physics_time{0};
    Duration io_time{0};
    auto total_start = Clock::now();

    std::unique_ptr<trajectory_data::Writer> trajectory;
    if (config_.output.save_trajectory) {
        trajectory = std::make_unique<trajectory_data::Writer>();
        if (!trajectory->open(run_directory_ + "/trajectory.bin", config_)) {
            std::cerr << "Failed to open trajectory writer\n";
            return results;
        }
    }

    size_t next_snapshot = 0;
    for (int frame = 0; frame < total_frames; ++frame) {
        // Several snapshots can fall due on one frame when there are more files than frames
        while (next_snapshot < snapshots.size() &&
               (next_snapshot == 0 ||
                frame >= refreshFrame(next_snapshot, snapshots.size(), total_frames))) {
            auto build_start = Clock::now();
            auto record = applySnapshot(snapshots[next_snapshot], frame);
            build_time += Clock::now() - build_start;

            std::cout << "Frame " << frame << ": snapshot " << next_snapshot + 1 << "/"
                      << snapshots.size() << " -> " << record.node_count << " bubbles, "
                      << record.carried_layouts << " kept in place, " << record.price_changes
                      << " price changes, area scale " << std::fixed << std::setprecision(3)
                      << record.area_scale << std::defaultfloat << "\n";
            results.refreshes.push_back(record);
            ++next_snapshot;
        }

        auto physics_start = Clock::now();
        advance(dt);
        physics_time += Clock::now() - physics_start;

        if (trajectory) {
            auto io_start = Clock::now();
            trajectory->writeFrame(nodes_);
            io_time += Clock::now() - io_start;
        }

        results.frames_completed = frame + 1;
        if (progress) {
            progress(frame + 1, total_frames);
        }
    }

    auto io_start = Clock::now();
    if (trajectory && !trajectory->close()) {
        std::cerr << "Failed to save trajectory\n";
    }
    results.final_node_count = nodes_.size();
    results.separated_pair_fraction =
        bubbles::separatedPairFraction(nodes_, config_.physics.collision_gap, 0.5);
    saveNodes();
    io_time += Clock::now() - io_start;

    results.timing.build_seconds = build_time.count();
    results.timing.physics_seconds = physics_time.count();
    results.timing.io_seconds = io_time.count();
    results.timing.total_seconds = Duration(Clock::now() - total_start).count();
    saveMetadata(results);

    std::cout << "\nCompleted " << results.frames_completed << " frames\n"
              << std::fixed << std::setprecision(3)
              << "  Build:   " << results.timing.build_seconds << "s\n"
              << "  Physics: " << results.timing.physics_seconds << "s\n"
              << "  I/O:     " << results.timing.io_seconds << "s\n"
              << "  Total:   " << results.timing.total_seconds << "s\n"
              << std::setprecision(1)
              << "  Separated pairs: " << results.separated_pair_fraction * 100.0 << "%\n";

    return results;
}
