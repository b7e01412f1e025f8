#include "bubbles/metric_extractor.h"
#include "config.h"
#include "display_format.h"
#include "enum_strings.h"
#include "instrument.h"
#include "simulation.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

void printUsage(char const* program) {
    std::cout << "Coin Bubbles (headless layout and physics)\n\n"
              << "Usage:\n"
              << "  " << program << " <instruments.json> [more.json...] [options]\n"
              << "  " << program << " -h, --help              Show this help\n\n"
              << "Each extra instrument file is applied as a data refresh, spaced evenly over\n"
              << "the run. Bubbles present in consecutive snapshots keep their position.\n\n"
              << "Options:\n"
              << "  --config <path>        TOML config (default: config/default.toml)\n"
              << "  --set <key>=<value>    Override config parameter (can be used multiple times)\n"
              << "  --save-trajectory      Record per-frame positions to trajectory.bin\n\n"
              << "Parameter keys use dot notation: section.parameter\n"
              << "  Sections: display, viewport, layout, physics, simulation, output\n\n"
              << "Examples:\n"
              << "  " << program << " data/sample_markets.json\n"
              << "  " << program << " data/sample_markets.json --set display.size_mode=volume\n"
              << "  " << program << " page1.json page1_later.json --set simulation.seed=7\n";
}

// Parsed command-line options
struct CLIOptions {
    std::string config_path = "config/default.toml";
    bool config_explicit = false;
    std::vector<std::string> instrument_paths;
    std::vector<std::pair<std::string, std::string>> overrides;
    bool save_trajectory = false;
};

// Parse --set key=value argument
std::optional<std::pair<std::string, std::string>> parseSetArg(std::string const& arg) {
    auto eq_pos = arg.find('=');
    if (eq_pos == std::string::npos) {
        std::cerr << "Invalid --set argument (missing '='): " << arg << "\n";
        return std::nullopt;
    }
    return std::make_pair(arg.substr(0, eq_pos), arg.substr(eq_pos + 1));
}

void printSummary(Config const& config, std::vector<InstrumentList> const& snapshots) {
    std::cout << "\n=== Coin Bubbles ===\n\n";

    std::cout << "Display:\n"
              << "  Timeframe:      " << toString(config.display.timeframe) << "\n"
              << "  Size mode:      " << toString(config.display.size_mode) << "\n"
              << "  Viewport:       " << config.viewport.width << "x" << config.viewport.height << "\n\n";

    std::cout << "Simulation:\n"
              << "  Duration:       " << config.simulation.duration_seconds << "s @ "
              << config.simulation.fps << " FPS (" << config.simulation.totalFrames() << " frames)\n"
              << "  Step:           " << std::fixed << std::setprecision(2)
              << config.simulation.stepDt() * 1000 << "ms (max " << config.simulation.max_dt * 1000
              << "ms)\n"
              << std::defaultfloat
              << "  Seed:           "
              << (config.simulation.seed == 0 ? std::string("random") : std::to_string(config.simulation.seed))
              << "\n\n";

    std::cout << "Data:\n"
              << "  Snapshots:      " << snapshots.size() << "\n"
              << "  Instruments:    " << snapshots.front().size() << "\n";

    // Top of the first snapshot, as the data source ranked it
    size_t shown = std::min<size_t>(5, snapshots.front().size());
    for (size_t i = 0; i < shown; ++i) {
        auto const& inst = *snapshots.front()[i];
        std::cout << "    " << std::left << std::setw(8) << inst.symbol << std::right
                  << std::setw(14) << formatPrice(inst.current_price) << "  "
                  << formatPercent(bubbles::selectChange(inst, config.display.timeframe)) << "\n";
    }
    std::cout << "\n";
}

int runSimulation(CLIOptions const& opts) {
    std::cout << "Loading config from: " << opts.config_path << "\n";
    Config config = Config::load(opts.config_path);

    for (auto const& [key, value] : opts.overrides) {
        if (!config.applyOverride(key, value)) {
            return 1;
        }
        std::cout << "Override: " << key << " = " << value << "\n";
    }
    config.validate();
    if (opts.save_trajectory) {
        config.output.save_trajectory = true;
    }

    std::vector<InstrumentList> snapshots;
    for (auto const& path : opts.instrument_paths) {
        auto instruments = loadInstruments(path);
        if (!instruments) {
            return 1;
        }
        std::cout << "Loaded " << instruments->size() << " instruments from " << path << "\n";
        snapshots.push_back(std::move(*instruments));
    }
    if (snapshots.front().empty()) {
        std::cerr << "First snapshot has no instruments\n";
        return 1;
    }

    printSummary(config, snapshots);

    Simulation sim(config);
    auto results = sim.run(snapshots, nullptr, opts.config_explicit ? opts.config_path : "");
    if (results.frames_completed == 0) {
        std::cerr << "Simulation failed\n";
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    CLIOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
            opts.config_explicit = true;
        } else if (arg == "--set" && i + 1 < argc) {
            auto parsed = parseSetArg(argv[++i]);
            if (!parsed) return 1;
            opts.overrides.push_back(*parsed);
        } else if (arg == "--save-trajectory") {
            opts.save_trajectory = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        } else {
            opts.instrument_paths.push_back(arg);
        }
    }

    if (opts.instrument_paths.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    return runSimulation(opts);
}
