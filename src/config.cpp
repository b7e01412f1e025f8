#include "config.h"

#include "enum_strings.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <toml++/toml.hpp>

namespace {

Timeframe parseTimeframeOr(std::string const& str, Timeframe fallback) {
    if (auto tf = parseTimeframe(str)) {
        return *tf;
    }
    std::cerr << "Unknown timeframe: " << str << ", using " << toString(fallback) << "\n";
    return fallback;
}

bubbles::SizeMode parseSizeModeOr(std::string const& str, bubbles::SizeMode fallback) {
    if (auto mode = enum_strings::fromString<bubbles::SizeMode>(str)) {
        return *mode;
    }
    std::cerr << "Unknown size mode: " << str << " (expected "
              << enum_strings::choices<bubbles::SizeMode>() << "), using " << toString(fallback)
              << "\n";
    return fallback;
}

bool parseBool(std::string const& value) {
    return value == "true" || value == "1";
}

// Safe value extraction helpers
template <typename T> T get_or(toml::table const& tbl, std::string_view key, T default_val) {
    if (auto node = tbl.get(key)) {
        if (auto val = node->value<T>()) {
            return *val;
        }
    }
    return default_val;
}

std::string get_string_or(toml::table const& tbl, std::string_view key, std::string default_val) {
    if (auto node = tbl.get(key)) {
        if (auto val = node->value<std::string>()) {
            return *val;
        }
    }
    return default_val;
}

// Load config values from a TOML table into an existing config (for include support)
void loadConfigFromTable(Config& config, toml::table const& tbl) {
    if (auto display = tbl["display"].as_table()) {
        auto tf_str = get_string_or(*display, "timeframe", "");
        if (!tf_str.empty()) {
            config.display.timeframe = parseTimeframeOr(tf_str, config.display.timeframe);
        }
        auto mode_str = get_string_or(*display, "size_mode", "");
        if (!mode_str.empty()) {
            config.display.size_mode = parseSizeModeOr(mode_str, config.display.size_mode);
        }
        config.display.depth_min = get_or(*display, "depth_min", config.display.depth_min);
        config.display.depth_max = get_or(*display, "depth_max", config.display.depth_max);
    }

    if (auto viewport = tbl["viewport"].as_table()) {
        config.viewport.width = get_or(*viewport, "width", config.viewport.width);
        config.viewport.height = get_or(*viewport, "height", config.viewport.height);
    }

    if (auto layout = tbl["layout"].as_table()) {
        config.layout.overlap_iterations =
            get_or(*layout, "overlap_iterations", config.layout.overlap_iterations);
        config.layout.overlap_gap = get_or(*layout, "overlap_gap", config.layout.overlap_gap);
        config.layout.placement_margin =
            get_or(*layout, "placement_margin", config.layout.placement_margin);
        config.layout.bounds_margin = get_or(*layout, "bounds_margin", config.layout.bounds_margin);
    }

    if (auto physics = tbl["physics"].as_table()) {
        auto& p = config.physics;
        p.bounds_margin = get_or(*physics, "bounds_margin", p.bounds_margin);
        p.collision_gap = get_or(*physics, "collision_gap", p.collision_gap);
        p.boundary_restitution = get_or(*physics, "boundary_restitution", p.boundary_restitution);
        p.collision_impulse = get_or(*physics, "collision_impulse", p.collision_impulse);
        p.velocity_damping = get_or(*physics, "velocity_damping", p.velocity_damping);
        p.wander_strength = get_or(*physics, "wander_strength", p.wander_strength);
        p.wander_freq_x = get_or(*physics, "wander_freq_x", p.wander_freq_x);
        p.wander_freq_y = get_or(*physics, "wander_freq_y", p.wander_freq_y);
        p.jitter_strength = get_or(*physics, "jitter_strength", p.jitter_strength);
    }

    if (auto sim = tbl["simulation"].as_table()) {
        config.simulation.duration_seconds =
            get_or(*sim, "duration_seconds", config.simulation.duration_seconds);
        config.simulation.fps = get_or(*sim, "fps", config.simulation.fps);
        config.simulation.max_dt = get_or(*sim, "max_dt", config.simulation.max_dt);
        auto seed = get_or<int64_t>(*sim, "seed", config.simulation.seed);
        if (seed < 0) {
            std::cerr << "Warning: seed cannot be negative, using system entropy\n";
            seed = 0;
        }
        config.simulation.seed = static_cast<uint32_t>(seed);
    }

    if (auto out = tbl["output"].as_table()) {
        auto dir = get_string_or(*out, "directory", "");
        if (!dir.empty()) {
            config.output.directory = dir;
        }
        config.output.save_trajectory = get_or(*out, "save_trajectory", config.output.save_trajectory);
    }
}

} // namespace

bubbles::BuildOptions Config::buildOptions() const {
    bubbles::BuildOptions options;
    options.timeframe = display.timeframe;
    options.size_mode = display.size_mode;
    options.width = viewport.width;
    options.height = viewport.height;
    options.depth_range = {display.depth_min, display.depth_max};
    options.layout = layout;
    return options;
}

Config Config::defaults() {
    return Config{};
}

Config Config::load(std::string const& path) {
    Config config;

    if (!std::filesystem::exists(path)) {
        std::cerr << "Config file not found: " << path << ", using defaults\n";
        return config;
    }

    try {
        auto tbl = toml::parse_file(path);
        std::string base_path = std::filesystem::path(path).parent_path().string();
        if (base_path.empty()) base_path = ".";

        // Process includes first (they provide base values that can be overridden)
        if (auto includes = tbl["include"].as_array()) {
            for (auto const& inc : *includes) {
                if (auto inc_path = inc.value<std::string>()) {
                    std::filesystem::path full_path = *inc_path;
                    if (!full_path.is_absolute()) {
                        full_path = std::filesystem::path(base_path) / *inc_path;
                    }
                    if (std::filesystem::exists(full_path)) {
                        try {
                            auto inc_tbl = toml::parse_file(full_path.string());
                            loadConfigFromTable(config, inc_tbl);
                        } catch (toml::parse_error const& err) {
                            std::cerr << "Error parsing included config " << full_path << ": "
                                      << err.description() << "\n";
                        }
                    } else {
                        std::cerr << "Warning: Included config not found: " << full_path << "\n";
                    }
                }
            }
        }

        loadConfigFromTable(config, tbl);

    } catch (toml::parse_error const& err) {
        std::cerr << "Error parsing config: " << err.description() << "\n";
        std::cerr << "Using defaults\n";
        return Config{};
    }

    config.validate();
    return config;
}

void Config::validate() {
    // Minimal validation - only catch obviously broken values
    Config const defaults;
    if (viewport.width <= 0 || viewport.height <= 0) {
        std::cerr << "Warning: viewport size must be positive, using default ("
                  << defaults.viewport.width << "x" << defaults.viewport.height << ")\n";
        viewport = defaults.viewport;
    }
    if (simulation.fps <= 0) {
        std::cerr << "Warning: fps must be positive, using default (" << defaults.simulation.fps
                  << ")\n";
        simulation.fps = defaults.simulation.fps;
    }
    if (simulation.duration_seconds <= 0) {
        std::cerr << "Warning: duration_seconds must be positive, using default ("
                  << defaults.simulation.duration_seconds << ")\n";
        simulation.duration_seconds = defaults.simulation.duration_seconds;
    }
    if (simulation.max_dt <= 0) {
        std::cerr << "Warning: max_dt must be positive, using default ("
                  << defaults.simulation.max_dt << ")\n";
        simulation.max_dt = defaults.simulation.max_dt;
    }
    if (layout.overlap_iterations < 0) {
        std::cerr << "Warning: overlap_iterations cannot be negative, using default ("
                  << defaults.layout.overlap_iterations << ")\n";
        layout.overlap_iterations = defaults.layout.overlap_iterations;
    }
    if (physics.velocity_damping < 0 || physics.velocity_damping > 1) {
        std::cerr << "Warning: velocity_damping must be in [0,1], using default ("
                  << defaults.physics.velocity_damping << ")\n";
        physics.velocity_damping = defaults.physics.velocity_damping;
    }
    if (display.depth_min > display.depth_max) {
        std::cerr << "Warning: depth_min exceeds depth_max, using defaults\n";
        display.depth_min = defaults.display.depth_min;
        display.depth_max = defaults.display.depth_max;
    }
}

bool Config::save(std::string const& path) const {
    auto tbl = toml::table{
        {"display", toml::table{
            {"timeframe", toString(display.timeframe)},
            {"size_mode", toString(display.size_mode)},
            {"depth_min", display.depth_min},
            {"depth_max", display.depth_max},
        }},
        {"viewport", toml::table{
            {"width", viewport.width},
            {"height", viewport.height},
        }},
        {"layout", toml::table{
            {"overlap_iterations", layout.overlap_iterations},
            {"overlap_gap", layout.overlap_gap},
            {"placement_margin", layout.placement_margin},
            {"bounds_margin", layout.bounds_margin},
        }},
        {"physics", toml::table{
            {"bounds_margin", physics.bounds_margin},
            {"collision_gap", physics.collision_gap},
            {"boundary_restitution", physics.boundary_restitution},
            {"collision_impulse", physics.collision_impulse},
            {"velocity_damping", physics.velocity_damping},
            {"wander_strength", physics.wander_strength},
            {"wander_freq_x", physics.wander_freq_x},
            {"wander_freq_y", physics.wander_freq_y},
            {"jitter_strength", physics.jitter_strength},
        }},
        {"simulation", toml::table{
            {"duration_seconds", simulation.duration_seconds},
            {"fps", simulation.fps},
            {"max_dt", simulation.max_dt},
            {"seed", static_cast<int64_t>(simulation.seed)},
        }},
        {"output", toml::table{
            {"directory", output.directory},
            {"save_trajectory", output.save_trajectory},
        }},
    };

    std::ofstream out(path);
    if (!out) {
        std::cerr << "Cannot write config: " << path << "\n";
        return false;
    }
    out << tbl << "\n";
    return static_cast<bool>(out);
}

bool Config::applyOverride(std::string const& key, std::string const& value) {
    // Parse dot-notation key (e.g., "physics.wander_strength")
    auto dot_pos = key.find('.');
    if (dot_pos == std::string::npos) {
        std::cerr << "Invalid parameter key (missing section): " << key << "\n";
        return false;
    }

    std::string section = key.substr(0, dot_pos);
    std::string param = key.substr(dot_pos + 1);

    try {
        if (section == "display") {
            if (param == "timeframe") {
                auto tf = parseTimeframe(value);
                if (!tf) {
                    std::cerr << "Unknown timeframe: " << value << " (expected 1h|24h|7d|30d|365d)\n";
                    return false;
                }
                display.timeframe = *tf;
            } else if (param == "size_mode") {
                auto mode = enum_strings::fromString<bubbles::SizeMode>(value);
                if (!mode) {
                    std::cerr << "Unknown size mode: " << value << " (expected "
                              << enum_strings::choices<bubbles::SizeMode>() << ")\n";
                    return false;
                }
                display.size_mode = *mode;
            } else if (param == "depth_min") {
                display.depth_min = std::stod(value);
            } else if (param == "depth_max") {
                display.depth_max = std::stod(value);
            } else {
                std::cerr << "Unknown display parameter: " << param << "\n";
                return false;
            }
        } else if (section == "viewport") {
            if (param == "width") {
                viewport.width = std::stoi(value);
            } else if (param == "height") {
                viewport.height = std::stoi(value);
            } else {
                std::cerr << "Unknown viewport parameter: " << param << "\n";
                return false;
            }
        } else if (section == "layout") {
            if (param == "overlap_iterations") {
                layout.overlap_iterations = std::stoi(value);
            } else if (param == "overlap_gap") {
                layout.overlap_gap = std::stod(value);
            } else if (param == "placement_margin") {
                layout.placement_margin = std::stod(value);
            } else if (param == "bounds_margin") {
                layout.bounds_margin = std::stod(value);
            } else {
                std::cerr << "Unknown layout parameter: " << param << "\n";
                return false;
            }
        } else if (section == "physics") {
            if (param == "bounds_margin") {
                physics.bounds_margin = std::stod(value);
            } else if (param == "collision_gap") {
                physics.collision_gap = std::stod(value);
            } else if (param == "boundary_restitution") {
                physics.boundary_restitution = std::stod(value);
            } else if (param == "collision_impulse") {
                physics.collision_impulse = std::stod(value);
            } else if (param == "velocity_damping") {
                physics.velocity_damping = std::stod(value);
            } else if (param == "wander_strength") {
                physics.wander_strength = std::stod(value);
            } else if (param == "wander_freq_x") {
                physics.wander_freq_x = std::stod(value);
            } else if (param == "wander_freq_y") {
                physics.wander_freq_y = std::stod(value);
            } else if (param == "jitter_strength") {
                physics.jitter_strength = std::stod(value);
            } else {
                std::cerr << "Unknown physics parameter: " << param << "\n";
                return false;
            }
        } else if (section == "simulation") {
            if (param == "duration_seconds") {
                simulation.duration_seconds = std::stod(value);
            } else if (param == "fps") {
                simulation.fps = std::stoi(value);
            } else if (param == "max_dt") {
                simulation.max_dt = std::stod(value);
            } else if (param == "seed") {
                long long seed = std::stoll(value);
                if (seed < 0) {
                    std::cerr << "Warning: seed cannot be negative, using system entropy\n";
                    seed = 0;
                }
                simulation.seed = static_cast<uint32_t>(seed);
            } else {
                std::cerr << "Unknown simulation parameter: " << param << "\n";
                return false;
            }
        } else if (section == "output") {
            if (param == "directory") {
                output.directory = value;
            } else if (param == "save_trajectory") {
                output.save_trajectory = parseBool(value);
            } else {
                std::cerr << "Unknown output parameter: " << param << "\n";
                return false;
            }
        } else {
            std::cerr << "Unknown config section: " << section << "\n";
            return false;
        }
    } catch (std::exception const& e) {
        std::cerr << "Invalid value for " << key << ": " << value << " (" << e.what() << ")\n";
        return false;
    }

    return true;
}
