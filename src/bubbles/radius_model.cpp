#include "bubbles/radius_model.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace bubbles {

namespace {

// Chain tuning
constexpr double CHAIN_EASE_EXPONENT = 0.5;
constexpr double CHAIN_RATIO_FLOOR = 0.5;
constexpr double CHAIN_MIN_FACTOR = 0.65;
constexpr double GLOBAL_MIN_FACTOR = 0.7;

// Global compression by spread
constexpr double SPREAD_LOW = 2.0;
constexpr double SPREAD_RANGE = 10.0;
constexpr double GLOBAL_SCALE_BASE = 0.72;

// Log area mapping
constexpr double LOG_MIN_AREA_FACTOR = 0.75;
constexpr double LOG_CONTRAST_DIVISOR = 25.0;
constexpr double LOG_EASE_EXPONENT = 1.1;

std::vector<double> rawValues(std::vector<Metric> const& metrics, SizeMode mode) {
    std::vector<double> raw;
    raw.reserve(metrics.size());
    for (auto const& m : metrics) {
        raw.push_back(mode == SizeMode::Volume ? m.volume : m.cap);
    }
    return raw;
}

} // namespace

double percentRadius(double change, double min_change, double max_change) {
    double range = max_change - min_change;
    if (range == 0.0) {
        range = 1.0;
    }
    double norm = clamp((change - min_change) / range, 0.0, 1.0);
    return MIN_RADIUS + norm * (MAX_RADIUS - MIN_RADIUS);
}

double globalScaleForSpread(double spread) {
    double tightness = clamp((spread - SPREAD_LOW) / SPREAD_RANGE, 0.0, 1.0);
    return GLOBAL_SCALE_BASE + (1.0 - GLOBAL_SCALE_BASE) * tightness;
}

std::vector<double> rankChainRadii(std::vector<double> const& raw_values) {
    size_t const n = raw_values.size();
    std::vector<double> radii(n, MIN_RADIUS);
    if (n == 0) {
        return radii;
    }

    std::vector<double> values(n);
    std::transform(raw_values.begin(), raw_values.end(), values.begin(),
                   [](double v) { return std::max(v, 1.0); });

    // Stable so equal values keep input order and get equal radii
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&values](size_t a, size_t b) { return values[a] > values[b]; });

    double const max_val = values[order.front()];
    double const min_val = values[order.back()];
    double const global_scale = globalScaleForSpread(max_val / std::max(min_val, 1.0));
    double const chain_floor = MIN_RADIUS * CHAIN_MIN_FACTOR;

    radii[order[0]] = MAX_RADIUS * ANCHOR_SCALE;
    for (size_t k = 1; k < n; ++k) {
        size_t prev = order[k - 1];
        size_t cur = order[k];
        double ratio = clamp(values[cur] / std::max(values[prev], 1.0), 0.0, 1.0);
        double eased = std::pow(ratio, CHAIN_EASE_EXPONENT);
        double weighted = CHAIN_RATIO_FLOOR + (1.0 - CHAIN_RATIO_FLOOR) * eased;
        radii[cur] = std::max(chain_floor, radii[prev] * weighted);
    }

    for (auto& r : radii) {
        r = std::max(MIN_RADIUS * GLOBAL_MIN_FACTOR, r * global_scale);
    }
    return radii;
}

std::vector<double> computeRadii(std::vector<Metric> const& metrics, SizeMode mode) {
    if (metrics.empty()) {
        return {};
    }

    if (mode == SizeMode::Percent) {
        auto [min_it, max_it] = std::minmax_element(
            metrics.begin(), metrics.end(),
            [](Metric const& a, Metric const& b) { return a.change < b.change; });
        double min_change = min_it->change;
        double max_change = max_it->change;

        std::vector<double> radii;
        radii.reserve(metrics.size());
        for (auto const& m : metrics) {
            radii.push_back(percentRadius(m.change, min_change, max_change));
        }
        return radii;
    }

    return rankChainRadii(rawValues(metrics, mode));
}

double logAreaRadius(double value, double min_value, double max_value) {
    double const min_v = std::max(1.0, min_value);
    double const max_v = std::max(min_v + 1.0, max_value);
    double const eff_min = std::max(min_v, max_v / LOG_CONTRAST_DIVISOR);
    double const v = clamp(value > 0.0 ? value : min_v, eff_min, max_v);

    double denom = std::log(max_v / eff_min);
    if (denom == 0.0) {
        denom = 1.0;
    }
    double norm = clamp(std::log(v / eff_min) / denom, 0.0, 1.0);
    double eased = std::pow(norm, LOG_EASE_EXPONENT);

    double const min_area = std::pow(MIN_RADIUS * LOG_MIN_AREA_FACTOR, 2);
    double const max_area = std::pow(MAX_RADIUS * ANCHOR_SCALE, 2);
    return std::sqrt(min_area + eased * (max_area - min_area));
}

double sizeFactorFor(double radius) {
    return (radius - MIN_RADIUS) / (MAX_RADIUS - MIN_RADIUS);
}

} // namespace bubbles
