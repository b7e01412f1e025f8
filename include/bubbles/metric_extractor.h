#pragma once

#include "instrument.h"

#include <string_view>
#include <vector>

namespace bubbles {

// Per-instrument sizing inputs, recomputed on every build
struct Metric {
    double cap = 0.0;    // market cap, 0 when absent
    double change = 0.0; // |percent change| for the selected window
    double volume = 1.0; // traded volume, 1 when absent
};

// Percent change for the given window, 0 when the field is absent
double selectChange(Instrument const& instrument, Timeframe timeframe);

// Parse "1h", "24h", "7d", "30d", "365d". Anything else means 24h.
Timeframe timeframeFromLabel(std::string_view label);

// One Metric per instrument, same order
std::vector<Metric> computeMetrics(InstrumentList const& instruments, Timeframe timeframe);

} // namespace bubbles
