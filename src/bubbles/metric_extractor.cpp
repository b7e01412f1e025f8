#include "bubbles/metric_extractor.h"

#include "enum_strings.h"

#include <cmath>

namespace bubbles {

double selectChange(Instrument const& instrument, Timeframe timeframe) {
    switch (timeframe) {
    case Timeframe::Hour1:
        return instrument.change_1h.value_or(0.0);
    case Timeframe::Day7:
        return instrument.change_7d.value_or(0.0);
    case Timeframe::Day30:
        return instrument.change_30d.value_or(0.0);
    case Timeframe::Day365:
        return instrument.change_1y.value_or(0.0);
    case Timeframe::Hour24:
        break;
    }
    return instrument.change_24h.value_or(0.0);
}

Timeframe timeframeFromLabel(std::string_view label) {
    return parseTimeframe(label).value_or(Timeframe::Hour24);
}

std::vector<Metric> computeMetrics(InstrumentList const& instruments, Timeframe timeframe) {
    std::vector<Metric> metrics;
    metrics.reserve(instruments.size());
    for (auto const& inst : instruments) {
        Metric m;
        m.cap = inst->market_cap.value_or(0.0);
        m.change = std::abs(selectChange(*inst, timeframe));
        m.volume = inst->total_volume.value_or(1.0);
        metrics.push_back(m);
    }
    return metrics;
}

} // namespace bubbles
