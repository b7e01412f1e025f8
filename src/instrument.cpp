#include "instrument.h"

#include <cmath>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace {

std::optional<double> optionalNumber(json const& j, char const* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

std::string stringOr(json const& j, char const* key, std::string default_val = {}) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return default_val;
    }
    return it->get<std::string>();
}

} // namespace

void from_json(json const& j, Instrument& instrument) {
    instrument.id = stringOr(j, "id");
    instrument.symbol = stringOr(j, "symbol");
    instrument.name = stringOr(j, "name");
    instrument.image = stringOr(j, "image");

    instrument.current_price = optionalNumber(j, "current_price");
    instrument.market_cap = optionalNumber(j, "market_cap");
    instrument.total_volume = optionalNumber(j, "total_volume");
    if (auto rank = optionalNumber(j, "market_cap_rank")) {
        instrument.market_cap_rank = static_cast<int>(std::lround(*rank));
    } else {
        instrument.market_cap_rank.reset();
    }
    instrument.circulating_supply = optionalNumber(j, "circulating_supply");
    instrument.total_supply = optionalNumber(j, "total_supply");

    instrument.change_1h = optionalNumber(j, "price_change_percentage_1h_in_currency");
    instrument.change_24h = optionalNumber(j, "price_change_percentage_24h");
    instrument.change_7d = optionalNumber(j, "price_change_percentage_7d_in_currency");
    instrument.change_30d = optionalNumber(j, "price_change_percentage_30d_in_currency");
    instrument.change_1y = optionalNumber(j, "price_change_percentage_1y_in_currency");
}

std::optional<InstrumentList> parseInstruments(json const& doc) {
    if (!doc.is_array()) {
        std::cerr << "Instrument data must be a JSON array\n";
        return std::nullopt;
    }

    InstrumentList instruments;
    instruments.reserve(doc.size());
    size_t index = 0;
    for (auto const& entry : doc) {
        if (!entry.is_object()) {
            std::cerr << "Warning: skipping non-object instrument entry " << index << "\n";
            ++index;
            continue;
        }
        auto inst = std::make_shared<Instrument>(entry.get<Instrument>());
        if (inst->id.empty()) {
            std::cerr << "Warning: skipping instrument entry " << index << " without id\n";
        } else {
            instruments.push_back(std::move(inst));
        }
        ++index;
    }
    return instruments;
}

std::optional<InstrumentList> loadInstruments(std::filesystem::path const& path) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "Cannot open instrument file: " << path << "\n";
        return std::nullopt;
    }

    try {
        json doc = json::parse(in);
        return parseInstruments(doc);
    } catch (json::exception const& e) {
        std::cerr << "Error parsing instrument file " << path << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

bool hasPriceChanged(Instrument const* prev, Instrument const& next) {
    if (!prev) {
        return true;
    }
    constexpr double EPSILON = 0.0001;
    auto differs = [](std::optional<double> const& a, std::optional<double> const& b) {
        return std::abs(a.value_or(0.0) - b.value_or(0.0)) > EPSILON;
    };
    return differs(prev->current_price, next.current_price) ||
           differs(prev->change_1h, next.change_1h) ||
           differs(prev->change_24h, next.change_24h) ||
           differs(prev->change_7d, next.change_7d);
}
