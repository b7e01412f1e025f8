#pragma once

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Percent-change windows reported by the market data source
enum class Timeframe { Hour1, Hour24, Day7, Day30, Day365 };

// One market instrument as delivered by the data source (CoinGecko coins/markets shape).
// Every numeric field may be missing; absent and JSON null are treated the same.
struct Instrument {
    std::string id;
    std::string symbol;
    std::string name;
    std::string image;

    std::optional<double> current_price;
    std::optional<double> market_cap;
    std::optional<double> total_volume;
    std::optional<int> market_cap_rank;
    std::optional<double> circulating_supply;
    std::optional<double> total_supply;

    std::optional<double> change_1h;
    std::optional<double> change_24h;
    std::optional<double> change_7d;
    std::optional<double> change_30d;
    std::optional<double> change_1y;
};

// Nodes share instruments read-only; the data source owns the batch
using InstrumentPtr = std::shared_ptr<Instrument const>;
using InstrumentList = std::vector<InstrumentPtr>;

void from_json(nlohmann::json const& j, Instrument& instrument);

// Parse a JSON array of instrument records. Records without an id are skipped.
// Returns nullopt if the document is not an array.
std::optional<InstrumentList> parseInstruments(nlohmann::json const& doc);

// Load and parse an instrument snapshot file
std::optional<InstrumentList> loadInstruments(std::filesystem::path const& path);

// True if the displayed price data differs between two snapshots of the same instrument
// (or if there is no previous snapshot)
bool hasPriceChanged(Instrument const* prev, Instrument const& next);
