#include <gtest/gtest.h>

#include "instrument.h"

#include <filesystem>
#include <fstream>

using json = nlohmann::json;

class InstrumentTest : public ::testing::Test {
protected:
    std::filesystem::path dataDir() const { return std::filesystem::path(BUBBLES_SOURCE_DIR) / "data"; }
};

TEST_F(InstrumentTest, ParsesFieldsAndNulls) {
    auto doc = json::parse(R"([
        {
            "id": "bitcoin", "symbol": "btc", "name": "Bitcoin",
            "current_price": 65000.5, "market_cap": 1.2e12, "total_volume": null,
            "market_cap_rank": 1,
            "price_change_percentage_24h": -1.25,
            "price_change_percentage_1y_in_currency": null
        }
    ])");

    auto list = parseInstruments(doc);
    ASSERT_TRUE(list.has_value());
    ASSERT_EQ(list->size(), 1u);
    auto const& btc = *list->front();
    EXPECT_EQ(btc.id, "bitcoin");
    EXPECT_EQ(btc.symbol, "btc");
    EXPECT_EQ(btc.name, "Bitcoin");
    EXPECT_DOUBLE_EQ(*btc.current_price, 65000.5);
    EXPECT_DOUBLE_EQ(*btc.market_cap, 1.2e12);
    EXPECT_FALSE(btc.total_volume.has_value());
    EXPECT_EQ(btc.market_cap_rank, 1);
    EXPECT_DOUBLE_EQ(*btc.change_24h, -1.25);
    EXPECT_FALSE(btc.change_1y.has_value());
    EXPECT_FALSE(btc.change_1h.has_value());
    EXPECT_TRUE(btc.image.empty());
}

TEST_F(InstrumentTest, SkipsEntriesWithoutId) {
    auto doc = json::parse(R"([
        {"id": "a", "market_cap": 10},
        {"symbol": "noid"},
        {"id": "", "market_cap": 5},
        42,
        {"id": "b"}
    ])");

    auto list = parseInstruments(doc);
    ASSERT_TRUE(list.has_value());
    ASSERT_EQ(list->size(), 2u);
    EXPECT_EQ((*list)[0]->id, "a");
    EXPECT_EQ((*list)[1]->id, "b");
}

TEST_F(InstrumentTest, RejectsNonArray) {
    EXPECT_FALSE(parseInstruments(json::parse(R"({"id": "bitcoin"})")).has_value());
    EXPECT_FALSE(parseInstruments(json()).has_value());
}

TEST_F(InstrumentTest, LoadsSampleSnapshot) {
    auto list = loadInstruments(dataDir() / "sample_markets.json");
    ASSERT_TRUE(list.has_value());
    ASSERT_EQ(list->size(), 12u);
    EXPECT_EQ(list->front()->id, "bitcoin");
}

TEST_F(InstrumentTest, LoadFailures) {
    EXPECT_FALSE(loadInstruments(dataDir() / "does_not_exist.json").has_value());

    auto path = std::filesystem::temp_directory_path() / "bubbles_bad_instruments.json";
    {
        std::ofstream out(path);
        out << "[{\"id\": \"a\",";
    }
    EXPECT_FALSE(loadInstruments(path).has_value());
    std::filesystem::remove(path);
}

TEST_F(InstrumentTest, PriceChangeDetection) {
    Instrument prev;
    prev.id = "a";
    prev.current_price = 10.0;
    prev.change_24h = 1.0;

    Instrument same = prev;
    EXPECT_FALSE(hasPriceChanged(&prev, same));
    EXPECT_TRUE(hasPriceChanged(nullptr, same));

    Instrument tiny = prev;
    tiny.current_price = 10.00005;
    EXPECT_FALSE(hasPriceChanged(&prev, tiny));

    Instrument moved = prev;
    moved.change_7d = 0.5;
    EXPECT_TRUE(hasPriceChanged(&prev, moved));

    // Absent counts as zero
    Instrument zero = prev;
    zero.change_1h = 0.0;
    EXPECT_FALSE(hasPriceChanged(&prev, zero));

    // Fields outside the displayed set do not count
    Instrument cap = prev;
    cap.market_cap = 1e9;
    EXPECT_FALSE(hasPriceChanged(&prev, cap));
}
