#include <gtest/gtest.h>

#include "color.h"
#include "display_format.h"
#include "enum_strings.h"

#include <cmath>
#include <limits>

class DisplayTest : public ::testing::Test {};

TEST_F(DisplayTest, PriceFormatting) {
    EXPECT_EQ(formatPrice(67250.4), "67,250");
    EXPECT_EQ(formatPrice(1234567.8), "1,234,568");
    EXPECT_EQ(formatPrice(1000.0), "1,000");
    EXPECT_EQ(formatPrice(999.5), "999.5");
    EXPECT_EQ(formatPrice(12.34), "12.34");
    EXPECT_EQ(formatPrice(1.0), "1");
    EXPECT_EQ(formatPrice(0.12), "0.12");
    EXPECT_EQ(formatPrice(0.0000172), "0.000017");
    EXPECT_EQ(formatPrice(0.0), "0");
}

TEST_F(DisplayTest, MissingPrice) {
    EXPECT_EQ(formatPrice(std::nullopt), "-");
    EXPECT_EQ(formatPrice(std::numeric_limits<double>::quiet_NaN()), "-");
    EXPECT_EQ(formatPrice(std::numeric_limits<double>::infinity()), "-");
}

TEST_F(DisplayTest, PercentFormatting) {
    EXPECT_EQ(formatPercent(1.234), "+1.23%");
    EXPECT_EQ(formatPercent(-0.4), "-0.40%");
    EXPECT_EQ(formatPercent(0.0), "+0.00%");
    EXPECT_EQ(formatPercent(std::nullopt), "-");
}

TEST_F(DisplayTest, ToneClassification) {
    EXPECT_EQ(classifyChange(1.5), BubbleTone::StrongGain);
    EXPECT_EQ(classifyChange(12.0), BubbleTone::StrongGain);
    EXPECT_EQ(classifyChange(1.49), BubbleTone::MildGain);
    EXPECT_EQ(classifyChange(0.0), BubbleTone::MildGain);
    EXPECT_EQ(classifyChange(-1.49), BubbleTone::MildLoss);
    EXPECT_EQ(classifyChange(-1.5), BubbleTone::StrongLoss);
}

TEST_F(DisplayTest, ToneColors) {
    EXPECT_EQ(toneColor(BubbleTone::StrongGain).toCss(), "rgba(180, 229, 13, 0.95)");
    EXPECT_EQ(toneColor(BubbleTone::MildGain).toCss(), "rgba(120, 200, 65, 0.90)");
    EXPECT_EQ(toneColor(BubbleTone::MildLoss).toCss(), "rgba(215, 108, 130, 0.90)");
    EXPECT_EQ(toneColor(BubbleTone::StrongLoss).toCss(), "rgba(255, 0, 0, 0.95)");
}

TEST_F(DisplayTest, EnumSpellings) {
    EXPECT_EQ(toString(BubbleTone::StrongGain), "strong_gain");
    EXPECT_EQ(toString(bubbles::SizeMode::Volume), "volume");
    EXPECT_STREQ(toString(Timeframe::Day365), "365d");

    EXPECT_EQ(enum_strings::fromString<bubbles::SizeMode>("percent"), bubbles::SizeMode::Percent);
    EXPECT_EQ(enum_strings::fromString<bubbles::SizeMode>("Cap"), bubbles::SizeMode::Cap);
    EXPECT_EQ(enum_strings::fromString<BubbleTone>("mild_loss"), BubbleTone::MildLoss);
    EXPECT_FALSE(enum_strings::fromString<bubbles::SizeMode>("area").has_value());
    EXPECT_EQ(enum_strings::choices<bubbles::SizeMode>(), "cap|percent|volume");

    EXPECT_EQ(parseTimeframe("7d"), Timeframe::Day7);
    EXPECT_FALSE(parseTimeframe("7D").has_value());
}
