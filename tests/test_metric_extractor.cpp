#include <gtest/gtest.h>

#include "bubbles/metric_extractor.h"
#include "test_helpers.h"

using namespace bubbles;

class MetricExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        inst_.id = "bitcoin";
        inst_.change_1h = 0.5;
        inst_.change_24h = -2.0;
        inst_.change_7d = 7.0;
        inst_.change_30d = -30.0;
        inst_.change_1y = 120.0;
    }

    Instrument inst_;
};

TEST_F(MetricExtractorTest, SelectsWindow) {
    EXPECT_DOUBLE_EQ(selectChange(inst_, Timeframe::Hour1), 0.5);
    EXPECT_DOUBLE_EQ(selectChange(inst_, Timeframe::Hour24), -2.0);
    EXPECT_DOUBLE_EQ(selectChange(inst_, Timeframe::Day7), 7.0);
    EXPECT_DOUBLE_EQ(selectChange(inst_, Timeframe::Day30), -30.0);
    EXPECT_DOUBLE_EQ(selectChange(inst_, Timeframe::Day365), 120.0);
}

TEST_F(MetricExtractorTest, MissingChangeIsZero) {
    Instrument empty;
    empty.id = "x";
    EXPECT_DOUBLE_EQ(selectChange(empty, Timeframe::Hour24), 0.0);
    EXPECT_DOUBLE_EQ(selectChange(empty, Timeframe::Day365), 0.0);
}

TEST_F(MetricExtractorTest, LabelParsing) {
    EXPECT_EQ(timeframeFromLabel("1h"), Timeframe::Hour1);
    EXPECT_EQ(timeframeFromLabel("24h"), Timeframe::Hour24);
    EXPECT_EQ(timeframeFromLabel("7d"), Timeframe::Day7);
    EXPECT_EQ(timeframeFromLabel("30d"), Timeframe::Day30);
    EXPECT_EQ(timeframeFromLabel("365d"), Timeframe::Day365);
    EXPECT_EQ(timeframeFromLabel("2w"), Timeframe::Hour24);
    EXPECT_EQ(timeframeFromLabel(""), Timeframe::Hour24);
}

TEST_F(MetricExtractorTest, MetricsDefaultsAndAbsoluteChange) {
    auto a = test_helpers::makeInstrument("a", 500.0, 20.0, -4.0);
    auto b = std::make_shared<Instrument>();
    b->id = "b";

    auto metrics = computeMetrics({a, b}, Timeframe::Hour24);
    ASSERT_EQ(metrics.size(), 2u);

    EXPECT_DOUBLE_EQ(metrics[0].cap, 500.0);
    EXPECT_DOUBLE_EQ(metrics[0].volume, 20.0);
    EXPECT_DOUBLE_EQ(metrics[0].change, 4.0);

    EXPECT_DOUBLE_EQ(metrics[1].cap, 0.0);
    EXPECT_DOUBLE_EQ(metrics[1].volume, 1.0);
    EXPECT_DOUBLE_EQ(metrics[1].change, 0.0);
}

TEST_F(MetricExtractorTest, EmptyBatch) {
    EXPECT_TRUE(computeMetrics({}, Timeframe::Day7).empty());
}
