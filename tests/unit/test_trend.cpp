// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Trend Classifier Unit Tests
// ============================================================================

#include "confluence/patterns/trend.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace confluence;
using namespace confluence::patterns;
using confluence::test::flat_candles;
using confluence::test::linear_candles;

TEST(FitLineTest, ExactLine) {
    const std::vector<double> values = {1.0, 2.0, 3.0};
    const auto line = fit_line(values);

    EXPECT_DOUBLE_EQ(line.slope, 1.0);
    EXPECT_DOUBLE_EQ(line.intercept, 1.0);
    EXPECT_DOUBLE_EQ(line.mean, 2.0);
}

TEST(FitLineTest, SingleValueHasNoSlope) {
    const std::vector<double> values = {5.0};
    const auto line = fit_line(values);

    EXPECT_DOUBLE_EQ(line.slope, 0.0);
    EXPECT_DOUBLE_EQ(line.intercept, 5.0);
}

TEST(TrendTest, TooFewCandlesIsSideways) {
    const auto trend = detect_trend(linear_candles(9, 100.0, 5.0));
    EXPECT_EQ(trend.direction, TrendDirection::Sideways);
    EXPECT_EQ(trend.strength, 0);
    EXPECT_FALSE(trend.consolidating);
}

TEST(TrendTest, RisingSeriesIsUptrend) {
    const auto trend = detect_trend(linear_candles(20, 100.0, 1.0));

    EXPECT_EQ(trend.direction, TrendDirection::Uptrend);
    // slope 1 over mean 109.5 -> 0.913% per period
    EXPECT_EQ(trend.strength, 9);
    EXPECT_FALSE(trend.consolidating);
}

TEST(TrendTest, FallingSeriesIsDowntrend) {
    const auto trend = detect_trend(linear_candles(30, 200.0, -2.0));
    EXPECT_EQ(trend.direction, TrendDirection::Downtrend);
    EXPECT_GT(trend.strength, 0);
}

TEST(TrendTest, StrengthIsCapped) {
    const auto trend = detect_trend(linear_candles(20, 1.0, 5.0));
    EXPECT_EQ(trend.strength, 100);
}

TEST(TrendTest, FlatSeriesConsolidates) {
    const auto trend = detect_trend(flat_candles(20));
    EXPECT_EQ(trend.direction, TrendDirection::Sideways);
    EXPECT_EQ(trend.strength, 0);
    EXPECT_TRUE(trend.consolidating);
}

TEST(BreakoutTest, RallyClosesAtHighs) {
    const auto candles = linear_candles(20, 100.0, 1.0);
    EXPECT_TRUE(is_at_breakout(candles));
    EXPECT_FALSE(is_at_breakdown(candles));
}

TEST(BreakoutTest, SelloffClosesAtLows) {
    const auto candles = linear_candles(20, 120.0, -1.0);
    EXPECT_TRUE(is_at_breakdown(candles));
    EXPECT_FALSE(is_at_breakout(candles));
}

TEST(BreakoutTest, NeedsFullLookback) {
    const auto candles = linear_candles(19, 100.0, 1.0);
    EXPECT_FALSE(is_at_breakout(candles));
    EXPECT_FALSE(is_at_breakdown(candles));
}

TEST(BreakoutTest, BreakdownNeedsFullLookback) {
    EXPECT_FALSE(is_at_breakdown(linear_candles(19, 120.0, -1.0)));
    EXPECT_TRUE(is_at_breakdown(linear_candles(20, 120.0, -1.0)));
}
