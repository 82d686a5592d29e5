// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Chart Pattern Unit Tests
// ============================================================================

#include "confluence/patterns/chart_patterns.hpp"
#include "confluence/patterns/pattern_detector.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace confluence;
using namespace confluence::patterns;
using confluence::test::bull_flag_closes;
using confluence::test::candles_from_closes;
using confluence::test::flat_candles;
using confluence::test::linear_candles;
using confluence::test::make_candle;

namespace {

// Flat 110 resistance with lows rising half a point per candle
CandleVector ascending_triangle_candles() {
    CandleVector candles;
    for (int i = 0; i < 15; ++i) {
        candles.push_back(make_candle(108.0, 110.0, 100.0 + 0.5 * i, 109.0, 1000.0, i));
    }
    return candles;
}

}  // namespace

// ============================================================================
// Flags
// ============================================================================

TEST(ChartPatternTest, BullishFlagAfterRally) {
    const auto candles = candles_from_closes(bull_flag_closes());

    const auto flag = detect_bullish_flag(candles);
    ASSERT_TRUE(flag.has_value());
    EXPECT_EQ(flag->kind, PatternKind::BullishFlag);
    EXPECT_EQ(flag->polarity, Polarity::Bullish);
    EXPECT_GE(flag->confidence, 75);
    EXPECT_LE(flag->confidence, 95);
    EXPECT_EQ(flag->confidence, 85);
    ASSERT_TRUE(flag->target_price.has_value());
    EXPECT_NEAR(*flag->target_price, 104.9 + (105.0 - 100.0), 1e-9);
}

TEST(ChartPatternTest, BearishFlagAfterDecline) {
    const auto candles = candles_from_closes({100.0, 99.2, 98.4, 97.5, 96.7, 95.8, 95.0,
                                              95.0, 95.3, 94.9, 95.2, 95.1, 95.4, 95.0, 95.2});

    const auto flag = detect_bearish_flag(candles);
    ASSERT_TRUE(flag.has_value());
    EXPECT_EQ(flag->polarity, Polarity::Bearish);
    EXPECT_EQ(flag->confidence, 85);
    ASSERT_TRUE(flag->target_price.has_value());
    EXPECT_NEAR(*flag->target_price, 95.2 - 5.0, 1e-9);
    EXPECT_FALSE(detect_bullish_flag(candles).has_value());
}

TEST(ChartPatternTest, ShortWindowHasNoFlagOrTriangle) {
    auto closes = bull_flag_closes();
    closes.erase(closes.begin());
    const auto candles = candles_from_closes(closes);

    EXPECT_FALSE(detect_bullish_flag(candles).has_value());
    EXPECT_FALSE(detect_bearish_flag(candles).has_value());
    EXPECT_FALSE(detect_ascending_triangle(candles).has_value());
    EXPECT_FALSE(detect_descending_triangle(candles).has_value());
}

// ============================================================================
// Triangles
// ============================================================================

TEST(ChartPatternTest, AscendingTriangle) {
    const auto candles = ascending_triangle_candles();

    const auto triangle = detect_ascending_triangle(candles);
    ASSERT_TRUE(triangle.has_value());
    EXPECT_EQ(triangle->confidence, 75);
    EXPECT_DOUBLE_EQ(*triangle->target_price, 120.0);
    EXPECT_FALSE(detect_descending_triangle(candles).has_value());
}

TEST(ChartPatternTest, DescendingTriangle) {
    CandleVector candles;
    for (int i = 0; i < 15; ++i) {
        candles.push_back(make_candle(91.0, 110.0 - 0.5 * i, 90.0, 92.0, 1000.0, i));
    }

    const auto triangle = detect_descending_triangle(candles);
    ASSERT_TRUE(triangle.has_value());
    EXPECT_EQ(triangle->polarity, Polarity::Bearish);
    EXPECT_FALSE(detect_ascending_triangle(candles).has_value());
}

// ============================================================================
// Bounce / Rejection
// ============================================================================

TEST(ChartPatternTest, SupportBounce) {
    std::vector<double> closes;
    for (int i = 0; i < 18; ++i) {
        closes.push_back(100.0 - 0.5 * i);
    }
    auto candles = candles_from_closes(closes);
    candles.push_back(make_candle(91.5, 91.8, 90.0, 91.0, 1000.0, 18));
    candles.push_back(make_candle(91.0, 93.2, 90.8, 93.0, 1000.0, 19));

    const auto bounce = detect_support_bounce(candles);
    ASSERT_TRUE(bounce.has_value());
    EXPECT_EQ(bounce->confidence, 65);
    ASSERT_TRUE(bounce->stop_loss.has_value());
    EXPECT_NEAR(*bounce->stop_loss, 89.1, 1e-9);
    EXPECT_EQ(bounce->index.value_or(0), 19u);
}

TEST(ChartPatternTest, ResistanceRejection) {
    std::vector<double> closes;
    for (int i = 0; i < 18; ++i) {
        closes.push_back(100.0 + 0.5 * i);
    }
    auto candles = candles_from_closes(closes);
    candles.push_back(make_candle(108.5, 110.0, 108.2, 109.0, 1000.0, 18));
    candles.push_back(make_candle(109.0, 109.2, 106.8, 107.0, 1000.0, 19));

    const auto rejection = detect_resistance_rejection(candles);
    ASSERT_TRUE(rejection.has_value());
    EXPECT_EQ(rejection->kind, PatternKind::ResistanceRejection);
    EXPECT_EQ(rejection->polarity, Polarity::Bearish);
    EXPECT_EQ(rejection->confidence, 65);
    ASSERT_TRUE(rejection->stop_loss.has_value());
    EXPECT_NEAR(*rejection->stop_loss, 111.1, 1e-9);
    EXPECT_EQ(rejection->index.value_or(0), 19u);
}

TEST(ChartPatternTest, RallyContinuationIsNotRejection) {
    EXPECT_FALSE(detect_resistance_rejection(linear_candles(20, 100.0, 1.0)).has_value());
}

TEST(ChartPatternTest, BounceNeedsTenCandles) {
    EXPECT_FALSE(detect_support_bounce(flat_candles(9)).has_value());
    EXPECT_FALSE(detect_resistance_rejection(flat_candles(9)).has_value());
}

// ============================================================================
// Aggregation
// ============================================================================

TEST(PatternDetectorTest, ChartPatternsSortedByConfidence) {
    const auto candles = candles_from_closes(bull_flag_closes());
    const auto matches = detect_chart_patterns(candles);

    ASSERT_FALSE(matches.empty());
    EXPECT_EQ(matches.front().kind, PatternKind::BullishFlag);
    for (size_t i = 1; i < matches.size(); ++i) {
        EXPECT_GE(matches[i - 1].confidence, matches[i].confidence);
    }
}

TEST(PatternDetectorTest, PrimaryAndSecondary) {
    const auto candles = ascending_triangle_candles();
    const auto analysis = detect_patterns(candles);

    ASSERT_TRUE(analysis.primary.has_value());
    EXPECT_EQ(analysis.primary->kind, PatternKind::AscendingTriangle);
    EXPECT_TRUE(analysis.secondary.empty());
}

TEST(PatternDetectorTest, FlatSeriesHasNoPrimary) {
    const auto analysis = detect_patterns(flat_candles(30));

    EXPECT_FALSE(analysis.primary.has_value());
    EXPECT_EQ(analysis.trend.direction, TrendDirection::Sideways);
    EXPECT_TRUE(analysis.trend.consolidating);
}
