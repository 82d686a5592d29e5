// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Core Types Unit Tests
// ============================================================================

#include "confluence/core/types.hpp"

#include <gtest/gtest.h>

using namespace confluence;

// ============================================================================
// Candle Tests
// ============================================================================

TEST(CandleTest, BullishGeometry) {
    Candle c{make_date(2024, 3, 1), 100.0, 106.0, 98.0, 104.0, 500.0};

    EXPECT_TRUE(c.is_bullish());
    EXPECT_DOUBLE_EQ(c.body(), 4.0);
    EXPECT_DOUBLE_EQ(c.range(), 8.0);
    EXPECT_DOUBLE_EQ(c.upper_wick(), 2.0);
    EXPECT_DOUBLE_EQ(c.lower_wick(), 2.0);
    EXPECT_DOUBLE_EQ(c.typical_price(), (106.0 + 98.0 + 104.0) / 3.0);
}

TEST(CandleTest, BearishGeometry) {
    Candle c{make_date(2024, 3, 1), 104.0, 105.0, 99.0, 100.0, 500.0};

    EXPECT_FALSE(c.is_bullish());
    EXPECT_DOUBLE_EQ(c.body(), 4.0);
    EXPECT_DOUBLE_EQ(c.upper_wick(), 1.0);
    EXPECT_DOUBLE_EQ(c.lower_wick(), 1.0);
}

TEST(CandleTest, FlatCandleIsNotBullish) {
    Candle c{make_date(2024, 3, 1), 100.0, 100.0, 100.0, 100.0, 0.0};
    EXPECT_FALSE(c.is_bullish());
    EXPECT_DOUBLE_EQ(c.body(), 0.0);
    EXPECT_DOUBLE_EQ(c.range(), 0.0);
}

// ============================================================================
// Date Tests
// ============================================================================

TEST(DateTest, MakeDateOrdering) {
    EXPECT_LT(make_date(2024, 1, 31), make_date(2024, 2, 1));
    EXPECT_EQ(make_date(2024, 2, 29) + std::chrono::days{1}, make_date(2024, 3, 1));
}

// ============================================================================
// String Conversion Tests
// ============================================================================

TEST(TypesTest, TimeframeLabels) {
    EXPECT_EQ(to_string(Timeframe::Daily), "1D");
    EXPECT_EQ(to_string(Timeframe::Weekly), "1W");
    EXPECT_EQ(to_string(Timeframe::Monthly), "1M");
}

TEST(TypesTest, SignalLabels) {
    EXPECT_EQ(to_string(Polarity::Bullish), "bullish");
    EXPECT_EQ(to_string(SignalTrend::Neutral), "neutral");
    EXPECT_EQ(to_string(Bias::Bearish), "BEARISH");
    EXPECT_EQ(to_string(Recommendation::Wait), "WAIT");
}

// ============================================================================
// Series Helper Tests
// ============================================================================

TEST(SeriesTest, TailOfLongSeries) {
    CandleVector candles(10);
    for (size_t i = 0; i < candles.size(); ++i) {
        candles[i].close = static_cast<double>(i);
    }

    auto last3 = tail(candles, 3);
    ASSERT_EQ(last3.size(), 3u);
    EXPECT_DOUBLE_EQ(last3[0].close, 7.0);
    EXPECT_DOUBLE_EQ(last3[2].close, 9.0);
}

TEST(SeriesTest, TailOfShortSeriesIsWholeSeries) {
    CandleVector candles(2);
    EXPECT_EQ(tail(candles, 5).size(), 2u);
    EXPECT_TRUE(tail(CandleSeries{}, 5).empty());
}

TEST(SeriesTest, ClosesOf) {
    CandleVector candles(3);
    candles[0].close = 1.0;
    candles[1].close = 2.0;
    candles[2].close = 3.0;
    EXPECT_EQ(closes_of(candles), (std::vector<double>{1.0, 2.0, 3.0}));
}
