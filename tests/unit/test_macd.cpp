// ============================================================================
// CONFLUENCE SIGNAL ENGINE - MACD Unit Tests
// ============================================================================

#include "confluence/strategy/indicator_set.hpp"
#include "confluence/strategy/indicators/macd.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace confluence;
using namespace confluence::strategy;

TEST(MACDTest, InitiallyNotReady) {
    MACD_12_26_9 macd;
    EXPECT_FALSE(macd.is_ready());
    EXPECT_FALSE(macd.has_line());
}

TEST(MACDTest, LineAfterSlowPeriodSignalAfterSeed) {
    MACD_12_26_9 macd;
    for (int i = 0; i < 26; ++i) {
        macd.update(100.0 + i);
    }
    EXPECT_TRUE(macd.has_line());
    EXPECT_FALSE(macd.is_ready());

    for (int i = 26; i < 34; ++i) {
        macd.update(100.0 + i);
    }
    EXPECT_TRUE(macd.is_ready());
}

TEST(MACDTest, RisingPricesGivePositiveLine) {
    MACD_12_26_9 macd;
    for (int i = 0; i < 60; ++i) {
        macd.update(100.0 + i);
    }
    EXPECT_GT(macd.value(), 0.0);
}

TEST(MACDTest, HistogramIsLineMinusSignal) {
    MACD_12_26_9 macd;
    for (int i = 0; i < 50; ++i) {
        macd.update(100.0 + (i % 7) * 0.8);
    }
    EXPECT_NEAR(macd.histogram(), macd.value() - macd.signal_line(), 1e-12);
}

TEST(ComputeMacdTest, ShortSeriesIsZeroAndNeutral) {
    std::vector<double> closes(25, 100.0);
    const auto result = compute_macd(closes, default_thresholds().indicators);

    EXPECT_DOUBLE_EQ(result.macd, 0.0);
    EXPECT_DOUBLE_EQ(result.signal, 0.0);
    EXPECT_DOUBLE_EQ(result.histogram, 0.0);
    EXPECT_EQ(result.trend, SignalTrend::Neutral);
    EXPECT_EQ(result.divergence, Divergence::None);
}

TEST(ComputeMacdTest, AcceleratingRallyIsBullish) {
    std::vector<double> closes;
    for (int i = 0; i < 60; ++i) {
        closes.push_back(100.0 + 0.05 * i * i);
    }

    const auto result = compute_macd(closes, default_thresholds().indicators);
    EXPECT_GT(result.histogram, 0.0);
    EXPECT_EQ(result.trend, SignalTrend::Bullish);
    EXPECT_EQ(result.divergence, Divergence::None);
}

TEST(ComputeMacdTest, AcceleratingSelloffIsBearish) {
    std::vector<double> closes;
    for (int i = 0; i < 60; ++i) {
        closes.push_back(500.0 - 0.05 * i * i);
    }

    const auto result = compute_macd(closes, default_thresholds().indicators);
    EXPECT_LT(result.histogram, 0.0);
    EXPECT_EQ(result.trend, SignalTrend::Bearish);
    EXPECT_EQ(result.divergence, Divergence::None);
}

// ============================================================================
// Divergence
// ============================================================================

namespace {

// Flat base, sharp 8-bar move, shallow retrace, then a marginal new extreme
std::vector<double> fading_rally_closes() {
    std::vector<double> closes(45, 100.0);
    for (int i = 0; i < 8; ++i) closes.push_back(closes.back() + 2.0);
    for (int i = 0; i < 8; ++i) closes.push_back(closes.back() - 0.5);
    for (int i = 0; i < 3; ++i) closes.push_back(closes.back() + 1.0);
    closes.push_back(116.5);
    return closes;
}

std::vector<double> mirrored(const std::vector<double>& closes) {
    std::vector<double> out;
    for (double c : closes) out.push_back(200.0 - c);
    return out;
}

}  // namespace

TEST(MacdDivergenceTest, NewHighWithWeakerHistogramIsBearish) {
    const auto closes = fading_rally_closes();
    const auto result = compute_macd(closes, default_thresholds().indicators);
    EXPECT_EQ(result.divergence, Divergence::Bearish);
}

TEST(MacdDivergenceTest, NewLowWithWeakerHistogramIsBullish) {
    const auto closes = mirrored(fading_rally_closes());
    const auto result = compute_macd(closes, default_thresholds().indicators);
    EXPECT_EQ(result.divergence, Divergence::Bullish);
}

TEST(MacdDivergenceTest, NoNewExtremeIsNone) {
    auto closes = fading_rally_closes();
    closes.back() = 115.5;
    const auto result = compute_macd(closes, default_thresholds().indicators);
    EXPECT_EQ(result.divergence, Divergence::None);
}

TEST(MacdDivergenceTest, StrictRatioSuppressesSignal) {
    auto thresholds = default_thresholds().indicators;
    thresholds.macd_divergence_ratio = -1.0;
    const auto result = compute_macd(fading_rally_closes(), thresholds);
    EXPECT_EQ(result.divergence, Divergence::None);
}
