// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Confidence Scorer Unit Tests
// ============================================================================

#include "confluence/analysis/confidence_scorer.hpp"

#include <gtest/gtest.h>

using namespace confluence;
using namespace confluence::analysis;
using confluence::patterns::PatternKind;
using confluence::patterns::PatternMatch;

namespace {

PatternMatch bullish_flag(int confidence) {
    PatternMatch m;
    m.kind = PatternKind::BullishFlag;
    m.polarity = Polarity::Bullish;
    m.confidence = confidence;
    return m;
}

}  // namespace

// ============================================================================
// Aggregator
// ============================================================================

TEST(ScoreAggregatorTest, WeightedAverage) {
    ScoreAggregator aggregator;
    EXPECT_DOUBLE_EQ(aggregator.weighted_average(), 0.0);

    aggregator.add(80.0, 1.0);
    aggregator.add(40.0, 3.0);
    EXPECT_DOUBLE_EQ(aggregator.weighted_average(), 50.0);

    aggregator.clear();
    EXPECT_DOUBLE_EQ(aggregator.weighted_average(), 0.0);
}

// ============================================================================
// Sub-scores
// ============================================================================

TEST(SubScoreTest, PatternStrength) {
    const auto& t = default_thresholds().scoring;
    EXPECT_EQ(score_pattern_strength(std::nullopt, t), 50);
    EXPECT_EQ(score_pattern_strength(bullish_flag(85), t), 85);
    EXPECT_EQ(score_pattern_strength(bullish_flag(140), t), 100);
}

TEST(SubScoreTest, NewsSentiment) {
    EXPECT_EQ(score_news_sentiment(NewsSummary{}), 50);
    EXPECT_EQ(score_news_sentiment({Sentiment::Positive, 90, NewsImpact::High, 0}), 50);
    EXPECT_EQ(score_news_sentiment({Sentiment::Positive, 70, NewsImpact::High, 4}), 90);
    EXPECT_EQ(score_news_sentiment({Sentiment::Negative, 40, NewsImpact::Medium, 2}), 30);
    EXPECT_EQ(score_news_sentiment({Sentiment::Neutral, 60, NewsImpact::High, 2}), 60);
    EXPECT_EQ(score_news_sentiment({Sentiment::Positive, 95, NewsImpact::High, 1}), 100);
    EXPECT_EQ(score_news_sentiment({Sentiment::Negative, 5, NewsImpact::High, 1}), 0);
}

TEST(SubScoreTest, VolumeTiers) {
    EXPECT_EQ(score_volume_confirmation(2.5), 95);
    EXPECT_EQ(score_volume_confirmation(2.0), 95);
    EXPECT_EQ(score_volume_confirmation(1.5), 80);
    EXPECT_EQ(score_volume_confirmation(1.2), 65);
    EXPECT_EQ(score_volume_confirmation(1.0), 45);
    EXPECT_EQ(score_volume_confirmation(0.7), 30);
    EXPECT_EQ(score_volume_confirmation(0.5), 20);
    EXPECT_EQ(score_volume_confirmation(0.0), 20);
}

TEST(SubScoreTest, FundamentalStrength) {
    FundamentalsSummary f;
    EXPECT_EQ(score_fundamental_strength(f), 50);

    f.valuation = Valuation::Undervalued;
    f.growth = Growth::Strong;
    f.sector = SectorComparison::Outperforming;
    EXPECT_EQ(score_fundamental_strength(f), 100);

    f.valuation = Valuation::Overvalued;
    f.growth = Growth::Weak;
    f.sector = SectorComparison::Underperforming;
    EXPECT_EQ(score_fundamental_strength(f), 3);

    f.valuation = Valuation::Fair;
    f.growth = Growth::Moderate;
    f.sector = SectorComparison::Inline;
    EXPECT_EQ(score_fundamental_strength(f), 63);
}

// ============================================================================
// Aggregate Score
// ============================================================================

TEST(ConfidenceScoreTest, NeutralInputs) {
    const auto result = score_confidence(ConfidenceInputs{});

    // 50 everywhere except volume at ratio 1.0 -> 45
    EXPECT_EQ(result.score, 49);
    EXPECT_EQ(result.breakdown.volume_confirmation, 45);
    EXPECT_EQ(result.recommendation, Recommendation::Hold);
    EXPECT_TRUE(result.factors.empty());
}

TEST(ConfidenceScoreTest, BullishSetupIsBuy) {
    ConfidenceInputs inputs;
    inputs.primary_pattern = bullish_flag(80);
    inputs.alignment = {AlignmentLabel::Bullish, 100};
    inputs.volume_ratio = 2.0;
    inputs.bias = Bias::Bullish;

    const auto result = score_confidence(inputs);
    EXPECT_EQ(result.breakdown.pattern_strength, 80);
    EXPECT_EQ(result.breakdown.technical_alignment, 100);
    EXPECT_EQ(result.breakdown.volume_confirmation, 95);
    // 0.25*80 + 0.20*50 + 0.25*100 + 0.15*95 + 0.15*50 = 76.75
    EXPECT_EQ(result.score, 77);
    EXPECT_EQ(result.recommendation, Recommendation::Buy);

    ASSERT_EQ(result.factors.size(), 3u);
    EXPECT_EQ(result.factors[0], "Primary pattern bullish_flag (bullish) at 80% confidence");
    EXPECT_EQ(result.factors[1], "Timeframe alignment bullish (100)");
    EXPECT_EQ(result.factors[2], "Volume at 2.00x average (95)");
}

TEST(ConfidenceScoreTest, ClampedAtBothEnds) {
    ConfidenceInputs low;
    low.primary_pattern = bullish_flag(0);
    low.news = {Sentiment::Negative, 0, NewsImpact::High, 3};
    low.alignment = {AlignmentLabel::Bearish, -40};
    low.volume_ratio = 0.0;
    low.fundamentals.valuation = Valuation::Overvalued;
    low.fundamentals.growth = Growth::Weak;
    low.fundamentals.sector = SectorComparison::Underperforming;

    const auto lo = score_confidence(low);
    EXPECT_EQ(lo.breakdown.technical_alignment, 0);
    EXPECT_GE(lo.score, 0);
    EXPECT_EQ(lo.score, 3);
    EXPECT_EQ(lo.recommendation, Recommendation::Wait);

    ConfidenceInputs high;
    high.primary_pattern = bullish_flag(150);
    high.news = {Sentiment::Positive, 100, NewsImpact::High, 3};
    high.alignment = {AlignmentLabel::Bullish, 500};
    high.volume_ratio = 9.0;
    high.fundamentals.valuation = Valuation::Undervalued;
    high.fundamentals.growth = Growth::Strong;
    high.fundamentals.sector = SectorComparison::Outperforming;

    const auto hi = score_confidence(high);
    EXPECT_EQ(hi.breakdown.technical_alignment, 100);
    EXPECT_LE(hi.score, 100);
    EXPECT_EQ(hi.score, 99);
}

TEST(ConfidenceScoreTest, CustomWeightsAreNormalized) {
    ScoringThresholds t = default_thresholds().scoring;
    t.weights.pattern = 2.0;
    t.weights.news = 0.0;
    t.weights.technical = 0.0;
    t.weights.volume = 0.0;
    t.weights.fundamental = 0.0;

    ConfidenceInputs inputs;
    inputs.primary_pattern = bullish_flag(64);
    EXPECT_EQ(score_confidence(inputs, t).score, 64);
}

// ============================================================================
// Recommendation
// ============================================================================

TEST(RecommendTest, Thresholds) {
    EXPECT_EQ(recommend(75, Bias::Bullish), Recommendation::Buy);
    EXPECT_EQ(recommend(70, Bias::Bullish), Recommendation::Buy);
    EXPECT_EQ(recommend(75, Bias::Bearish), Recommendation::Sell);
    EXPECT_EQ(recommend(90, Bias::Neutral), Recommendation::Hold);
    EXPECT_EQ(recommend(69, Bias::Bullish), Recommendation::Hold);
    EXPECT_EQ(recommend(40, Bias::Bearish), Recommendation::Hold);
    EXPECT_EQ(recommend(39, Bias::Bullish), Recommendation::Wait);
}

// ============================================================================
// Technical Bias
// ============================================================================

class TechnicalBiasTest : public ::testing::Test {
protected:
    strategy::IndicatorSet indicators;
    patterns::PatternAnalysis patterns;
};

TEST_F(TechnicalBiasTest, DefaultsAreNeutral) {
    EXPECT_EQ(derive_technical_bias(indicators, patterns), Bias::Neutral);
}

TEST_F(TechnicalBiasTest, TrendingIndicatorsAreBullish) {
    indicators.moving_averages.trend = SignalTrend::Bullish;
    indicators.macd.trend = SignalTrend::Bullish;
    indicators.rsi.value = 55.0;
    EXPECT_EQ(derive_technical_bias(indicators, patterns), Bias::Bullish);
}

TEST_F(TechnicalBiasTest, OverboughtWeakIndicatorsAreBearish) {
    indicators.moving_averages.trend = SignalTrend::Bearish;
    indicators.macd.trend = SignalTrend::Bearish;
    indicators.rsi.value = 75.0;
    EXPECT_EQ(derive_technical_bias(indicators, patterns), Bias::Bearish);
}

TEST_F(TechnicalBiasTest, TiedSignalsAreNeutral) {
    indicators.moving_averages.trend = SignalTrend::Bullish;
    indicators.macd.trend = SignalTrend::Bearish;
    indicators.rsi.value = 30.0;
    EXPECT_EQ(derive_technical_bias(indicators, patterns), Bias::Neutral);
}

TEST_F(TechnicalBiasTest, PatternAndBreakoutCount) {
    indicators.rsi.value = 30.0;
    patterns.primary = bullish_flag(85);
    patterns.at_breakout = true;
    EXPECT_EQ(derive_technical_bias(indicators, patterns), Bias::Bullish);
}
