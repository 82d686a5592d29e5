// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Confidence Scorer Implementation
// ============================================================================

#include "confluence/analysis/confidence_scorer.hpp"

#include "confluence/utils/format.hpp"

#include <algorithm>
#include <cmath>

namespace confluence::analysis {

namespace {

using utils::fixed;

constexpr int NEUTRAL_SCORE = 50;

// Volume ratio tiers, checked top-down
struct VolumeTier {
    double min_ratio;
    bool inclusive;
    int score;
};

constexpr VolumeTier VOLUME_TIERS[] = {
    {2.0, true, 95},
    {1.5, true, 80},
    {1.0, false, 65},
    {0.7, false, 45},
    {0.5, false, 30},
};
constexpr int VOLUME_FLOOR_SCORE = 20;
constexpr int VOLUME_NEUTRAL_SCORE = 45;

constexpr int HIGH_IMPACT_SHIFT = 20;
constexpr int MEDIUM_IMPACT_SHIFT = 10;

struct FundamentalAdjustments {
    int undervalued = 25;
    int overvalued = -20;
    int fair = 5;
    int strong_growth = 20;
    int moderate_growth = 8;
    int weak_growth = -15;
    int outperforming = 12;
    int underperforming = -12;
};
constexpr FundamentalAdjustments FUNDAMENTAL{};

int clamp_score(double value) noexcept {
    return static_cast<int>(std::clamp(std::lround(value), 0L, 100L));
}

}  // namespace

std::string_view to_string(Sentiment sentiment) noexcept {
    switch (sentiment) {
        case Sentiment::Positive: return "positive";
        case Sentiment::Negative: return "negative";
        case Sentiment::Neutral:  return "neutral";
    }
    return "?";
}

std::string_view to_string(NewsImpact impact) noexcept {
    switch (impact) {
        case NewsImpact::High:   return "high";
        case NewsImpact::Medium: return "medium";
        case NewsImpact::Low:    return "low";
    }
    return "?";
}

// ============================================================================
// Sub-scores
// ============================================================================

int score_pattern_strength(const std::optional<patterns::PatternMatch>& primary,
                           const ScoringThresholds& t) {
    if (!primary) return t.default_pattern_score;
    return std::clamp(primary->confidence, 0, 100);
}

int score_news_sentiment(const NewsSummary& news) noexcept {
    if (news.headline_count <= 0) return NEUTRAL_SCORE;

    int shift = 0;
    if (news.impact == NewsImpact::High) {
        shift = HIGH_IMPACT_SHIFT;
    } else if (news.impact == NewsImpact::Medium) {
        shift = MEDIUM_IMPACT_SHIFT;
    }

    int score = news.score;
    if (news.sentiment == Sentiment::Positive) {
        score += shift;
    } else if (news.sentiment == Sentiment::Negative) {
        score -= shift;
    }
    return std::clamp(score, 0, 100);
}

int score_volume_confirmation(double volume_ratio) noexcept {
    for (const auto& tier : VOLUME_TIERS) {
        const bool hit = tier.inclusive ? volume_ratio >= tier.min_ratio
                                        : volume_ratio > tier.min_ratio;
        if (hit) return tier.score;
    }
    return VOLUME_FLOOR_SCORE;
}

int score_fundamental_strength(const FundamentalsSummary& f) noexcept {
    int score = NEUTRAL_SCORE;

    switch (f.valuation) {
        case Valuation::Undervalued: score += FUNDAMENTAL.undervalued; break;
        case Valuation::Overvalued:  score += FUNDAMENTAL.overvalued; break;
        case Valuation::Fair:        score += FUNDAMENTAL.fair; break;
        case Valuation::Unknown:     break;
    }

    switch (f.growth) {
        case Growth::Strong:   score += FUNDAMENTAL.strong_growth; break;
        case Growth::Moderate: score += FUNDAMENTAL.moderate_growth; break;
        case Growth::Weak:     score += FUNDAMENTAL.weak_growth; break;
        case Growth::Unknown:  break;
    }

    switch (f.sector) {
        case SectorComparison::Outperforming:   score += FUNDAMENTAL.outperforming; break;
        case SectorComparison::Underperforming: score += FUNDAMENTAL.underperforming; break;
        case SectorComparison::Inline:
        case SectorComparison::Unknown:         break;
    }

    return std::clamp(score, 0, 100);
}

// ============================================================================
// Aggregate Score
// ============================================================================

Recommendation recommend(int score, Bias bias, const ScoringThresholds& t) noexcept {
    if (score >= t.actionable_score) {
        if (bias == Bias::Bullish) return Recommendation::Buy;
        if (bias == Bias::Bearish) return Recommendation::Sell;
    }
    if (score >= t.hold_score) return Recommendation::Hold;
    return Recommendation::Wait;
}

ConfidenceResult score_confidence(const ConfidenceInputs& inputs, const ScoringThresholds& t) {
    ConfidenceResult result;
    auto& b = result.breakdown;

    b.pattern_strength = score_pattern_strength(inputs.primary_pattern, t);
    b.news_sentiment = score_news_sentiment(inputs.news);
    b.technical_alignment = std::clamp(inputs.alignment.score, 0, 100);
    b.volume_confirmation = score_volume_confirmation(inputs.volume_ratio);
    b.fundamental_strength = score_fundamental_strength(inputs.fundamentals);

    ScoreAggregator aggregator;
    aggregator.add(b.pattern_strength, t.weights.pattern);
    aggregator.add(b.news_sentiment, t.weights.news);
    aggregator.add(b.technical_alignment, t.weights.technical);
    aggregator.add(b.volume_confirmation, t.weights.volume);
    aggregator.add(b.fundamental_strength, t.weights.fundamental);

    result.score = clamp_score(aggregator.weighted_average());
    result.recommendation = recommend(result.score, inputs.bias, t);

    // Factors follow the breakdown order; neutral sub-scores say nothing
    auto& factors = result.factors;
    if (inputs.primary_pattern) {
        factors.push_back("Primary pattern " + inputs.primary_pattern->label() + " at " +
                          std::to_string(b.pattern_strength) + "% confidence");
    }
    if (b.news_sentiment != NEUTRAL_SCORE) {
        factors.push_back("News sentiment " + std::string(to_string(inputs.news.sentiment)) +
                          " with " + std::string(to_string(inputs.news.impact)) +
                          " impact (" + std::to_string(b.news_sentiment) + ")");
    }
    if (b.technical_alignment != NEUTRAL_SCORE) {
        factors.push_back("Timeframe alignment " +
                          std::string(to_string(inputs.alignment.label)) + " (" +
                          std::to_string(b.technical_alignment) + ")");
    }
    if (b.volume_confirmation != VOLUME_NEUTRAL_SCORE) {
        factors.push_back("Volume at " + fixed(inputs.volume_ratio) + "x average (" +
                          std::to_string(b.volume_confirmation) + ")");
    }
    if (b.fundamental_strength != NEUTRAL_SCORE) {
        factors.push_back("Fundamentals " +
                          std::string(to_string(inputs.fundamentals.valuation)) +
                          " valuation with " + std::string(to_string(inputs.fundamentals.growth)) +
                          " growth (" + std::to_string(b.fundamental_strength) + ")");
    }

    return result;
}

// ============================================================================
// Technical Bias
// ============================================================================

Bias derive_technical_bias(const strategy::IndicatorSet& indicators,
                           const patterns::PatternAnalysis& patterns,
                           const AnalysisThresholds& thresholds) {
    const auto& t = thresholds.scoring;
    const double rsi = indicators.rsi.value;

    int bullish = 0;
    int bearish = 0;

    if (indicators.moving_averages.trend == SignalTrend::Bullish) ++bullish;
    if (indicators.moving_averages.trend == SignalTrend::Bearish) ++bearish;

    if (indicators.macd.trend == SignalTrend::Bullish) ++bullish;
    if (indicators.macd.trend == SignalTrend::Bearish) ++bearish;

    if (rsi > t.bias_rsi_low && rsi < thresholds.indicators.rsi_overbought) ++bullish;
    if (rsi > thresholds.indicators.rsi_overbought) ++bearish;

    if (patterns.primary) {
        if (patterns.primary->polarity == Polarity::Bullish) ++bullish;
        if (patterns.primary->polarity == Polarity::Bearish) ++bearish;
    }

    if (patterns.at_breakout) ++bullish;

    if (bullish >= t.bias_min_signals && bullish > bearish) return Bias::Bullish;
    if (bearish >= t.bias_min_signals && bearish > bullish) return Bias::Bearish;
    return Bias::Neutral;
}

}  // namespace confluence::analysis
