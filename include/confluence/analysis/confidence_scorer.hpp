#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Confidence Scorer
// ============================================================================
// Weighted combination of pattern, news, alignment, volume and fundamental
// sub-scores into one 0-100 score with a readable factor list
// ============================================================================

#include "confluence/analysis/fundamentals.hpp"
#include "confluence/analysis/multi_timeframe.hpp"
#include "confluence/core/thresholds.hpp"
#include "confluence/core/types.hpp"
#include "confluence/patterns/pattern_types.hpp"
#include "confluence/strategy/indicator_set.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace confluence::analysis {

// ============================================================================
// News Input
// ============================================================================

enum class Sentiment : uint8_t { Positive, Negative, Neutral };
enum class NewsImpact : uint8_t { High, Medium, Low };

[[nodiscard]] std::string_view to_string(Sentiment sentiment) noexcept;
[[nodiscard]] std::string_view to_string(NewsImpact impact) noexcept;

struct NewsSummary {
    Sentiment sentiment = Sentiment::Neutral;
    int score = 50;                  // 0-100, external sentiment model
    NewsImpact impact = NewsImpact::Low;
    int headline_count = 0;
};

// ============================================================================
// Scoring Types
// ============================================================================

struct ConfidenceInputs {
    std::optional<patterns::PatternMatch> primary_pattern;
    NewsSummary news;
    AlignmentResult alignment;
    double volume_ratio = 1.0;
    FundamentalsSummary fundamentals;
    Bias bias = Bias::Neutral;
};

struct ConfidenceBreakdown {
    int pattern_strength = 50;
    int news_sentiment = 50;
    int technical_alignment = 50;
    int volume_confirmation = 50;
    int fundamental_strength = 50;
};

struct ConfidenceResult {
    int score = 0;
    ConfidenceBreakdown breakdown;
    std::vector<std::string> factors;
    Recommendation recommendation = Recommendation::Wait;
};

// ============================================================================
// Weighted Aggregator
// ============================================================================

/// Accumulates weighted 0-100 sub-scores
class ScoreAggregator {
public:
    void add(double score, double weight) {
        weighted_sum_ += score * weight;
        total_weight_ += weight;
    }

    void clear() {
        weighted_sum_ = 0.0;
        total_weight_ = 0.0;
    }

    /// Weighted average, 0 when nothing carries weight
    [[nodiscard]] double weighted_average() const noexcept {
        if (total_weight_ == 0.0) return 0.0;
        return weighted_sum_ / total_weight_;
    }

private:
    double weighted_sum_ = 0.0;
    double total_weight_ = 0.0;
};

// ============================================================================
// Sub-scores
// ============================================================================

[[nodiscard]] int score_pattern_strength(const std::optional<patterns::PatternMatch>& primary,
                                         const ScoringThresholds& t);
[[nodiscard]] int score_news_sentiment(const NewsSummary& news) noexcept;
[[nodiscard]] int score_volume_confirmation(double volume_ratio) noexcept;
[[nodiscard]] int score_fundamental_strength(const FundamentalsSummary& fundamentals) noexcept;

// ============================================================================
// Operations
// ============================================================================

[[nodiscard]] ConfidenceResult score_confidence(
    const ConfidenceInputs& inputs,
    const ScoringThresholds& t = default_thresholds().scoring);

/// BUY/SELL need the actionable score and a directional bias
[[nodiscard]] Recommendation recommend(int score, Bias bias,
                                       const ScoringThresholds& t = default_thresholds().scoring)
    noexcept;

/// Counts bullish and bearish indicator/pattern signals; needs a clear majority
[[nodiscard]] Bias derive_technical_bias(
    const strategy::IndicatorSet& indicators,
    const patterns::PatternAnalysis& patterns,
    const AnalysisThresholds& thresholds = default_thresholds());

}  // namespace confluence::analysis
