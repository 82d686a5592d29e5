#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Multi-Timeframe Aggregator
// ============================================================================
// Runs indicators and patterns on daily, weekly and monthly series and
// measures how far the three trends agree
// ============================================================================

#include "confluence/core/thresholds.hpp"
#include "confluence/core/types.hpp"
#include "confluence/patterns/pattern_types.hpp"
#include "confluence/strategy/indicator_set.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace confluence::analysis {

// ============================================================================
// Inputs
// ============================================================================

/// Candle series per timeframe; views must outlive the analysis call
struct TimeframeData {
    CandleSeries daily;
    CandleSeries weekly;
    CandleSeries monthly;
};

// ============================================================================
// Results
// ============================================================================

/// Condensed per-timeframe reading
struct TimeframeResult {
    std::vector<patterns::PatternKind> patterns;   // At most 5, primary first
    patterns::TrendDirection trend = patterns::TrendDirection::Sideways;
    int strength = 0;
    double support = 0.0;
    double resistance = 0.0;
};

enum class AlignmentLabel : uint8_t { Bullish, Bearish, Neutral, Mixed };

[[nodiscard]] std::string_view to_string(AlignmentLabel label) noexcept;

struct AlignmentResult {
    AlignmentLabel label = AlignmentLabel::Neutral;
    int score = 50;
};

/// Full indicator and pattern output of one timeframe
struct TimeframeAnalysis {
    strategy::IndicatorSet indicators;
    patterns::PatternAnalysis patterns;
};

struct ComprehensiveTechnicalAnalysis {
    TimeframeResult daily;
    TimeframeResult weekly;
    TimeframeResult monthly;
    AlignmentResult alignment;

    std::vector<patterns::PatternMatch> candlestick_patterns;   // Daily, newest first
    strategy::BollingerResult bollinger;                        // Daily closes
    strategy::FibonacciResult fibonacci;                        // Daily closes

    TimeframeAnalysis daily_detail;
    std::optional<TimeframeAnalysis> weekly_detail;    // Absent below min_candles
    std::optional<TimeframeAnalysis> monthly_detail;
};

// ============================================================================
// Operations
// ============================================================================

/// Uptrend counts as bullish, downtrend as bearish
[[nodiscard]] AlignmentResult compute_alignment(
    patterns::TrendDirection daily,
    patterns::TrendDirection weekly,
    patterns::TrendDirection monthly,
    const ScoringThresholds& t = default_thresholds().scoring);

/// Condense one timeframe's full analysis into pattern tags and key levels
[[nodiscard]] TimeframeResult summarize_timeframe(const TimeframeAnalysis& analysis);

/// Per-timeframe analysis plus alignment.
/// With parallel set, weekly and monthly run on worker threads.
[[nodiscard]] ComprehensiveTechnicalAnalysis analyze_multi_timeframe(
    const TimeframeData& data,
    const AnalysisThresholds& thresholds = default_thresholds(),
    bool parallel = false);

}  // namespace confluence::analysis
