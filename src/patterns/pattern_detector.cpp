// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Pattern Detector Implementation
// ============================================================================

#include "confluence/patterns/pattern_detector.hpp"

#include "confluence/patterns/chart_patterns.hpp"
#include "confluence/patterns/trend.hpp"

#include <algorithm>
#include <array>
#include <numeric>

namespace confluence::patterns {

namespace {

// Evaluation order doubles as the tie-break order
constexpr std::array<ChartDetector, 6> CHART_DETECTORS = {
    &detect_bullish_flag,
    &detect_ascending_triangle,
    &detect_support_bounce,
    &detect_bearish_flag,
    &detect_descending_triangle,
    &detect_resistance_rejection,
};

}  // namespace

std::vector<PatternMatch> detect_chart_patterns(CandleSeries candles,
                                                const ChartPatternThresholds& t) {
    auto matches = std::accumulate(
        CHART_DETECTORS.begin(), CHART_DETECTORS.end(), std::vector<PatternMatch>{},
        [&](std::vector<PatternMatch> acc, ChartDetector detector) {
            if (auto match = detector(candles, t)) {
                acc.push_back(std::move(*match));
            }
            return acc;
        });

    std::stable_sort(matches.begin(), matches.end(),
                     [](const PatternMatch& a, const PatternMatch& b) {
                         return a.confidence > b.confidence;
                     });
    return matches;
}

PatternAnalysis detect_patterns(CandleSeries candles, const AnalysisThresholds& thresholds) {
    PatternAnalysis analysis;
    auto matches = detect_chart_patterns(candles, thresholds.chart);

    if (!matches.empty()) {
        analysis.primary = std::move(matches.front());
        analysis.secondary.assign(std::make_move_iterator(matches.begin() + 1),
                                  std::make_move_iterator(matches.end()));
    }

    analysis.trend = detect_trend(candles, thresholds.trend);
    analysis.at_breakout = is_at_breakout(candles, thresholds.trend);
    analysis.at_breakdown = is_at_breakdown(candles, thresholds.trend);
    return analysis;
}

}  // namespace confluence::patterns
