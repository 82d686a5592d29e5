#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Pattern Detector
// ============================================================================
// Runs every chart detector, ranks matches, attaches trend and breakout state
// ============================================================================

#include "confluence/core/thresholds.hpp"
#include "confluence/patterns/pattern_types.hpp"

#include <vector>

namespace confluence::patterns {

/// All chart-pattern matches sorted by confidence (ties keep detector order)
[[nodiscard]] std::vector<PatternMatch> detect_chart_patterns(
    CandleSeries candles, const ChartPatternThresholds& t = default_thresholds().chart);

/// Primary/secondary patterns plus trend, breakout and breakdown state
[[nodiscard]] PatternAnalysis detect_patterns(
    CandleSeries candles, const AnalysisThresholds& thresholds = default_thresholds());

}  // namespace confluence::patterns
