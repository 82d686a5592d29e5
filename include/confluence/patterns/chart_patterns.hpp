#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Chart Patterns
// ============================================================================
// Multi-candle formations: flags, triangles, bounces and rejections
// Each detector returns at most one match; short series return nullopt
// ============================================================================

#include "confluence/core/thresholds.hpp"
#include "confluence/patterns/pattern_types.hpp"

#include <optional>

namespace confluence::patterns {

using ChartDetector = std::optional<PatternMatch> (*)(CandleSeries,
                                                      const ChartPatternThresholds&);

// Bullish
[[nodiscard]] std::optional<PatternMatch> detect_bullish_flag(
    CandleSeries candles, const ChartPatternThresholds& t = default_thresholds().chart);
[[nodiscard]] std::optional<PatternMatch> detect_ascending_triangle(
    CandleSeries candles, const ChartPatternThresholds& t = default_thresholds().chart);
[[nodiscard]] std::optional<PatternMatch> detect_support_bounce(
    CandleSeries candles, const ChartPatternThresholds& t = default_thresholds().chart);

// Bearish
[[nodiscard]] std::optional<PatternMatch> detect_bearish_flag(
    CandleSeries candles, const ChartPatternThresholds& t = default_thresholds().chart);
[[nodiscard]] std::optional<PatternMatch> detect_descending_triangle(
    CandleSeries candles, const ChartPatternThresholds& t = default_thresholds().chart);
[[nodiscard]] std::optional<PatternMatch> detect_resistance_rejection(
    CandleSeries candles, const ChartPatternThresholds& t = default_thresholds().chart);

}  // namespace confluence::patterns
