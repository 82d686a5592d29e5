#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Candlestick Patterns
// ============================================================================
// Single and multi-candle reversal/conviction patterns over the last candles
// ============================================================================

#include "confluence/core/thresholds.hpp"
#include "confluence/patterns/pattern_types.hpp"

#include <string>
#include <vector>

namespace confluence::patterns {

/// Every match over the lookback window, in detection order (oldest index first)
[[nodiscard]] std::vector<PatternMatch> scan_candlestick_patterns(
    CandleSeries candles,
    const CandlestickThresholds& thresholds = default_thresholds().candlestick);

/// Name-deduplicated matches, newest first, at most max_results
[[nodiscard]] std::vector<PatternMatch> detect_candlestick_patterns(
    CandleSeries candles,
    const CandlestickThresholds& thresholds = default_thresholds().candlestick);

/// detect_candlestick_patterns formatted as "<name> (<polarity>)"
[[nodiscard]] std::vector<std::string> candlestick_pattern_names(
    CandleSeries candles,
    const CandlestickThresholds& thresholds = default_thresholds().candlestick);

}  // namespace confluence::patterns
