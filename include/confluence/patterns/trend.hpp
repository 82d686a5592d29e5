#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Trend Classifier
// ============================================================================
// Least-squares slope of recent closes, normalized to percent of mean price
// ============================================================================

#include "confluence/core/thresholds.hpp"
#include "confluence/patterns/pattern_types.hpp"

namespace confluence::patterns {

struct RegressionLine {
    double slope = 0.0;       // Price units per period
    double intercept = 0.0;
    double mean = 0.0;        // Mean of the fitted values
};

/// Ordinary least squares of values against 0..n-1 (n < 2 gives a flat line)
[[nodiscard]] RegressionLine fit_line(std::span<const double> values) noexcept;

[[nodiscard]] TrendResult detect_trend(CandleSeries candles,
                                       const TrendThresholds& t = default_thresholds().trend);

/// Close within breakout_ratio of the lookback high
[[nodiscard]] bool is_at_breakout(CandleSeries candles,
                                  const TrendThresholds& t = default_thresholds().trend);

/// Close within breakdown_ratio of the lookback low
[[nodiscard]] bool is_at_breakdown(CandleSeries candles,
                                   const TrendThresholds& t = default_thresholds().trend);

}  // namespace confluence::patterns
