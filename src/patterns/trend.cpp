// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Trend Classifier Implementation
// ============================================================================

#include "confluence/patterns/trend.hpp"

#include <algorithm>
#include <cmath>

namespace confluence::patterns {

RegressionLine fit_line(std::span<const double> values) noexcept {
    RegressionLine line;
    const size_t n = values.size();
    if (n == 0) return line;

    double sum_x = 0.0;
    double sum_y = 0.0;
    double sum_xy = 0.0;
    double sum_x2 = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const auto x = static_cast<double>(i);
        sum_x += x;
        sum_y += values[i];
        sum_xy += x * values[i];
        sum_x2 += x * x;
    }

    const auto dn = static_cast<double>(n);
    line.mean = sum_y / dn;

    const double denominator = dn * sum_x2 - sum_x * sum_x;
    if (denominator == 0.0) {
        line.intercept = line.mean;
        return line;
    }

    line.slope = (dn * sum_xy - sum_x * sum_y) / denominator;
    line.intercept = (sum_y - line.slope * sum_x) / dn;
    return line;
}

TrendResult detect_trend(CandleSeries candles, const TrendThresholds& t) {
    TrendResult result;
    if (candles.size() < t.min_candles) return result;

    const auto closes = closes_of(tail(candles, t.lookback));
    const auto line = fit_line(closes);
    if (line.mean == 0.0) return result;

    const double slope_pct = line.slope / line.mean * 100.0;

    if (slope_pct > t.slope_threshold_pct) {
        result.direction = TrendDirection::Uptrend;
    } else if (slope_pct < -t.slope_threshold_pct) {
        result.direction = TrendDirection::Downtrend;
    }
    result.strength = static_cast<int>(
        std::lround(std::min(std::abs(slope_pct) * t.strength_multiplier, 100.0)));

    double max_deviation = 0.0;
    for (double close : closes) {
        max_deviation = std::max(max_deviation, std::abs(close - line.mean));
    }
    result.consolidating = max_deviation / line.mean * 100.0 < t.consolidation_band_pct;
    return result;
}

bool is_at_breakout(CandleSeries candles, const TrendThresholds& t) {
    if (candles.size() < t.breakout_lookback) return false;

    const auto window = tail(candles, t.breakout_lookback);
    double high = window[0].high;
    for (const auto& c : window) {
        high = std::max(high, c.high);
    }
    return candles.back().close >= high * t.breakout_ratio;
}

bool is_at_breakdown(CandleSeries candles, const TrendThresholds& t) {
    if (candles.size() < t.breakout_lookback) return false;

    const auto window = tail(candles, t.breakout_lookback);
    double low = window[0].low;
    for (const auto& c : window) {
        low = std::min(low, c.low);
    }
    return candles.back().close <= low * t.breakdown_ratio;
}

}  // namespace confluence::patterns
