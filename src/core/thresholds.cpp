// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Analysis Thresholds Implementation
// ============================================================================

#include "confluence/core/thresholds.hpp"

#include <stdexcept>
#include <string>

namespace confluence {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument("invalid threshold: " + message);
    }
}

}  // namespace

const AnalysisThresholds& default_thresholds() noexcept {
    static const AnalysisThresholds defaults{};
    return defaults;
}

void AnalysisThresholds::validate() const {
    require(indicators.min_candles >= 2, "indicators.min_candles must be at least 2");
    require(indicators.rsi_oversold < indicators.rsi_overbought,
            "rsi_oversold must be below rsi_overbought");
    require(indicators.volume_lookback > 0, "volume_lookback must be positive");
    require(indicators.volume_low_ratio < indicators.volume_high_ratio,
            "volume_low_ratio must be below volume_high_ratio");
    require(indicators.vwap_period > 0, "vwap_period must be positive");
    require(indicators.swing_lookback > 0, "swing_lookback must be positive");

    require(candlestick.lookback > 0, "candlestick.lookback must be positive");
    require(candlestick.max_results > 0, "candlestick.max_results must be positive");

    // The flag splits the window into a pole and a flag of at least two closes
    require(chart.pole_length >= 2 && chart.pole_length + 2 <= chart.window,
            "chart.pole_length must leave room for the flag");
    require(chart.bull_flag_min_pct < chart.bull_flag_max_pct, "bull flag band is inverted");
    require(chart.bear_flag_min_pct < chart.bear_flag_max_pct, "bear flag band is inverted");
    require(chart.bounce_min_candles >= 2, "chart.bounce_min_candles must be at least 2");
    require(chart.bounce_lookback >= 2, "chart.bounce_lookback must be at least 2");

    require(trend.lookback >= 2, "trend.lookback must be at least 2");
    require(trend.min_candles >= 2, "trend.min_candles must be at least 2");
    require(trend.breakout_lookback > 0, "trend.breakout_lookback must be positive");

    const auto& w = scoring.weights;
    require(w.pattern >= 0 && w.news >= 0 && w.technical >= 0 && w.volume >= 0 &&
                w.fundamental >= 0,
            "confidence weights must be non-negative");
    require(w.total() > 0.0, "confidence weights must not all be zero");
    require(scoring.hold_score <= scoring.actionable_score,
            "hold_score must not exceed actionable_score");
    // Two agreeing timeframes must keep the mixed score inside [20, 100]
    require(scoring.alignment_mixed_step >= 0 && scoring.alignment_mixed_step <= 25,
            "alignment_mixed_step must be within [0, 25]");

    require(fundamentals.undervalued_pe <= fundamentals.overvalued_pe,
            "undervalued_pe must not exceed overvalued_pe");
    require(fundamentals.moderate_growth <= fundamentals.strong_growth,
            "moderate_growth must not exceed strong_growth");
    require(fundamentals.inline_roe <= fundamentals.outperforming_roe,
            "inline_roe must not exceed outperforming_roe");

    require(risk.min_candles >= 2, "risk.min_candles must be at least 2");
    require(risk.min_win_rate <= risk.max_win_rate, "risk win-rate band is inverted");
}

}  // namespace confluence
