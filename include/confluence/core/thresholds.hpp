#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Analysis Thresholds
// ============================================================================
// Every tunable numeric constant used by the detectors and scorers
// Defaults reproduce the reference behaviour; YAML config can override them
// ============================================================================

#include <cstddef>

namespace confluence {

// ============================================================================
// Indicator Thresholds
// ============================================================================

struct IndicatorThresholds {
    size_t min_candles = 5;            // Below this the indicator set is degenerate

    double rsi_oversold = 30.0;        // RSI <= oversold
    double rsi_overbought = 70.0;      // RSI >= overbought

    size_t volume_lookback = 20;       // Rolling average window
    double volume_high_ratio = 1.5;    // ratio > high -> "high"
    double volume_low_ratio = 0.5;     // ratio < low -> "low"

    size_t swing_lookback = 20;        // Window for swing high/low
    size_t macd_divergence_lookback = 20;
    double macd_divergence_ratio = 0.8;

    size_t fibonacci_min_candles = 5;
    size_t vwap_period = 5;
};

// ============================================================================
// Pattern Thresholds
// ============================================================================

struct CandlestickThresholds {
    size_t lookback = 5;                  // Candles scanned for patterns
    size_t min_candles = 3;
    size_t max_results = 5;
    double doji_body_ratio = 0.1;         // body < ratio * range
    double hammer_wick_ratio = 2.0;       // long wick > ratio * body
    double hammer_opposite_ratio = 0.5;   // short wick < ratio * body
    double star_first_body_ratio = 3.0;   // first body > ratio * middle body
    double star_third_body_ratio = 2.0;   // third body > ratio * middle body
    double marubozu_body_ratio = 0.9;     // body > ratio * range
    int high_reliability_confidence = 75;
    int medium_reliability_confidence = 60;
};

struct ChartPatternThresholds {
    size_t window = 15;                   // Flags and triangles
    size_t pole_length = 7;
    double pole_min_move_pct = 3.0;
    double bull_flag_min_pct = -2.0;      // Flag drift band, exclusive
    double bull_flag_max_pct = 1.0;
    double bear_flag_min_pct = -1.0;
    double bear_flag_max_pct = 2.0;
    double flag_base_confidence = 75.0;
    double flag_pole_multiplier = 2.0;
    double flag_max_confidence = 95.0;

    double triangle_touch_pct = 2.0;      // Within pct of the window extreme
    size_t triangle_min_touches = 3;
    double triangle_slope_pct = 1.0;      // Second-half average vs first-half
    int triangle_confidence = 75;

    size_t bounce_min_candles = 10;
    size_t bounce_lookback = 20;
    double bounce_proximity_pct = 1.0;
    int bounce_confidence = 65;
};

struct TrendThresholds {
    size_t lookback = 20;                 // Regression window
    size_t min_candles = 10;
    double slope_threshold_pct = 0.1;     // Per-period slope for up/down
    double strength_multiplier = 10.0;
    double consolidation_band_pct = 2.0;

    size_t breakout_lookback = 20;
    double breakout_ratio = 0.99;         // close >= ratio * high
    double breakdown_ratio = 1.01;        // close <= ratio * low
};

// ============================================================================
// Scoring Thresholds
// ============================================================================

struct ConfidenceWeights {
    double pattern = 0.25;
    double news = 0.20;
    double technical = 0.25;
    double volume = 0.15;
    double fundamental = 0.15;

    [[nodiscard]] double total() const noexcept {
        return pattern + news + technical + volume + fundamental;
    }
};

struct ScoringThresholds {
    ConfidenceWeights weights;
    int default_pattern_score = 50;
    int alignment_mixed_step = 15;
    int actionable_score = 70;            // >= actionable -> BUY/SELL
    int hold_score = 40;                  // >= hold -> HOLD, below -> WAIT
    double bias_rsi_low = 40.0;           // RSI inside (low, overbought) is healthy
    int bias_min_signals = 2;
};

struct FundamentalThresholds {
    double undervalued_pe = 15.0;         // P/E < undervalued
    double overvalued_pe = 30.0;          // P/E > overvalued
    double strong_growth = 0.15;          // revenue growth > strong
    double moderate_growth = 0.05;
    double outperforming_roe = 0.20;      // ROE > outperforming vs sector
    double inline_roe = 0.10;

    double conflict_pe = 30.0;            // Bullish + overvalued needs P/E above this
    int overvalued_bullish_adjustment = -15;
    int weak_growth_bullish_adjustment = -10;
    int undervalued_bullish_adjustment = 15;
    int undervalued_bearish_adjustment = -10;
    int overvalued_bearish_adjustment = 10;
};

struct RiskThresholds {
    size_t min_candles = 20;
    double trading_days = 252.0;
    double risk_free_rate = 7.0;          // Annual percent
    double target_atr_multiple = 2.0;
    double stop_atr_multiple = 1.0;
    double min_win_rate = 40.0;
    double max_win_rate = 80.0;
};

// ============================================================================
// Aggregate Table
// ============================================================================

struct AnalysisThresholds {
    IndicatorThresholds indicators;
    CandlestickThresholds candlestick;
    ChartPatternThresholds chart;
    TrendThresholds trend;
    ScoringThresholds scoring;
    FundamentalThresholds fundamentals;
    RiskThresholds risk;

    /// Throws std::invalid_argument when a value makes the engine ill-defined
    void validate() const;
};

/// Shared default table
[[nodiscard]] const AnalysisThresholds& default_thresholds() noexcept;

}  // namespace confluence
