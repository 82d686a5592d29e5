#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Risk Metrics
// ============================================================================
// ATR-based trade quality estimates from daily history
// All percentages are in percent units (2.5 = 2.5%)
// ============================================================================

#include "confluence/core/thresholds.hpp"
#include "confluence/core/types.hpp"

namespace confluence::risk {

struct RiskMetrics {
    double expected_return = 0.0;     // Per trade, percent
    double sharpe_ratio = 0.0;        // Annualized
    double max_drawdown = 0.0;        // Peak-to-trough, reported negative
    double volatility = 0.0;          // Annualized stddev of daily returns
    double risk_reward_ratio = 0.0;
    double win_rate = 0.0;            // Estimated from confidence
};

/// Annualized volatility of simple close-to-close returns
[[nodiscard]] double annualized_volatility(CandleSeries candles, double trading_days);

/// Largest peak-to-trough close decline as a positive percent
[[nodiscard]] double max_drawdown_pct(CandleSeries candles) noexcept;

/// Win rate mapped from a 0-100 confidence, clamped to the configured band
[[nodiscard]] double estimate_win_rate(int confidence,
                                       const RiskThresholds& t = default_thresholds().risk)
    noexcept;

/// Zeroed metrics below min_candles
[[nodiscard]] RiskMetrics compute_risk_metrics(
    CandleSeries daily, double atr, int adjusted_confidence,
    const RiskThresholds& t = default_thresholds().risk);

}  // namespace confluence::risk
