// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Risk Metrics Implementation
// ============================================================================

#include "confluence/risk/risk_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace confluence::risk {

namespace {

// Win rate = base + slope * confidence before clamping
constexpr double WIN_RATE_BASE = 35.0;
constexpr double WIN_RATE_SLOPE = 0.5;

}  // namespace

double annualized_volatility(CandleSeries candles, double trading_days) {
    std::vector<double> returns;
    returns.reserve(candles.size());
    for (size_t i = 1; i < candles.size(); ++i) {
        const double prev = candles[i - 1].close;
        if (prev == 0.0) continue;
        returns.push_back((candles[i].close - prev) / prev);
    }
    if (returns.empty()) return 0.0;

    const auto n = static_cast<double>(returns.size());
    double mean = 0.0;
    for (double r : returns) mean += r;
    mean /= n;

    double variance = 0.0;
    for (double r : returns) variance += (r - mean) * (r - mean);
    variance /= n;

    return std::sqrt(variance) * std::sqrt(trading_days) * 100.0;
}

double max_drawdown_pct(CandleSeries candles) noexcept {
    if (candles.empty()) return 0.0;

    double peak = candles.front().close;
    double worst = 0.0;
    for (const auto& c : candles) {
        peak = std::max(peak, c.close);
        if (peak <= 0.0) continue;
        worst = std::max(worst, (peak - c.close) / peak * 100.0);
    }
    return worst;
}

double estimate_win_rate(int confidence, const RiskThresholds& t) noexcept {
    const double raw = WIN_RATE_BASE + WIN_RATE_SLOPE * confidence;
    return std::clamp(raw, t.min_win_rate, t.max_win_rate);
}

RiskMetrics compute_risk_metrics(CandleSeries daily, double atr, int adjusted_confidence,
                                 const RiskThresholds& t) {
    RiskMetrics metrics;
    if (daily.size() < t.min_candles) return metrics;

    metrics.volatility = annualized_volatility(daily, t.trading_days);
    metrics.max_drawdown = -max_drawdown_pct(daily);
    metrics.win_rate = estimate_win_rate(adjusted_confidence, t);

    const double price = daily.back().close;
    if (price <= 0.0) return metrics;

    const double gain_pct = atr * t.target_atr_multiple / price * 100.0;
    const double loss_pct = atr * t.stop_atr_multiple / price * 100.0;
    const double w = metrics.win_rate / 100.0;

    metrics.expected_return = w * gain_pct - (1.0 - w) * loss_pct;
    metrics.risk_reward_ratio = loss_pct > 0.0 ? gain_pct / loss_pct : 0.0;
    metrics.sharpe_ratio =
        metrics.volatility > 0.0
            ? (metrics.expected_return * t.trading_days - t.risk_free_rate) / metrics.volatility
            : 0.0;
    return metrics;
}

}  // namespace confluence::risk
