// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Indicator Set Implementation
// ============================================================================

#include "confluence/strategy/indicator_set.hpp"

#include "confluence/strategy/indicators/atr.hpp"
#include "confluence/strategy/indicators/bollinger.hpp"
#include "confluence/strategy/indicators/ema.hpp"
#include "confluence/strategy/indicators/macd.hpp"
#include "confluence/strategy/indicators/rsi.hpp"
#include "confluence/utils/logger.hpp"

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>

namespace confluence::strategy {

namespace {

constexpr std::array<double, 7> FIBONACCI_RATIOS = {0.0, 0.236, 0.382, 0.5, 0.618, 0.786, 1.0};

/// Feed every value of a series into a streaming indicator
template <typename T, typename Series>
void feed(T& indicator, const Series& series) {
    for (const auto& v : series) {
        indicator.update(v);
    }
}

/// Degenerate set for series too short to trust
IndicatorSet degenerate_set(CandleSeries candles, std::span<const double> closes,
                            const IndicatorThresholds& thresholds) {
    IndicatorSet set;
    set.bollinger = compute_bollinger(closes);
    set.fibonacci = compute_fibonacci(closes, thresholds);
    LOG_DEBUG("indicator set degenerate: {} candles (need {})", candles.size(),
              thresholds.min_candles);
    return set;
}

}  // namespace

// ============================================================================
// Indicator Set
// ============================================================================

IndicatorSet compute_indicators(CandleSeries candles, const IndicatorThresholds& thresholds) {
    const auto closes = closes_of(candles);

    if (candles.size() < thresholds.min_candles) {
        return degenerate_set(candles, closes, thresholds);
    }

    IndicatorSet set;
    set.rsi = compute_rsi(closes, thresholds);
    set.moving_averages = compute_moving_averages(closes);
    set.support_resistance = compute_support_resistance(candles, thresholds);
    set.volume = compute_volume(candles, thresholds);
    set.macd = compute_macd(closes, thresholds);
    set.atr = compute_atr(candles);
    set.bollinger = compute_bollinger(closes);
    set.fibonacci = compute_fibonacci(closes, thresholds);
    set.vwap = compute_vwap(candles, thresholds);
    return set;
}

// ============================================================================
// Momentum
// ============================================================================

RsiResult compute_rsi(std::span<const double> closes, const IndicatorThresholds& thresholds) {
    RSI14 rsi;
    feed(rsi, closes);

    RsiResult result;
    result.value = rsi.value();
    if (result.value <= thresholds.rsi_oversold) {
        result.zone = RsiZone::Oversold;
    } else if (result.value >= thresholds.rsi_overbought) {
        result.zone = RsiZone::Overbought;
    }
    return result;
}

MacdResult compute_macd(std::span<const double> closes, const IndicatorThresholds& thresholds) {
    MacdResult result;

    MACD_12_26_9 macd;
    std::vector<double> histograms;
    histograms.reserve(closes.size());
    for (double close : closes) {
        macd.update(close);
        if (macd.is_ready()) {
            histograms.push_back(macd.histogram());
        }
    }

    if (!macd.has_line()) {
        return result;
    }

    result.macd = macd.value();
    result.signal = macd.signal_line();
    result.histogram = macd.histogram();

    if (result.histogram > 0.0) {
        result.trend = SignalTrend::Bullish;
    } else if (result.histogram < 0.0) {
        result.trend = SignalTrend::Bearish;
    }

    // Divergence: price makes a new extreme that the histogram does not confirm
    const size_t lookback = thresholds.macd_divergence_lookback;
    if (lookback < 2 || closes.size() < lookback || histograms.size() < lookback) {
        return result;
    }

    const auto window_closes = closes.subspan(closes.size() - lookback, lookback - 1);
    const auto window_hist =
        std::span<const double>(histograms).subspan(histograms.size() - lookback, lookback - 1);
    const double current_close = closes.back();
    const double current_hist = histograms.back();
    const double ratio = thresholds.macd_divergence_ratio;

    const double max_close = *std::max_element(window_closes.begin(), window_closes.end());
    const double min_close = *std::min_element(window_closes.begin(), window_closes.end());

    if (current_close > max_close) {
        const double max_hist = *std::max_element(window_hist.begin(), window_hist.end());
        if (max_hist > 0.0 && current_hist < max_hist * ratio) {
            result.divergence = Divergence::Bearish;
        }
    } else if (current_close < min_close) {
        const double min_hist = *std::min_element(window_hist.begin(), window_hist.end());
        if (min_hist < 0.0 && current_hist > min_hist * ratio) {
            result.divergence = Divergence::Bullish;
        }
    }
    return result;
}

// ============================================================================
// Trend
// ============================================================================

MovingAverages compute_moving_averages(std::span<const double> closes) {
    MovingAverages ma;
    if (closes.empty()) return ma;

    SMA20 sma20;
    SMA50 sma50;
    SMA200 sma200;
    EMA9 ema9;
    EMA21 ema21;
    for (double close : closes) {
        sma20.update(close);
        sma50.update(close);
        sma200.update(close);
        ema9.update(close);
        ema21.update(close);
    }

    ma.sma20 = sma20.value();
    ma.sma50 = sma50.value();
    ma.sma200 = sma200.value();
    ma.ema9 = ema9.value();
    ma.ema21 = ema21.value();

    const double price = closes.back();
    if (price > ma.ema9 && price > ma.ema21) {
        ma.trend = SignalTrend::Bullish;
    } else if (price < ma.ema9 && price < ma.ema21) {
        ma.trend = SignalTrend::Bearish;
    }
    return ma;
}

// ============================================================================
// Levels
// ============================================================================

SupportResistance compute_support_resistance(CandleSeries candles,
                                             const IndicatorThresholds& thresholds) {
    SupportResistance sr;
    if (candles.empty()) return sr;

    const Candle& last = candles.back();
    const double range = last.high - last.low;

    sr.pivot = (last.high + last.low + last.close) / 3.0;
    sr.r1 = 2.0 * sr.pivot - last.low;
    sr.r2 = sr.pivot + range;
    sr.s1 = 2.0 * sr.pivot - last.high;
    sr.s2 = sr.pivot - range;
    sr.support = sr.s1;
    sr.resistance = sr.r1;

    const auto swing = tail(candles, thresholds.swing_lookback);
    sr.swing_high = std::max_element(swing.begin(), swing.end(),
                                     [](const Candle& a, const Candle& b) {
                                         return a.high < b.high;
                                     })->high;
    sr.swing_low = std::min_element(swing.begin(), swing.end(),
                                    [](const Candle& a, const Candle& b) {
                                        return a.low < b.low;
                                    })->low;
    return sr;
}

FibonacciResult compute_fibonacci(std::span<const double> closes,
                                  const IndicatorThresholds& thresholds) {
    FibonacciResult fib;
    if (closes.empty()) return fib;

    if (closes.size() < thresholds.fibonacci_min_candles) {
        fib.high = fib.low = closes.back();
        return fib;
    }

    // Latest occurrence of each extreme decides the swing direction
    size_t high_index = 0;
    size_t low_index = 0;
    for (size_t i = 0; i < closes.size(); ++i) {
        if (closes[i] >= closes[high_index]) high_index = i;
        if (closes[i] <= closes[low_index]) low_index = i;
    }

    fib.high = closes[high_index];
    fib.low = closes[low_index];
    fib.uptrend = high_index >= low_index;

    const double diff = fib.high - fib.low;
    fib.levels.reserve(FIBONACCI_RATIOS.size());
    for (double ratio : FIBONACCI_RATIOS) {
        const double price = fib.uptrend ? fib.high - diff * ratio : fib.low + diff * ratio;
        fib.levels.push_back({ratio, price});
    }
    return fib;
}

// ============================================================================
// Volatility
// ============================================================================

double compute_atr(CandleSeries candles) {
    ATR14 atr;
    feed(atr, candles);
    return atr.value();
}

BollingerResult compute_bollinger(std::span<const double> closes) {
    BollingerResult bb;
    if (closes.empty()) return bb;

    BB20_2 bands;
    feed(bands, closes);

    bb.upper = bands.upper_band();
    bb.middle = bands.value();
    bb.lower = bands.lower_band();
    bb.bandwidth = bands.band_width_pct();
    bb.percent_b = bands.percent_b();

    const double current = closes.back();
    if (!bands.is_ready()) {
        bb.position = BandPosition::Middle;
    } else if (current > bb.upper) {
        bb.position = BandPosition::AboveUpper;
    } else if (current > bb.middle + (bb.upper - bb.middle) / 2.0) {
        bb.position = BandPosition::UpperHalf;
    } else if (current < bb.lower) {
        bb.position = BandPosition::BelowLower;
    } else if (current < bb.middle - (bb.middle - bb.lower) / 2.0) {
        bb.position = BandPosition::LowerHalf;
    } else {
        bb.position = BandPosition::Middle;
    }
    return bb;
}

// ============================================================================
// Volume
// ============================================================================

VolumeAnalysis compute_volume(CandleSeries candles, const IndicatorThresholds& thresholds) {
    VolumeAnalysis va;
    if (candles.empty()) return va;

    const auto window = tail(candles, thresholds.volume_lookback);
    double total = 0.0;
    for (const auto& c : window) {
        total += c.volume;
    }

    va.current = candles.back().volume;
    va.average = total / static_cast<double>(window.size());
    va.ratio = va.average > 0.0 ? va.current / va.average : 1.0;

    if (va.ratio > thresholds.volume_high_ratio) {
        va.trend = VolumeTrend::High;
    } else if (va.ratio < thresholds.volume_low_ratio) {
        va.trend = VolumeTrend::Low;
    }
    return va;
}

double compute_vwap(CandleSeries candles, const IndicatorThresholds& thresholds) {
    if (candles.size() < thresholds.vwap_period) return 0.0;

    double price_volume = 0.0;
    double volume = 0.0;
    for (const auto& c : tail(candles, thresholds.vwap_period)) {
        price_volume += c.typical_price() * c.volume;
        volume += c.volume;
    }
    return volume > 0.0 ? price_volume / volume : 0.0;
}

// ============================================================================
// String Conversion
// ============================================================================

std::string_view to_string(RsiZone zone) noexcept {
    switch (zone) {
        case RsiZone::Oversold:   return "oversold";
        case RsiZone::Neutral:    return "neutral";
        case RsiZone::Overbought: return "overbought";
    }
    return "?";
}

std::string_view to_string(VolumeTrend trend) noexcept {
    switch (trend) {
        case VolumeTrend::High:   return "high";
        case VolumeTrend::Normal: return "normal";
        case VolumeTrend::Low:    return "low";
    }
    return "?";
}

std::string_view to_string(Divergence divergence) noexcept {
    switch (divergence) {
        case Divergence::None:    return "none";
        case Divergence::Bullish: return "bullish";
        case Divergence::Bearish: return "bearish";
    }
    return "?";
}

std::string_view to_string(BandPosition position) noexcept {
    switch (position) {
        case BandPosition::AboveUpper: return "above_upper";
        case BandPosition::UpperHalf:  return "upper_half";
        case BandPosition::Middle:     return "middle";
        case BandPosition::LowerHalf:  return "lower_half";
        case BandPosition::BelowLower: return "below_lower";
    }
    return "?";
}

std::string fibonacci_label(double ratio) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << ratio * 100.0 << '%';
    return out.str();
}

}  // namespace confluence::strategy
