#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Indicator Set
// ============================================================================
// Batch evaluation of every indicator over one candle series
// Short series yield a degenerate but structurally complete set
// ============================================================================

#include "confluence/core/thresholds.hpp"
#include "confluence/core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace confluence::strategy {

// ============================================================================
// Result Types
// ============================================================================

enum class RsiZone : uint8_t { Oversold, Neutral, Overbought };
enum class VolumeTrend : uint8_t { High, Normal, Low };
enum class Divergence : uint8_t { None, Bullish, Bearish };
enum class BandPosition : uint8_t { AboveUpper, UpperHalf, Middle, LowerHalf, BelowLower };

struct RsiResult {
    double value = 50.0;
    RsiZone zone = RsiZone::Neutral;
};

struct MovingAverages {
    double sma20 = 0.0;
    double sma50 = 0.0;
    double sma200 = 0.0;
    double ema9 = 0.0;
    double ema21 = 0.0;
    SignalTrend trend = SignalTrend::Neutral;
};

/// Classic pivot levels from the last completed period
struct SupportResistance {
    double pivot = 0.0;
    double r1 = 0.0;
    double r2 = 0.0;
    double s1 = 0.0;
    double s2 = 0.0;
    double support = 0.0;      // s1
    double resistance = 0.0;   // r1
    double swing_low = 0.0;    // Lowest low of the swing window
    double swing_high = 0.0;   // Highest high of the swing window
};

struct VolumeAnalysis {
    double current = 0.0;
    double average = 0.0;
    double ratio = 1.0;
    VolumeTrend trend = VolumeTrend::Normal;
};

struct MacdResult {
    double macd = 0.0;
    double signal = 0.0;
    double histogram = 0.0;
    SignalTrend trend = SignalTrend::Neutral;
    Divergence divergence = Divergence::None;
};

struct BollingerResult {
    double upper = 0.0;
    double middle = 0.0;
    double lower = 0.0;
    double bandwidth = 0.0;    // Percent of middle band
    BandPosition position = BandPosition::Middle;
    double percent_b = 0.5;
};

struct FibonacciLevel {
    double ratio = 0.0;        // 0.236 etc.
    double price = 0.0;
};

struct FibonacciResult {
    double high = 0.0;
    double low = 0.0;
    bool uptrend = true;       // Most recent extreme was the high
    std::vector<FibonacciLevel> levels;
};

struct IndicatorSet {
    RsiResult rsi;
    MovingAverages moving_averages;
    SupportResistance support_resistance;
    VolumeAnalysis volume;
    MacdResult macd;
    double atr = 0.0;
    BollingerResult bollinger;
    FibonacciResult fibonacci;
    double vwap = 0.0;
};

// ============================================================================
// Calculators
// ============================================================================

/// Full indicator set; fewer than thresholds.min_candles candles -> degenerate set
[[nodiscard]] IndicatorSet compute_indicators(
    CandleSeries candles,
    const IndicatorThresholds& thresholds = default_thresholds().indicators);

[[nodiscard]] RsiResult compute_rsi(std::span<const double> closes,
                                    const IndicatorThresholds& thresholds);

[[nodiscard]] MovingAverages compute_moving_averages(std::span<const double> closes);

[[nodiscard]] SupportResistance compute_support_resistance(
    CandleSeries candles, const IndicatorThresholds& thresholds);

[[nodiscard]] VolumeAnalysis compute_volume(CandleSeries candles,
                                            const IndicatorThresholds& thresholds);

[[nodiscard]] MacdResult compute_macd(std::span<const double> closes,
                                      const IndicatorThresholds& thresholds);

[[nodiscard]] double compute_atr(CandleSeries candles);

[[nodiscard]] BollingerResult compute_bollinger(std::span<const double> closes);

[[nodiscard]] FibonacciResult compute_fibonacci(std::span<const double> closes,
                                                const IndicatorThresholds& thresholds);

[[nodiscard]] double compute_vwap(CandleSeries candles, const IndicatorThresholds& thresholds);

// ============================================================================
// String Conversion
// ============================================================================

[[nodiscard]] std::string_view to_string(RsiZone zone) noexcept;
[[nodiscard]] std::string_view to_string(VolumeTrend trend) noexcept;
[[nodiscard]] std::string_view to_string(Divergence divergence) noexcept;
[[nodiscard]] std::string_view to_string(BandPosition position) noexcept;

/// "23.6%" style label of a retracement ratio
[[nodiscard]] std::string fibonacci_label(double ratio);

}  // namespace confluence::strategy
