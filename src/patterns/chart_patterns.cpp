// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Chart Patterns Implementation
// ============================================================================

#include "confluence/patterns/chart_patterns.hpp"

#include "confluence/utils/format.hpp"

#include <algorithm>
#include <cmath>

namespace confluence::patterns {

namespace {

using utils::fixed;

double percent_change(double from, double to) {
    return (to - from) / from * 100.0;
}

struct FlagShape {
    double pole_start = 0.0;
    double pole_end = 0.0;
    double flag_end = 0.0;
    double pole_pct = 0.0;
    double flag_pct = 0.0;
};

/// Split the window into pole and flag; nullopt when too short or zero priced
std::optional<FlagShape> measure_flag(CandleSeries candles, const ChartPatternThresholds& t) {
    if (candles.size() < t.window) return std::nullopt;

    const auto recent = tail(candles, t.window);
    FlagShape shape;
    shape.pole_start = recent[0].close;
    shape.pole_end = recent[t.pole_length - 1].close;
    const double flag_start = recent[t.pole_length].close;
    shape.flag_end = recent.back().close;

    if (shape.pole_start == 0.0 || flag_start == 0.0) return std::nullopt;

    shape.pole_pct = percent_change(shape.pole_start, shape.pole_end);
    shape.flag_pct = percent_change(flag_start, shape.flag_end);
    return shape;
}

int flag_confidence(double pole_pct, const ChartPatternThresholds& t) {
    const double raw = t.flag_base_confidence + std::abs(pole_pct) * t.flag_pole_multiplier;
    return static_cast<int>(std::lround(std::min(raw, t.flag_max_confidence)));
}

struct TriangleShape {
    double max_high = 0.0;
    double min_low = 0.0;
    size_t high_touches = 0;
    size_t low_touches = 0;
    double first_low_avg = 0.0;
    double second_low_avg = 0.0;
    double first_high_avg = 0.0;
    double second_high_avg = 0.0;
};

std::optional<TriangleShape> measure_triangle(CandleSeries candles,
                                              const ChartPatternThresholds& t) {
    if (candles.size() < t.window) return std::nullopt;

    const auto recent = tail(candles, t.window);
    const size_t half = recent.size() / 2;

    TriangleShape shape;
    shape.max_high = recent[0].high;
    shape.min_low = recent[0].low;
    for (const auto& c : recent) {
        shape.max_high = std::max(shape.max_high, c.high);
        shape.min_low = std::min(shape.min_low, c.low);
    }

    const double touch = t.triangle_touch_pct / 100.0;
    for (size_t i = 0; i < recent.size(); ++i) {
        const Candle& c = recent[i];
        if (c.high >= shape.max_high * (1.0 - touch)) ++shape.high_touches;
        if (c.low <= shape.min_low * (1.0 + touch)) ++shape.low_touches;

        if (i < half) {
            shape.first_low_avg += c.low;
            shape.first_high_avg += c.high;
        } else {
            shape.second_low_avg += c.low;
            shape.second_high_avg += c.high;
        }
    }

    const auto first_n = static_cast<double>(half);
    const auto second_n = static_cast<double>(recent.size() - half);
    shape.first_low_avg /= first_n;
    shape.first_high_avg /= first_n;
    shape.second_low_avg /= second_n;
    shape.second_high_avg /= second_n;
    return shape;
}

}  // namespace

// ============================================================================
// Flags
// ============================================================================

std::optional<PatternMatch> detect_bullish_flag(CandleSeries candles,
                                                const ChartPatternThresholds& t) {
    const auto shape = measure_flag(candles, t);
    if (!shape) return std::nullopt;

    if (shape->pole_pct > t.pole_min_move_pct && shape->flag_pct > t.bull_flag_min_pct &&
        shape->flag_pct < t.bull_flag_max_pct) {
        PatternMatch m;
        m.kind = PatternKind::BullishFlag;
        m.polarity = Polarity::Bullish;
        m.confidence = flag_confidence(shape->pole_pct, t);
        m.description = "Flag after " + fixed(shape->pole_pct, 1) + "% rally";
        m.target_price = shape->flag_end + (shape->pole_end - shape->pole_start);
        return m;
    }
    return std::nullopt;
}

std::optional<PatternMatch> detect_bearish_flag(CandleSeries candles,
                                                const ChartPatternThresholds& t) {
    const auto shape = measure_flag(candles, t);
    if (!shape) return std::nullopt;

    if (shape->pole_pct < -t.pole_min_move_pct && shape->flag_pct > t.bear_flag_min_pct &&
        shape->flag_pct < t.bear_flag_max_pct) {
        PatternMatch m;
        m.kind = PatternKind::BearishFlag;
        m.polarity = Polarity::Bearish;
        m.confidence = flag_confidence(shape->pole_pct, t);
        m.description = "Flag after " + fixed(std::abs(shape->pole_pct), 1) + "% decline";
        m.target_price = shape->flag_end - std::abs(shape->pole_end - shape->pole_start);
        return m;
    }
    return std::nullopt;
}

// ============================================================================
// Triangles
// ============================================================================

std::optional<PatternMatch> detect_ascending_triangle(CandleSeries candles,
                                                      const ChartPatternThresholds& t) {
    const auto shape = measure_triangle(candles, t);
    if (!shape) return std::nullopt;

    // Flat resistance with rising lows
    if (shape->high_touches >= t.triangle_min_touches &&
        shape->second_low_avg > shape->first_low_avg * (1.0 + t.triangle_slope_pct / 100.0)) {
        PatternMatch m;
        m.kind = PatternKind::AscendingTriangle;
        m.polarity = Polarity::Bullish;
        m.confidence = t.triangle_confidence;
        m.description = "Higher lows with flat resistance";
        m.target_price = shape->max_high + (shape->max_high - shape->min_low);
        return m;
    }
    return std::nullopt;
}

std::optional<PatternMatch> detect_descending_triangle(CandleSeries candles,
                                                       const ChartPatternThresholds& t) {
    const auto shape = measure_triangle(candles, t);
    if (!shape) return std::nullopt;

    // Flat support with falling highs
    if (shape->low_touches >= t.triangle_min_touches &&
        shape->second_high_avg < shape->first_high_avg * (1.0 - t.triangle_slope_pct / 100.0)) {
        PatternMatch m;
        m.kind = PatternKind::DescendingTriangle;
        m.polarity = Polarity::Bearish;
        m.confidence = t.triangle_confidence;
        m.description = "Lower highs with flat support";
        m.target_price = shape->min_low - (shape->max_high - shape->min_low);
        return m;
    }
    return std::nullopt;
}

// ============================================================================
// Bounce / Rejection
// ============================================================================

std::optional<PatternMatch> detect_support_bounce(CandleSeries candles,
                                                  const ChartPatternThresholds& t) {
    if (candles.size() < t.bounce_min_candles) return std::nullopt;

    const Candle& last = candles[candles.size() - 1];
    const Candle& prev = candles[candles.size() - 2];
    const auto window = tail(candles, t.bounce_lookback);
    const double support = std::min_element(window.begin(), window.end(),
                                            [](const Candle& a, const Candle& b) {
                                                return a.low < b.low;
                                            })->low;
    const double proximity = t.bounce_proximity_pct / 100.0;

    if (prev.low <= support * (1.0 + proximity) && last.close > prev.close &&
        last.close > last.open) {
        PatternMatch m;
        m.kind = PatternKind::SupportBounce;
        m.polarity = Polarity::Bullish;
        m.confidence = t.bounce_confidence;
        m.description = "Bounce from support at " + fixed(support, 0);
        m.stop_loss = support * (1.0 - proximity);
        m.index = candles.size() - 1;
        return m;
    }
    return std::nullopt;
}

std::optional<PatternMatch> detect_resistance_rejection(CandleSeries candles,
                                                        const ChartPatternThresholds& t) {
    if (candles.size() < t.bounce_min_candles) return std::nullopt;

    const Candle& last = candles[candles.size() - 1];
    const Candle& prev = candles[candles.size() - 2];
    const auto window = tail(candles, t.bounce_lookback);
    const double resistance = std::max_element(window.begin(), window.end(),
                                               [](const Candle& a, const Candle& b) {
                                                   return a.high < b.high;
                                               })->high;
    const double proximity = t.bounce_proximity_pct / 100.0;

    if (prev.high >= resistance * (1.0 - proximity) && last.close < prev.close &&
        last.close < last.open) {
        PatternMatch m;
        m.kind = PatternKind::ResistanceRejection;
        m.polarity = Polarity::Bearish;
        m.confidence = t.bounce_confidence;
        m.description = "Rejection from resistance at " + fixed(resistance, 0);
        m.stop_loss = resistance * (1.0 + proximity);
        m.index = candles.size() - 1;
        return m;
    }
    return std::nullopt;
}

}  // namespace confluence::patterns
