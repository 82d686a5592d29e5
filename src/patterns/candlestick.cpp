// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Candlestick Patterns Implementation
// ============================================================================

#include "confluence/patterns/candlestick.hpp"

#include <algorithm>

namespace confluence::patterns {

namespace {

enum class Reliability { High, Medium };

PatternMatch make_match(PatternKind kind, Polarity polarity, Reliability reliability,
                        size_t index, const CandlestickThresholds& t) {
    PatternMatch m;
    m.kind = kind;
    m.polarity = polarity;
    m.confidence = reliability == Reliability::High ? t.high_reliability_confidence
                                                    : t.medium_reliability_confidence;
    m.description = std::string{to_string(kind)} + " candle";
    m.index = index;
    return m;
}

/// All patterns completing at index i, in fixed evaluation order
void scan_index(CandleSeries candles, size_t i, const CandlestickThresholds& t,
                std::vector<PatternMatch>& out) {
    const Candle& cur = candles[i];
    const Candle* prev = i > 0 ? &candles[i - 1] : nullptr;
    const Candle* prev2 = i > 1 ? &candles[i - 2] : nullptr;

    const double body = cur.body();
    const double range = cur.range();
    const double upper_wick = cur.upper_wick();
    const double lower_wick = cur.lower_wick();
    const bool bullish = cur.is_bullish();

    // Doji: tiny body inside a real range
    if (range > 0.0 && body < range * t.doji_body_ratio) {
        out.push_back(make_match(PatternKind::Doji, Polarity::Neutral, Reliability::Medium, i, t));
    }

    // Hammer: long lower wick, little upper wick
    if (body > 0.0 && lower_wick > body * t.hammer_wick_ratio &&
        upper_wick < body * t.hammer_opposite_ratio) {
        out.push_back(make_match(PatternKind::Hammer, Polarity::Bullish, Reliability::High, i, t));
    }

    // Inverted hammer / shooting star: label depends on the prior close
    if (body > 0.0 && upper_wick > body * t.hammer_wick_ratio &&
        lower_wick < body * t.hammer_opposite_ratio) {
        const bool after_higher_close = prev != nullptr && prev->close > cur.close;
        out.push_back(after_higher_close
                          ? make_match(PatternKind::ShootingStar, Polarity::Bearish,
                                       Reliability::Medium, i, t)
                          : make_match(PatternKind::InvertedHammer, Polarity::Bullish,
                                       Reliability::Medium, i, t));
    }

    if (prev != nullptr && body > 0.0) {
        const double prev_body = prev->body();

        if (bullish && !prev->is_bullish() && cur.open < prev->close &&
            cur.close > prev->open && body > prev_body) {
            out.push_back(make_match(PatternKind::BullishEngulfing, Polarity::Bullish,
                                     Reliability::High, i, t));
        }

        if (!bullish && prev->is_bullish() && cur.open > prev->close &&
            cur.close < prev->open && body > prev_body) {
            out.push_back(make_match(PatternKind::BearishEngulfing, Polarity::Bearish,
                                     Reliability::High, i, t));
        }
    }

    if (prev != nullptr && prev2 != nullptr) {
        const double first_body = prev2->body();
        const double middle_body = prev->body();
        const double first_mid = (prev2->open + prev2->close) / 2.0;
        const bool star_shape = first_body > middle_body * t.star_first_body_ratio &&
                                body > middle_body * t.star_third_body_ratio;

        if (star_shape && !prev2->is_bullish() && bullish && cur.close > first_mid) {
            out.push_back(make_match(PatternKind::MorningStar, Polarity::Bullish,
                                     Reliability::High, i, t));
        }
        if (star_shape && prev2->is_bullish() && !bullish && cur.close < first_mid) {
            out.push_back(make_match(PatternKind::EveningStar, Polarity::Bearish,
                                     Reliability::High, i, t));
        }
    }

    // Marubozu: body is almost the whole range
    if (range > 0.0 && body > range * t.marubozu_body_ratio) {
        out.push_back(bullish ? make_match(PatternKind::BullishMarubozu, Polarity::Bullish,
                                           Reliability::Medium, i, t)
                              : make_match(PatternKind::BearishMarubozu, Polarity::Bearish,
                                           Reliability::Medium, i, t));
    }
}

}  // namespace

std::vector<PatternMatch> scan_candlestick_patterns(CandleSeries candles,
                                                    const CandlestickThresholds& thresholds) {
    std::vector<PatternMatch> matches;
    if (candles.size() < thresholds.min_candles) return matches;

    const size_t start =
        candles.size() > thresholds.lookback ? candles.size() - thresholds.lookback : 0;
    for (size_t i = start; i < candles.size(); ++i) {
        scan_index(candles, i, thresholds, matches);
    }
    return matches;
}

std::vector<PatternMatch> detect_candlestick_patterns(CandleSeries candles,
                                                      const CandlestickThresholds& thresholds) {
    const auto all = scan_candlestick_patterns(candles, thresholds);

    // Group newest index first, keep the in-index evaluation order
    std::vector<PatternMatch> ordered(all.begin(), all.end());
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const PatternMatch& a, const PatternMatch& b) {
                         return a.index.value_or(0) > b.index.value_or(0);
                     });

    std::vector<PatternMatch> unique;
    for (auto& match : ordered) {
        if (unique.size() >= thresholds.max_results) break;
        const bool seen = std::any_of(unique.begin(), unique.end(), [&](const PatternMatch& u) {
            return u.kind == match.kind;
        });
        if (!seen) {
            unique.push_back(std::move(match));
        }
    }
    return unique;
}

std::vector<std::string> candlestick_pattern_names(CandleSeries candles,
                                                   const CandlestickThresholds& thresholds) {
    std::vector<std::string> names;
    for (const auto& match : detect_candlestick_patterns(candles, thresholds)) {
        names.push_back(match.label());
    }
    return names;
}

}  // namespace confluence::patterns
