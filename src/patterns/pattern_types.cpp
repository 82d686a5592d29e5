// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Pattern Types Implementation
// ============================================================================

#include "confluence/patterns/pattern_types.hpp"

#include <array>
#include <utility>

namespace confluence::patterns {

namespace {

constexpr std::array<std::pair<PatternKind, std::string_view>, 18> PATTERN_NAMES = {{
    {PatternKind::Doji, "Doji"},
    {PatternKind::Hammer, "Hammer"},
    {PatternKind::InvertedHammer, "Inverted Hammer"},
    {PatternKind::ShootingStar, "Shooting Star"},
    {PatternKind::BullishEngulfing, "Bullish Engulfing"},
    {PatternKind::BearishEngulfing, "Bearish Engulfing"},
    {PatternKind::MorningStar, "Morning Star"},
    {PatternKind::EveningStar, "Evening Star"},
    {PatternKind::BullishMarubozu, "Bullish Marubozu"},
    {PatternKind::BearishMarubozu, "Bearish Marubozu"},
    {PatternKind::BullishFlag, "bullish_flag"},
    {PatternKind::BearishFlag, "bearish_flag"},
    {PatternKind::AscendingTriangle, "ascending_triangle"},
    {PatternKind::DescendingTriangle, "descending_triangle"},
    {PatternKind::SupportBounce, "support_bounce"},
    {PatternKind::ResistanceRejection, "resistance_rejection"},
    {PatternKind::AboveMAs, "Above MAs"},
    {PatternKind::BelowMAs, "Below MAs"},
}};

}  // namespace

std::string_view to_string(PatternKind kind) noexcept {
    for (const auto& [k, name] : PATTERN_NAMES) {
        if (k == kind) return name;
    }
    return "?";
}

std::optional<PatternKind> parse_pattern_kind(std::string_view name) noexcept {
    for (const auto& [k, n] : PATTERN_NAMES) {
        if (n == name) return k;
    }
    return std::nullopt;
}

bool is_candlestick(PatternKind kind) noexcept {
    return kind <= PatternKind::BearishMarubozu;
}

std::string PatternMatch::label() const {
    std::string out{to_string(kind)};
    out += " (";
    out += confluence::to_string(polarity);
    out += ')';
    return out;
}

std::string_view to_string(TrendDirection direction) noexcept {
    switch (direction) {
        case TrendDirection::Uptrend:   return "uptrend";
        case TrendDirection::Downtrend: return "downtrend";
        case TrendDirection::Sideways:  return "sideways";
    }
    return "?";
}

}  // namespace confluence::patterns
