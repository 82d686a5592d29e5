#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Pattern Types
// ============================================================================
// Typed pattern kinds shared by the detectors, aggregator and renderer
// Strings only appear at the formatting boundary
// ============================================================================

#include "confluence/core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace confluence::patterns {

// ============================================================================
// Pattern Kinds
// ============================================================================

enum class PatternKind : uint8_t {
    // Candlestick
    Doji,
    Hammer,
    InvertedHammer,
    ShootingStar,
    BullishEngulfing,
    BearishEngulfing,
    MorningStar,
    EveningStar,
    BullishMarubozu,
    BearishMarubozu,

    // Chart
    BullishFlag,
    BearishFlag,
    AscendingTriangle,
    DescendingTriangle,
    SupportBounce,
    ResistanceRejection,

    // Moving-average tags added by the aggregator
    AboveMAs,
    BelowMAs
};

/// Display name ("Bullish Engulfing", "bullish_flag", "Above MAs")
[[nodiscard]] std::string_view to_string(PatternKind kind) noexcept;

/// Inverse of to_string
[[nodiscard]] std::optional<PatternKind> parse_pattern_kind(std::string_view name) noexcept;

[[nodiscard]] bool is_candlestick(PatternKind kind) noexcept;

// ============================================================================
// Detection Results
// ============================================================================

struct PatternMatch {
    PatternKind kind = PatternKind::Doji;
    Polarity polarity = Polarity::Neutral;
    int confidence = 0;                     // 0-100
    std::string description;
    std::optional<double> target_price;
    std::optional<double> stop_loss;
    std::optional<size_t> index;            // Position in the analysed series

    /// "<name> (<polarity>)"
    [[nodiscard]] std::string label() const;
};

enum class TrendDirection : uint8_t {
    Uptrend,
    Downtrend,
    Sideways
};

[[nodiscard]] std::string_view to_string(TrendDirection direction) noexcept;

struct TrendResult {
    TrendDirection direction = TrendDirection::Sideways;
    int strength = 0;                       // 0-100
    bool consolidating = false;
};

struct PatternAnalysis {
    std::optional<PatternMatch> primary;
    std::vector<PatternMatch> secondary;
    TrendResult trend;
    bool at_breakout = false;
    bool at_breakdown = false;
};

}  // namespace confluence::patterns
