#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Fundamentals
// ============================================================================
// Externally supplied fundamental metrics and their coarse labels
// ============================================================================

#include "confluence/core/thresholds.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace confluence::analysis {

enum class Valuation : uint8_t { Undervalued, Fair, Overvalued, Unknown };
enum class Growth : uint8_t { Strong, Moderate, Weak, Unknown };
enum class SectorComparison : uint8_t { Outperforming, Inline, Underperforming, Unknown };

[[nodiscard]] std::string_view to_string(Valuation valuation) noexcept;
[[nodiscard]] std::string_view to_string(Growth growth) noexcept;
[[nodiscard]] std::string_view to_string(SectorComparison sector) noexcept;

struct FundamentalsSummary {
    Valuation valuation = Valuation::Unknown;
    Growth growth = Growth::Unknown;
    SectorComparison sector = SectorComparison::Unknown;

    std::optional<double> pe_ratio;
    std::optional<double> pb_ratio;
    std::optional<double> revenue_growth;   // Fraction, 0.12 = 12%
    std::optional<double> return_on_equity; // Fraction
    std::optional<double> market_cap;
    std::optional<double> dividend_yield;
    std::optional<double> eps;
};

[[nodiscard]] Valuation classify_valuation(
    std::optional<double> pe_ratio,
    const FundamentalThresholds& t = default_thresholds().fundamentals) noexcept;

[[nodiscard]] Growth classify_growth(
    std::optional<double> revenue_growth,
    const FundamentalThresholds& t = default_thresholds().fundamentals) noexcept;

/// Sector standing approximated from return on equity
[[nodiscard]] SectorComparison classify_sector(
    std::optional<double> return_on_equity,
    const FundamentalThresholds& t = default_thresholds().fundamentals) noexcept;

/// Fill valuation and growth labels from the raw metrics. The sector label
/// is derived only when return on equity is present.
[[nodiscard]] FundamentalsSummary classify_fundamentals(
    FundamentalsSummary summary,
    const FundamentalThresholds& t = default_thresholds().fundamentals) noexcept;

}  // namespace confluence::analysis
