// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Fundamentals Implementation
// ============================================================================

#include "confluence/analysis/fundamentals.hpp"

namespace confluence::analysis {

std::string_view to_string(Valuation valuation) noexcept {
    switch (valuation) {
        case Valuation::Undervalued: return "undervalued";
        case Valuation::Fair:        return "fair";
        case Valuation::Overvalued:  return "overvalued";
        case Valuation::Unknown:     return "unknown";
    }
    return "?";
}

std::string_view to_string(Growth growth) noexcept {
    switch (growth) {
        case Growth::Strong:   return "strong";
        case Growth::Moderate: return "moderate";
        case Growth::Weak:     return "weak";
        case Growth::Unknown:  return "unknown";
    }
    return "?";
}

std::string_view to_string(SectorComparison sector) noexcept {
    switch (sector) {
        case SectorComparison::Outperforming:   return "outperforming";
        case SectorComparison::Inline:          return "inline";
        case SectorComparison::Underperforming: return "underperforming";
        case SectorComparison::Unknown:         return "unknown";
    }
    return "?";
}

Valuation classify_valuation(std::optional<double> pe_ratio,
                             const FundamentalThresholds& t) noexcept {
    if (!pe_ratio) return Valuation::Unknown;
    if (*pe_ratio < t.undervalued_pe) return Valuation::Undervalued;
    if (*pe_ratio > t.overvalued_pe) return Valuation::Overvalued;
    return Valuation::Fair;
}

Growth classify_growth(std::optional<double> revenue_growth,
                       const FundamentalThresholds& t) noexcept {
    if (!revenue_growth) return Growth::Unknown;
    if (*revenue_growth > t.strong_growth) return Growth::Strong;
    if (*revenue_growth > t.moderate_growth) return Growth::Moderate;
    return Growth::Weak;
}

SectorComparison classify_sector(std::optional<double> return_on_equity,
                                 const FundamentalThresholds& t) noexcept {
    if (!return_on_equity) return SectorComparison::Unknown;
    if (*return_on_equity > t.outperforming_roe) return SectorComparison::Outperforming;
    if (*return_on_equity > t.inline_roe) return SectorComparison::Inline;
    return SectorComparison::Underperforming;
}

FundamentalsSummary classify_fundamentals(FundamentalsSummary summary,
                                          const FundamentalThresholds& t) noexcept {
    summary.valuation = classify_valuation(summary.pe_ratio, t);
    summary.growth = classify_growth(summary.revenue_growth, t);
    if (summary.return_on_equity) {
        summary.sector = classify_sector(summary.return_on_equity, t);
    }
    return summary;
}

}  // namespace confluence::analysis
