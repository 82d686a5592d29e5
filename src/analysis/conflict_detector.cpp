// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Conflict Detector Implementation
// ============================================================================

#include "confluence/analysis/conflict_detector.hpp"

#include "confluence/utils/format.hpp"

#include <algorithm>

namespace confluence::analysis {

namespace {

constexpr int MAX_ADJUSTMENT = 30;

std::string_view recommendation_for(ConflictType type, Bias bias) noexcept {
    switch (type) {
        case ConflictType::OvervaluedBullish:
            return "Proceed with caution: technically strong but overvalued. "
                   "Consider a smaller position or wait for a pullback.";
        case ConflictType::UndervaluedBearish:
            return "Bearish setup but fundamentally attractive, support may appear soon. "
                   "Consider waiting for a reversal signal.";
        case ConflictType::WeakGrowthBullish:
            return "Technical strength not backed by fundamentals. Be ready to exit quickly.";
        case ConflictType::None:
            break;
    }
    if (bias == Bias::Neutral) {
        return "No strong technical or fundamental bias. SKIP";
    }
    return "Fundamental and technical analysis aligned. Higher confidence.";
}

}  // namespace

std::string_view to_string(ConflictType type) noexcept {
    switch (type) {
        case ConflictType::None:               return "NONE";
        case ConflictType::OvervaluedBullish:  return "OVERVALUED_BULLISH";
        case ConflictType::UndervaluedBearish: return "UNDERVALUED_BEARISH";
        case ConflictType::WeakGrowthBullish:  return "WEAK_GROWTH_BULLISH";
    }
    return "?";
}

ConflictResult detect_conflict(Bias technical_bias, const FundamentalsSummary& fundamentals,
                               const FundamentalThresholds& t) {
    ConflictResult result;
    result.technical_bias = technical_bias;

    const auto valuation = fundamentals.valuation;
    const auto growth = fundamentals.growth;
    const std::string growth_name{to_string(growth)};

    int adjustment = 0;
    auto type = ConflictType::None;

    if (technical_bias == Bias::Bullish) {
        if (valuation == Valuation::Overvalued && fundamentals.pe_ratio &&
            *fundamentals.pe_ratio > t.conflict_pe) {
            type = ConflictType::OvervaluedBullish;
            adjustment = t.overvalued_bullish_adjustment;
            result.details.push_back(
                "Technically bullish but fundamentally overvalued (P/E " +
                utils::fixed(*fundamentals.pe_ratio, 1) + ")");
        }

        if (growth == Growth::Weak) {
            type = ConflictType::WeakGrowthBullish;
            adjustment = std::min(adjustment, t.weak_growth_bullish_adjustment);
            result.details.push_back("Bullish technical setup but " + growth_name +
                                     " earnings growth");
        }

        // Overrides any penalty above; the conflict type stays as set
        if (valuation == Valuation::Undervalued) {
            adjustment = t.undervalued_bullish_adjustment;
            result.details.push_back("Strong fundamental support: undervalued with " +
                                     growth_name + " growth");
        }
    } else if (technical_bias == Bias::Bearish) {
        if (valuation == Valuation::Undervalued && growth == Growth::Strong) {
            type = ConflictType::UndervaluedBearish;
            adjustment = t.undervalued_bearish_adjustment;
            result.details.push_back(
                "Bearish technical but fundamentally undervalued, potential reversal");
        }

        if (valuation == Valuation::Overvalued) {
            adjustment = t.overvalued_bearish_adjustment;
            result.details.push_back("Fundamental weakness confirms bearish technical setup");
        }
    }

    result.conflict_type = type;
    result.has_conflict = type != ConflictType::None;
    result.confidence_adjustment = std::clamp(adjustment, -MAX_ADJUSTMENT, MAX_ADJUSTMENT);
    result.recommendation = std::string(recommendation_for(type, technical_bias));
    result.fundamental_verdict =
        std::string(to_string(valuation)) + " valuation with " + growth_name + " growth";
    return result;
}

std::string conflict_summary(const ConflictResult& conflict) {
    if (!conflict.has_conflict) {
        return "Fundamental-technical alignment: " + conflict.fundamental_verdict;
    }
    return "Conflict detected: " + std::string(to_string(conflict.technical_bias)) +
           " technical but " + conflict.fundamental_verdict;
}

}  // namespace confluence::analysis
