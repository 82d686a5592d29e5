#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Conflict Detector
// ============================================================================
// Reconciles the technical bias with fundamental valuation and growth
// ============================================================================

#include "confluence/analysis/fundamentals.hpp"
#include "confluence/core/thresholds.hpp"
#include "confluence/core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace confluence::analysis {

enum class ConflictType : uint8_t {
    None,
    OvervaluedBullish,
    UndervaluedBearish,
    WeakGrowthBullish
};

/// "NONE", "OVERVALUED_BULLISH", ...
[[nodiscard]] std::string_view to_string(ConflictType type) noexcept;

struct ConflictResult {
    bool has_conflict = false;
    Bias technical_bias = Bias::Neutral;
    std::string fundamental_verdict;        // "<valuation> valuation with <growth> growth"
    ConflictType conflict_type = ConflictType::None;
    int confidence_adjustment = 0;          // -30..+30
    std::string recommendation;
    std::vector<std::string> details;
};

/// Rules run in order; within a bias branch the last matching rule sets the adjustment
[[nodiscard]] ConflictResult detect_conflict(
    Bias technical_bias,
    const FundamentalsSummary& fundamentals,
    const FundamentalThresholds& t = default_thresholds().fundamentals);

/// One-line verdict for reports
[[nodiscard]] std::string conflict_summary(const ConflictResult& conflict);

}  // namespace confluence::analysis
