#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Stock Analysis
// ============================================================================
// End-to-end pipeline: timeframes -> bias -> confidence -> conflict -> risk
// ============================================================================

#include "confluence/analysis/confidence_scorer.hpp"
#include "confluence/analysis/conflict_detector.hpp"
#include "confluence/analysis/fundamentals.hpp"
#include "confluence/analysis/multi_timeframe.hpp"
#include "confluence/core/thresholds.hpp"
#include "confluence/risk/risk_metrics.hpp"

#include <string>

namespace confluence::analysis {

/// Final record handed to report and persistence collaborators
struct StockAnalysis {
    std::string symbol;
    ComprehensiveTechnicalAnalysis technical;
    NewsSummary news;
    FundamentalsSummary fundamentals;

    Bias bias = Bias::Neutral;
    ConfidenceResult confidence;
    ConflictResult conflict;
    int adjusted_confidence = 0;               // confidence + conflict adjustment, clamped
    Recommendation final_recommendation = Recommendation::Wait;
    risk::RiskMetrics risk;
};

[[nodiscard]] StockAnalysis analyze_stock(
    std::string symbol,
    const TimeframeData& data,
    const NewsSummary& news,
    const FundamentalsSummary& fundamentals,
    const AnalysisThresholds& thresholds = default_thresholds(),
    bool parallel_timeframes = false);

}  // namespace confluence::analysis
