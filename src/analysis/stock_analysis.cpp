// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Stock Analysis Implementation
// ============================================================================

#include "confluence/analysis/stock_analysis.hpp"

#include "confluence/utils/logger.hpp"

#include <algorithm>
#include <utility>

namespace confluence::analysis {

StockAnalysis analyze_stock(std::string symbol, const TimeframeData& data,
                            const NewsSummary& news, const FundamentalsSummary& fundamentals,
                            const AnalysisThresholds& thresholds, bool parallel_timeframes) {
    SCOPED_TIMER("analyze_stock");

    StockAnalysis result;
    result.symbol = std::move(symbol);
    result.news = news;
    result.fundamentals = fundamentals;
    result.technical = analyze_multi_timeframe(data, thresholds, parallel_timeframes);

    const auto& daily = result.technical.daily_detail;
    result.bias = derive_technical_bias(daily.indicators, daily.patterns, thresholds);

    ConfidenceInputs inputs;
    inputs.primary_pattern = daily.patterns.primary;
    inputs.news = news;
    inputs.alignment = result.technical.alignment;
    inputs.volume_ratio = daily.indicators.volume.ratio;
    inputs.fundamentals = fundamentals;
    inputs.bias = result.bias;
    result.confidence = score_confidence(inputs, thresholds.scoring);

    result.conflict = detect_conflict(result.bias, fundamentals, thresholds.fundamentals);
    result.adjusted_confidence =
        std::clamp(result.confidence.score + result.conflict.confidence_adjustment, 0, 100);
    result.final_recommendation =
        recommend(result.adjusted_confidence, result.bias, thresholds.scoring);

    result.risk = risk::compute_risk_metrics(data.daily, daily.indicators.atr,
                                             result.adjusted_confidence, thresholds.risk);

    if (result.conflict.has_conflict) {
        LOG_WARN("{}: {}", result.symbol, conflict_summary(result.conflict));
    }
    LOG_INFO("{}: bias={} confidence={} adjusted={} recommendation={}", result.symbol,
             to_string(result.bias), result.confidence.score, result.adjusted_confidence,
             to_string(result.final_recommendation));
    return result;
}

}  // namespace confluence::analysis
