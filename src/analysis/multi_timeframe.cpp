// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Multi-Timeframe Aggregator Implementation
// ============================================================================

#include "confluence/analysis/multi_timeframe.hpp"

#include "confluence/patterns/candlestick.hpp"
#include "confluence/patterns/pattern_detector.hpp"
#include "confluence/utils/logger.hpp"

#include <algorithm>
#include <functional>
#include <future>

namespace confluence::analysis {

namespace {

constexpr size_t MAX_TIMEFRAME_PATTERNS = 5;
constexpr size_t MAX_SECONDARY_PATTERNS = 4;

struct TimeframeOutcome {
    TimeframeResult result;
    std::optional<TimeframeAnalysis> detail;
};

TimeframeOutcome analyze_timeframe(Timeframe timeframe, CandleSeries candles,
                                   const AnalysisThresholds& thresholds) {
    TimeframeOutcome outcome;
    if (candles.size() < thresholds.indicators.min_candles) {
        LOG_DEBUG("[{}] {} candles, timeframe skipped", to_string(timeframe), candles.size());
        return outcome;
    }

    TimeframeAnalysis detail;
    detail.indicators = strategy::compute_indicators(candles, thresholds.indicators);
    detail.patterns = patterns::detect_patterns(candles, thresholds);

    outcome.result = summarize_timeframe(detail);

    const auto& ind = detail.indicators;
    LOG_DEBUG("[{}] close={:.2f} rsi={:.1f} ({}) ma={} macd={} trend={} strength={}",
              to_string(timeframe), candles.back().close, ind.rsi.value,
              strategy::to_string(ind.rsi.zone), to_string(ind.moving_averages.trend),
              to_string(ind.macd.trend), patterns::to_string(outcome.result.trend),
              outcome.result.strength);

    outcome.detail = std::move(detail);
    return outcome;
}

}  // namespace

std::string_view to_string(AlignmentLabel label) noexcept {
    switch (label) {
        case AlignmentLabel::Bullish: return "bullish";
        case AlignmentLabel::Bearish: return "bearish";
        case AlignmentLabel::Neutral: return "neutral";
        case AlignmentLabel::Mixed:   return "mixed";
    }
    return "?";
}

AlignmentResult compute_alignment(patterns::TrendDirection daily,
                                  patterns::TrendDirection weekly,
                                  patterns::TrendDirection monthly,
                                  const ScoringThresholds& t) {
    int bullish = 0;
    int bearish = 0;
    for (auto direction : {daily, weekly, monthly}) {
        if (direction == patterns::TrendDirection::Uptrend) ++bullish;
        if (direction == patterns::TrendDirection::Downtrend) ++bearish;
    }

    if (bullish == 3) return {AlignmentLabel::Bullish, 100};
    if (bearish == 3) return {AlignmentLabel::Bearish, 100};
    if (bullish == 0 && bearish == 0) return {AlignmentLabel::Neutral, 50};
    return {AlignmentLabel::Mixed, 50 + t.alignment_mixed_step * (bullish - bearish)};
}

TimeframeResult summarize_timeframe(const TimeframeAnalysis& analysis) {
    TimeframeResult result;
    const auto& pa = analysis.patterns;

    if (pa.primary) {
        result.patterns.push_back(pa.primary->kind);
    }
    const size_t secondary_count = std::min(pa.secondary.size(), MAX_SECONDARY_PATTERNS);
    for (size_t i = 0; i < secondary_count; ++i) {
        result.patterns.push_back(pa.secondary[i].kind);
    }

    if (result.patterns.size() < MAX_TIMEFRAME_PATTERNS) {
        switch (analysis.indicators.moving_averages.trend) {
            case SignalTrend::Bullish:
                result.patterns.push_back(patterns::PatternKind::AboveMAs);
                break;
            case SignalTrend::Bearish:
                result.patterns.push_back(patterns::PatternKind::BelowMAs);
                break;
            case SignalTrend::Neutral:
                break;
        }
    }

    result.trend = pa.trend.direction;
    result.strength = pa.trend.strength;
    result.support = analysis.indicators.support_resistance.support;
    result.resistance = analysis.indicators.support_resistance.resistance;
    return result;
}

ComprehensiveTechnicalAnalysis analyze_multi_timeframe(const TimeframeData& data,
                                                       const AnalysisThresholds& thresholds,
                                                       bool parallel) {
    TimeframeOutcome daily;
    TimeframeOutcome weekly;
    TimeframeOutcome monthly;

    if (parallel) {
        auto weekly_task = std::async(std::launch::async, analyze_timeframe, Timeframe::Weekly,
                                      data.weekly, std::cref(thresholds));
        auto monthly_task = std::async(std::launch::async, analyze_timeframe,
                                       Timeframe::Monthly, data.monthly, std::cref(thresholds));
        daily = analyze_timeframe(Timeframe::Daily, data.daily, thresholds);
        weekly = weekly_task.get();
        monthly = monthly_task.get();
    } else {
        daily = analyze_timeframe(Timeframe::Daily, data.daily, thresholds);
        weekly = analyze_timeframe(Timeframe::Weekly, data.weekly, thresholds);
        monthly = analyze_timeframe(Timeframe::Monthly, data.monthly, thresholds);
    }

    ComprehensiveTechnicalAnalysis analysis;
    analysis.daily = std::move(daily.result);
    analysis.weekly = std::move(weekly.result);
    analysis.monthly = std::move(monthly.result);
    analysis.alignment = compute_alignment(analysis.daily.trend, analysis.weekly.trend,
                                           analysis.monthly.trend, thresholds.scoring);

    // Daily detail is always present, degenerate when the series is short
    if (daily.detail) {
        analysis.daily_detail = std::move(*daily.detail);
    } else {
        analysis.daily_detail.indicators =
            strategy::compute_indicators(data.daily, thresholds.indicators);
        analysis.daily_detail.patterns = patterns::detect_patterns(data.daily, thresholds);
    }
    analysis.weekly_detail = std::move(weekly.detail);
    analysis.monthly_detail = std::move(monthly.detail);

    analysis.candlestick_patterns =
        patterns::detect_candlestick_patterns(data.daily, thresholds.candlestick);
    analysis.bollinger = analysis.daily_detail.indicators.bollinger;
    analysis.fibonacci = analysis.daily_detail.indicators.fibonacci;

    LOG_DEBUG("alignment {} ({})", to_string(analysis.alignment.label), analysis.alignment.score);
    return analysis;
}

}  // namespace confluence::analysis
