// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Summary Renderer Implementation
// ============================================================================

#include "confluence/analysis/summary.hpp"

#include "confluence/utils/format.hpp"

#include <sstream>
#include <utility>

namespace confluence::analysis {

namespace {

using utils::fixed;

constexpr std::string_view BULLET = "- ";

void write_timeframe(std::ostringstream& out, std::string_view name,
                     const TimeframeResult& tf) {
    out << BULLET << name << ": " << patterns::to_string(tf.trend) << " (strength "
        << tf.strength << "), support " << fixed(tf.support) << ", resistance "
        << fixed(tf.resistance) << '\n';
}

void write_indicators(std::ostringstream& out, const strategy::IndicatorSet& ind) {
    const auto& ma = ind.moving_averages;
    const auto& macd = ind.macd;
    const auto& vol = ind.volume;

    out << "Daily indicators:\n";
    out << BULLET << "RSI(14): " << fixed(ind.rsi.value, 1) << " ("
        << strategy::to_string(ind.rsi.zone) << ")\n";
    out << BULLET << "SMA20/50/200: " << fixed(ma.sma20) << " / " << fixed(ma.sma50) << " / "
        << fixed(ma.sma200) << '\n';
    out << BULLET << "EMA9/21: " << fixed(ma.ema9) << " / " << fixed(ma.ema21) << " ("
        << to_string(ma.trend) << ")\n";
    out << BULLET << "MACD: " << fixed(macd.macd, 3) << ", signal " << fixed(macd.signal, 3)
        << ", histogram " << fixed(macd.histogram, 3) << " (" << to_string(macd.trend)
        << ", divergence " << strategy::to_string(macd.divergence) << ")\n";
    out << BULLET << "Volume: " << fixed(vol.ratio) << "x average ("
        << strategy::to_string(vol.trend) << ")\n";
    out << BULLET << "ATR(14): " << fixed(ind.atr) << '\n';
    out << BULLET << "VWAP: " << fixed(ind.vwap) << '\n';
}

void write_bands(std::ostringstream& out, const strategy::BollingerResult& bb) {
    out << "Bollinger bands:\n";
    out << BULLET << "Upper " << fixed(bb.upper) << ", middle " << fixed(bb.middle)
        << ", lower " << fixed(bb.lower) << '\n';
    out << BULLET << "Position " << strategy::to_string(bb.position) << ", %B "
        << fixed(bb.percent_b) << ", bandwidth " << fixed(bb.bandwidth) << "%\n";
}

void write_fibonacci(std::ostringstream& out, const strategy::FibonacciResult& fib) {
    out << "Fibonacci (" << (fib.uptrend ? "uptrend" : "downtrend") << ", high "
        << fixed(fib.high) << ", low " << fixed(fib.low) << "):\n";
    for (const auto& level : fib.levels) {
        out << BULLET << strategy::fibonacci_label(level.ratio) << ": " << fixed(level.price)
            << '\n';
    }
}

}  // namespace

std::string render_pattern_list(const std::vector<patterns::PatternKind>& kinds) {
    std::string out;
    for (auto kind : kinds) {
        out += BULLET;
        out += patterns::to_string(kind);
        out += '\n';
    }
    return out;
}

std::vector<patterns::PatternKind> parse_pattern_list(std::string_view text) {
    std::vector<patterns::PatternKind> kinds;
    while (!text.empty()) {
        const auto end = text.find('\n');
        auto line = text.substr(0, end);
        text = end == std::string_view::npos ? std::string_view{} : text.substr(end + 1);

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (line.substr(0, BULLET.size()) != BULLET) continue;
        if (auto kind = patterns::parse_pattern_kind(line.substr(BULLET.size()))) {
            kinds.push_back(*kind);
        }
    }
    return kinds;
}

std::string to_summary_text(const ComprehensiveTechnicalAnalysis& analysis) {
    std::ostringstream out;

    out << "Multi-timeframe trend:\n";
    write_timeframe(out, "Daily", analysis.daily);
    write_timeframe(out, "Weekly", analysis.weekly);
    write_timeframe(out, "Monthly", analysis.monthly);
    out << BULLET << "Alignment: " << to_string(analysis.alignment.label) << " ("
        << analysis.alignment.score << ")\n";

    const std::pair<std::string_view, const TimeframeResult*> frames[] = {
        {to_string(Timeframe::Daily), &analysis.daily},
        {to_string(Timeframe::Weekly), &analysis.weekly},
        {to_string(Timeframe::Monthly), &analysis.monthly},
    };
    for (const auto& [label, tf] : frames) {
        if (tf->patterns.empty()) continue;
        out << "Patterns (" << label << "):\n" << render_pattern_list(tf->patterns);
    }

    write_indicators(out, analysis.daily_detail.indicators);
    write_bands(out, analysis.bollinger);
    write_fibonacci(out, analysis.fibonacci);

    out << "Candlestick patterns:\n";
    if (analysis.candlestick_patterns.empty()) {
        out << BULLET << "none\n";
    }
    for (const auto& match : analysis.candlestick_patterns) {
        out << BULLET << match.label() << '\n';
    }

    const auto& sr = analysis.daily_detail.indicators.support_resistance;
    out << "Key levels (daily):\n";
    out << BULLET << "Pivot " << fixed(sr.pivot) << '\n';
    out << BULLET << "R1 " << fixed(sr.r1) << ", R2 " << fixed(sr.r2) << '\n';
    out << BULLET << "S1 " << fixed(sr.s1) << ", S2 " << fixed(sr.s2) << '\n';
    out << BULLET << "Swing high " << fixed(sr.swing_high) << ", swing low "
        << fixed(sr.swing_low) << '\n';

    return out.str();
}

std::string to_summary_text(const StockAnalysis& analysis) {
    std::ostringstream out;
    out << "Symbol: " << analysis.symbol << '\n';
    out << to_summary_text(analysis.technical);

    const auto& c = analysis.confidence;
    const auto& b = c.breakdown;
    out << "Confidence: " << c.score << " (" << to_string(c.recommendation) << ", bias "
        << to_string(analysis.bias) << ")\n";
    out << BULLET << "Pattern strength: " << b.pattern_strength << '\n';
    out << BULLET << "News sentiment: " << b.news_sentiment << '\n';
    out << BULLET << "Technical alignment: " << b.technical_alignment << '\n';
    out << BULLET << "Volume confirmation: " << b.volume_confirmation << '\n';
    out << BULLET << "Fundamental strength: " << b.fundamental_strength << '\n';

    out << "Factors:\n";
    for (const auto& factor : c.factors) {
        out << BULLET << factor << '\n';
    }

    const auto& conflict = analysis.conflict;
    out << "Fundamentals vs technicals:\n";
    out << BULLET << conflict_summary(conflict) << '\n';
    out << BULLET << "Type " << to_string(conflict.conflict_type) << ", adjustment "
        << conflict.confidence_adjustment << '\n';
    for (const auto& detail : conflict.details) {
        out << BULLET << detail << '\n';
    }
    out << BULLET << conflict.recommendation << '\n';

    const auto& r = analysis.risk;
    out << "Risk:\n";
    out << BULLET << "Expected return " << fixed(r.expected_return) << "%, win rate "
        << fixed(r.win_rate, 1) << "%\n";
    out << BULLET << "Risk/reward " << fixed(r.risk_reward_ratio) << ", Sharpe "
        << fixed(r.sharpe_ratio) << '\n';
    out << BULLET << "Volatility " << fixed(r.volatility) << "%, max drawdown "
        << fixed(r.max_drawdown) << "%\n";

    out << "Final: " << to_string(analysis.final_recommendation) << " at "
        << analysis.adjusted_confidence << "% confidence\n";
    return out.str();
}

}  // namespace confluence::analysis
