// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Engine Configuration Implementation
// ============================================================================

#include "confluence/config/engine_config.hpp"

#include <yaml-cpp/yaml.h>

namespace confluence::config {

namespace {

void apply_logging(const YAML::Node& node, utils::LogConfig& log) {
    if (!node) return;
    if (node["level"]) {
        log.level = utils::parse_log_level(node["level"].as<std::string>());
    }
    log.log_file = node["file"].as<std::string>(log.log_file);
    log.pattern = node["pattern"].as<std::string>(log.pattern);
    log.async = node["async"].as<bool>(log.async);
    log.queue_size = node["queue_size"].as<size_t>(log.queue_size);
}

void apply_indicators(const YAML::Node& node, IndicatorThresholds& t) {
    if (!node) return;
    t.min_candles = node["min_candles"].as<size_t>(t.min_candles);
    t.rsi_oversold = node["rsi_oversold"].as<double>(t.rsi_oversold);
    t.rsi_overbought = node["rsi_overbought"].as<double>(t.rsi_overbought);
    t.volume_lookback = node["volume_lookback"].as<size_t>(t.volume_lookback);
    t.volume_high_ratio = node["volume_high_ratio"].as<double>(t.volume_high_ratio);
    t.volume_low_ratio = node["volume_low_ratio"].as<double>(t.volume_low_ratio);
    t.swing_lookback = node["swing_lookback"].as<size_t>(t.swing_lookback);
    t.macd_divergence_lookback =
        node["macd_divergence_lookback"].as<size_t>(t.macd_divergence_lookback);
    t.macd_divergence_ratio = node["macd_divergence_ratio"].as<double>(t.macd_divergence_ratio);
    t.fibonacci_min_candles = node["fibonacci_min_candles"].as<size_t>(t.fibonacci_min_candles);
    t.vwap_period = node["vwap_period"].as<size_t>(t.vwap_period);
}

void apply_candlestick(const YAML::Node& node, CandlestickThresholds& t) {
    if (!node) return;
    t.lookback = node["lookback"].as<size_t>(t.lookback);
    t.min_candles = node["min_candles"].as<size_t>(t.min_candles);
    t.max_results = node["max_results"].as<size_t>(t.max_results);
    t.doji_body_ratio = node["doji_body_ratio"].as<double>(t.doji_body_ratio);
    t.hammer_wick_ratio = node["hammer_wick_ratio"].as<double>(t.hammer_wick_ratio);
    t.hammer_opposite_ratio = node["hammer_opposite_ratio"].as<double>(t.hammer_opposite_ratio);
    t.star_first_body_ratio = node["star_first_body_ratio"].as<double>(t.star_first_body_ratio);
    t.star_third_body_ratio = node["star_third_body_ratio"].as<double>(t.star_third_body_ratio);
    t.marubozu_body_ratio = node["marubozu_body_ratio"].as<double>(t.marubozu_body_ratio);
    t.high_reliability_confidence =
        node["high_reliability_confidence"].as<int>(t.high_reliability_confidence);
    t.medium_reliability_confidence =
        node["medium_reliability_confidence"].as<int>(t.medium_reliability_confidence);
}

void apply_chart(const YAML::Node& node, ChartPatternThresholds& t) {
    if (!node) return;
    t.window = node["window"].as<size_t>(t.window);
    t.pole_length = node["pole_length"].as<size_t>(t.pole_length);
    t.pole_min_move_pct = node["pole_min_move_pct"].as<double>(t.pole_min_move_pct);
    t.bull_flag_min_pct = node["bull_flag_min_pct"].as<double>(t.bull_flag_min_pct);
    t.bull_flag_max_pct = node["bull_flag_max_pct"].as<double>(t.bull_flag_max_pct);
    t.bear_flag_min_pct = node["bear_flag_min_pct"].as<double>(t.bear_flag_min_pct);
    t.bear_flag_max_pct = node["bear_flag_max_pct"].as<double>(t.bear_flag_max_pct);
    t.flag_base_confidence = node["flag_base_confidence"].as<double>(t.flag_base_confidence);
    t.flag_pole_multiplier = node["flag_pole_multiplier"].as<double>(t.flag_pole_multiplier);
    t.flag_max_confidence = node["flag_max_confidence"].as<double>(t.flag_max_confidence);
    t.triangle_touch_pct = node["triangle_touch_pct"].as<double>(t.triangle_touch_pct);
    t.triangle_min_touches = node["triangle_min_touches"].as<size_t>(t.triangle_min_touches);
    t.triangle_slope_pct = node["triangle_slope_pct"].as<double>(t.triangle_slope_pct);
    t.triangle_confidence = node["triangle_confidence"].as<int>(t.triangle_confidence);
    t.bounce_min_candles = node["bounce_min_candles"].as<size_t>(t.bounce_min_candles);
    t.bounce_lookback = node["bounce_lookback"].as<size_t>(t.bounce_lookback);
    t.bounce_proximity_pct = node["bounce_proximity_pct"].as<double>(t.bounce_proximity_pct);
    t.bounce_confidence = node["bounce_confidence"].as<int>(t.bounce_confidence);
}

void apply_trend(const YAML::Node& node, TrendThresholds& t) {
    if (!node) return;
    t.lookback = node["lookback"].as<size_t>(t.lookback);
    t.min_candles = node["min_candles"].as<size_t>(t.min_candles);
    t.slope_threshold_pct = node["slope_threshold_pct"].as<double>(t.slope_threshold_pct);
    t.strength_multiplier = node["strength_multiplier"].as<double>(t.strength_multiplier);
    t.consolidation_band_pct =
        node["consolidation_band_pct"].as<double>(t.consolidation_band_pct);
    t.breakout_lookback = node["breakout_lookback"].as<size_t>(t.breakout_lookback);
    t.breakout_ratio = node["breakout_ratio"].as<double>(t.breakout_ratio);
    t.breakdown_ratio = node["breakdown_ratio"].as<double>(t.breakdown_ratio);
}

void apply_scoring(const YAML::Node& node, ScoringThresholds& t) {
    if (!node) return;
    t.default_pattern_score = node["default_pattern_score"].as<int>(t.default_pattern_score);
    t.alignment_mixed_step = node["alignment_mixed_step"].as<int>(t.alignment_mixed_step);
    t.actionable_score = node["actionable_score"].as<int>(t.actionable_score);
    t.hold_score = node["hold_score"].as<int>(t.hold_score);
    t.bias_rsi_low = node["bias_rsi_low"].as<double>(t.bias_rsi_low);
    t.bias_min_signals = node["bias_min_signals"].as<int>(t.bias_min_signals);
}

void apply_weights(const YAML::Node& node, ConfidenceWeights& w) {
    if (!node) return;
    w.pattern = node["pattern"].as<double>(w.pattern);
    w.news = node["news"].as<double>(w.news);
    w.technical = node["technical"].as<double>(w.technical);
    w.volume = node["volume"].as<double>(w.volume);
    w.fundamental = node["fundamental"].as<double>(w.fundamental);
}

void apply_fundamentals(const YAML::Node& node, FundamentalThresholds& t) {
    if (!node) return;
    t.undervalued_pe = node["undervalued_pe"].as<double>(t.undervalued_pe);
    t.overvalued_pe = node["overvalued_pe"].as<double>(t.overvalued_pe);
    t.strong_growth = node["strong_growth"].as<double>(t.strong_growth);
    t.moderate_growth = node["moderate_growth"].as<double>(t.moderate_growth);
    t.outperforming_roe = node["outperforming_roe"].as<double>(t.outperforming_roe);
    t.inline_roe = node["inline_roe"].as<double>(t.inline_roe);
    t.conflict_pe = node["conflict_pe"].as<double>(t.conflict_pe);
    t.overvalued_bullish_adjustment =
        node["overvalued_bullish_adjustment"].as<int>(t.overvalued_bullish_adjustment);
    t.weak_growth_bullish_adjustment =
        node["weak_growth_bullish_adjustment"].as<int>(t.weak_growth_bullish_adjustment);
    t.undervalued_bullish_adjustment =
        node["undervalued_bullish_adjustment"].as<int>(t.undervalued_bullish_adjustment);
    t.undervalued_bearish_adjustment =
        node["undervalued_bearish_adjustment"].as<int>(t.undervalued_bearish_adjustment);
    t.overvalued_bearish_adjustment =
        node["overvalued_bearish_adjustment"].as<int>(t.overvalued_bearish_adjustment);
}

void apply_risk(const YAML::Node& node, RiskThresholds& t) {
    if (!node) return;
    t.min_candles = node["min_candles"].as<size_t>(t.min_candles);
    t.trading_days = node["trading_days"].as<double>(t.trading_days);
    t.risk_free_rate = node["risk_free_rate"].as<double>(t.risk_free_rate);
    t.target_atr_multiple = node["target_atr_multiple"].as<double>(t.target_atr_multiple);
    t.stop_atr_multiple = node["stop_atr_multiple"].as<double>(t.stop_atr_multiple);
    t.min_win_rate = node["min_win_rate"].as<double>(t.min_win_rate);
    t.max_win_rate = node["max_win_rate"].as<double>(t.max_win_rate);
}

}  // namespace

void apply_yaml(const YAML::Node& root, EngineConfig& config) {
    apply_logging(root["logging"], config.logging);

    if (const auto engine = root["engine"]) {
        config.parallel_timeframes =
            engine["parallel_timeframes"].as<bool>(config.parallel_timeframes);
    }

    auto& t = config.thresholds;
    if (const auto thresholds = root["thresholds"]) {
        apply_indicators(thresholds["indicators"], t.indicators);
        apply_candlestick(thresholds["candlestick"], t.candlestick);
        apply_chart(thresholds["chart"], t.chart);
        apply_trend(thresholds["trend"], t.trend);
        apply_scoring(thresholds["scoring"], t.scoring);
        apply_fundamentals(thresholds["fundamentals"], t.fundamentals);
    }
    apply_weights(root["weights"], t.scoring.weights);
    apply_risk(root["risk"], t.risk);
}

EngineConfig parse_engine_config(const std::string& yaml_text) {
    EngineConfig config;
    apply_yaml(YAML::Load(yaml_text), config);
    config.thresholds.validate();
    return config;
}

EngineConfig load_engine_config(const std::string& path) {
    EngineConfig config;

    try {
        apply_yaml(YAML::LoadFile(path), config);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config load failed ({}): {}, using defaults", path, e.what());
        config = EngineConfig{};
    }

    config.thresholds.validate();
    return config;
}

}  // namespace confluence::config
