// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Command Line Analyzer
// ============================================================================
// Loads daily candles from CSV (weekly/monthly from CSV or resampled),
// takes news and fundamentals from flags and prints the analysis report
//
// Usage:
//   confluence_cli [config.yaml] --daily <csv> [--weekly <csv>] [--monthly <csv>]
//                  [--symbol NAME] [--pe X] [--pb X] [--revenue-growth X] [--roe X]
//                  [--sector outperforming|inline|underperforming]
//                  [--news-score N] [--news-sentiment positive|negative|neutral]
//                  [--news-impact high|medium|low] [--headlines N]
//                  [--log-level LEVEL]
// ============================================================================

#include "confluence/analysis/fundamentals.hpp"
#include "confluence/analysis/stock_analysis.hpp"
#include "confluence/analysis/summary.hpp"
#include "confluence/config/engine_config.hpp"
#include "confluence/market/candle_loader.hpp"
#include "confluence/utils/logger.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

using namespace confluence;

struct CliOptions {
    std::string config_path = "config/config.yaml";
    std::string daily_file;
    std::string weekly_file;
    std::string monthly_file;
    std::string symbol = "UNKNOWN";
    std::optional<std::string> log_level;

    analysis::NewsSummary news;
    analysis::FundamentalsSummary fundamentals;
};

void print_usage() {
    std::cout << "Usage: confluence_cli [config.yaml] --daily <csv> [--weekly <csv>] "
                 "[--monthly <csv>]\n"
                 "       [--symbol NAME] [--pe X] [--pb X] [--revenue-growth X] [--roe X]\n"
                 "       [--sector outperforming|inline|underperforming]\n"
                 "       [--news-score N] [--news-sentiment positive|negative|neutral]\n"
                 "       [--news-impact high|medium|low] [--headlines N] "
                 "[--log-level LEVEL]\n";
}

analysis::Sentiment parse_sentiment(const std::string& s) {
    if (s == "positive") return analysis::Sentiment::Positive;
    if (s == "negative") return analysis::Sentiment::Negative;
    if (s == "neutral") return analysis::Sentiment::Neutral;
    throw std::invalid_argument("unknown news sentiment: " + s);
}

analysis::NewsImpact parse_impact(const std::string& s) {
    if (s == "high") return analysis::NewsImpact::High;
    if (s == "medium") return analysis::NewsImpact::Medium;
    if (s == "low") return analysis::NewsImpact::Low;
    throw std::invalid_argument("unknown news impact: " + s);
}

analysis::SectorComparison parse_sector(const std::string& s) {
    if (s == "outperforming") return analysis::SectorComparison::Outperforming;
    if (s == "inline") return analysis::SectorComparison::Inline;
    if (s == "underperforming") return analysis::SectorComparison::Underperforming;
    throw std::invalid_argument("unknown sector comparison: " + s);
}

/// nullopt when --help was requested
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions options;
    int first = 1;
    if (argc > 1 && argv[1][0] != '-') {
        options.config_path = argv[1];
        first = 2;
    }

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--daily" && has_value) {
            options.daily_file = argv[++i];
        } else if (arg == "--weekly" && has_value) {
            options.weekly_file = argv[++i];
        } else if (arg == "--monthly" && has_value) {
            options.monthly_file = argv[++i];
        } else if (arg == "--symbol" && has_value) {
            options.symbol = argv[++i];
        } else if (arg == "--pe" && has_value) {
            options.fundamentals.pe_ratio = std::stod(argv[++i]);
        } else if (arg == "--pb" && has_value) {
            options.fundamentals.pb_ratio = std::stod(argv[++i]);
        } else if (arg == "--revenue-growth" && has_value) {
            options.fundamentals.revenue_growth = std::stod(argv[++i]);
        } else if (arg == "--roe" && has_value) {
            options.fundamentals.return_on_equity = std::stod(argv[++i]);
        } else if (arg == "--sector" && has_value) {
            options.fundamentals.sector = parse_sector(argv[++i]);
        } else if (arg == "--news-score" && has_value) {
            options.news.score = std::stoi(argv[++i]);
        } else if (arg == "--news-sentiment" && has_value) {
            options.news.sentiment = parse_sentiment(argv[++i]);
        } else if (arg == "--news-impact" && has_value) {
            options.news.impact = parse_impact(argv[++i]);
        } else if (arg == "--headlines" && has_value) {
            options.news.headline_count = std::stoi(argv[++i]);
        } else if (arg == "--log-level" && has_value) {
            options.log_level = argv[++i];
        } else {
            throw std::invalid_argument("unknown or incomplete argument: " + arg);
        }
    }

    if (options.daily_file.empty()) {
        throw std::invalid_argument("--daily <csv> is required");
    }
    return options;
}

CandleVector load_or_resample(const std::string& path, const CandleVector& daily,
                              Timeframe timeframe) {
    if (!path.empty()) return market::load_candles_csv(path);
    auto candles = market::resample(daily, timeframe);
    LOG_DEBUG("resampled {} daily candles into {} {} candles", daily.size(), candles.size(),
              to_string(timeframe));
    return candles;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        const auto options = parse_args(argc, argv);
        if (!options) {
            print_usage();
            return 0;
        }

        auto config = config::load_engine_config(options->config_path);
        if (options->log_level) {
            config.logging.level = utils::parse_log_level(*options->log_level);
        }
        utils::Logger::initialize(config.logging);
        LOG_INFO("config loaded from {}", options->config_path);

        const auto daily = market::load_candles_csv(options->daily_file);
        const auto weekly = load_or_resample(options->weekly_file, daily, Timeframe::Weekly);
        const auto monthly = load_or_resample(options->monthly_file, daily, Timeframe::Monthly);

        const analysis::TimeframeData data{daily, weekly, monthly};
        const auto fundamentals = analysis::classify_fundamentals(
            options->fundamentals, config.thresholds.fundamentals);

        const auto result =
            analysis::analyze_stock(options->symbol, data, options->news, fundamentals,
                                    config.thresholds, config.parallel_timeframes);

        std::cout << analysis::to_summary_text(result);
        utils::Logger::shutdown();
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        std::cerr << "[HINT] Run with --help for usage\n";
        return 1;
    }

    return 0;
}
