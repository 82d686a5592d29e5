#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Summary Renderer
// ============================================================================
// Deterministic plain-text rendering of analysis results, one bullet per line
// ============================================================================

#include "confluence/analysis/multi_timeframe.hpp"
#include "confluence/analysis/stock_analysis.hpp"
#include "confluence/patterns/pattern_types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace confluence::analysis {

/// "- <name>" per pattern, newline terminated
[[nodiscard]] std::string render_pattern_list(const std::vector<patterns::PatternKind>& kinds);

/// Inverse of render_pattern_list; lines that are not known bullets are skipped
[[nodiscard]] std::vector<patterns::PatternKind> parse_pattern_list(std::string_view text);

[[nodiscard]] std::string to_summary_text(const ComprehensiveTechnicalAnalysis& analysis);

/// Technical summary followed by confidence, conflict and risk sections
[[nodiscard]] std::string to_summary_text(const StockAnalysis& analysis);

}  // namespace confluence::analysis
