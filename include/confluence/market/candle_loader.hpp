#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Candle Loader
// ============================================================================
// CSV ingestion and daily -> weekly/monthly resampling
// CSV layout: date,open,high,low,close,volume with ISO dates (YYYY-MM-DD)
// ============================================================================

#include "confluence/core/types.hpp"

#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace confluence::market {

/// Parse "YYYY-MM-DD"; nullopt on malformed or impossible dates
[[nodiscard]] std::optional<Date> parse_date(std::string_view text) noexcept;

/// Format as "YYYY-MM-DD"
[[nodiscard]] std::string format_date(Date date);

/// Parse CSV rows from a stream. An optional header row and blank lines are skipped.
/// Throws std::runtime_error("<source>:<line>: ...") on malformed rows.
[[nodiscard]] CandleVector parse_candles_csv(std::istream& in,
                                             std::string_view source = "<stream>");

/// Load and date-sort a CSV file; throws std::runtime_error when unreadable
[[nodiscard]] CandleVector load_candles_csv(const std::string& path);

/// Bucket daily candles by ISO week (Monday start) or calendar month.
/// Daily input is returned unchanged.
[[nodiscard]] CandleVector resample(CandleSeries daily, Timeframe timeframe);

}  // namespace confluence::market
