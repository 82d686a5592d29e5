#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Core Types
// ============================================================================
// Fundamental type definitions shared by every analysis stage
// Candles are plain values, series are read-only spans over them
// ============================================================================

#include <chrono>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace confluence {

// ============================================================================
// Time Types
// ============================================================================

/// Calendar day of a candle (daily resolution is all the engine needs)
using Date = std::chrono::sys_days;

/// Build a Date from year/month/day
[[nodiscard]] constexpr Date make_date(int year, unsigned month, unsigned day) noexcept {
    return Date{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
}

// ============================================================================
// Market Data
// ============================================================================

/// One period of OHLCV data
struct Candle {
    Date date{};
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;

    [[nodiscard]] constexpr double body() const noexcept {
        return close > open ? close - open : open - close;
    }
    [[nodiscard]] constexpr double range() const noexcept { return high - low; }
    [[nodiscard]] constexpr double upper_wick() const noexcept {
        return high - (open > close ? open : close);
    }
    [[nodiscard]] constexpr double lower_wick() const noexcept {
        return (open < close ? open : close) - low;
    }
    [[nodiscard]] constexpr bool is_bullish() const noexcept { return close > open; }
    [[nodiscard]] constexpr double typical_price() const noexcept {
        return (high + low + close) / 3.0;
    }
};

/// Read-only view of a date-ascending candle sequence
using CandleSeries = std::span<const Candle>;

/// Owned candle sequence
using CandleVector = std::vector<Candle>;

/// Analysis timeframe
enum class Timeframe : uint8_t {
    Daily = 0,
    Weekly = 1,
    Monthly = 2
};

// ============================================================================
// Signal Types
// ============================================================================

/// Direction a pattern or indicator leans
enum class Polarity : uint8_t {
    Bullish = 0,
    Bearish = 1,
    Neutral = 2
};

/// Three-way reading shared by MA, MACD and similar trend signals
enum class SignalTrend : uint8_t {
    Bullish = 0,
    Bearish = 1,
    Neutral = 2
};

/// Net directional lean assigned to a stock
enum class Bias : uint8_t {
    Bullish = 0,
    Bearish = 1,
    Neutral = 2
};

/// Final trade recommendation
enum class Recommendation : uint8_t {
    Buy = 0,
    Sell = 1,
    Hold = 2,
    Wait = 3
};

// ============================================================================
// String Conversion
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(Timeframe tf) noexcept {
    switch (tf) {
        case Timeframe::Daily:   return "1D";
        case Timeframe::Weekly:  return "1W";
        case Timeframe::Monthly: return "1M";
    }
    return "?";
}

[[nodiscard]] constexpr std::string_view to_string(Polarity p) noexcept {
    switch (p) {
        case Polarity::Bullish: return "bullish";
        case Polarity::Bearish: return "bearish";
        case Polarity::Neutral: return "neutral";
    }
    return "?";
}

[[nodiscard]] constexpr std::string_view to_string(SignalTrend t) noexcept {
    switch (t) {
        case SignalTrend::Bullish: return "bullish";
        case SignalTrend::Bearish: return "bearish";
        case SignalTrend::Neutral: return "neutral";
    }
    return "?";
}

[[nodiscard]] constexpr std::string_view to_string(Bias b) noexcept {
    switch (b) {
        case Bias::Bullish: return "BULLISH";
        case Bias::Bearish: return "BEARISH";
        case Bias::Neutral: return "NEUTRAL";
    }
    return "?";
}

[[nodiscard]] constexpr std::string_view to_string(Recommendation r) noexcept {
    switch (r) {
        case Recommendation::Buy:  return "BUY";
        case Recommendation::Sell: return "SELL";
        case Recommendation::Hold: return "HOLD";
        case Recommendation::Wait: return "WAIT";
    }
    return "?";
}

// ============================================================================
// Series Helpers
// ============================================================================

/// Last n candles of a series (the whole series when shorter)
[[nodiscard]] inline CandleSeries tail(CandleSeries series, size_t n) noexcept {
    if (series.size() <= n) return series;
    return series.subspan(series.size() - n);
}

/// Closing prices of a series
[[nodiscard]] inline std::vector<double> closes_of(CandleSeries series) {
    std::vector<double> closes;
    closes.reserve(series.size());
    for (const auto& c : series) {
        closes.push_back(c.close);
    }
    return closes;
}

}  // namespace confluence
