// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Candle Loader Implementation
// ============================================================================

#include "confluence/market/candle_loader.hpp"

#include "confluence/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace confluence::market {

namespace {

constexpr size_t CSV_COLUMNS = 6;

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        fields.push_back(trim(line.substr(start, comma - start)));
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return fields;
}

template <typename T>
std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

[[noreturn]] void fail(std::string_view source, size_t line_no, const std::string& what) {
    throw std::runtime_error(std::string(source) + ":" + std::to_string(line_no) + ": " + what);
}

/// Monday of the ISO week containing date
Date week_start(Date date) noexcept {
    const std::chrono::weekday wd{date};
    return date - std::chrono::days{wd.iso_encoding() - 1};
}

std::chrono::year_month month_of(Date date) noexcept {
    const std::chrono::year_month_day ymd{date};
    return ymd.year() / ymd.month();
}

}  // namespace

std::optional<Date> parse_date(std::string_view text) noexcept {
    text = trim(text);
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;

    const auto y = parse_number<int>(text.substr(0, 4));
    const auto m = parse_number<unsigned>(text.substr(5, 2));
    const auto d = parse_number<unsigned>(text.substr(8, 2));
    if (!y || !m || !d) return std::nullopt;

    const std::chrono::year_month_day ymd{std::chrono::year{*y}, std::chrono::month{*m},
                                          std::chrono::day{*d}};
    if (!ymd.ok()) return std::nullopt;
    return Date{ymd};
}

std::string format_date(Date date) {
    const std::chrono::year_month_day ymd{date};
    std::ostringstream out;
    out << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2)
        << static_cast<unsigned>(ymd.day());
    return out.str();
}

CandleVector parse_candles_csv(std::istream& in, std::string_view source) {
    CandleVector candles;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        const auto text = trim(line);
        if (text.empty()) continue;

        const auto fields = split_fields(text);
        if (fields.size() != CSV_COLUMNS) {
            fail(source, line_no,
                 "expected " + std::to_string(CSV_COLUMNS) + " columns, got " +
                     std::to_string(fields.size()));
        }

        const auto date = parse_date(fields[0]);
        if (!date) {
            // Header row: first non-blank line whose date column is not a date
            if (candles.empty() && !fields[0].empty() &&
                std::isalpha(static_cast<unsigned char>(fields[0].front()))) {
                continue;
            }
            fail(source, line_no, "invalid date '" + std::string(fields[0]) + "'");
        }

        Candle c;
        c.date = *date;
        double* targets[] = {&c.open, &c.high, &c.low, &c.close, &c.volume};
        for (size_t i = 0; i < std::size(targets); ++i) {
            const auto value = parse_number<double>(fields[i + 1]);
            if (!value) {
                fail(source, line_no, "invalid number '" + std::string(fields[i + 1]) + "'");
            }
            *targets[i] = *value;
        }
        candles.push_back(c);
    }

    std::stable_sort(candles.begin(), candles.end(),
                     [](const Candle& a, const Candle& b) { return a.date < b.date; });
    return candles;
}

CandleVector load_candles_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open candle file: " + path);
    }
    auto candles = parse_candles_csv(file, path);
    LOG_INFO("loaded {} candles from {}", candles.size(), path);
    return candles;
}

CandleVector resample(CandleSeries daily, Timeframe timeframe) {
    if (timeframe == Timeframe::Daily) {
        return CandleVector(daily.begin(), daily.end());
    }

    const auto same_bucket = [timeframe](Date a, Date b) {
        if (timeframe == Timeframe::Weekly) return week_start(a) == week_start(b);
        return month_of(a) == month_of(b);
    };

    CandleVector out;
    for (const auto& c : daily) {
        if (out.empty() || !same_bucket(out.back().date, c.date)) {
            out.push_back(c);
            continue;
        }
        auto& bucket = out.back();
        bucket.high = std::max(bucket.high, c.high);
        bucket.low = std::min(bucket.low, c.low);
        bucket.close = c.close;
        bucket.volume += c.volume;
    }
    return out;
}

}  // namespace confluence::market
