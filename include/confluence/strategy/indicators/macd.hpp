#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - MACD (Moving Average Convergence Divergence)
// ============================================================================
// Trend-following momentum indicator
// Standard settings: 12/26/9 EMAs
// ============================================================================

#include "ema.hpp"
#include "indicator_base.hpp"

namespace confluence::strategy {

/// MACD Indicator with configurable periods
template <size_t FastPeriod = 12, size_t SlowPeriod = 26, size_t SignalPeriod = 9>
class MACD : public IndicatorBase<MACD<FastPeriod, SlowPeriod, SignalPeriod>> {
public:
    static_assert(FastPeriod < SlowPeriod, "Fast period must be less than slow period");

    MACD() { reset_impl(); }

    void update_impl(double price) {
        fast_ema_.update(price);
        slow_ema_.update(price);
        ++count_;

        if (count_ >= SlowPeriod) {
            macd_line_ = fast_ema_.value() - slow_ema_.value();

            // Signal line is the EMA of the MACD line
            signal_ema_.update(macd_line_);
            histogram_ = macd_line_ - signal_ema_.value();
        }
    }

    /// MACD line (fast EMA - slow EMA)
    [[nodiscard]] double value_impl() const { return macd_line_; }

    /// Signal line (EMA of MACD)
    [[nodiscard]] double signal_line() const { return signal_ema_.value(); }

    /// Histogram (MACD - Signal)
    [[nodiscard]] double histogram() const { return histogram_; }

    /// MACD line exists (slow EMA seeded)
    [[nodiscard]] bool has_line() const { return count_ >= SlowPeriod; }

    [[nodiscard]] bool is_ready_impl() const {
        return count_ >= SlowPeriod + SignalPeriod - 1;
    }

    void reset_impl() {
        count_ = 0;
        macd_line_ = 0.0;
        histogram_ = 0.0;
        fast_ema_.reset();
        slow_ema_.reset();
        signal_ema_.reset();
    }

    [[nodiscard]] constexpr size_t period_impl() const { return SlowPeriod + SignalPeriod - 1; }

private:
    EMA<FastPeriod> fast_ema_;
    EMA<SlowPeriod> slow_ema_;
    EMA<SignalPeriod> signal_ema_;

    size_t count_;
    double macd_line_;
    double histogram_;
};

using MACD_12_26_9 = MACD<12, 26, 9>;

}  // namespace confluence::strategy
