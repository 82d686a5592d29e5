#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - ATR (Average True Range)
// ============================================================================
// Volatility indicator: mean of the last Period true ranges
// True range = max(high - low, |high - prev close|, |low - prev close|)
// ============================================================================

#include "indicator_base.hpp"

#include <algorithm>
#include <cmath>

namespace confluence::strategy {

template <size_t Period = 14>
class AverageTrueRange : public IndicatorBase<AverageTrueRange<Period>, Candle> {
public:
    AverageTrueRange() { reset_impl(); }

    void update_impl(const Candle& candle) {
        if (has_prev_) {
            const double tr = std::max({candle.high - candle.low,
                                        std::abs(candle.high - prev_close_),
                                        std::abs(candle.low - prev_close_)});
            window_.push(tr);
        }
        prev_close_ = candle.close;
        has_prev_ = true;
    }

    /// 0 until Period true ranges exist
    [[nodiscard]] double value_impl() const {
        return is_ready_impl() ? window_.mean() : 0.0;
    }

    [[nodiscard]] bool is_ready_impl() const { return window_.is_full(); }

    void reset_impl() {
        window_.reset();
        prev_close_ = 0.0;
        has_prev_ = false;
    }

    [[nodiscard]] constexpr size_t period_impl() const { return Period; }

private:
    RollingWindow<Period> window_;
    double prev_close_;
    bool has_prev_;
};

using ATR14 = AverageTrueRange<14>;

}  // namespace confluence::strategy
