#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - RSI (Relative Strength Index)
// ============================================================================
// Momentum oscillator measuring speed and magnitude of price changes
// Range: 0-100, reads 50 until Period deltas have been seen
// ============================================================================

#include "indicator_base.hpp"

#include <algorithm>

namespace confluence::strategy {

/// RSI Indicator with Wilder's smoothing
template <size_t Period = 14>
class RSI : public IndicatorBase<RSI<Period>> {
public:
    static constexpr double NEUTRAL = 50.0;

    RSI() { reset_impl(); }

    void update_impl(double price) {
        if (count_ == 0) {
            prev_price_ = price;
            ++count_;
            return;
        }

        const double change = price - prev_price_;
        prev_price_ = price;
        ++count_;

        const double gain = std::max(change, 0.0);
        const double loss = std::max(-change, 0.0);

        // count_ - 1 deltas have been seen at this point
        if (count_ - 1 <= Period) {
            gain_sum_ += gain;
            loss_sum_ += loss;

            if (count_ - 1 == Period) {
                avg_gain_ = gain_sum_ / Period;
                avg_loss_ = loss_sum_ / Period;
            }
        } else {
            // Wilder's smoothing
            avg_gain_ = (avg_gain_ * (Period - 1) + gain) / Period;
            avg_loss_ = (avg_loss_ * (Period - 1) + loss) / Period;
        }
    }

    [[nodiscard]] double value_impl() const {
        if (!is_ready_impl()) return NEUTRAL;

        if (avg_loss_ == 0.0) {
            // Flat window has no momentum either way
            return avg_gain_ == 0.0 ? NEUTRAL : 100.0;
        }

        const double rs = avg_gain_ / avg_loss_;
        return 100.0 - (100.0 / (1.0 + rs));
    }

    [[nodiscard]] bool is_ready_impl() const {
        return count_ > Period;
    }

    void reset_impl() {
        count_ = 0;
        prev_price_ = 0.0;
        gain_sum_ = 0.0;
        loss_sum_ = 0.0;
        avg_gain_ = 0.0;
        avg_loss_ = 0.0;
    }

    [[nodiscard]] constexpr size_t period_impl() const { return Period; }

private:
    size_t count_;
    double prev_price_;
    double gain_sum_;
    double loss_sum_;
    double avg_gain_;
    double avg_loss_;
};

using RSI14 = RSI<14>;

}  // namespace confluence::strategy
