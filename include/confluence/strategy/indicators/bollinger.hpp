#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Bollinger Bands
// ============================================================================
// Volatility indicator using standard deviation bands
// Default: 20-period SMA with 2 standard deviation bands
// ============================================================================

#include "indicator_base.hpp"

namespace confluence::strategy {

/// Bollinger Bands Indicator
template <size_t Period = 20, size_t StdDevMultiplier = 2>
class BollingerBands : public IndicatorBase<BollingerBands<Period, StdDevMultiplier>> {
public:
    BollingerBands() { reset_impl(); }

    void update_impl(double price) {
        window_.push(price);
        latest_price_ = price;
        ++count_;

        if (count_ >= Period) {
            middle_ = window_.mean();
            const double std_dev = window_.std_dev();
            upper_ = middle_ + static_cast<double>(StdDevMultiplier) * std_dev;
            lower_ = middle_ - static_cast<double>(StdDevMultiplier) * std_dev;
        } else {
            middle_ = upper_ = lower_ = price;
        }
    }

    /// Middle band (SMA)
    [[nodiscard]] double value_impl() const { return middle_; }

    [[nodiscard]] double upper_band() const { return upper_; }
    [[nodiscard]] double lower_band() const { return lower_; }
    [[nodiscard]] double latest_price() const { return latest_price_; }

    /// Band width as a percentage of the middle band
    [[nodiscard]] double band_width_pct() const {
        if (middle_ == 0.0) return 0.0;
        return (upper_ - lower_) / middle_ * 100.0;
    }

    /// %B: 0 = at lower band, 0.5 = at middle, 1 = at upper band
    [[nodiscard]] double percent_b() const {
        if (upper_ == lower_) return 0.5;
        return (latest_price_ - lower_) / (upper_ - lower_);
    }

    [[nodiscard]] bool is_ready_impl() const { return count_ >= Period; }

    void reset_impl() {
        window_.reset();
        count_ = 0;
        middle_ = 0.0;
        upper_ = 0.0;
        lower_ = 0.0;
        latest_price_ = 0.0;
    }

    [[nodiscard]] constexpr size_t period_impl() const { return Period; }

private:
    RollingWindow<Period> window_;
    size_t count_;
    double middle_;
    double upper_;
    double lower_;
    double latest_price_;
};

using BB20_2 = BollingerBands<20, 2>;

}  // namespace confluence::strategy
