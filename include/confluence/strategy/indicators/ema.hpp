#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Moving Averages
// ============================================================================
// SMA20/50/200 and EMA9/21 feed the MA trend reading; EMA12/26/9 feed MACD
// ============================================================================

#include "indicator_base.hpp"

namespace confluence::strategy {

/// Mean of the last Period closes. Short histories average what they have.
template <size_t Period>
class SMA : public IndicatorBase<SMA<Period>> {
public:
    static_assert(Period > 0, "Period must be positive");

    SMA() { reset_impl(); }

    void update_impl(double close) {
        closes_.push(close);
        ++seen_;
    }

    [[nodiscard]] double value_impl() const { return closes_.mean(); }

    [[nodiscard]] bool is_ready_impl() const { return seen_ >= Period; }

    void reset_impl() {
        closes_.reset();
        seen_ = 0;
    }

    [[nodiscard]] constexpr size_t period_impl() const { return Period; }

private:
    RollingWindow<Period> closes_;
    size_t seen_;
};

/// Exponential average with alpha 2 / (Period + 1). Until Period closes
/// have been seen it reports their running mean, which becomes the seed.
template <size_t Period>
class EMA : public IndicatorBase<EMA<Period>> {
public:
    static_assert(Period > 0, "Period must be positive");

    static constexpr double ALPHA = 2.0 / (Period + 1);

    EMA() { reset_impl(); }

    void update_impl(double close) {
        ++seen_;
        if (seen_ <= Period) {
            seed_sum_ += close;
            average_ = seed_sum_ / static_cast<double>(seen_);
            return;
        }
        average_ += ALPHA * (close - average_);
    }

    [[nodiscard]] double value_impl() const { return average_; }

    [[nodiscard]] bool is_ready_impl() const { return seen_ >= Period; }

    void reset_impl() {
        seen_ = 0;
        average_ = 0.0;
        seed_sum_ = 0.0;
    }

    [[nodiscard]] constexpr size_t period_impl() const { return Period; }

private:
    size_t seen_;
    double average_;
    double seed_sum_;
};

using EMA9 = EMA<9>;
using EMA21 = EMA<21>;

using SMA20 = SMA<20>;
using SMA50 = SMA<50>;
using SMA200 = SMA<200>;

}  // namespace confluence::strategy
