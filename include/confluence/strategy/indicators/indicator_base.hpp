#pragma once
// ============================================================================
// CONFLUENCE SIGNAL ENGINE - Indicator Base Class
// ============================================================================
// CRTP pattern for zero-overhead polymorphism
// Indicators are streaming: feed values oldest to newest, read the latest
// ============================================================================

#include "confluence/core/types.hpp"

#include <array>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <limits>

namespace confluence::strategy {

// ============================================================================
// Indicator Concepts
// ============================================================================

/// Indicator fed with one price per period
template <typename T>
concept Indicator = requires(T indicator, double value) {
    { indicator.update(value) } -> std::same_as<void>;
    { indicator.value() } -> std::convertible_to<double>;
    { indicator.is_ready() } -> std::convertible_to<bool>;
    { indicator.reset() } -> std::same_as<void>;
};

/// Indicator fed with a whole candle per period
template <typename T>
concept CandleIndicator = requires(T indicator, const Candle& candle) {
    { indicator.update(candle) } -> std::same_as<void>;
    { indicator.value() } -> std::convertible_to<double>;
    { indicator.is_ready() } -> std::convertible_to<bool>;
};

// ============================================================================
// CRTP Base Class
// ============================================================================

template <typename Derived, typename Input = double>
class IndicatorBase {
public:
    /// Update indicator with the next period's input
    void update(const Input& value) {
        static_cast<Derived*>(this)->update_impl(value);
    }

    /// Get current indicator value
    [[nodiscard]] double value() const {
        return static_cast<const Derived*>(this)->value_impl();
    }

    /// Check if indicator has enough data
    [[nodiscard]] bool is_ready() const {
        return static_cast<const Derived*>(this)->is_ready_impl();
    }

    /// Reset indicator state
    void reset() {
        static_cast<Derived*>(this)->reset_impl();
    }

    /// Get indicator period
    [[nodiscard]] size_t period() const {
        return static_cast<const Derived*>(this)->period_impl();
    }

protected:
    IndicatorBase() = default;
    ~IndicatorBase() = default;
};

// ============================================================================
// Rolling Window for Historical Data
// ============================================================================

template <size_t MaxSize>
class RollingWindow {
public:
    static_assert(MaxSize > 0, "Window must hold at least one value");

    RollingWindow() : size_(0), index_(0) {}

    void push(double value) {
        buffer_[index_] = value;
        index_ = (index_ + 1) % MaxSize;
        if (size_ < MaxSize) {
            ++size_;
        }
    }

    [[nodiscard]] double operator[](size_t i) const {
        // i=0 is the most recent value
        if (i >= size_) return 0.0;
        return buffer_[(index_ + MaxSize - 1 - i) % MaxSize];
    }

    [[nodiscard]] double newest() const {
        return buffer_[(index_ + MaxSize - 1) % MaxSize];
    }

    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] bool is_full() const { return size_ == MaxSize; }

    void reset() {
        size_ = 0;
        index_ = 0;
    }

    /// Sum of the held values (oldest first, so results are reproducible)
    [[nodiscard]] double sum() const {
        double s = 0.0;
        for (size_t i = size_; i > 0; --i) {
            s += (*this)[i - 1];
        }
        return s;
    }

    [[nodiscard]] double mean() const {
        if (size_ == 0) return 0.0;
        return sum() / static_cast<double>(size_);
    }

    /// Population standard deviation
    [[nodiscard]] double std_dev() const {
        if (size_ < 2) return 0.0;
        const double m = mean();
        double variance = 0.0;
        for (size_t i = size_; i > 0; --i) {
            const double diff = (*this)[i - 1] - m;
            variance += diff * diff;
        }
        return std::sqrt(variance / static_cast<double>(size_));
    }

    [[nodiscard]] double max() const {
        double m = -std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < size_; ++i) {
            if ((*this)[i] > m) m = (*this)[i];
        }
        return size_ == 0 ? 0.0 : m;
    }

    [[nodiscard]] double min() const {
        double m = std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < size_; ++i) {
            if ((*this)[i] < m) m = (*this)[i];
        }
        return size_ == 0 ? 0.0 : m;
    }

private:
    std::array<double, MaxSize> buffer_{};
    size_t size_;
    size_t index_;
};

}  // namespace confluence::strategy
