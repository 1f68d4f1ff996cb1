#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <stdexcept>

namespace cyclebt {
namespace analytics {

EmaTracker::EmaTracker(int period)
    : period_(period)
    , k_(2.0 / (period + 1)) {
    if (period < 1) {
        throw std::invalid_argument("EMA period must be >= 1");
    }
}

std::optional<double> EmaTracker::update(double value) {
    if (value_) {
        value_ = k_ * value + (1.0 - k_) * (*value_);
        return value_;
    }

    seed_sum_ += value;
    ++count_;
    if (count_ == period_) {
        value_ = seed_sum_ / period_;
    }
    return value_;
}

EwmaStatsTracker::EwmaStatsTracker(int window_n)
    : alpha_(2.0 / (window_n + 1)) {
    if (window_n < 1) {
        throw std::invalid_argument("EWMA window must be >= 1");
    }
}

void EwmaStatsTracker::update(double sample) {
    if (!mean_) {
        mean_ = sample;
        variance_ = 0.0;
        return;
    }
    const double mu = alpha_ * sample + (1.0 - alpha_) * (*mean_);
    const double diff = sample - mu;
    variance_ = alpha_ * diff * diff + (1.0 - alpha_) * variance_;
    mean_ = mu;
}

std::optional<double> EwmaStatsTracker::stddev() const {
    if (!mean_) {
        return std::nullopt;
    }
    return std::sqrt(variance_);
}

WilderSmoother::WilderSmoother(int period)
    : period_(period) {
    if (period < 1) {
        throw std::invalid_argument("Wilder period must be >= 1");
    }
}

std::optional<double> WilderSmoother::update(std::optional<double> sample) {
    if (value_) {
        if (sample) {
            value_ = *value_ + (*sample - *value_) / period_;
        }
        return value_;
    }

    if (!sample) {
        return value_;
    }
    seed_sum_ += *sample;
    ++count_;
    if (count_ == period_) {
        value_ = seed_sum_ / period_;
    }
    return value_;
}

AdxTracker::AdxTracker(int period)
    : period_(period)
    , plus_dm_(period)
    , minus_dm_(period)
    , true_range_(period)
    , adx_(period) {
    if (period < 2) {
        throw std::invalid_argument("ADX period must be >= 2");
    }
}

std::optional<double> AdxTracker::update(const Candle& candle) {
    double plus_dm = 0.0;
    double minus_dm = 0.0;
    double tr = candle.high - candle.low;

    if (has_prev_) {
        const double up_move = candle.high - prev_.high;
        const double down_move = prev_.low - candle.low;
        if (up_move > down_move && up_move > 0) {
            plus_dm = up_move;
        }
        if (down_move > up_move && down_move > 0) {
            minus_dm = down_move;
        }
        tr = std::max({candle.high - candle.low,
                       std::abs(candle.high - prev_.close),
                       std::abs(candle.low - prev_.close)});
    }
    prev_ = candle;
    has_prev_ = true;

    const auto s_plus = plus_dm_.update(plus_dm);
    const auto s_minus = minus_dm_.update(minus_dm);
    const auto s_tr = true_range_.update(tr);

    std::optional<double> dx;
    if (s_plus && s_minus && s_tr && *s_tr != 0.0) {
        const double plus_di = 100.0 * (*s_plus) / (*s_tr);
        const double minus_di = 100.0 * (*s_minus) / (*s_tr);
        const double di_sum = plus_di + minus_di;
        if (di_sum != 0.0) {
            dx = 100.0 * std::abs(plus_di - minus_di) / di_sum;
        }
    }

    // Until the DI smoothers are seeded there is nothing to feed the ADX smoother;
    // afterwards an undefined DX holds the previous ADX.
    if (!s_tr) {
        return adx_.value();
    }
    return adx_.update(dx);
}

} // namespace analytics
} // namespace cyclebt
