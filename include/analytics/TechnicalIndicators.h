#pragma once

#include <optional>
#include "common/Types.h"

namespace cyclebt {
namespace analytics {

// Streaming indicator trackers. Each keeps O(1) recursive state and is fed one
// sample per bar, so a replay never rescans history.

// EMA seeded with the SMA of the first `period` samples, k = 2 / (period + 1).
class EmaTracker {
public:
    explicit EmaTracker(int period);

    std::optional<double> update(double value);
    std::optional<double> value() const { return value_; }
    int period() const { return period_; }

private:
    int period_;
    double k_;
    int count_ = 0;
    double seed_sum_ = 0.0;
    std::optional<double> value_;
};

// EWMA mean / variance with alpha = 2 / (window + 1).
//   mu_t  = a * x + (1 - a) * mu_{t-1}
//   var_t = a * (x - mu_t)^2 + (1 - a) * var_{t-1}
// The first sample seeds mu with itself and var with 0.
class EwmaStatsTracker {
public:
    explicit EwmaStatsTracker(int window_n);

    void update(double sample);
    std::optional<double> mean() const { return mean_; }
    std::optional<double> stddev() const;
    double alpha() const { return alpha_; }

private:
    double alpha_;
    std::optional<double> mean_;
    double variance_ = 0.0;
};

// Wilder smoothing: first value is the mean of the first `period` valid
// samples, then s += (x - s) / period. Missing samples hold the last value.
class WilderSmoother {
public:
    explicit WilderSmoother(int period);

    std::optional<double> update(std::optional<double> sample);
    std::optional<double> value() const { return value_; }

private:
    int period_;
    int count_ = 0;
    double seed_sum_ = 0.0;
    std::optional<double> value_;
};

// Average Directional Index (Wilder). Needs roughly 2 * period bars.
class AdxTracker {
public:
    explicit AdxTracker(int period = 14);

    std::optional<double> update(const Candle& candle);
    std::optional<double> value() const { return adx_.value(); }

private:
    int period_;
    bool has_prev_ = false;
    Candle prev_;
    WilderSmoother plus_dm_;
    WilderSmoother minus_dm_;
    WilderSmoother true_range_;
    WilderSmoother adx_;
};

} // namespace analytics
} // namespace cyclebt
