#pragma once

#include <cstddef>
#include <optional>
#include "common/Types.h"
#include "analytics/TechnicalIndicators.h"

namespace cyclebt {
namespace analytics {

struct IndicatorParams {
    int ema_period = 25;
    int fast_ema_period = 7;
    int ewma_window = 50;
    int adx_period = 14;
    double trend_scale = 100.0;     // thresholds are expressed in beta * trend_scale
    double band_z = 1.645;          // p5 / p95 quantile of the deviation band
    double inertia_base = 5.0;      // t_adj = clamp(base * (1 + adx/100), base, inertia_max)
    double inertia_max = 10.0;
    double flat_beta_ratio = 1e-4;  // |beta| < ema * ratio counts as flat
    int min_lookback = 30;
};

// Per-bar output. Price levels are only meaningful when ready == true.
struct SignalSnapshot {
    bool ready = false;
    bool has_prior_trend = false;   // a trend value existed on the previous bar

    double trend_value = 0.0;
    double trend_delta = 0.0;
    double volatility_estimate = 0.0;

    double ema = 0.0;
    double fast_ema = 0.0;          // 0 until the fast EMA has seeded
    double beta = 0.0;
    double p5 = 0.0;
    double p95 = 0.0;
    double inertia_mid = 0.0;
    double adx = 0.0;
};

class IndicatorPipeline {
public:
    explicit IndicatorPipeline(const IndicatorParams& params = IndicatorParams());

    SignalSnapshot update(const Candle& candle);

    const SignalSnapshot& last() const { return last_; }
    std::size_t barsSeen() const { return bars_seen_; }
    const IndicatorParams& params() const { return params_; }

private:
    double computeInertiaMid(double ema, double beta, double p5, double p95, double adx) const;

    IndicatorParams params_;
    EmaTracker ema_;
    EmaTracker fast_ema_;
    EwmaStatsTracker deviation_stats_;
    AdxTracker adx_;

    std::optional<double> prev_ema_;
    std::optional<double> prev_trend_;
    std::size_t bars_seen_ = 0;
    SignalSnapshot last_;
};

} // namespace analytics
} // namespace cyclebt
