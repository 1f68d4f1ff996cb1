#include "analytics/IndicatorPipeline.h"
#include <algorithm>
#include <cmath>

namespace cyclebt {
namespace analytics {

IndicatorPipeline::IndicatorPipeline(const IndicatorParams& params)
    : params_(params)
    , ema_(params.ema_period)
    , fast_ema_(params.fast_ema_period)
    , deviation_stats_(params.ewma_window)
    , adx_(params.adx_period) {
}

SignalSnapshot IndicatorPipeline::update(const Candle& candle) {
    ++bars_seen_;

    SignalSnapshot snap;
    const auto ema = ema_.update(candle.close);
    const auto fast_ema = fast_ema_.update(candle.close);
    const auto adx = adx_.update(candle);

    std::optional<double> beta;
    if (ema && prev_ema_) {
        beta = *ema - *prev_ema_;
    }
    if (ema && *ema != 0.0) {
        deviation_stats_.update((candle.close - *ema) / *ema);
    }
    prev_ema_ = ema;

    const auto sigma = deviation_stats_.stddev();

    if (beta) {
        snap.beta = *beta;
        snap.trend_value = *beta * params_.trend_scale;
        snap.has_prior_trend = prev_trend_.has_value();
        snap.trend_delta = prev_trend_ ? snap.trend_value - *prev_trend_ : 0.0;
        prev_trend_ = snap.trend_value;
    }

    if (ema && sigma) {
        snap.ema = *ema;
        snap.volatility_estimate = *sigma;
        snap.p5 = *ema * (1.0 - params_.band_z * (*sigma));
        snap.p95 = *ema * (1.0 + params_.band_z * (*sigma));
    }
    if (adx) {
        snap.adx = *adx;
    }
    if (fast_ema) {
        snap.fast_ema = *fast_ema;
    }

    snap.ready = ema && beta && sigma && adx &&
                 bars_seen_ >= static_cast<std::size_t>(params_.min_lookback);
    if (snap.ready) {
        snap.inertia_mid = computeInertiaMid(snap.ema, snap.beta, snap.p5, snap.p95, snap.adx);
    }

    last_ = snap;
    return snap;
}

double IndicatorPipeline::computeInertiaMid(double ema, double beta, double p5,
                                            double p95, double adx) const {
    const double t_adj = std::clamp(params_.inertia_base * (1.0 + adx / 100.0),
                                    params_.inertia_base, params_.inertia_max);
    if (std::abs(beta) < ema * params_.flat_beta_ratio) {
        return ema;
    }
    if (beta > 0) {
        return p95 + beta * t_adj;
    }
    return p5 + beta * t_adj;
}

} // namespace analytics
} // namespace cyclebt
