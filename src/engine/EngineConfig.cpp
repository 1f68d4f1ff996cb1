#include "engine/EngineConfig.h"
#include "common/Errors.h"
#include "common/Money.h"
#include <cmath>
#include <set>

namespace cyclebt {
namespace engine {

namespace {
void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError(message);
    }
}

bool validRate(double rate) {
    return std::isfinite(rate) && rate >= 0.0 && rate < 1.0;
}
} // namespace

void EngineConfig::validate() const {
    require(std::isfinite(initial_capital) && initial_capital > 0.0,
            "simulation.initial_capital must be > 0");
    require(initial_capital <= kMaxInitialCapital,
            "simulation.initial_capital must be <= " + std::to_string(kMaxInitialCapital));
    require(max_positions >= 1, "simulation.max_positions must be >= 1");
    require(validRate(fee_rate), "simulation.fee_rate must be in [0, 1)");

    std::set<std::string> seen;
    for (const auto& id : instrument_order) {
        require(!id.empty(), "simulation.instrument_order contains an empty id");
        require(seen.insert(id).second, "simulation.instrument_order lists " + id + " twice");
    }

    require(indicators.ema_period >= 1, "indicators.ema_period must be >= 1");
    require(indicators.fast_ema_period >= 1, "indicators.fast_ema_period must be >= 1");
    require(indicators.ewma_window >= 1, "indicators.ewma_window must be >= 1");
    require(indicators.adx_period >= 2, "indicators.adx_period must be >= 2");
    require(indicators.min_lookback >= 0, "indicators.min_lookback must be >= 0");
    require(indicators.trend_scale > 0.0, "indicators.trend_scale must be > 0");
    require(indicators.inertia_base > 0.0 && indicators.inertia_max >= indicators.inertia_base,
            "indicators.inertia_max must be >= inertia_base > 0");

    require(cycle.bull_exit < cycle.bull_warning && cycle.bull_warning < cycle.bull_strong,
            "cycle thresholds must satisfy bull_exit < bull_warning < bull_strong");
    require(cycle.bear_strong < cycle.bear_warning && cycle.bear_warning < cycle.bear_exit,
            "cycle thresholds must satisfy bear_strong < bear_warning < bear_exit");

    require(validRate(strategy.limit_entry.entry_discount), "strategy.limit_entry.entry_discount must be in [0, 1)");
    require(validRate(strategy.limit_entry.stop_loss_pct), "strategy.limit_entry.stop_loss_pct must be in [0, 1)");
    require(strategy.limit_entry.take_profit_pct >= 0.0, "strategy.limit_entry.take_profit_pct must be >= 0");

    require(validRate(strategy.conservative_entry.entry_discount),
            "strategy.conservative_entry.entry_discount must be in [0, 1)");
    require(strategy.conservative_entry.consolidation_multiplier >= 1.0,
            "strategy.conservative_entry.consolidation_multiplier must be >= 1");
    require(validRate(strategy.conservative_entry.stop_loss_pct),
            "strategy.conservative_entry.stop_loss_pct must be in [0, 1)");
    require(strategy.conservative_entry.take_profit_pct >= 0.0,
            "strategy.conservative_entry.take_profit_pct must be >= 0");

    require(validRate(strategy.bull_warning_entry.stop_loss_pct),
            "strategy.bull_warning_entry.stop_loss_pct must be in [0, 1)");
    require(strategy.bull_warning_entry.take_profit_pct >= 0.0,
            "strategy.bull_warning_entry.take_profit_pct must be >= 0");

    const auto& trend = strategy.cycle_trend_entry;
    require(trend.cycle_window >= 1, "strategy.cycle_trend_entry.cycle_window must be >= 1");
    require(trend.slope_window >= 1, "strategy.cycle_trend_entry.slope_window must be >= 1");
    require(trend.bull_share >= 0.0 && trend.bull_share < 1.0,
            "strategy.cycle_trend_entry.bull_share must be in [0, 1)");
    require(validRate(trend.stop_loss_pct), "strategy.cycle_trend_entry.stop_loss_pct must be in [0, 1)");
    require(trend.take_profit_pct >= 0.0, "strategy.cycle_trend_entry.take_profit_pct must be >= 0");
}

} // namespace engine
} // namespace cyclebt
