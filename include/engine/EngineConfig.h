#pragma once

#include <string>
#include <vector>
#include "analytics/CycleClassifier.h"
#include "analytics/IndicatorPipeline.h"
#include "execution/LimitPriceCalculator.h"
#include "strategy/StrategyConfig.h"

namespace cyclebt {
namespace engine {

// Parameters of one backtest run. Immutable once the run starts.
struct EngineConfig {
    double initial_capital;
    int max_positions;
    double fee_rate;

    // Per-timestep instrument processing order. Empty: ascending instrument id.
    // Instruments in the data but not listed here are appended in id order.
    std::vector<std::string> instrument_order;

    execution::SellRepricePolicy reprice_policy;
    strategy::StrategyKind strategy_kind;

    analytics::IndicatorParams indicators;
    analytics::CycleThresholds cycle;
    strategy::StrategyParams strategy;

    EngineConfig()
        : initial_capital(10000.0)
        , max_positions(10)
        , fee_rate(0.0)
        , reprice_policy(execution::SellRepricePolicy::RECOMPUTE)
        , strategy_kind(strategy::StrategyKind::LIMIT_ENTRY)
    {}

    // Throws ConfigError on values no run can honour.
    void validate() const;
};

} // namespace engine
} // namespace cyclebt
