#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "common/Errors.h"
#include "common/Types.h"
#include "analytics/CycleClassifier.h"
#include "analytics/IndicatorPipeline.h"
#include "backtest/BacktestResult.h"
#include "engine/EngineConfig.h"
#include "execution/LimitOrderManager.h"
#include "risk/CapitalPool.h"
#include "risk/PositionCoordinator.h"
#include "strategy/Strategy.h"

namespace cyclebt {
namespace backtest {

// Replays every instrument in lockstep over the sorted union of bar timestamps.
// Per timestamp and instrument (in instrument order):
//   0. validate bar, update indicators / phase, strategy onBar
//   1. stop-loss and resting sells
//   2. resting buys
//   3. re-target sells of open positions
//   4. cancel stale buys, place a new one when gate, slot and capital allow
//   5. statistics
// then one equity point for the timestamp.
class BacktestDriver {
public:
    using StepObserver = std::function<void(TimestampMs, const risk::CapitalPool&,
                                            const risk::PositionCoordinator&)>;

    // Throws ConfigError when the config does not validate.
    explicit BacktestDriver(const engine::EngineConfig& config,
                            risk::EntryGate entry_gate = risk::defaultEntryGate());

    // Never throws; fatal bookkeeping errors end the run with completed == false.
    BacktestResult run(const std::map<std::string, std::vector<Candle>>& bars);

    // Called after every timestamp, for invariant checks and progress output.
    void setStepObserver(StepObserver observer) { observer_ = std::move(observer); }

    // Configured ids first (ids without data dropped), then the rest ascending.
    static std::vector<std::string> resolveInstrumentOrder(
        const std::vector<std::string>& configured,
        const std::map<std::string, std::vector<Candle>>& bars);

    const engine::EngineConfig& config() const { return config_; }

private:
    struct InstrumentState {
        std::string id;
        const std::vector<Candle>* bars = nullptr;
        std::size_t cursor = 0;
        analytics::IndicatorPipeline pipeline;
        analytics::CycleClassifier classifier;
        std::unique_ptr<execution::LimitOrderManager> orders;
        strategy::Strategy strategy_state;
        std::optional<Candle> last_valid;
        bool aborted = false;
        double realized_pnl = 0.0;
        std::vector<double> realized_curve;
        InstrumentSummary summary;

        InstrumentState(const std::string& instrument, const engine::EngineConfig& config,
                        risk::CapitalPool& pool, execution::OrderIdSequence& ids);
    };

    struct RunState {
        risk::CapitalPool pool;
        risk::PositionCoordinator coordinator;
        execution::OrderIdSequence ids;
        std::vector<std::unique_ptr<InstrumentState>> instruments;
        BacktestResult result;

        RunState(const engine::EngineConfig& config, const risk::EntryGate& gate);
    };

    void processBar(RunState& run, InstrumentState& inst, const Candle& candle);
    void processSells(RunState& run, InstrumentState& inst, const Candle& candle);
    void processBuys(RunState& run, InstrumentState& inst, const Candle& candle, std::size_t bar_index);
    void retargetSells(InstrumentState& inst, const strategy::BarContext& ctx);
    void placeEntry(RunState& run, InstrumentState& inst, const strategy::BarContext& ctx);
    void abortInstrument(RunState& run, InstrumentState& inst, const InvalidBarError& error);
    void recordTrade(RunState& run, InstrumentState& inst, const execution::TradeRecord& trade);
    void recordEquity(RunState& run, TimestampMs ts);
    void finalize(RunState& run);

    engine::EngineConfig config_;
    risk::EntryGate entry_gate_;
    StepObserver observer_;
};

} // namespace backtest
} // namespace cyclebt
