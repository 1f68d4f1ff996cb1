#include "backtest/BacktestDriver.h"
#include "backtest/DataHistory.h"
#include "backtest/PerformanceMetrics.h"
#include "common/Logger.h"
#include <algorithm>
#include <set>

namespace cyclebt {
namespace backtest {

using execution::LimitOrderManager;
using execution::OrderPlacementStatus;
using execution::TradeRecord;

BacktestDriver::InstrumentState::InstrumentState(const std::string& instrument,
                                                 const engine::EngineConfig& config,
                                                 risk::CapitalPool& pool,
                                                 execution::OrderIdSequence& ids)
    : id(instrument)
    , pipeline(config.indicators)
    , classifier(config.cycle)
    , orders(std::make_unique<LimitOrderManager>(instrument, pool, config.fee_rate, &ids))
    , strategy_state(strategy::makeStrategy(config.strategy_kind, config.strategy)) {
    summary.instrument = instrument;
}

BacktestDriver::RunState::RunState(const engine::EngineConfig& config, const risk::EntryGate& gate)
    : pool(config.initial_capital)
    , coordinator(config.max_positions, gate) {
}

BacktestDriver::BacktestDriver(const engine::EngineConfig& config, risk::EntryGate entry_gate)
    : config_(config)
    , entry_gate_(entry_gate ? std::move(entry_gate) : risk::defaultEntryGate()) {
    config_.validate();
}

std::vector<std::string> BacktestDriver::resolveInstrumentOrder(
    const std::vector<std::string>& configured,
    const std::map<std::string, std::vector<Candle>>& bars) {
    std::vector<std::string> order;
    std::set<std::string> placed;
    for (const auto& id : configured) {
        if (bars.count(id) == 0) {
            LOG_WARN("instrument_order lists {} but no bars were supplied", id);
            continue;
        }
        if (placed.insert(id).second) {
            order.push_back(id);
        }
    }
    for (const auto& [id, series] : bars) {
        if (placed.insert(id).second) {
            order.push_back(id);
        }
    }
    return order;
}

BacktestResult BacktestDriver::run(const std::map<std::string, std::vector<Candle>>& bars) {
    std::optional<RunState> state;
    try {
        state.emplace(config_, entry_gate_);
    } catch (const std::exception& e) {
        BacktestResult failed;
        failed.fatal_error = e.what();
        LOG_ERROR("Backtest could not start: {}", e.what());
        return failed;
    }

    RunState& run = *state;
    BacktestResult& result = run.result;
    result.instrument_order = resolveInstrumentOrder(config_.instrument_order, bars);

    try {
        std::set<TimestampMs> timeline;
        for (const auto& id : result.instrument_order) {
            const auto& series = bars.at(id);
            auto inst = std::make_unique<InstrumentState>(id, config_, run.pool, run.ids);
            inst->bars = &series;
            for (const auto& candle : series) {
                timeline.insert(candle.timestamp);
            }
            run.instruments.push_back(std::move(inst));
        }

        LOG_INFO("Backtest start: {} instruments, {} timestamps, capital={:.2f}, max_positions={}, strategy={}",
                 run.instruments.size(), timeline.size(), config_.initial_capital, config_.max_positions,
                 strategy::strategyKindToString(config_.strategy_kind));

        for (TimestampMs ts : timeline) {
            for (auto& inst_ptr : run.instruments) {
                InstrumentState& inst = *inst_ptr;
                if (inst.aborted) {
                    continue;
                }
                const auto& series = *inst.bars;
                if (inst.cursor >= series.size()) {
                    continue;
                }
                if (series[inst.cursor].timestamp > ts) {
                    if (inst.cursor > 0) {
                        ++inst.summary.skipped_bars;
                    }
                    continue;
                }

                const Candle& candle = series[inst.cursor];
                try {
                    if (candle.timestamp < ts) {
                        throw InvalidBarError(inst.id, candle.timestamp,
                                              "bar timestamps of " + inst.id + " are not strictly increasing");
                    }
                    processBar(run, inst, candle);
                } catch (const InvalidBarError& e) {
                    abortInstrument(run, inst, e);
                }
                ++inst.cursor;
            }

            recordEquity(run, ts);
            run.pool.checkInvariant();
            run.coordinator.checkInvariant();
            if (observer_) {
                observer_(ts, run.pool, run.coordinator);
            }
        }
        result.completed = true;
    } catch (const InvariantViolation& e) {
        result.fatal_error = e.what();
        LOG_ERROR("Backtest stopped on invariant violation: {}", e.what());
    } catch (const std::exception& e) {
        result.fatal_error = e.what();
        LOG_ERROR("Backtest stopped: {}", e.what());
    }

    finalize(run);
    return std::move(run.result);
}

void BacktestDriver::processBar(RunState& run, InstrumentState& inst, const Candle& candle) {
    DataHistory::validateCandle(inst.id, candle);

    const std::size_t bar_index = inst.cursor;
    const analytics::SignalSnapshot signal = inst.pipeline.update(candle);
    const analytics::CycleState cycle = inst.classifier.update(signal, bar_index, candle);
    const strategy::BarContext ctx{candle, bar_index, signal, cycle};
    strategy::onBar(inst.strategy_state, ctx);

    auto& summary = inst.summary;
    ++summary.bars_processed;
    ++summary.phase_counts[analytics::phaseToString(cycle.phase)];
    if (!signal.ready) {
        ++summary.insufficient_history_bars;
    }

    processSells(run, inst, candle);
    processBuys(run, inst, candle, bar_index);
    retargetSells(inst, ctx);
    placeEntry(run, inst, ctx);

    inst.last_valid = candle;
}

void BacktestDriver::processSells(RunState& run, InstrumentState& inst, const Candle& candle) {
    std::vector<long long> position_ids;
    for (const auto& [id, pos] : inst.orders->positions()) {
        position_ids.push_back(id);
    }

    for (long long id : position_ids) {
        const execution::Position& pos = inst.orders->positions().at(id);
        if (pos.exit_at_open) {
            const std::string reason = *pos.exit_at_open;
            recordTrade(run, inst, inst.orders->fillSell(id, candle.open, candle.timestamp, reason));
            continue;
        }

        const auto stop = pos.stop_price;

        // Stop first: with both levels inside one bar the loss is assumed.
        if (stop && candle.low <= *stop) {
            const Price fill = std::min(*stop, candle.open);
            recordTrade(run, inst, inst.orders->fillSell(id, fill, candle.timestamp, "stop_loss"));
            continue;
        }

        const execution::PendingOrder* sell = inst.orders->sellOrderFor(id);
        if (sell && sell->isPending() && LimitOrderManager::checkFill(*sell, candle)) {
            const Price fill = sell->price;
            const std::string reason = sell->reason;
            recordTrade(run, inst, inst.orders->fillSell(id, fill, candle.timestamp, reason));
        }
    }
}

void BacktestDriver::processBuys(RunState& run, InstrumentState& inst, const Candle& candle,
                                 std::size_t bar_index) {
    for (const auto& order : inst.orders->pendingBuys()) {
        if (!LimitOrderManager::checkFill(order, candle)) {
            continue;
        }
        inst.orders->fillBuy(order.id, bar_index, candle.timestamp);
        run.coordinator.onBuyFilled(inst.id);
        ++inst.summary.buy_fills;
    }
}

void BacktestDriver::retargetSells(InstrumentState& inst, const strategy::BarContext& ctx) {
    std::vector<long long> position_ids;
    for (const auto& [id, pos] : inst.orders->positions()) {
        position_ids.push_back(id);
    }

    for (long long id : position_ids) {
        const auto plan = strategy::exitTarget(inst.strategy_state, ctx, inst.orders->positions().at(id));
        if (!plan) {
            continue;
        }
        inst.orders->setStopPrice(id, plan->stop_price);
        if (plan->exit_at_next_open) {
            inst.orders->scheduleExitAtOpen(id, *plan->exit_at_next_open);
        }
        inst.orders->placeSellOrder(id, plan->target.price, config_.reprice_policy,
                                    ctx.bar_index, ctx.candle.timestamp, plan->target.reason);
    }
}

void BacktestDriver::placeEntry(RunState& run, InstrumentState& inst, const strategy::BarContext& ctx) {
    const TimestampMs ts = ctx.candle.timestamp;

    const std::size_t stale = inst.orders->pendingBuyCount();
    if (stale > 0) {
        inst.orders->cancelAllPendingBuys(ts);
        for (std::size_t i = 0; i < stale; ++i) {
            run.coordinator.onBuyCancelled(inst.id);
        }
    }

    if (!strategy::entryPredicate(inst.strategy_state, ctx)) {
        return;
    }
    if (!run.coordinator.entryAllowed(ctx.cycle.phase) || !run.coordinator.canOpenPosition()) {
        return;
    }

    const double available = run.pool.available();
    const double base_size = run.coordinator.dynamicOrderSize(available);
    if (base_size <= 0.0) {
        ++inst.summary.insufficient_capital_count;
        LOG_DEBUG("[{}] no capital for a new entry at {}", inst.id, ts);
        return;
    }

    for (const auto& plan : strategy::entryPlans(inst.strategy_state, ctx, base_size, available)) {
        if (!run.coordinator.canOpenPosition()) {
            break;
        }
        const auto placed = inst.orders->createBuyOrder(plan.price, plan.amount, ctx.bar_index, ts, plan.reason);
        switch (placed.status) {
            case OrderPlacementStatus::PLACED:
                run.coordinator.onBuyPlaced(inst.id);
                ++inst.summary.buy_orders_placed;
                break;
            case OrderPlacementStatus::INSUFFICIENT_CAPITAL:
                ++inst.summary.insufficient_capital_count;
                break;
            case OrderPlacementStatus::INVALID_REQUEST:
                LOG_DEBUG("[{}] entry plan rejected: price={} amount={}", inst.id, plan.price, plan.amount);
                break;
        }
    }
}

void BacktestDriver::abortInstrument(RunState& run, InstrumentState& inst, const InvalidBarError& error) {
    LOG_ERROR("[{}] instrument aborted: {}", inst.id, error.what());

    const TimestampMs ts = error.timestamp();
    const std::size_t pending = inst.orders->pendingBuyCount();
    inst.orders->cancelAllPendingBuys(ts);
    for (std::size_t i = 0; i < pending; ++i) {
        run.coordinator.onBuyCancelled(inst.id);
    }

    int liquidated = 0;
    if (inst.last_valid) {
        for (const auto& trade : inst.orders->liquidateAll(inst.last_valid->close, ts, "instrument_aborted")) {
            recordTrade(run, inst, trade);
            ++liquidated;
        }
    }

    inst.aborted = true;
    inst.summary.aborted = true;
    inst.summary.failure = error.what();
    run.result.failures.push_back(InstrumentFailure{inst.id, ts, error.what(), liquidated});
}

void BacktestDriver::recordTrade(RunState& run, InstrumentState& inst, const TradeRecord& trade) {
    run.coordinator.onPositionClosed(inst.id);
    run.result.trades.push_back(trade);

    auto& summary = inst.summary;
    ++summary.trades;
    if (trade.pnl > 0.0) {
        ++summary.winning_trades;
    }
    summary.total_pnl += trade.pnl;
    inst.realized_pnl += trade.pnl;
    inst.realized_curve.push_back(inst.realized_pnl);
}

void BacktestDriver::recordEquity(RunState& run, TimestampMs ts) {
    EquityPoint point;
    point.timestamp = ts;
    point.cash = run.pool.total();
    for (const auto& inst : run.instruments) {
        if (inst->last_valid) {
            point.holdings_value += inst->orders->marketValue(inst->last_valid->close);
        }
    }
    point.equity = point.cash + point.holdings_value;
    point.open_positions = run.coordinator.openCount();
    run.result.equity_curve.push_back(point);
}

void BacktestDriver::finalize(RunState& run) {
    auto& result = run.result;
    result.ledger = run.pool.ledger();

    for (const auto& inst : run.instruments) {
        InstrumentSummary summary = inst->summary;
        summary.win_rate = (summary.trades > 0)
            ? static_cast<double>(summary.winning_trades) / summary.trades * 100.0
            : 0.0;
        summary.return_pct = summary.total_pnl / config_.initial_capital * 100.0;
        summary.max_drawdown = PerformanceMetrics::maxDrawdownAbs(inst->realized_curve);
        summary.open_positions_at_end = static_cast<int>(inst->orders->openPositionCount());
        result.instruments[inst->id] = summary;
    }

    result.summary = PerformanceMetrics::summarize(result.trades, result.equity_curve, config_.initial_capital);

    const auto& s = result.summary;
    LOG_INFO("Backtest {}: trades={} win_rate={:.2f}% return={:.2f}% max_dd={:.2f}% apr={:.2f}% failures={}",
             result.completed ? "finished" : "aborted", s.total_trades, s.win_rate, s.total_return_rate,
             s.max_drawdown, s.apr, result.failures.size());
}

} // namespace backtest
} // namespace cyclebt
