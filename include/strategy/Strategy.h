#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "common/Types.h"
#include "analytics/CycleClassifier.h"
#include "analytics/IndicatorPipeline.h"
#include "execution/LimitOrderManager.h"
#include "execution/LimitPriceCalculator.h"
#include "strategy/StrategyConfig.h"

namespace cyclebt {
namespace strategy {

// Everything a strategy may look at for the current bar of one instrument.
struct BarContext {
    const Candle& candle;
    std::size_t bar_index;
    const analytics::SignalSnapshot& signal;
    const analytics::CycleState& cycle;
};

struct EntryPlan {
    Price price = 0.0;
    double amount = 0.0;
    std::string reason;
};

struct ExitPlan {
    execution::SellTarget target;
    std::optional<Price> stop_price;
    std::optional<std::string> exit_at_next_open;   // reason of a market exit on the next bar
};

// Limit buy at min(p5, close, (p5 + mid)/2) * (1 - discount), sized by the
// shared dynamic order size. Sells follow the cycle phase.
class LimitEntryStrategy {
public:
    explicit LimitEntryStrategy(const LimitEntryConfig& config = LimitEntryConfig());

    void onBar(const BarContext& ctx);
    bool entryPredicate(const BarContext& ctx) const;
    std::optional<EntryPlan> entryPlan(const BarContext& ctx, double base_size, double available) const;
    std::optional<ExitPlan> exitTarget(const BarContext& ctx, const execution::Position& position) const;

    const LimitEntryConfig& config() const { return config_; }

private:
    LimitEntryConfig config_;
};

// Same prices as LimitEntryStrategy; during consolidation the order size is
// multiplied, capped by available capital.
class ConservativeEntryStrategy {
public:
    explicit ConservativeEntryStrategy(const ConservativeEntryConfig& config = ConservativeEntryConfig());

    void onBar(const BarContext& ctx);
    bool entryPredicate(const BarContext& ctx) const;
    std::optional<EntryPlan> entryPlan(const BarContext& ctx, double base_size, double available) const;
    std::optional<ExitPlan> exitTarget(const BarContext& ctx, const execution::Position& position) const;

    const ConservativeEntryConfig& config() const { return config_; }

private:
    ConservativeEntryConfig config_;
};

// Buys at the signal close on the bar where the phase turns from
// consolidation to bull_warning; exits on fixed take-profit / stop-loss.
class BullWarningEntryStrategy {
public:
    explicit BullWarningEntryStrategy(const BullWarningEntryConfig& config = BullWarningEntryConfig());

    void onBar(const BarContext& ctx);
    bool entryPredicate(const BarContext& ctx) const;
    std::optional<EntryPlan> entryPlan(const BarContext& ctx, double base_size, double available) const;
    std::optional<ExitPlan> exitTarget(const BarContext& ctx, const execution::Position& position) const;

    const BullWarningEntryConfig& config() const { return config_; }
    int signalCount() const { return signal_count_; }

private:
    BullWarningEntryConfig config_;
    analytics::Phase last_phase_ = analytics::Phase::CONSOLIDATION;
    bool entry_signal_ = false;
    int signal_count_ = 0;
};

// Trend follower over the classifier's phase history. While bull_strong bars
// exceed bull_share of the last cycle_window phases and the slow EMA slope is
// the highest of the last slope_window slopes, it rests two buys: one at the
// fast EMA, one at the slow EMA. Exits: stop, fixed take-profit, and once the
// trend is gone a fast-below-slow EMA cross sells at the next open.
class CycleTrendEntryStrategy {
public:
    explicit CycleTrendEntryStrategy(const CycleTrendEntryConfig& config = CycleTrendEntryConfig());

    void onBar(const BarContext& ctx);
    bool entryPredicate(const BarContext& ctx) const;
    std::vector<EntryPlan> entryPlans(const BarContext& ctx, double base_size, double available) const;
    std::optional<ExitPlan> exitTarget(const BarContext& ctx, const execution::Position& position) const;

    const CycleTrendEntryConfig& config() const { return config_; }
    bool inBullTrend() const { return bull_trend_; }
    double bullStrongShare() const;

private:
    bool slopeIsHighest() const;

    CycleTrendEntryConfig config_;
    std::deque<analytics::Phase> phases_;
    std::deque<double> slopes_;
    std::optional<double> prev_fast_;
    std::optional<double> prev_slow_;
    bool bull_trend_ = false;
    bool cross_down_ = false;
};

using Strategy = std::variant<LimitEntryStrategy, ConservativeEntryStrategy, BullWarningEntryStrategy,
                              CycleTrendEntryStrategy>;

Strategy makeStrategy(StrategyKind kind, const StrategyParams& params);
StrategyKind strategyKind(const Strategy& strategy);

void onBar(Strategy& strategy, const BarContext& ctx);
bool entryPredicate(const Strategy& strategy, const BarContext& ctx);
// Zero or more buy orders to rest this bar, in placement order.
std::vector<EntryPlan> entryPlans(const Strategy& strategy, const BarContext& ctx,
                                  double base_size, double available);
std::optional<ExitPlan> exitTarget(const Strategy& strategy, const BarContext& ctx,
                                   const execution::Position& position);

} // namespace strategy
} // namespace cyclebt
