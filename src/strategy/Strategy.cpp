#include "strategy/Strategy.h"
#include <algorithm>
#include <cctype>
#include <type_traits>

namespace cyclebt {
namespace strategy {

using analytics::Phase;
using execution::LimitPriceCalculator;

const char* strategyKindToString(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::LIMIT_ENTRY: return "limit_entry";
        case StrategyKind::CONSERVATIVE_ENTRY: return "conservative_entry";
        case StrategyKind::BULL_WARNING_ENTRY: return "bull_warning_entry";
        case StrategyKind::CYCLE_TREND_ENTRY: return "cycle_trend_entry";
    }
    return "limit_entry";
}

std::optional<StrategyKind> parseStrategyKind(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (n == "limit_entry") return StrategyKind::LIMIT_ENTRY;
    if (n == "conservative_entry") return StrategyKind::CONSERVATIVE_ENTRY;
    if (n == "bull_warning_entry") return StrategyKind::BULL_WARNING_ENTRY;
    if (n == "cycle_trend_entry") return StrategyKind::CYCLE_TREND_ENTRY;
    return std::nullopt;
}

namespace {
std::optional<Price> scheduledEntryPrice(const BarContext& ctx, double discount) {
    const auto& s = ctx.signal;
    if (!s.ready || s.p5 <= 0.0 || s.inertia_mid <= 0.0) {
        return std::nullopt;
    }
    const Price base = LimitPriceCalculator::entryBasePrice(s.p5, ctx.candle.close, s.inertia_mid);
    const Price price = LimitPriceCalculator::entryOrderPrice(base, discount);
    if (price <= 0.0) {
        return std::nullopt;
    }
    return price;
}

std::optional<ExitPlan> cycleExit(const BarContext& ctx, const execution::Position& position,
                                  double take_profit_pct, double stop_loss_pct) {
    if (!ctx.signal.ready) {
        return std::nullopt;
    }
    ExitPlan plan;
    plan.target = LimitPriceCalculator::cycleSellTarget(ctx.cycle.phase, ctx.signal.ema, ctx.signal.p95);
    plan.target = LimitPriceCalculator::applyTakeProfitCap(plan.target, position.entry_price, take_profit_pct);
    plan.stop_price = LimitPriceCalculator::stopLossPrice(position.entry_price, stop_loss_pct);
    return plan;
}
} // namespace

// ===== LimitEntryStrategy =====

LimitEntryStrategy::LimitEntryStrategy(const LimitEntryConfig& config)
    : config_(config) {
}

void LimitEntryStrategy::onBar(const BarContext&) {
}

bool LimitEntryStrategy::entryPredicate(const BarContext& ctx) const {
    return ctx.signal.ready;
}

std::optional<EntryPlan> LimitEntryStrategy::entryPlan(const BarContext& ctx, double base_size,
                                                       double available) const {
    const auto price = scheduledEntryPrice(ctx, config_.entry_discount);
    if (!price || base_size <= 0.0 || available < base_size) {
        return std::nullopt;
    }
    return EntryPlan{*price, base_size, "limit_entry"};
}

std::optional<ExitPlan> LimitEntryStrategy::exitTarget(const BarContext& ctx,
                                                       const execution::Position& position) const {
    return cycleExit(ctx, position, config_.take_profit_pct, config_.stop_loss_pct);
}

// ===== ConservativeEntryStrategy =====

ConservativeEntryStrategy::ConservativeEntryStrategy(const ConservativeEntryConfig& config)
    : config_(config) {
}

void ConservativeEntryStrategy::onBar(const BarContext&) {
}

bool ConservativeEntryStrategy::entryPredicate(const BarContext& ctx) const {
    return ctx.signal.ready;
}

std::optional<EntryPlan> ConservativeEntryStrategy::entryPlan(const BarContext& ctx, double base_size,
                                                              double available) const {
    const auto price = scheduledEntryPrice(ctx, config_.entry_discount);
    if (!price || base_size <= 0.0) {
        return std::nullopt;
    }
    double amount = base_size;
    std::string reason = "conservative_entry";
    if (ctx.cycle.phase == Phase::CONSOLIDATION) {
        amount = std::min(base_size * config_.consolidation_multiplier, available);
        reason = "conservative_entry_consolidation";
    }
    if (amount <= 0.0 || available < amount) {
        return std::nullopt;
    }
    return EntryPlan{*price, amount, reason};
}

std::optional<ExitPlan> ConservativeEntryStrategy::exitTarget(const BarContext& ctx,
                                                              const execution::Position& position) const {
    return cycleExit(ctx, position, config_.take_profit_pct, config_.stop_loss_pct);
}

// ===== BullWarningEntryStrategy =====

BullWarningEntryStrategy::BullWarningEntryStrategy(const BullWarningEntryConfig& config)
    : config_(config) {
}

void BullWarningEntryStrategy::onBar(const BarContext& ctx) {
    const Phase current = ctx.cycle.phase;
    entry_signal_ = ctx.cycle.valid &&
                    last_phase_ == Phase::CONSOLIDATION &&
                    current == Phase::BULL_WARNING;
    if (entry_signal_) {
        ++signal_count_;
    }
    last_phase_ = current;
}

bool BullWarningEntryStrategy::entryPredicate(const BarContext& ctx) const {
    return ctx.signal.ready && entry_signal_;
}

std::optional<EntryPlan> BullWarningEntryStrategy::entryPlan(const BarContext& ctx, double base_size,
                                                             double available) const {
    if (!entry_signal_ || base_size <= 0.0 || available < base_size || ctx.candle.close <= 0.0) {
        return std::nullopt;
    }
    return EntryPlan{ctx.candle.close, base_size, "bull_warning_signal"};
}

std::optional<ExitPlan> BullWarningEntryStrategy::exitTarget(const BarContext& ctx,
                                                             const execution::Position& position) const {
    if (config_.take_profit_pct <= 0.0) {
        return cycleExit(ctx, position, 0.0, config_.stop_loss_pct);
    }
    ExitPlan plan;
    plan.target = {position.entry_price * (1.0 + config_.take_profit_pct), "take_profit"};
    plan.stop_price = LimitPriceCalculator::stopLossPrice(position.entry_price, config_.stop_loss_pct);
    return plan;
}

// ===== CycleTrendEntryStrategy =====

CycleTrendEntryStrategy::CycleTrendEntryStrategy(const CycleTrendEntryConfig& config)
    : config_(config) {
}

void CycleTrendEntryStrategy::onBar(const BarContext& ctx) {
    phases_.push_back(ctx.cycle.phase);
    while (phases_.size() > static_cast<std::size_t>(config_.cycle_window)) {
        phases_.pop_front();
    }

    cross_down_ = false;
    const double fast = ctx.signal.fast_ema;
    const double slow = ctx.signal.ema;
    const bool have_emas = fast > 0.0 && slow > 0.0;
    if (have_emas) {
        if (prev_slow_) {
            slopes_.push_back(slow - *prev_slow_);
            while (slopes_.size() > static_cast<std::size_t>(config_.slope_window)) {
                slopes_.pop_front();
            }
        }
        if (prev_fast_ && prev_slow_) {
            cross_down_ = fast < slow && *prev_fast_ >= *prev_slow_;
        }
        prev_fast_ = fast;
        prev_slow_ = slow;
    }

    bull_trend_ = have_emas &&
                  phases_.size() == static_cast<std::size_t>(config_.cycle_window) &&
                  bullStrongShare() > config_.bull_share &&
                  slopeIsHighest();
}

double CycleTrendEntryStrategy::bullStrongShare() const {
    if (phases_.empty()) {
        return 0.0;
    }
    const auto strong = std::count(phases_.begin(), phases_.end(), Phase::BULL_STRONG);
    return static_cast<double>(strong) / static_cast<double>(phases_.size());
}

bool CycleTrendEntryStrategy::slopeIsHighest() const {
    if (slopes_.size() < static_cast<std::size_t>(config_.slope_window)) {
        return false;
    }
    return slopes_.back() >= *std::max_element(slopes_.begin(), slopes_.end());
}

bool CycleTrendEntryStrategy::entryPredicate(const BarContext& ctx) const {
    return ctx.signal.ready && bull_trend_;
}

std::vector<EntryPlan> CycleTrendEntryStrategy::entryPlans(const BarContext& ctx, double base_size,
                                                           double available) const {
    std::vector<EntryPlan> plans;
    if (!bull_trend_ || base_size <= 0.0) {
        return plans;
    }
    const Price levels[] = {ctx.signal.fast_ema, ctx.signal.ema};
    const char* reasons[] = {"cycle_trend_fast_ema", "cycle_trend_slow_ema"};
    double remaining = available;
    for (int i = 0; i < 2; ++i) {
        if (levels[i] <= 0.0 || remaining < base_size) {
            break;
        }
        plans.push_back(EntryPlan{levels[i], base_size, reasons[i]});
        remaining -= base_size;
    }
    return plans;
}

std::optional<ExitPlan> CycleTrendEntryStrategy::exitTarget(const BarContext& ctx,
                                                            const execution::Position& position) const {
    ExitPlan plan;
    if (config_.take_profit_pct > 0.0) {
        plan.target = {position.entry_price * (1.0 + config_.take_profit_pct), "take_profit"};
    } else {
        plan.target = LimitPriceCalculator::cycleSellTarget(ctx.cycle.phase, ctx.signal.ema, ctx.signal.p95);
    }
    plan.stop_price = LimitPriceCalculator::stopLossPrice(position.entry_price, config_.stop_loss_pct);
    if (!bull_trend_ && cross_down_) {
        plan.exit_at_next_open = "cycle_exit";
    }
    return plan;
}

// ===== variant dispatch =====

Strategy makeStrategy(StrategyKind kind, const StrategyParams& params) {
    switch (kind) {
        case StrategyKind::LIMIT_ENTRY:
            return LimitEntryStrategy(params.limit_entry);
        case StrategyKind::CONSERVATIVE_ENTRY:
            return ConservativeEntryStrategy(params.conservative_entry);
        case StrategyKind::BULL_WARNING_ENTRY:
            return BullWarningEntryStrategy(params.bull_warning_entry);
        case StrategyKind::CYCLE_TREND_ENTRY:
            return CycleTrendEntryStrategy(params.cycle_trend_entry);
    }
    return LimitEntryStrategy(params.limit_entry);
}

StrategyKind strategyKind(const Strategy& strategy) {
    switch (strategy.index()) {
        case 1: return StrategyKind::CONSERVATIVE_ENTRY;
        case 2: return StrategyKind::BULL_WARNING_ENTRY;
        case 3: return StrategyKind::CYCLE_TREND_ENTRY;
        default: return StrategyKind::LIMIT_ENTRY;
    }
}

void onBar(Strategy& strategy, const BarContext& ctx) {
    std::visit([&ctx](auto& s) { s.onBar(ctx); }, strategy);
}

bool entryPredicate(const Strategy& strategy, const BarContext& ctx) {
    return std::visit([&ctx](const auto& s) { return s.entryPredicate(ctx); }, strategy);
}

std::vector<EntryPlan> entryPlans(const Strategy& strategy, const BarContext& ctx,
                                  double base_size, double available) {
    return std::visit([&](const auto& s) -> std::vector<EntryPlan> {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, CycleTrendEntryStrategy>) {
            return s.entryPlans(ctx, base_size, available);
        } else {
            std::vector<EntryPlan> plans;
            if (auto plan = s.entryPlan(ctx, base_size, available)) {
                plans.push_back(std::move(*plan));
            }
            return plans;
        }
    }, strategy);
}

std::optional<ExitPlan> exitTarget(const Strategy& strategy, const BarContext& ctx,
                                   const execution::Position& position) {
    return std::visit([&](const auto& s) { return s.exitTarget(ctx, position); }, strategy);
}

} // namespace strategy
} // namespace cyclebt
