#pragma once

#include <optional>
#include <string>

namespace cyclebt {
namespace strategy {

enum class StrategyKind {
    LIMIT_ENTRY,
    CONSERVATIVE_ENTRY,
    BULL_WARNING_ENTRY,
    CYCLE_TREND_ENTRY
};

const char* strategyKindToString(StrategyKind kind);
std::optional<StrategyKind> parseStrategyKind(const std::string& name);

// Rates are fractions (0.05 == 5%). A rate <= 0 disables the rule.
struct LimitEntryConfig {
    double entry_discount = 0.001;
    double take_profit_pct = 0.0;
    double stop_loss_pct = 0.0;
};

struct ConservativeEntryConfig {
    double entry_discount = 0.001;
    double consolidation_multiplier = 3.0;
    double take_profit_pct = 0.0;
    double stop_loss_pct = 0.0;
};

struct BullWarningEntryConfig {
    double take_profit_pct = 0.10;
    double stop_loss_pct = 0.05;
};

// Enters while bull_strong bars exceed bull_share of the last cycle_window
// phases and the slow EMA slope is the highest of the last slope_window.
struct CycleTrendEntryConfig {
    int cycle_window = 42;
    double bull_share = 0.40;
    int slope_window = 6;
    double take_profit_pct = 0.10;
    double stop_loss_pct = 0.03;
};

struct StrategyParams {
    LimitEntryConfig limit_entry;
    ConservativeEntryConfig conservative_entry;
    BullWarningEntryConfig bull_warning_entry;
    CycleTrendEntryConfig cycle_trend_entry;
};

} // namespace strategy
} // namespace cyclebt
