#pragma once

#include <map>
#include <string>
#include <vector>
#include "common/Types.h"
#include "execution/LimitOrderManager.h"
#include "risk/CapitalPool.h"

namespace cyclebt {
namespace backtest {

struct EquityPoint {
    TimestampMs timestamp = 0;
    double equity = 0.0;            // cash + holdings marked at the last known close
    double cash = 0.0;
    double holdings_value = 0.0;
    int open_positions = 0;
};

struct InstrumentFailure {
    std::string instrument;
    TimestampMs timestamp = 0;
    std::string reason;
    int positions_liquidated = 0;
};

struct InstrumentSummary {
    std::string instrument;
    int bars_processed = 0;
    int skipped_bars = 0;               // gaps inside the instrument's own first..last bar span
    int insufficient_history_bars = 0;
    int insufficient_capital_count = 0;
    int buy_orders_placed = 0;
    int buy_fills = 0;
    int trades = 0;
    int winning_trades = 0;
    double win_rate = 0.0;              // percent
    double total_pnl = 0.0;
    double return_pct = 0.0;            // total_pnl / initial capital, percent
    double max_drawdown = 0.0;          // of cumulative realized pnl, currency units
    int open_positions_at_end = 0;
    bool aborted = false;
    std::string failure;
    std::map<std::string, int> phase_counts;
};

struct GlobalSummary {
    double initial_capital = 0.0;
    double final_equity = 0.0;
    double total_return = 0.0;
    double total_return_rate = 0.0;     // percent
    int total_trades = 0;
    int winning_trades = 0;
    double win_rate = 0.0;              // percent
    double total_pnl = 0.0;
    double total_fees = 0.0;
    double profit_factor = 0.0;
    double max_drawdown = 0.0;          // percent of peak equity
    int trading_days = 0;
    double apr = 0.0;                   // percent
    int open_positions = 0;
    std::map<std::string, int> exit_reason_counts;
};

struct BacktestResult {
    bool completed = false;
    std::string fatal_error;
    std::vector<std::string> instrument_order;
    GlobalSummary summary;
    std::map<std::string, InstrumentSummary> instruments;
    std::vector<execution::TradeRecord> trades;
    std::vector<EquityPoint> equity_curve;
    std::vector<risk::CapitalTransaction> ledger;
    std::vector<InstrumentFailure> failures;
};

} // namespace backtest
} // namespace cyclebt
