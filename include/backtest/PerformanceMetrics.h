#pragma once

#include <vector>
#include "backtest/BacktestResult.h"

namespace cyclebt {
namespace backtest {

class PerformanceMetrics {
public:
    // Largest peak-to-trough drop of the equity curve, percent of the peak.
    static double maxDrawdownPct(const std::vector<EquityPoint>& curve);

    // Largest peak-to-trough drop of a running series, in its own units.
    static double maxDrawdownAbs(const std::vector<double>& series);

    // gross profit / |gross loss|; 0 when there is no losing trade.
    static double profitFactor(const std::vector<execution::TradeRecord>& trades);

    // Days covered by [first_ts, last_ts], at least 1.
    static int tradingDays(TimestampMs first_ts, TimestampMs last_ts);

    static double apr(double total_return_rate, int trading_days);

    // Fills every GlobalSummary field from trades and the equity curve.
    static GlobalSummary summarize(const std::vector<execution::TradeRecord>& trades,
                                   const std::vector<EquityPoint>& curve,
                                   double initial_capital);
};

} // namespace backtest
} // namespace cyclebt
