#include "backtest/PerformanceMetrics.h"
#include <algorithm>
#include <cmath>

namespace cyclebt {
namespace backtest {

namespace {
constexpr double kMsPerDay = 24.0 * 60.0 * 60.0 * 1000.0;
}

double PerformanceMetrics::maxDrawdownPct(const std::vector<EquityPoint>& curve) {
    double peak = 0.0;
    double max_dd = 0.0;
    for (const auto& point : curve) {
        peak = std::max(peak, point.equity);
        if (peak > 0.0) {
            max_dd = std::max(max_dd, (peak - point.equity) / peak);
        }
    }
    return max_dd * 100.0;
}

double PerformanceMetrics::maxDrawdownAbs(const std::vector<double>& series) {
    if (series.empty()) {
        return 0.0;
    }
    double peak = 0.0;      // realized pnl starts from zero
    double max_dd = 0.0;
    for (double v : series) {
        peak = std::max(peak, v);
        max_dd = std::max(max_dd, peak - v);
    }
    return max_dd;
}

double PerformanceMetrics::profitFactor(const std::vector<execution::TradeRecord>& trades) {
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    for (const auto& t : trades) {
        if (t.pnl > 0.0) {
            gross_profit += t.pnl;
        } else {
            gross_loss_abs += -t.pnl;
        }
    }
    return (gross_loss_abs > 1e-12) ? (gross_profit / gross_loss_abs) : 0.0;
}

int PerformanceMetrics::tradingDays(TimestampMs first_ts, TimestampMs last_ts) {
    if (last_ts <= first_ts) {
        return 1;
    }
    const double days = static_cast<double>(last_ts - first_ts) / kMsPerDay;
    return std::max(1, static_cast<int>(days));
}

double PerformanceMetrics::apr(double total_return_rate, int trading_days) {
    if (trading_days <= 0) {
        return 0.0;
    }
    return total_return_rate / trading_days * 365.0;
}

GlobalSummary PerformanceMetrics::summarize(const std::vector<execution::TradeRecord>& trades,
                                            const std::vector<EquityPoint>& curve,
                                            double initial_capital) {
    GlobalSummary s;
    s.initial_capital = initial_capital;
    s.final_equity = curve.empty() ? initial_capital : curve.back().equity;
    s.total_return = s.final_equity - initial_capital;
    s.total_return_rate = (initial_capital > 0.0) ? (s.final_equity / initial_capital - 1.0) * 100.0 : 0.0;

    s.total_trades = static_cast<int>(trades.size());
    for (const auto& t : trades) {
        if (t.pnl > 0.0) {
            ++s.winning_trades;
        }
        s.total_pnl += t.pnl;
        s.total_fees += t.fees;
        ++s.exit_reason_counts[t.exit_reason];
    }
    s.win_rate = (s.total_trades > 0)
        ? static_cast<double>(s.winning_trades) / s.total_trades * 100.0
        : 0.0;
    s.profit_factor = profitFactor(trades);
    s.max_drawdown = maxDrawdownPct(curve);

    if (!curve.empty()) {
        s.trading_days = tradingDays(curve.front().timestamp, curve.back().timestamp);
        s.open_positions = curve.back().open_positions;
    } else {
        s.trading_days = 1;
    }
    s.apr = apr(s.total_return_rate, s.trading_days);
    return s;
}

} // namespace backtest
} // namespace cyclebt
