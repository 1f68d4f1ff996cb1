#include "backtest/ResultWriter.h"
#include "common/Logger.h"
#include "common/Money.h"

#include <fstream>
#include <iomanip>

namespace cyclebt {
namespace backtest {

namespace {
std::ofstream openTruncated(const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    return std::ofstream(path, std::ios::binary | std::ios::trunc);
}

// Reasons are fixed identifiers, but quote anything a CSV reader would split on.
std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

nlohmann::json summaryToJson(const GlobalSummary& s) {
    return {
        {"initial_capital", s.initial_capital},
        {"final_equity", s.final_equity},
        {"total_return", s.total_return},
        {"total_return_rate", s.total_return_rate},
        {"total_trades", s.total_trades},
        {"winning_trades", s.winning_trades},
        {"win_rate", s.win_rate},
        {"total_pnl", s.total_pnl},
        {"total_fees", s.total_fees},
        {"profit_factor", s.profit_factor},
        {"max_drawdown", s.max_drawdown},
        {"trading_days", s.trading_days},
        {"apr", s.apr},
        {"open_positions", s.open_positions},
        {"exit_reason_counts", s.exit_reason_counts}
    };
}

nlohmann::json instrumentToJson(const InstrumentSummary& s) {
    nlohmann::json j = {
        {"instrument", s.instrument},
        {"bars_processed", s.bars_processed},
        {"skipped_bars", s.skipped_bars},
        {"insufficient_history_bars", s.insufficient_history_bars},
        {"insufficient_capital_count", s.insufficient_capital_count},
        {"buy_orders_placed", s.buy_orders_placed},
        {"buy_fills", s.buy_fills},
        {"trades", s.trades},
        {"winning_trades", s.winning_trades},
        {"win_rate", s.win_rate},
        {"total_pnl", s.total_pnl},
        {"return_pct", s.return_pct},
        {"max_drawdown", s.max_drawdown},
        {"open_positions_at_end", s.open_positions_at_end},
        {"aborted", s.aborted},
        {"phase_counts", s.phase_counts}
    };
    if (s.aborted) {
        j["failure"] = s.failure;
    }
    return j;
}
} // namespace

nlohmann::json ResultWriter::toJson(const BacktestResult& result) {
    nlohmann::json j;
    j["completed"] = result.completed;
    if (!result.fatal_error.empty()) {
        j["fatal_error"] = result.fatal_error;
    }
    j["instrument_order"] = result.instrument_order;
    j["summary"] = summaryToJson(result.summary);

    j["instruments"] = nlohmann::json::array();
    for (const auto& id : result.instrument_order) {
        auto it = result.instruments.find(id);
        if (it != result.instruments.end()) {
            j["instruments"].push_back(instrumentToJson(it->second));
        }
    }

    j["failures"] = nlohmann::json::array();
    for (const auto& f : result.failures) {
        j["failures"].push_back({
            {"instrument", f.instrument},
            {"timestamp", f.timestamp},
            {"reason", f.reason},
            {"positions_liquidated", f.positions_liquidated}
        });
    }
    return j;
}

bool ResultWriter::writeSummaryJson(const BacktestResult& result, const std::filesystem::path& path) {
    auto out = openTruncated(path);
    if (!out.is_open()) {
        LOG_WARN("Summary open failed: {}", path.string());
        return false;
    }
    out << toJson(result).dump(2) << "\n";
    return true;
}

bool ResultWriter::writeTradesCsv(const BacktestResult& result, const std::filesystem::path& path) {
    auto out = openTruncated(path);
    if (!out.is_open()) {
        LOG_WARN("Trades CSV open failed: {}", path.string());
        return false;
    }

    out << "instrument,position_id,entry_time,exit_time,entry_price,exit_price,quantity,pnl,pnl_pct,fees,exit_reason\n";
    out << std::setprecision(10);
    for (const auto& t : result.trades) {
        out << csvField(t.instrument_id) << ','
            << t.position_id << ','
            << t.entry_time << ','
            << t.exit_time << ','
            << t.entry_price << ','
            << t.exit_price << ','
            << t.quantity << ','
            << t.pnl << ','
            << t.pnl_pct << ','
            << t.fees << ','
            << csvField(t.exit_reason) << '\n';
    }
    return true;
}

bool ResultWriter::writeEquityCsv(const BacktestResult& result, const std::filesystem::path& path) {
    auto out = openTruncated(path);
    if (!out.is_open()) {
        LOG_WARN("Equity CSV open failed: {}", path.string());
        return false;
    }

    out << "timestamp,equity,cash,holdings_value,open_positions\n";
    out << std::fixed << std::setprecision(8);
    for (const auto& p : result.equity_curve) {
        out << p.timestamp << ','
            << p.equity << ','
            << p.cash << ','
            << p.holdings_value << ','
            << p.open_positions << '\n';
    }
    return true;
}

bool ResultWriter::writeLedgerJsonl(const BacktestResult& result, const std::filesystem::path& path) {
    auto out = openTruncated(path);
    if (!out.is_open()) {
        LOG_WARN("Ledger open failed: {}", path.string());
        return false;
    }

    for (const auto& tx : result.ledger) {
        nlohmann::json line;
        line["ts_ms"] = tx.timestamp;
        line["type"] = risk::capitalTxTypeToString(tx.type);
        line["amount"] = fromMoneyUnits(tx.amount);
        line["instrument"] = tx.instrument;
        line["order_id"] = tx.order_id;
        line["available_after"] = fromMoneyUnits(tx.available_after);
        line["frozen_after"] = fromMoneyUnits(tx.frozen_after);
        out << line.dump() << "\n";
    }
    return true;
}

bool ResultWriter::writeAll(const BacktestResult& result, const std::filesystem::path& out_dir) {
    std::filesystem::create_directories(out_dir);

    bool ok = writeSummaryJson(result, out_dir / "summary.json");
    ok = writeTradesCsv(result, out_dir / "trades.csv") && ok;
    ok = writeEquityCsv(result, out_dir / "equity.csv") && ok;
    ok = writeLedgerJsonl(result, out_dir / "ledger.jsonl") && ok;

    if (ok) {
        LOG_INFO("Results written to {}", out_dir.string());
    }
    return ok;
}

} // namespace backtest
} // namespace cyclebt
