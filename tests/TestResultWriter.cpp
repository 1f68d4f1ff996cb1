#include "backtest/ResultWriter.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace cyclebt;
using backtest::BacktestResult;
using backtest::ResultWriter;

namespace {
std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

BacktestResult sampleResult() {
    BacktestResult r;
    r.completed = true;
    r.instrument_order = {"BBB", "AAA"};

    execution::TradeRecord t;
    t.instrument_id = "AAA";
    t.position_id = 3;
    t.entry_price = 100.0;
    t.exit_price = 104.0;
    t.entry_time = 1000;
    t.exit_time = 5000;
    t.quantity = 10.0;
    t.pnl = 40.0;
    t.pnl_pct = 4.0;
    t.fees = 0.0;
    t.exit_reason = "consolidation_mid";
    r.trades.push_back(t);

    r.equity_curve.push_back({1000, 10000.0, 9000.0, 1000.0, 1});
    r.equity_curve.push_back({5000, 10040.0, 10040.0, 0.0, 0});

    risk::CapitalTransaction tx;
    tx.timestamp = 1000;
    tx.type = risk::CapitalTxType::FREEZE;
    tx.amount = toMoneyUnits(1000.0);
    tx.instrument = "AAA";
    tx.order_id = 3;
    tx.available_after = toMoneyUnits(9000.0);
    tx.frozen_after = toMoneyUnits(1000.0);
    r.ledger.push_back(tx);
    tx.type = risk::CapitalTxType::SETTLE;
    tx.frozen_after = 0;
    r.ledger.push_back(tx);

    backtest::InstrumentSummary a;
    a.instrument = "AAA";
    a.trades = 1;
    a.total_pnl = 40.0;
    a.phase_counts["consolidation"] = 2;
    r.instruments["AAA"] = a;

    backtest::InstrumentSummary b;
    b.instrument = "BBB";
    b.aborted = true;
    b.failure = "invalid bar for BBB at 3000: low > high";
    r.instruments["BBB"] = b;
    r.failures.push_back({"BBB", 3000, b.failure, 0});

    r.summary.initial_capital = 10000.0;
    r.summary.final_equity = 10040.0;
    r.summary.total_trades = 1;
    r.summary.exit_reason_counts["consolidation_mid"] = 1;
    return r;
}
}

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "cyclebt_test_results";
    std::filesystem::remove_all(dir);

    const BacktestResult result = sampleResult();
    assert(ResultWriter::writeAll(result, dir));

    {
        std::ifstream in(dir / "summary.json");
        nlohmann::json j;
        in >> j;
        assert(j["completed"].get<bool>());
        assert(!j.contains("fatal_error"));
        assert(j["summary"]["total_trades"].get<int>() == 1);
        assert(j["summary"]["exit_reason_counts"]["consolidation_mid"].get<int>() == 1);
        // Instruments follow the processing order.
        assert(j["instruments"].size() == 2);
        assert(j["instruments"][0]["instrument"] == "BBB");
        assert(j["instruments"][0]["aborted"].get<bool>());
        assert(j["instruments"][0].contains("failure"));
        assert(!j["instruments"][1].contains("failure"));
        assert(j["instruments"][1]["phase_counts"]["consolidation"].get<int>() == 2);
        assert(j["failures"][0]["timestamp"].get<long long>() == 3000);
    }

    {
        const auto lines = readLines(dir / "trades.csv");
        assert(lines.size() == 2);
        assert(lines[0].rfind("instrument,position_id,", 0) == 0);
        assert(lines[1].rfind("AAA,3,1000,5000,", 0) == 0);
        assert(lines[1].find("consolidation_mid") != std::string::npos);
    }

    {
        const auto lines = readLines(dir / "equity.csv");
        assert(lines.size() == 3);
        assert(lines[0] == "timestamp,equity,cash,holdings_value,open_positions");
        assert(lines[2].rfind("5000,10040.", 0) == 0);
    }

    {
        const auto lines = readLines(dir / "ledger.jsonl");
        assert(lines.size() == 2);
        const auto first = nlohmann::json::parse(lines[0]);
        assert(first["type"] == "freeze");
        assert(first["amount"].get<double>() == 1000.0);
        assert(first["available_after"].get<double>() == 9000.0);
        assert(nlohmann::json::parse(lines[1])["type"] == "settle");
    }

    {
        BacktestResult stopped;
        stopped.fatal_error = "CapitalPool: available + frozen != total";
        const auto j = ResultWriter::toJson(stopped);
        assert(!j["completed"].get<bool>());
        assert(j["fatal_error"] == stopped.fatal_error);
        assert(j["instruments"].empty());
    }

    std::cout << "[TEST] ResultWriter PASSED\n";
    return 0;
}
