#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include "backtest/BacktestResult.h"

namespace cyclebt {
namespace backtest {

// Writes a finished run to disk:
//   summary.json    global + per-instrument summaries, failures
//   trades.csv      one row per closed trade
//   equity.csv      one row per run timestamp
//   ledger.jsonl    one capital transaction per line
// Each writer returns false when its file could not be opened.
class ResultWriter {
public:
    static nlohmann::json toJson(const BacktestResult& result);

    static bool writeSummaryJson(const BacktestResult& result, const std::filesystem::path& path);
    static bool writeTradesCsv(const BacktestResult& result, const std::filesystem::path& path);
    static bool writeEquityCsv(const BacktestResult& result, const std::filesystem::path& path);
    static bool writeLedgerJsonl(const BacktestResult& result, const std::filesystem::path& path);

    static bool writeAll(const BacktestResult& result, const std::filesystem::path& out_dir);
};

} // namespace backtest
} // namespace cyclebt
