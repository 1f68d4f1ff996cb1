#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "backtest/BacktestDriver.h"
#include "backtest/DataHistory.h"
#include "backtest/ResultWriter.h"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace cyclebt;

namespace {

struct CliOptions {
    std::string config_path = "config/config.json";
    std::vector<std::pair<std::string, std::string>> data;   // instrument, file
    std::string out_dir;
    std::optional<double> initial_capital;
    std::optional<int> max_positions;
    std::optional<strategy::StrategyKind> strategy_kind;
    TimestampMs start_ms = 0;
    TimestampMs end_ms = 0;
    bool json_mode = false;
};

void printUsage() {
    std::cout << "Usage: cyclebt --data SYMBOL=path [--data SYMBOL=path ...]\n"
              << "               [--config file] [--out dir]\n"
              << "               [--initial-capital X] [--max-positions N]\n"
              << "               [--strategy limit_entry|conservative_entry|bull_warning_entry|cycle_trend_entry]\n"
              << "               [--start ms] [--end ms] [--json]\n";
}

// Returns std::nullopt (after printing the reason) when the arguments are unusable.
std::optional<CliOptions> parseArgs(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = (i + 1 < argc);

        try {
            if (arg == "--json") {
                opts.json_mode = true;
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return std::nullopt;
            } else if (arg == "--config" && has_value) {
                opts.config_path = argv[++i];
            } else if (arg == "--out" && has_value) {
                opts.out_dir = argv[++i];
            } else if (arg == "--data" && has_value) {
                const std::string binding = argv[++i];
                const auto eq = binding.find('=');
                if (eq == std::string::npos || eq == 0 || eq + 1 == binding.size()) {
                    std::cerr << "--data expects SYMBOL=path, got: " << binding << "\n";
                    return std::nullopt;
                }
                opts.data.emplace_back(binding.substr(0, eq), binding.substr(eq + 1));
            } else if (arg == "--initial-capital" && has_value) {
                opts.initial_capital = std::stod(argv[++i]);
            } else if (arg == "--max-positions" && has_value) {
                opts.max_positions = std::stoi(argv[++i]);
            } else if (arg == "--strategy" && has_value) {
                const std::string name = argv[++i];
                opts.strategy_kind = strategy::parseStrategyKind(name);
                if (!opts.strategy_kind) {
                    std::cerr << "Unknown strategy: " << name << "\n";
                    return std::nullopt;
                }
            } else if (arg == "--start" && has_value) {
                opts.start_ms = backtest::DataHistory::normalizeTimestamp(std::stoll(argv[++i]));
            } else if (arg == "--end" && has_value) {
                opts.end_ms = backtest::DataHistory::normalizeTimestamp(std::stoll(argv[++i]));
            } else {
                std::cerr << "Unknown or incomplete argument: " << arg << "\n";
                printUsage();
                return std::nullopt;
            }
        } catch (const std::logic_error&) {
            // std::stod / std::stoi report bad numbers as invalid_argument or out_of_range.
            std::cerr << "Invalid value for " << arg << "\n";
            return std::nullopt;
        }
    }

    if (opts.data.empty()) {
        std::cerr << "At least one --data SYMBOL=path is required\n";
        printUsage();
        return std::nullopt;
    }
    return opts;
}

void printSummary(const backtest::BacktestResult& result) {
    const auto& s = result.summary;
    std::cout << "\nBacktest result\n";
    std::cout << "---------------------------------------------\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Initial capital: " << s.initial_capital << "\n";
    std::cout << "Final equity:    " << s.final_equity << "\n";
    std::cout << "Total return:    " << s.total_return << " (" << s.total_return_rate << "%)\n";
    std::cout << "Trades:          " << s.total_trades << " (wins " << s.winning_trades
              << ", " << s.win_rate << "%)\n";
    std::cout << "Fees:            " << s.total_fees << "\n";
    std::cout << "Profit factor:   " << std::setprecision(3) << s.profit_factor << "\n";
    std::cout << std::setprecision(2);
    std::cout << "Max drawdown:    " << s.max_drawdown << "%\n";
    std::cout << "Trading days:    " << s.trading_days << "  APR: " << s.apr << "%\n";
    std::cout << "Open positions:  " << s.open_positions << "\n";

    if (!result.instruments.empty()) {
        std::cout << "Per instrument:\n";
        for (const auto& id : result.instrument_order) {
            auto it = result.instruments.find(id);
            if (it == result.instruments.end()) {
                continue;
            }
            const auto& inst = it->second;
            std::cout << "  - " << inst.instrument
                      << " | trades=" << inst.trades
                      << " | win=" << std::setprecision(1) << inst.win_rate << "%"
                      << " | pnl=" << std::setprecision(2) << inst.total_pnl
                      << " | open=" << inst.open_positions_at_end;
            if (inst.aborted) {
                std::cout << " | aborted: " << inst.failure;
            }
            std::cout << "\n";
        }
    }
    if (!result.completed) {
        std::cout << "Run stopped early: " << result.fatal_error << "\n";
    }
    std::cout << "---------------------------------------------\n";
}

} // namespace

int main(int argc, char* argv[]) {
    const auto opts = parseArgs(argc, argv);
    if (!opts) {
        return 2;
    }

    try {
        auto& config = Config::getInstance();
        config.load(opts->config_path);
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel(), opts->json_mode);

        if (opts->initial_capital) {
            config.setInitialCapital(*opts->initial_capital);
        }
        if (opts->max_positions) {
            config.setMaxPositions(*opts->max_positions);
        }
        if (opts->strategy_kind) {
            config.setStrategyKind(*opts->strategy_kind);
        }

        std::map<std::string, std::vector<Candle>> bars;
        for (const auto& [symbol, path] : opts->data) {
            if (!std::filesystem::exists(path)) {
                std::cerr << "Data file not found: " << path << "\n";
                return 1;
            }
            auto candles = backtest::DataHistory::loadFile(path);
            if (opts->start_ms > 0 || opts->end_ms > 0) {
                candles = backtest::DataHistory::filterByRange(candles, opts->start_ms, opts->end_ms);
            }
            LOG_INFO("Loaded {} bars for {} from {}", candles.size(), symbol, path);
            if (!bars.emplace(symbol, std::move(candles)).second) {
                std::cerr << "Duplicate instrument: " << symbol << "\n";
                return 1;
            }
        }

        backtest::BacktestDriver driver(config.getEngineConfig());
        const auto result = driver.run(bars);

        if (!opts->out_dir.empty() && !backtest::ResultWriter::writeAll(result, opts->out_dir)) {
            std::cerr << "Some result files could not be written to " << opts->out_dir << "\n";
        }

        if (opts->json_mode) {
            std::cout << backtest::ResultWriter::toJson(result).dump() << "\n";
        } else {
            printSummary(result);
        }
        return result.completed ? 0 : 1;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
