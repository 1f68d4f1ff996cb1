#include "common/Config.h"
#include "common/Errors.h"
#include "common/Money.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace cyclebt;

namespace {
bool validateThrows(const engine::EngineConfig& cfg) {
    try {
        cfg.validate();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}
}

int main() {
    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();

    // Defaults.
    {
        config.loadFromJson(nlohmann::json::object());
        const auto cfg = config.getEngineConfig();
        assert(cfg.initial_capital == 10000.0);
        assert(cfg.max_positions == 10);
        assert(cfg.fee_rate == 0.0);
        assert(cfg.strategy_kind == strategy::StrategyKind::LIMIT_ENTRY);
        assert(cfg.reprice_policy == execution::SellRepricePolicy::RECOMPUTE);
        assert(cfg.cycle.bull_warning == 600.0 && cfg.cycle.bear_strong == -1000.0);
        assert(cfg.indicators.ema_period == 25);
        assert(config.getLogLevel() == "info");
        cfg.validate();
    }

    // Every section is read; the bear side mirrors the bull side.
    {
        const auto j = nlohmann::json::parse(R"({
            "simulation": {
                "initial_capital": 5000,
                "max_positions": 3,
                "fee_rate": 0.0005,
                "instrument_order": ["ETH", "BTC"],
                "reprice_policy": "never_lower",
                "strategy": "conservative_entry"
            },
            "cycle": { "bull_warning": 400, "bull_strong": 900 },
            "indicators": { "ema_period": 20, "fast_ema_period": 9, "min_lookback": 40 },
            "strategy": {
                "conservative_entry": { "consolidation_multiplier": 2.5 },
                "bull_warning_entry": { "take_profit_pct": 0.08 },
                "cycle_trend_entry": { "cycle_window": 30, "bull_share": 0.24, "slope_window": 2 }
            },
            "logging": { "level": "debug", "dir": "out/logs" }
        })");
        config.loadFromJson(j);
        const auto cfg = config.getEngineConfig();
        assert(cfg.initial_capital == 5000.0);
        assert(cfg.max_positions == 3);
        assert(std::abs(cfg.fee_rate - 0.0005) < 1e-12);
        assert(cfg.instrument_order.size() == 2 && cfg.instrument_order[0] == "ETH");
        assert(cfg.reprice_policy == execution::SellRepricePolicy::NEVER_LOWER);
        assert(cfg.strategy_kind == strategy::StrategyKind::CONSERVATIVE_ENTRY);
        assert(cfg.cycle.bull_warning == 400.0);
        assert(cfg.cycle.bear_warning == -400.0);
        assert(cfg.cycle.bear_strong == -900.0);
        assert(cfg.cycle.bear_exit == 0.0);
        assert(cfg.indicators.ema_period == 20);
        assert(cfg.indicators.fast_ema_period == 9);
        assert(cfg.indicators.ewma_window == 50);
        assert(cfg.indicators.min_lookback == 40);
        assert(cfg.strategy.conservative_entry.consolidation_multiplier == 2.5);
        assert(cfg.strategy.bull_warning_entry.take_profit_pct == 0.08);
        assert(cfg.strategy.bull_warning_entry.stop_loss_pct == 0.05);
        assert(cfg.strategy.cycle_trend_entry.cycle_window == 30);
        assert(cfg.strategy.cycle_trend_entry.bull_share == 0.24);
        assert(cfg.strategy.cycle_trend_entry.slope_window == 2);
        assert(cfg.strategy.cycle_trend_entry.stop_loss_pct == 0.03);
        assert(config.getLogLevel() == "debug");
        assert(config.getLogDir() == "out/logs");
        cfg.validate();
    }

    // Overrides from the command line.
    {
        config.setInitialCapital(1234.0);
        config.setMaxPositions(7);
        config.setStrategyKind(strategy::StrategyKind::BULL_WARNING_ENTRY);
        const auto cfg = config.getEngineConfig();
        assert(cfg.initial_capital == 1234.0);
        assert(cfg.max_positions == 7);
        assert(cfg.strategy_kind == strategy::StrategyKind::BULL_WARNING_ENTRY);
    }

    // Unknown names and wrong types are configuration errors.
    {
        bool threw = false;
        try {
            config.loadFromJson(nlohmann::json::parse(R"({"simulation": {"strategy": "grid"}})"));
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            config.loadFromJson(nlohmann::json::parse(R"({"simulation": {"reprice_policy": "sticky"}})"));
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            config.loadFromJson(nlohmann::json::parse(R"({"simulation": {"max_positions": "many"}})"));
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);
    }

    // Files: missing keeps defaults, malformed throws.
    {
        const auto dir = std::filesystem::temp_directory_path() / "cyclebt_test_config";
        std::filesystem::create_directories(dir);

        config.loadFromJson(nlohmann::json::object());
        config.load((dir / "does_not_exist.json").string());
        assert(config.getEngineConfig().max_positions == 10);

        const auto good = dir / "good.json";
        {
            std::ofstream out(good, std::ios::trunc);
            out << R"({"simulation": {"max_positions": 4}})";
        }
        // stdout stays clean so --json output can be piped.
        std::ostringstream captured;
        std::streambuf* saved = std::cout.rdbuf(captured.rdbuf());
        config.load(good.string());
        std::cout.rdbuf(saved);
        assert(captured.str().empty());
        assert(config.getEngineConfig().max_positions == 4);
        assert(config.getLoadedPath() == good.string());

        const auto bad = dir / "bad.json";
        {
            std::ofstream out(bad, std::ios::trunc);
            out << "{ \"simulation\": ";
        }
        bool threw = false;
        try {
            config.load(bad.string());
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);
    }

    // Values no run can honour.
    {
        engine::EngineConfig cfg;
        cfg.validate();

        auto broken = cfg;
        broken.initial_capital = 0.0;
        assert(validateThrows(broken));

        broken = cfg;
        broken.max_positions = 0;
        assert(validateThrows(broken));

        broken = cfg;
        broken.fee_rate = -0.001;
        assert(validateThrows(broken));

        broken = cfg;
        broken.cycle.bull_strong = 500.0;   // below bull_warning
        assert(validateThrows(broken));

        broken = cfg;
        broken.cycle.bear_strong = -100.0;
        assert(validateThrows(broken));

        broken = cfg;
        broken.instrument_order = {"BTC", "BTC"};
        assert(validateThrows(broken));

        broken = cfg;
        broken.strategy.conservative_entry.consolidation_multiplier = 0.5;
        assert(validateThrows(broken));

        // Capital the fixed-point pool cannot represent.
        broken = cfg;
        broken.initial_capital = 1e11;
        assert(validateThrows(broken));
        broken.initial_capital = kMaxInitialCapital;
        broken.validate();

        broken = cfg;
        broken.strategy.cycle_trend_entry.cycle_window = 0;
        assert(validateThrows(broken));

        broken = cfg;
        broken.strategy.cycle_trend_entry.bull_share = 1.5;
        assert(validateThrows(broken));
    }

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
