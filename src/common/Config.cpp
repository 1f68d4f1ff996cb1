#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace cyclebt {

namespace {
void loadSimulation(const nlohmann::json& s, engine::EngineConfig& cfg) {
    cfg.initial_capital = s.value("initial_capital", cfg.initial_capital);
    cfg.max_positions = s.value("max_positions", cfg.max_positions);
    cfg.fee_rate = s.value("fee_rate", cfg.fee_rate);

    if (s.contains("instrument_order")) {
        cfg.instrument_order = s["instrument_order"].get<std::vector<std::string>>();
    }

    if (s.contains("reprice_policy")) {
        const std::string name = s["reprice_policy"].get<std::string>();
        auto policy = execution::parseSellRepricePolicy(name);
        if (!policy) {
            throw ConfigError("unknown simulation.reprice_policy: " + name);
        }
        cfg.reprice_policy = *policy;
    }

    if (s.contains("strategy")) {
        const std::string name = s["strategy"].get<std::string>();
        auto kind = strategy::parseStrategyKind(name);
        if (!kind) {
            throw ConfigError("unknown simulation.strategy: " + name);
        }
        cfg.strategy_kind = *kind;
    }
}

void loadCycle(const nlohmann::json& c, analytics::CycleThresholds& t) {
    t.bull_warning = c.value("bull_warning", t.bull_warning);
    t.bull_strong = c.value("bull_strong", t.bull_strong);
    t.bull_exit = c.value("bull_exit", t.bull_exit);
    // Bear side mirrors the bull side unless given explicitly.
    t.bear_warning = c.value("bear_warning", -t.bull_warning);
    t.bear_strong = c.value("bear_strong", -t.bull_strong);
    t.bear_exit = c.value("bear_exit", -t.bull_exit);
}

void loadIndicators(const nlohmann::json& i, analytics::IndicatorParams& p) {
    p.ema_period = i.value("ema_period", p.ema_period);
    p.fast_ema_period = i.value("fast_ema_period", p.fast_ema_period);
    p.ewma_window = i.value("ewma_window", p.ewma_window);
    p.adx_period = i.value("adx_period", p.adx_period);
    p.trend_scale = i.value("trend_scale", p.trend_scale);
    p.band_z = i.value("band_z", p.band_z);
    p.inertia_base = i.value("inertia_base", p.inertia_base);
    p.inertia_max = i.value("inertia_max", p.inertia_max);
    p.flat_beta_ratio = i.value("flat_beta_ratio", p.flat_beta_ratio);
    p.min_lookback = i.value("min_lookback", p.min_lookback);
}

void loadStrategies(const nlohmann::json& st, strategy::StrategyParams& p) {
    if (st.contains("limit_entry")) {
        const auto& s = st["limit_entry"];
        p.limit_entry.entry_discount = s.value("entry_discount", p.limit_entry.entry_discount);
        p.limit_entry.take_profit_pct = s.value("take_profit_pct", p.limit_entry.take_profit_pct);
        p.limit_entry.stop_loss_pct = s.value("stop_loss_pct", p.limit_entry.stop_loss_pct);
    }

    if (st.contains("conservative_entry")) {
        const auto& s = st["conservative_entry"];
        p.conservative_entry.entry_discount = s.value("entry_discount", p.conservative_entry.entry_discount);
        p.conservative_entry.consolidation_multiplier =
            s.value("consolidation_multiplier", p.conservative_entry.consolidation_multiplier);
        p.conservative_entry.take_profit_pct = s.value("take_profit_pct", p.conservative_entry.take_profit_pct);
        p.conservative_entry.stop_loss_pct = s.value("stop_loss_pct", p.conservative_entry.stop_loss_pct);
    }

    if (st.contains("bull_warning_entry")) {
        const auto& s = st["bull_warning_entry"];
        p.bull_warning_entry.take_profit_pct = s.value("take_profit_pct", p.bull_warning_entry.take_profit_pct);
        p.bull_warning_entry.stop_loss_pct = s.value("stop_loss_pct", p.bull_warning_entry.stop_loss_pct);
    }

    if (st.contains("cycle_trend_entry")) {
        const auto& s = st["cycle_trend_entry"];
        auto& c = p.cycle_trend_entry;
        c.cycle_window = s.value("cycle_window", c.cycle_window);
        c.bull_share = s.value("bull_share", c.bull_share);
        c.slope_window = s.value("slope_window", c.slope_window);
        c.take_profit_pct = s.value("take_profit_pct", c.take_profit_pct);
        c.stop_loss_pct = s.value("stop_loss_pct", c.stop_loss_pct);
    }
}
} // namespace

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    // Diagnostics go to stderr; stdout carries the run result.
    std::cerr << "Config path: " << config_path.string() << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cerr << "Warning: config file not found, using defaults: " << config_path.string() << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("malformed config " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loaded_path_ = config_path.string();
    }
    const auto cfg = getEngineConfig();
    std::cerr << "Config loaded: capital=" << cfg.initial_capital
              << ", max_positions=" << cfg.max_positions
              << ", strategy=" << strategy::strategyKindToString(cfg.strategy_kind) << std::endl;
}

void Config::loadFromJson(const nlohmann::json& j) {
    engine::EngineConfig cfg;
    std::string log_level = "info";
    std::string log_dir = "logs";

    try {
        if (j.contains("simulation")) {
            loadSimulation(j["simulation"], cfg);
        }
        if (j.contains("cycle")) {
            loadCycle(j["cycle"], cfg.cycle);
        }
        if (j.contains("indicators")) {
            loadIndicators(j["indicators"], cfg.indicators);
        }
        if (j.contains("strategy")) {
            loadStrategies(j["strategy"], cfg.strategy);
        }
        if (j.contains("logging")) {
            log_level = j["logging"].value("level", log_level);
            log_dir = j["logging"].value("dir", log_dir);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    engine_config_ = cfg;
    log_level_ = log_level;
    log_dir_ = log_dir;
}

engine::EngineConfig Config::getEngineConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_config_;
}

std::string Config::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_level_;
}

std::string Config::getLogDir() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_dir_;
}

std::string Config::getLoadedPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_path_;
}

void Config::setInitialCapital(double v) {
    std::lock_guard<std::mutex> lock(mutex_);
    engine_config_.initial_capital = v;
}

void Config::setMaxPositions(int v) {
    std::lock_guard<std::mutex> lock(mutex_);
    engine_config_.max_positions = v;
}

void Config::setStrategyKind(strategy::StrategyKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    engine_config_.strategy_kind = kind;
}

} // namespace cyclebt
