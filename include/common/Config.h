#pragma once

#include <string>
#include <mutex>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace cyclebt {

class Config {
public:
    static Config& getInstance();

    // Missing file: keep defaults with a warning. Malformed JSON or unknown
    // enum names throw ConfigError.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    engine::EngineConfig getEngineConfig() const;
    std::string getLogLevel() const;
    std::string getLogDir() const;
    std::string getLoadedPath() const;

    void setInitialCapital(double v);
    void setMaxPositions(int v);
    void setStrategyKind(strategy::StrategyKind kind);

private:
    Config() = default;

    mutable std::mutex mutex_;
    engine::EngineConfig engine_config_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    std::string loaded_path_;
};

} // namespace cyclebt
