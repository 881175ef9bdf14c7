#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace microtrend {

// Runtime configuration. Values come from a JSON file first, then environment
// overrides. Consumers take copies of the value structs; nothing is shared.
class Config {
public:
    Config() = default;

    // JSON file (relative paths resolve against the executable dir) + environment
    void load(const std::string& config_path);

    void loadJson(const nlohmann::json& j);
    void applyEnvironment();

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    engine::DecisionThresholds getThresholds() const { return engine_config_.thresholds; }
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

private:
    void validateThresholds();
    void validateRisk();

    engine::EngineConfig engine_config_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
};

} // namespace microtrend
