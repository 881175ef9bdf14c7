#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace microtrend {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

// Malformed values keep the current setting; returns true only when `out` was updated
bool envDouble(const char* name, double& out) {
    const std::string raw = readEnvVar(name);
    if (raw.empty()) {
        return false;
    }
    try {
        size_t used = 0;
        const double v = std::stod(raw, &used);
        if (used == raw.size() && std::isfinite(v)) {
            out = v;
            return true;
        }
    } catch (const std::exception&) {
    }
    std::cerr << "Config: ignoring malformed " << name << "=" << raw << std::endl;
    return false;
}

bool envInt(const char* name, int& out) {
    const std::string raw = readEnvVar(name);
    if (raw.empty()) {
        return false;
    }
    try {
        size_t used = 0;
        const int v = std::stoi(raw, &used);
        if (used == raw.size()) {
            out = v;
            return true;
        }
    } catch (const std::exception&) {
    }
    std::cerr << "Config: ignoring malformed " << name << "=" << raw << std::endl;
    return false;
}

// spdlog::level::from_str maps unknown names to "off"
std::string normalizeLogLevel(const std::string& raw, const std::string& fallback) {
    static const char* kKnown[] = {
        "trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off"
    };
    const std::string level = toLowerCopy(trimCopy(raw));
    for (const char* known : kKnown) {
        if (level == known) {
            return level;
        }
    }
    std::cerr << "Config: unknown log level '" << raw << "', keeping " << fallback << std::endl;
    return fallback;
}

void envBool(const char* name, bool& out) {
    const std::string v = toLowerCopy(readEnvVar(name));
    if (v == "1" || v == "true" || v == "y" || v == "yes") {
        out = true;
    } else if (v == "0" || v == "false" || v == "n" || v == "no") {
        out = false;
    } else if (!v.empty()) {
        std::cerr << "Config: ignoring malformed " << name << "=" << v << std::endl;
    }
}

engine::ModelMode parseModelMode(const std::string& raw) {
    return toLowerCopy(trimCopy(raw)) == "extended"
        ? engine::ModelMode::EXTENDED
        : engine::ModelMode::BASELINE;
}
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cout << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Config file not found, using defaults: " << config_path << std::endl;
        } else {
            std::ifstream file(config_path);
            if (!file.is_open()) {
                std::cout << "Config file could not be opened, using defaults." << std::endl;
            } else {
                nlohmann::json j;
                file >> j;
                loadJson(j);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }

    applyEnvironment();

    const auto& t = engine_config_.thresholds;
    std::cout << "Config Loaded: buy=" << t.buy_threshold
              << ", sell=" << t.sell_threshold
              << ", ma_filter=" << (t.use_ma_filter ? "on" : "off")
              << ", model_mode=" << engine::toString(engine_config_.model_mode) << std::endl;
}

void Config::loadJson(const nlohmann::json& j) {
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        log_level_ = normalizeLogLevel(l.value("level", log_level_), log_level_);
        log_dir_ = l.value("dir", log_dir_);
    }

    if (j.contains("strategy")) {
        const auto& s = j["strategy"];
        auto& t = engine_config_.thresholds;
        t.buy_threshold = s.value("buy_threshold", t.buy_threshold);
        t.sell_threshold = s.value("sell_threshold", t.sell_threshold);
        t.use_ma_filter = s.value("use_ma_filter", t.use_ma_filter);
    }

    if (j.contains("model")) {
        const auto& m = j["model"];
        engine_config_.model_mode = parseModelMode(
            m.value("mode", std::string(engine::toString(engine_config_.model_mode))));
        engine_config_.model_seed = m.value("seed", engine_config_.model_seed);
        engine_config_.model_state_path = m.value("state_path", engine_config_.model_state_path);
        engine_config_.initial_learning_rate = m.value("learning_rate", engine_config_.initial_learning_rate);
        engine_config_.initial_epochs = m.value("epochs", engine_config_.initial_epochs);
    }

    if (j.contains("walk_forward")) {
        const auto& w = j["walk_forward"];
        auto& wf = engine_config_.walk_forward;
        wf.interval_minutes = w.value("interval_minutes", wf.interval_minutes);
        wf.refit_every_candles = w.value("refit_every_candles", wf.refit_every_candles);
        wf.window_candles = w.value("window_candles", wf.window_candles);
        wf.learning_rate = w.value("learning_rate", wf.learning_rate);
        wf.epochs = w.value("epochs", wf.epochs);
    }

    if (j.contains("risk")) {
        const auto& r = j["risk"];
        auto& rs = engine_config_.risk;
        rs.vol_risk_adjust = r.value("vol_risk_adjust", rs.vol_risk_adjust);
        rs.risk_per_trade_pct = r.value("risk_per_trade_pct", rs.risk_per_trade_pct);
        rs.equity_usd = r.value("equity_usd", rs.equity_usd);
        rs.high_vol_threshold = r.value("high_vol_threshold", rs.high_vol_threshold);
        rs.elevated_vol_threshold = r.value("elevated_vol_threshold", rs.elevated_vol_threshold);
        rs.low_vol_threshold = r.value("low_vol_threshold", rs.low_vol_threshold);
        rs.high_vol_factor = r.value("high_vol_factor", rs.high_vol_factor);
        rs.elevated_vol_factor = r.value("elevated_vol_factor", rs.elevated_vol_factor);
        rs.low_vol_factor = r.value("low_vol_factor", rs.low_vol_factor);
    }

    validateThresholds();
    validateRisk();
}

void Config::applyEnvironment() {
    auto& t = engine_config_.thresholds;
    envDouble("BUY_THRESHOLD", t.buy_threshold);
    envDouble("SELL_THRESHOLD", t.sell_threshold);
    envBool("USE_MA_FILTER", t.use_ma_filter);

    const std::string mode = readEnvVar("MODEL_MODE");
    if (!mode.empty()) {
        engine_config_.model_mode = parseModelMode(mode);
    }

    auto& wf = engine_config_.walk_forward;
    envInt("WALK_FORWARD_MIN", wf.interval_minutes);
    envInt("WALK_FORWARD_CANDLES", wf.refit_every_candles);
    envInt("MAX_HISTORY_CANDLES", wf.window_candles);
    // training knobs apply to both the boot fit and walk-forward refits
    if (envDouble("LEARNING_RATE", wf.learning_rate)) {
        engine_config_.initial_learning_rate = wf.learning_rate;
    }
    if (envInt("TRAIN_EPOCHS", wf.epochs)) {
        engine_config_.initial_epochs = wf.epochs;
    }

    auto& rs = engine_config_.risk;
    envBool("VOL_RISK_ADJUST", rs.vol_risk_adjust);
    envDouble("RISK_PER_TRADE_PCT", rs.risk_per_trade_pct);
    envDouble("USD_EQUITY", rs.equity_usd);

    const std::string seed = readEnvVar("MODEL_SEED");
    if (!seed.empty()) {
        try {
            engine_config_.model_seed = std::stoull(seed);
        } catch (const std::exception&) {
            std::cerr << "Config: ignoring malformed MODEL_SEED=" << seed << std::endl;
        }
    }

    const std::string state_path = readEnvVar("MODEL_STATE_PATH");
    if (!state_path.empty()) {
        engine_config_.model_state_path = state_path;
    }

    const std::string level = readEnvVar("LOG_LEVEL");
    if (!level.empty()) {
        log_level_ = normalizeLogLevel(level, log_level_);
    }

    validateThresholds();
    validateRisk();
}

void Config::validateThresholds() {
    auto& t = engine_config_.thresholds;
    const bool in_range = t.buy_threshold >= 0.0 && t.buy_threshold <= 1.0 &&
                          t.sell_threshold >= 0.0 && t.sell_threshold <= 1.0;
    if (in_range && t.buy_threshold > t.sell_threshold) {
        return;
    }

    std::cerr << "Config: invalid thresholds buy=" << t.buy_threshold
              << " sell=" << t.sell_threshold
              << " (need 0 <= sell < buy <= 1), reverting to 0.55/0.45" << std::endl;
    const engine::DecisionThresholds defaults;
    t.buy_threshold = defaults.buy_threshold;
    t.sell_threshold = defaults.sell_threshold;
}

void Config::validateRisk() {
    auto& rs = engine_config_.risk;
    const engine::RiskSizingConfig defaults;

    auto positive = [](double v) { return std::isfinite(v) && v > 0.0; };
    if (!(positive(rs.high_vol_factor) && positive(rs.elevated_vol_factor) && positive(rs.low_vol_factor))) {
        std::cerr << "Config: risk factors must be positive, reverting to "
                  << defaults.high_vol_factor << "/" << defaults.elevated_vol_factor
                  << "/" << defaults.low_vol_factor << std::endl;
        rs.high_vol_factor = defaults.high_vol_factor;
        rs.elevated_vol_factor = defaults.elevated_vol_factor;
        rs.low_vol_factor = defaults.low_vol_factor;
    }
    if (!(std::isfinite(rs.risk_per_trade_pct) && rs.risk_per_trade_pct >= 0.0)) {
        std::cerr << "Config: invalid RISK_PER_TRADE_PCT " << rs.risk_per_trade_pct
                  << ", reverting to " << defaults.risk_per_trade_pct << std::endl;
        rs.risk_per_trade_pct = defaults.risk_per_trade_pct;
    }
    if (!(std::isfinite(rs.equity_usd) && rs.equity_usd > 0.0)) {
        std::cerr << "Config: invalid USD_EQUITY " << rs.equity_usd
                  << ", reverting to " << defaults.equity_usd << std::endl;
        rs.equity_usd = defaults.equity_usd;
    }
}

} // namespace microtrend
