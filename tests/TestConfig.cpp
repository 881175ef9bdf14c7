#include "common/Config.h"

#include <cassert>
#include <cstdlib>
#include <iostream>

using namespace microtrend;

namespace {

const char* kEnvKeys[] = {
    "BUY_THRESHOLD", "SELL_THRESHOLD", "USE_MA_FILTER", "MODEL_MODE",
    "WALK_FORWARD_MIN", "WALK_FORWARD_CANDLES", "MAX_HISTORY_CANDLES",
    "VOL_RISK_ADJUST", "RISK_PER_TRADE_PCT", "USD_EQUITY",
    "LEARNING_RATE", "TRAIN_EPOCHS", "MODEL_SEED", "MODEL_STATE_PATH", "LOG_LEVEL"
};

void clearEnvironment() {
    for (const char* key : kEnvKeys) {
        unsetenv(key);
    }
}

} // namespace

int main() {
    clearEnvironment();

    {
        Config config;
        config.applyEnvironment();
        const auto cfg = config.getEngineConfig();
        assert(cfg.thresholds.buy_threshold == 0.55);
        assert(cfg.thresholds.sell_threshold == 0.45);
        assert(cfg.thresholds.use_ma_filter);
        assert(cfg.model_mode == engine::ModelMode::BASELINE);
        assert(cfg.walk_forward.interval_minutes == 0);
        assert(cfg.walk_forward.refit_every_candles == 0);
        assert(cfg.walk_forward.window_candles == 5000);
        assert(!cfg.risk.vol_risk_adjust);
        assert(cfg.risk.risk_per_trade_pct == 0.25);
        assert(cfg.model_seed == 0);
        assert(cfg.model_state_path.empty());
        assert(config.getLogLevel() == "info");
    }

    {
        Config config;
        config.loadJson(nlohmann::json::parse(R"({
            "logging": {"level": "debug", "dir": "/tmp/mt-logs"},
            "strategy": {"buy_threshold": 0.6, "sell_threshold": 0.4, "use_ma_filter": false},
            "model": {"mode": "Extended", "seed": 99, "state_path": "state/m.json",
                      "learning_rate": 0.02, "epochs": 6},
            "walk_forward": {"interval_minutes": 30, "refit_every_candles": 120,
                             "window_candles": 800, "learning_rate": 0.01, "epochs": 2},
            "risk": {"vol_risk_adjust": true, "risk_per_trade_pct": 0.5, "equity_usd": 2500}
        })"));
        const auto cfg = config.getEngineConfig();
        assert(cfg.thresholds.buy_threshold == 0.6);
        assert(cfg.thresholds.sell_threshold == 0.4);
        assert(!cfg.thresholds.use_ma_filter);
        assert(cfg.model_mode == engine::ModelMode::EXTENDED);
        assert(cfg.model_seed == 99);
        assert(cfg.model_state_path == "state/m.json");
        assert(cfg.initial_learning_rate == 0.02);
        assert(cfg.initial_epochs == 6);
        assert(cfg.walk_forward.interval_minutes == 30);
        assert(cfg.walk_forward.refit_every_candles == 120);
        assert(cfg.walk_forward.window_candles == 800);
        assert(cfg.walk_forward.learning_rate == 0.01);
        assert(cfg.walk_forward.epochs == 2);
        assert(cfg.risk.vol_risk_adjust);
        assert(cfg.risk.risk_per_trade_pct == 0.5);
        assert(cfg.risk.equity_usd == 2500.0);
        assert(cfg.risk.high_vol_factor == 0.6);
        assert(config.getLogLevel() == "debug");
        assert(config.getLogDir() == "/tmp/mt-logs");
    }

    {
        // environment wins over the file
        setenv("BUY_THRESHOLD", "0.62", 1);
        setenv("SELL_THRESHOLD", " 0.38 ", 1);
        setenv("USE_MA_FILTER", "no", 1);
        setenv("MODEL_MODE", "extended", 1);
        setenv("WALK_FORWARD_MIN", "15", 1);
        setenv("WALK_FORWARD_CANDLES", "200", 1);
        setenv("MAX_HISTORY_CANDLES", "1200", 1);
        setenv("VOL_RISK_ADJUST", "TRUE", 1);
        setenv("RISK_PER_TRADE_PCT", "0.4", 1);
        setenv("USD_EQUITY", "5000", 1);
        setenv("LEARNING_RATE", "0.03", 1);
        setenv("TRAIN_EPOCHS", "5", 1);
        setenv("MODEL_SEED", "1234", 1);
        setenv("MODEL_STATE_PATH", "/tmp/model.json", 1);
        setenv("LOG_LEVEL", "WARN", 1);

        Config config;
        config.loadJson(nlohmann::json::parse(R"({"strategy": {"buy_threshold": 0.7, "use_ma_filter": true}})"));
        config.applyEnvironment();
        const auto cfg = config.getEngineConfig();
        assert(cfg.thresholds.buy_threshold == 0.62);
        assert(cfg.thresholds.sell_threshold == 0.38);
        assert(!cfg.thresholds.use_ma_filter);
        assert(cfg.model_mode == engine::ModelMode::EXTENDED);
        assert(cfg.walk_forward.interval_minutes == 15);
        assert(cfg.walk_forward.refit_every_candles == 200);
        assert(cfg.walk_forward.window_candles == 1200);
        assert(cfg.risk.vol_risk_adjust);
        assert(cfg.risk.risk_per_trade_pct == 0.4);
        assert(cfg.risk.equity_usd == 5000.0);
        assert(cfg.walk_forward.learning_rate == 0.03);
        assert(cfg.initial_learning_rate == 0.03);
        assert(cfg.walk_forward.epochs == 5);
        assert(cfg.initial_epochs == 5);
        assert(cfg.model_seed == 1234);
        assert(cfg.model_state_path == "/tmp/model.json");
        assert(config.getLogLevel() == "warn");

        clearEnvironment();
    }

    {
        // malformed values keep the previous setting
        setenv("BUY_THRESHOLD", "abc", 1);
        setenv("WALK_FORWARD_CANDLES", "12x", 1);
        setenv("USE_MA_FILTER", "maybe", 1);
        setenv("MODEL_SEED", "seed", 1);

        Config config;
        config.applyEnvironment();
        const auto cfg = config.getEngineConfig();
        assert(cfg.thresholds.buy_threshold == 0.55);
        assert(cfg.walk_forward.refit_every_candles == 0);
        assert(cfg.thresholds.use_ma_filter);
        assert(cfg.model_seed == 0);

        clearEnvironment();
    }

    {
        // inverted or out-of-range thresholds fall back to 0.55/0.45
        setenv("BUY_THRESHOLD", "0.40", 1);
        setenv("SELL_THRESHOLD", "0.60", 1);
        Config inverted;
        inverted.applyEnvironment();
        assert(inverted.getThresholds().buy_threshold == 0.55);
        assert(inverted.getThresholds().sell_threshold == 0.45);
        clearEnvironment();

        setenv("BUY_THRESHOLD", "1.5", 1);
        Config out_of_range;
        out_of_range.applyEnvironment();
        assert(out_of_range.getThresholds().buy_threshold == 0.55);
        assert(out_of_range.getThresholds().sell_threshold == 0.45);
        clearEnvironment();

        Config equal;
        equal.loadJson(nlohmann::json::parse(R"({"strategy": {"buy_threshold": 0.5, "sell_threshold": 0.5}})"));
        assert(equal.getThresholds().buy_threshold == 0.55);
        assert(equal.getThresholds().sell_threshold == 0.45);
    }

    {
        Config config;
        config.loadJson(nlohmann::json::parse(R"({"risk": {"high_vol_factor": 0.0, "risk_per_trade_pct": -1}})"));
        const auto cfg = config.getEngineConfig();
        assert(cfg.risk.high_vol_factor == 0.6);
        assert(cfg.risk.risk_per_trade_pct == 0.25);
    }

    {
        // non-finite sizing inputs never survive loading
        setenv("USD_EQUITY", "nan", 1);
        setenv("RISK_PER_TRADE_PCT", "inf", 1);
        Config config;
        config.applyEnvironment();
        const auto cfg = config.getEngineConfig();
        assert(cfg.risk.equity_usd == 1000.0);
        assert(cfg.risk.risk_per_trade_pct == 0.25);
        clearEnvironment();

        Config negative_equity;
        negative_equity.loadJson(nlohmann::json::parse(R"({"risk": {"equity_usd": -5}})"));
        assert(negative_equity.getEngineConfig().risk.equity_usd == 1000.0);
    }

    {
        // a malformed LEARNING_RATE/TRAIN_EPOCHS leaves the file's boot-fit settings alone
        setenv("LEARNING_RATE", "fast", 1);
        setenv("TRAIN_EPOCHS", "many", 1);
        Config config;
        config.loadJson(nlohmann::json::parse(R"({
            "model": {"learning_rate": 0.02, "epochs": 6},
            "walk_forward": {"learning_rate": 0.01, "epochs": 2}
        })"));
        config.applyEnvironment();
        const auto cfg = config.getEngineConfig();
        assert(cfg.initial_learning_rate == 0.02);
        assert(cfg.initial_epochs == 6);
        assert(cfg.walk_forward.learning_rate == 0.01);
        assert(cfg.walk_forward.epochs == 2);
        clearEnvironment();
    }

    {
        Config upper;
        upper.loadJson(nlohmann::json::parse(R"({"logging": {"level": "INFO"}})"));
        assert(upper.getLogLevel() == "info");

        Config typo;
        typo.loadJson(nlohmann::json::parse(R"({"logging": {"level": "debgu"}})"));
        assert(typo.getLogLevel() == "info");

        setenv("LOG_LEVEL", "verbose", 1);
        Config env_typo;
        env_typo.loadJson(nlohmann::json::parse(R"({"logging": {"level": "Debug"}})"));
        env_typo.applyEnvironment();
        assert(env_typo.getLogLevel() == "debug");
        clearEnvironment();
    }

    std::cout << "[TEST] Config PASSED\n";
    return 0;
}
