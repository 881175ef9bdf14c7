#pragma once

#include <cstdint>
#include <string>

namespace microtrend {
namespace engine {

// Prediction path selector. Only the baseline micro-model ships; "extended" is
// accepted for dashboard compatibility and falls back to baseline.
enum class ModelMode {
    BASELINE,
    EXTENDED
};

inline const char* toString(ModelMode mode) {
    return mode == ModelMode::EXTENDED ? "extended" : "baseline";
}

// Decision thresholds, built once at startup and never mutated afterwards
struct DecisionThresholds {
    double buy_threshold = 0.55;
    double sell_threshold = 0.45;
    bool use_ma_filter = true;
};

struct WalkForwardConfig {
    int interval_minutes = 0;        // 0 = no time trigger
    int refit_every_candles = 0;     // 0 = no candle-count trigger
    int window_candles = 5000;       // rolling window handed to fit()
    double learning_rate = 0.05;
    int epochs = 4;
};

struct RiskSizingConfig {
    bool vol_risk_adjust = false;
    double risk_per_trade_pct = 0.25;   // percent of equity
    double equity_usd = 1000.0;

    // relative volatility bands (std20 / close)
    double high_vol_threshold = 0.02;
    double elevated_vol_threshold = 0.01;
    double low_vol_threshold = 0.004;
    double high_vol_factor = 0.6;
    double elevated_vol_factor = 0.8;
    double low_vol_factor = 1.2;
};

struct EngineConfig {
    DecisionThresholds thresholds;
    WalkForwardConfig walk_forward;
    RiskSizingConfig risk;
    ModelMode model_mode = ModelMode::BASELINE;

    // boot-time training on the warm-up history
    double initial_learning_rate = 0.05;
    int initial_epochs = 4;

    std::uint64_t model_seed = 0;    // 0 = seed from the clock
    std::string model_state_path;    // empty = no persistence
};

} // namespace engine
} // namespace microtrend
