#include "common/Logger.h"
#include "common/Config.h"
#include "analytics/EmaCrossTrendGate.h"
#include "core/execution/PaperOrderSink.h"
#include "core/orchestration/TradingCycleCoordinator.h"
#include "core/state/ModelStateStoreJson.h"
#include "data/CandleHistory.h"
#include "engine/MetricsRegistry.h"
#include "engine/ThresholdDecisionEngine.h"
#include "model/FeatureExtractor.h"
#include "model/SeedProvider.h"
#include "model/SignalModel.h"
#include "model/WalkForwardScheduler.h"
#include "risk/RiskSizer.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace microtrend;

namespace {

std::atomic<bool> g_stop_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_requested = true;
    }
}

struct CliOptions {
    std::string config_path = "config/config.json";
    std::string replay_path;
    size_t warmup_candles = 350;
    size_t metrics_every = 500;
};

void printUsage() {
    std::cout << "usage: microtrend --replay <candles.csv|candles.json> [--config <path>]\n"
              << "                  [--warmup <n>] [--metrics-every <n>]\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--config") {
            if (!next(opts.config_path)) return false;
        } else if (arg == "--replay") {
            if (!next(opts.replay_path)) return false;
        } else if (arg == "--warmup" || arg == "--metrics-every") {
            if (!next(value)) return false;
            try {
                const auto n = static_cast<size_t>(std::stoul(value));
                if (arg == "--warmup") opts.warmup_candles = n;
                else opts.metrics_every = n;
            } catch (const std::exception&) {
                std::cerr << "invalid number for " << arg << ": " << value << "\n";
                return false;
            }
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else {
            std::cerr << "unknown argument: " << arg << "\n";
            return false;
        }
    }
    return !opts.replay_path.empty();
}

std::vector<Candle> loadCandles(const std::string& path) {
    const auto ext = std::filesystem::path(path).extension().string();
    if (ext == ".json") {
        return data::CandleHistory::loadJSON(path);
    }
    return data::CandleHistory::loadCSV(path);
}

Timestamp candleTime(const Candle& c) {
    return Timestamp(std::chrono::milliseconds(c.timestamp));
}

std::shared_ptr<model::SignalModel> buildModel(
    const engine::EngineConfig& cfg,
    const std::shared_ptr<core::IModelStateStore>& store
) {
    if (store) {
        if (auto snapshot = store->load()) {
            if (snapshot->state.weights.size() == model::FeatureExtractor::kFeatureCount) {
                LOG_INFO("Model warm start from {} (saved_at_ms={}, refits={})",
                         cfg.model_state_path, snapshot->saved_at_ms, snapshot->refit_count);
                return std::make_shared<model::SignalModel>(snapshot->state);
            }
            LOG_WARN("Ignoring persisted model: {} weights, expected {}",
                     snapshot->state.weights.size(), model::FeatureExtractor::kFeatureCount);
        }
    }

    if (cfg.model_seed != 0) {
        model::FixedSeedProvider seeds(cfg.model_seed);
        LOG_INFO("Model initialized with fixed seed {}", cfg.model_seed);
        return std::make_shared<model::SignalModel>(seeds);
    }
    model::ClockSeedProvider seeds;
    return std::make_shared<model::SignalModel>(seeds);
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 2;
    }

    try {
        Config config;
        config.load(opts.config_path);
        const engine::EngineConfig cfg = config.getEngineConfig();

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        auto metrics = std::make_shared<engine::MetricsRegistry>();
        if (cfg.model_mode == engine::ModelMode::EXTENDED) {
            LOG_WARN("MODEL_MODE=extended requested but no extended model is available; using baseline");
        }
        metrics->setModelMode(engine::ModelMode::BASELINE);

        std::shared_ptr<core::IModelStateStore> store;
        if (!cfg.model_state_path.empty()) {
            store = std::make_shared<core::ModelStateStoreJson>(cfg.model_state_path);
        }

        auto candles = loadCandles(opts.replay_path);
        if (candles.size() <= opts.warmup_candles) {
            LOG_ERROR("Replay needs more than {} candles, got {}", opts.warmup_candles, candles.size());
            return 1;
        }

        auto signal_model = buildModel(cfg, store);

        std::vector<Candle> history(candles.begin(), candles.begin() + opts.warmup_candles);
        const auto boot = signal_model->fit(history, cfg.initial_learning_rate, cfg.initial_epochs);
        if (boot.applied) {
            LOG_INFO("Boot fit: samples={}, epochs={}", boot.samples, boot.epochs);
        } else {
            LOG_WARN("Boot fit skipped: {} warm-up candles", history.size());
        }

        auto scheduler = std::make_shared<model::WalkForwardScheduler>(signal_model, cfg.walk_forward, metrics, store);
        auto decision_engine = std::make_shared<engine::ThresholdDecisionEngine>(
            cfg.thresholds, std::make_shared<analytics::EmaCrossTrendGate>());
        auto sizer = std::make_shared<risk::RiskSizer>(cfg.risk);
        auto orders = std::make_shared<core::PaperOrderSink>();

        core::TradingCycleCoordinator coordinator(signal_model, decision_engine, sizer, scheduler, metrics, orders);

        const size_t max_history = cfg.walk_forward.window_candles > 0
            ? std::max(static_cast<size_t>(cfg.walk_forward.window_candles), opts.warmup_candles)
            : candles.size();

        LOG_INFO("Replay: {} candles, warm-up {}, thresholds {}/{}, ma_filter={}, walk-forward={}",
                 candles.size(), opts.warmup_candles,
                 cfg.thresholds.buy_threshold, cfg.thresholds.sell_threshold,
                 cfg.thresholds.use_ma_filter ? "on" : "off",
                 scheduler->isEnabled() ? "on" : "off");

        for (size_t i = opts.warmup_candles; i < candles.size() && !g_stop_requested; ++i) {
            history.push_back(candles[i]);
            if (history.size() > max_history) {
                history.erase(history.begin(), history.begin() + (history.size() - max_history));
            }

            const auto outcome = coordinator.runCycle(history, candleTime(candles[i]));
            if (outcome.decision.kind != DecisionKind::FLAT) {
                LOG_INFO("{} @ {:.2f} conf={:.3f} | {}",
                         toString(outcome.decision.kind), candles[i].close,
                         outcome.decision.confidence, outcome.decision.reason);
            }

            if (opts.metrics_every > 0 && coordinator.cycleCount() % opts.metrics_every == 0) {
                LOG_INFO("metrics\n{}", metrics->exportPrometheusMetrics());
            }
        }

        if (g_stop_requested) {
            LOG_INFO("Stop requested, replay interrupted");
        }

        const auto state = signal_model->snapshot();
        LOG_INFO("Replay done: cycles={}, BUY={}, SELL={}, FLAT={}, refits={} (skipped {}), orders={}",
                 coordinator.cycleCount(),
                 metrics->decisionCount(DecisionKind::BUY),
                 metrics->decisionCount(DecisionKind::SELL),
                 metrics->decisionCount(DecisionKind::FLAT),
                 scheduler->refitCount(), scheduler->skippedRefitCount(),
                 orders->submitted().size());
        LOG_INFO("Final weights [{:.6f}, {:.6f}, {:.6f}, {:.6f}] bias={:.6f}",
                 state.weights.size() > 0 ? state.weights[0] : 0.0,
                 state.weights.size() > 1 ? state.weights[1] : 0.0,
                 state.weights.size() > 2 ? state.weights[2] : 0.0,
                 state.weights.size() > 3 ? state.weights[3] : 0.0,
                 state.bias);
        LOG_INFO("metrics\n{}", metrics->exportPrometheusMetrics());

        spdlog::shutdown();
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
