#include "core/orchestration/TradingCycleCoordinator.h"
#include "core/execution/PaperOrderSink.h"
#include "engine/MetricsRegistry.h"
#include "CandleFixtures.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>

using namespace microtrend;

namespace {

engine::DecisionThresholds unfiltered() {
    engine::DecisionThresholds t;
    t.use_ma_filter = false;
    return t;
}

Timestamp nowFor(const std::vector<Candle>& candles) {
    return Timestamp(std::chrono::milliseconds(candles.back().timestamp));
}

} // namespace

int main() {
    const auto candles = testing::waveCandles(80);

    {
        // bias 2 -> pUp = sigmoid(2 + w.x) with w = 0
        auto signal_model = std::make_shared<model::SignalModel>(model::ModelState{{0.0, 0.0, 0.0, 0.0}, 2.0});
        auto decisions = std::make_shared<engine::ThresholdDecisionEngine>(unfiltered());
        auto sizer = std::make_shared<risk::RiskSizer>(engine::RiskSizingConfig{});
        auto metrics = std::make_shared<engine::MetricsRegistry>();
        auto orders = std::make_shared<core::PaperOrderSink>();

        core::TradingCycleCoordinator coordinator(signal_model, decisions, sizer, nullptr, metrics, orders);

        const auto out = coordinator.runCycle(candles, nowFor(candles));
        assert(out.decision.kind == DecisionKind::BUY);
        assert(testing::near(out.decision.probability, model::SignalModel::sigmoid(2.0)));
        assert(out.risk_factor == 1.0);
        assert(testing::near(out.risk_pct, 0.25));
        assert(testing::near(out.notional, 2.5));
        assert(out.order_submitted);
        assert(!out.refit_triggered);

        const auto last = orders->last();
        assert(last.has_value());
        assert(last->side == OrderSide::BUY);
        assert(last->price == candles.back().close);
        assert(last->timestamp == candles.back().timestamp);
        assert(testing::near(last->notional, 2.5));

        assert(metrics->decisionCount(DecisionKind::BUY) == 1);
        assert(metrics->riskFactor() == 1.0);
        assert(coordinator.cycleCount() == 1);
    }

    {
        auto signal_model = std::make_shared<model::SignalModel>(model::ModelState{{0.0, 0.0, 0.0, 0.0}, -2.0});
        auto decisions = std::make_shared<engine::ThresholdDecisionEngine>(unfiltered());
        engine::RiskSizingConfig risk_cfg;
        risk_cfg.vol_risk_adjust = true;
        auto sizer = std::make_shared<risk::RiskSizer>(risk_cfg);
        auto metrics = std::make_shared<engine::MetricsRegistry>();
        auto orders = std::make_shared<core::PaperOrderSink>();

        core::TradingCycleCoordinator coordinator(signal_model, decisions, sizer, nullptr, metrics, orders);

        // std20 / close ~ 3%: high-volatility band
        const auto volatile_candles = testing::alternatingCandles(60, 3.0);
        const auto out = coordinator.runCycle(volatile_candles, nowFor(volatile_candles));
        assert(out.decision.kind == DecisionKind::SELL);
        assert(out.risk_factor == 0.6);
        assert(testing::near(out.risk_pct, 0.15));
        assert(testing::near(out.notional, 1.5));
        assert(metrics->riskFactor() == 0.6);
        assert(orders->last()->side == OrderSide::SELL);
    }

    {
        // under 40 candles: FLAT, nothing submitted
        auto signal_model = std::make_shared<model::SignalModel>(model::ModelState{{0.0, 0.0, 0.0, 0.0}, 5.0});
        auto decisions = std::make_shared<engine::ThresholdDecisionEngine>(unfiltered());
        auto sizer = std::make_shared<risk::RiskSizer>(engine::RiskSizingConfig{});
        auto metrics = std::make_shared<engine::MetricsRegistry>();
        auto orders = std::make_shared<core::PaperOrderSink>();

        core::TradingCycleCoordinator coordinator(signal_model, decisions, sizer, nullptr, metrics, orders);

        const auto few = testing::waveCandles(39);
        const auto out = coordinator.runCycle(few, nowFor(few));
        assert(out.decision.kind == DecisionKind::FLAT);
        assert(out.decision.reason == "not_enough_data");
        assert(!out.order_submitted);
        assert(orders->submitted().empty());
        assert(metrics->decisionCount(DecisionKind::FLAT) == 1);
    }

    {
        // walk-forward refit runs before the decision on the same candle
        auto signal_model = std::make_shared<model::SignalModel>(model::ModelState{{0.0, 0.0, 0.0, 0.0}, 0.0});
        auto metrics = std::make_shared<engine::MetricsRegistry>();
        engine::WalkForwardConfig wf;
        wf.refit_every_candles = 1;
        auto scheduler = std::make_shared<model::WalkForwardScheduler>(signal_model, wf, metrics);
        auto decisions = std::make_shared<engine::ThresholdDecisionEngine>(unfiltered());
        auto sizer = std::make_shared<risk::RiskSizer>(engine::RiskSizingConfig{});

        core::TradingCycleCoordinator coordinator(signal_model, decisions, sizer, scheduler, metrics);

        const auto out = coordinator.runCycle(candles, nowFor(candles));
        assert(out.refit_triggered);
        assert(scheduler->refitCount() == 1);
        assert(metrics->refitCount() == 1);

        const auto features = model::FeatureExtractor::latestFeatures(candles);
        assert(testing::near(out.decision.probability, signal_model->predict(features)));
        assert(!out.order_submitted);
    }

    {
        core::PaperOrderSink sink;
        core::OrderIntent empty;
        empty.price = 100.0;
        const bool accepted = sink.submit(empty);
        assert(!accepted);
        assert(!sink.last().has_value());
    }

    {
        // NaN sizing is refused by the paper sink
        auto signal_model = std::make_shared<model::SignalModel>(model::ModelState{{0.0, 0.0, 0.0, 0.0}, 5.0});
        auto decisions = std::make_shared<engine::ThresholdDecisionEngine>(unfiltered());
        engine::RiskSizingConfig risk_cfg;
        risk_cfg.equity_usd = std::numeric_limits<double>::quiet_NaN();
        auto sizer = std::make_shared<risk::RiskSizer>(risk_cfg);
        auto orders = std::make_shared<core::PaperOrderSink>();

        core::TradingCycleCoordinator coordinator(signal_model, decisions, sizer, nullptr, nullptr, orders);

        const auto wave = testing::waveCandles(60);
        const auto out = coordinator.runCycle(wave, nowFor(wave));
        assert(out.decision.kind == DecisionKind::BUY);
        assert(std::isnan(out.notional));
        assert(!out.order_submitted);
        assert(orders->submitted().empty());

        core::OrderIntent nan_price;
        nan_price.price = std::numeric_limits<double>::quiet_NaN();
        nan_price.notional = 2.5;
        const bool accepted = orders->submit(nan_price);
        assert(!accepted);
    }

    std::cout << "[TEST] TradingCycleCoordinator PASSED\n";
    return 0;
}
