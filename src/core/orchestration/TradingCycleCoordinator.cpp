#include "core/orchestration/TradingCycleCoordinator.h"
#include "common/Logger.h"
#include "model/FeatureExtractor.h"

namespace microtrend {
namespace core {

TradingCycleCoordinator::TradingCycleCoordinator(
    std::shared_ptr<model::SignalModel> model,
    std::shared_ptr<engine::ThresholdDecisionEngine> decision_engine,
    std::shared_ptr<risk::RiskSizer> risk_sizer,
    std::shared_ptr<model::WalkForwardScheduler> scheduler,
    std::shared_ptr<IMetricsSink> metrics,
    std::shared_ptr<IOrderSink> order_sink
)
    : model_(std::move(model))
    , decision_engine_(std::move(decision_engine))
    , risk_sizer_(std::move(risk_sizer))
    , scheduler_(std::move(scheduler))
    , metrics_(std::move(metrics))
    , order_sink_(std::move(order_sink)) {}

double TradingCycleCoordinator::predictLatest(const std::vector<Candle>& candles) const {
    const auto features = model::FeatureExtractor::latestFeatures(candles);
    if (!model_ || !model::FeatureExtractor::isFinite(features)) {
        return 0.5;
    }
    return model_->predict(features);
}

CycleOutcome TradingCycleCoordinator::runCycle(const std::vector<Candle>& candles, Timestamp now) {
    CycleOutcome out;
    cycles_++;

    if (scheduler_) {
        out.refit_triggered = scheduler_->onCandle(candles, now);
    }

    if (candles.size() < kMinDecisionCandles || !decision_engine_) {
        out.decision.kind = DecisionKind::FLAT;
        out.decision.reason = "not_enough_data";
    } else {
        out.decision = decision_engine_->decide(predictLatest(candles), candles);
    }

    if (risk_sizer_) {
        out.risk_factor = risk_sizer_->computeFactor(candles);
        out.risk_pct = risk_sizer_->effectiveRiskPct(out.risk_factor);
        out.notional = risk_sizer_->positionNotional(risk_sizer_->equity(), out.risk_factor);
    }

    if (metrics_) {
        metrics_->onDecision(out.decision.kind);
        metrics_->setRiskFactor(out.risk_factor);
    }

    LOG_DEBUG("cycle #{}: {} ({}) factor={:.2f}",
              cycles_.load(), toString(out.decision.kind), out.decision.reason, out.risk_factor);

    if (out.decision.kind != DecisionKind::FLAT && order_sink_ && !candles.empty()) {
        OrderIntent intent;
        intent.side = (out.decision.kind == DecisionKind::BUY) ? OrderSide::BUY : OrderSide::SELL;
        intent.price = candles.back().close;
        intent.probability = out.decision.probability;
        intent.confidence = out.decision.confidence;
        intent.risk_factor = out.risk_factor;
        intent.risk_pct = out.risk_pct;
        intent.notional = out.notional;
        intent.timestamp = candles.back().timestamp;
        out.order_submitted = order_sink_->submit(intent);
        if (!out.order_submitted) {
            LOG_WARN("Order sink refused {} intent", toString(out.decision.kind));
        }
    }

    return out;
}

} // namespace core
} // namespace microtrend
