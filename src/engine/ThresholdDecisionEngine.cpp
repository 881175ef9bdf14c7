#include "engine/ThresholdDecisionEngine.h"

#include <cstdio>

namespace microtrend {
namespace engine {

namespace {
std::string formatReason(double p, const DecisionThresholds& t, const core::TrendConfirmation& trend) {
    char buf[160];
    std::snprintf(buf, sizeof(buf), "pUp=%.5f buy>=%.2f sell<=%.2f ma_filter=%s gate=%s",
                  p, t.buy_threshold, t.sell_threshold,
                  t.use_ma_filter ? "on" : "off",
                  trend.pattern.empty() ? "none" : trend.pattern.c_str());
    return buf;
}
}

ThresholdDecisionEngine::ThresholdDecisionEngine(
    DecisionThresholds thresholds,
    std::shared_ptr<core::ITrendGate> trend_gate
)
    : thresholds_(thresholds)
    , trend_gate_(std::move(trend_gate)) {}

Decision ThresholdDecisionEngine::decide(double probability, const std::vector<Candle>& candles) const {
    core::TrendConfirmation trend;
    if (thresholds_.use_ma_filter && trend_gate_) {
        trend = trend_gate_->evaluate(candles);
    }
    return decide(probability, trend);
}

Decision ThresholdDecisionEngine::decide(double probability, const core::TrendConfirmation& trend) const {
    Decision d;
    d.probability = probability;
    d.reason = formatReason(probability, thresholds_, trend);

    const bool filter = thresholds_.use_ma_filter;
    if (probability >= thresholds_.buy_threshold && (!filter || trend.bullish)) {
        d.kind = DecisionKind::BUY;
        d.confidence = probability;
        return d;
    }
    if (probability <= thresholds_.sell_threshold && (!filter || trend.bearish)) {
        d.kind = DecisionKind::SELL;
        d.confidence = 1.0 - probability;
        return d;
    }

    d.kind = DecisionKind::FLAT;
    d.confidence = 0.5;
    return d;
}

} // namespace engine
} // namespace microtrend
