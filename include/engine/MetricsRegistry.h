#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "core/contracts/IMetricsSink.h"

namespace microtrend {
namespace engine {

// In-process counters and gauges, rendered in Prometheus text exposition format.
// Writers only touch atomics so the decision and training paths never wait on a scrape.
class MetricsRegistry : public core::IMetricsSink {
public:
    void onDecision(DecisionKind kind) override;
    void onRefit() override;
    void setRiskFactor(double factor) override;
    void setModelMode(ModelMode mode) override;

    std::uint64_t decisionCount(DecisionKind kind) const;
    std::uint64_t refitCount() const { return walk_forward_fits_.load(); }
    double riskFactor() const { return vol_risk_factor_.load(); }
    int modelModeGauge(ModelMode mode) const;

    std::string exportPrometheusMetrics() const;

private:
    std::atomic<std::uint64_t> decisions_buy_{0};
    std::atomic<std::uint64_t> decisions_sell_{0};
    std::atomic<std::uint64_t> decisions_flat_{0};
    std::atomic<std::uint64_t> walk_forward_fits_{0};
    std::atomic<double> vol_risk_factor_{1.0};
    std::atomic<bool> extended_mode_{false};  // drives both bot_model_mode series
};

} // namespace engine
} // namespace microtrend
