#pragma once

#include <memory>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/ITrendGate.h"
#include "engine/EngineConfig.h"

namespace microtrend {
namespace engine {

struct Decision {
    DecisionKind kind = DecisionKind::FLAT;
    double probability = 0.5;   // pUp that produced the decision
    double confidence = 0.5;    // p for BUY, 1 - p for SELL, 0.5 for FLAT
    std::string reason;
};

// p >= buy -> BUY, p <= sell -> SELL, otherwise FLAT.
// With the MA filter on, BUY/SELL also need the trend gate's confirmation.
class ThresholdDecisionEngine {
public:
    explicit ThresholdDecisionEngine(
        DecisionThresholds thresholds,
        std::shared_ptr<core::ITrendGate> trend_gate = nullptr
    );

    // Evaluates the trend gate on `candles` only when the filter needs it
    Decision decide(double probability, const std::vector<Candle>& candles) const;

    // Pure threshold rule against an already computed confirmation
    Decision decide(double probability, const core::TrendConfirmation& trend) const;

private:
    const DecisionThresholds thresholds_;
    std::shared_ptr<core::ITrendGate> trend_gate_;
};

} // namespace engine
} // namespace microtrend
