#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace microtrend {
namespace core {

// Fire-and-forget observability hooks. Implementations must not block.
class IMetricsSink {
public:
    virtual ~IMetricsSink() = default;

    virtual void onDecision(DecisionKind kind) = 0;
    virtual void onRefit() = 0;
    virtual void setRiskFactor(double factor) = 0;
    virtual void setModelMode(engine::ModelMode mode) = 0;
};

} // namespace core
} // namespace microtrend
