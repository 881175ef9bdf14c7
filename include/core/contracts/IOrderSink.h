#pragma once

#include "common/Types.h"

namespace microtrend {
namespace core {

struct OrderIntent {
    OrderSide side = OrderSide::BUY;
    double price = 0.0;            // close of the deciding candle
    double probability = 0.5;      // pUp that produced the decision
    double confidence = 0.5;
    double risk_factor = 1.0;
    double risk_pct = 0.0;         // effective percent of equity at risk
    double notional = 0.0;         // equity * risk_pct / 100
    long long timestamp = 0;
};

// Order execution lives outside the decision core
class IOrderSink {
public:
    virtual ~IOrderSink() = default;

    virtual bool submit(const OrderIntent& intent) = 0;
};

} // namespace core
} // namespace microtrend
