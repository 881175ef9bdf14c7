#pragma once

#include "core/contracts/ITrendGate.h"

namespace microtrend {
namespace analytics {

// Fast/slow EMA turn detector used as the moving-average filter.
// Compares the EMA spread now, two and three candles back:
//   LowBottom / PriceDownGoingUp -> bullish
//   HighPeak  / PriceUpGoingDown -> bearish
class EmaCrossTrendGate : public core::ITrendGate {
public:
    explicit EmaCrossTrendGate(int fast_period = 4, int slow_period = 8);

    core::TrendConfirmation evaluate(const std::vector<Candle>& candles) const override;

private:
    int fast_period_;
    int slow_period_;
};

} // namespace analytics
} // namespace microtrend
