#pragma once

#include <vector>

#include "common/Types.h"

namespace microtrend {
namespace core {

// Relative volatility of the most recent candles (e.g. 0.01 == 1% of price)
class IVolatilityEstimator {
public:
    virtual ~IVolatilityEstimator() = default;

    virtual double relativeVolatility(const std::vector<Candle>& candles) const = 0;
};

} // namespace core
} // namespace microtrend
