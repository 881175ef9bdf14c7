#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace microtrend {
namespace core {

struct TrendConfirmation {
    bool bullish = false;   // confirms BUY
    bool bearish = false;   // confirms SELL
    std::string pattern;    // which pattern fired, empty if none
};

class ITrendGate {
public:
    virtual ~ITrendGate() = default;

    virtual TrendConfirmation evaluate(const std::vector<Candle>& candles) const = 0;
};

} // namespace core
} // namespace microtrend
