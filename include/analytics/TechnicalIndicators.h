#pragma once

#include <vector>
#include "common/Types.h"

namespace microtrend {
namespace analytics {

// Technical Indicators
// Every *Series function returns a vector aligned to its input (out[i] belongs
// to prices[i]); positions without a full look-back are filled as documented.
class TechnicalIndicators {
public:
    // Simple moving average. NaN before index period-1.
    static std::vector<double> calculateSMASeries(const std::vector<double>& prices, int period);

    // EMA seeded with the SMA of the first `period` prices. NaN before index period-1.
    static std::vector<double> calculateEMASeries(const std::vector<double>& prices, int period);

    // RSI with Wilder's smoothing, range [0, 100]. 0 before index `period`.
    static std::vector<double> calculateRSISeries(const std::vector<double>& prices, int period = 14);

    // Rolling z-score of price against its trailing mean. 0 before index period-1.
    static std::vector<double> calculateZScoreSeries(const std::vector<double>& prices, int period = 20);

    // Rolling population standard deviation. 0 before index period-1.
    static std::vector<double> calculateRollingStdSeries(const std::vector<double>& prices, int period = 20);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
};

} // namespace analytics
} // namespace microtrend
