#include "analytics/EmaCrossTrendGate.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <cmath>

namespace microtrend {
namespace analytics {

EmaCrossTrendGate::EmaCrossTrendGate(int fast_period, int slow_period)
    : fast_period_(fast_period)
    , slow_period_(slow_period) {}

core::TrendConfirmation EmaCrossTrendGate::evaluate(const std::vector<Candle>& candles) const {
    core::TrendConfirmation out;
    if (candles.size() < 4) {
        return out;
    }

    const auto closes = TechnicalIndicators::extractClosePrices(candles);
    const auto fast_ema = TechnicalIndicators::calculateEMASeries(closes, fast_period_);
    const auto slow_ema = TechnicalIndicators::calculateEMASeries(closes, slow_period_);

    const size_t i = closes.size() - 1;
    const double fast = fast_ema[i];
    const double slow = slow_ema[i];
    const double fast2 = fast_ema[i - 2];
    const double slow2 = slow_ema[i - 2];
    const double fast3 = fast_ema[i - 3];
    const double slow3 = slow_ema[i - 3];

    if (std::isnan(fast) || std::isnan(slow) || std::isnan(fast3) || std::isnan(slow3) ||
        std::isnan(fast2) || std::isnan(slow2)) {
        return out;
    }

    // spread widening then narrowing while still on the same side = turning point
    const bool high_peak = (slow3 < fast3) &&
                           (slow2 - fast2 > slow3 - fast3) &&
                           (slow - fast < slow2 - fast2) &&
                           (slow < fast);
    const bool price_down_going_up = (slow > fast) &&
                                     (slow - fast < slow3 - fast3) &&
                                     (slow3 > fast3);
    const bool low_bottom = (fast3 < slow3) &&
                            (fast2 - slow2 > fast3 - slow3) &&
                            (fast - slow < fast2 - slow2) &&
                            (fast < slow);
    const bool price_up_going_down = (fast > slow) &&
                                     (fast - slow < fast3 - slow3) &&
                                     (fast3 > slow3);

    if (low_bottom) {
        out.bullish = true;
        out.pattern = "low_bottom";
    } else if (high_peak) {
        out.bearish = true;
        out.pattern = "high_peak";
    } else if (price_down_going_up) {
        out.bullish = true;
        out.pattern = "price_down_going_up";
    } else if (price_up_going_down) {
        out.bearish = true;
        out.pattern = "price_up_going_down";
    }

    if (!out.pattern.empty()) {
        LOG_DEBUG("MA gate {}: ema{}={:.2f} ema{}={:.2f}",
                  out.pattern, fast_period_, fast, slow_period_, slow);
    }
    return out;
}

} // namespace analytics
} // namespace microtrend
