#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <limits>

namespace microtrend {
namespace analytics {

std::vector<double> TechnicalIndicators::calculateSMASeries(
    const std::vector<double>& prices,
    int period
) {
    std::vector<double> out(prices.size(), std::numeric_limits<double>::quiet_NaN());
    if (period <= 0) return out;

    double sum = 0.0;
    for (size_t i = 0; i < prices.size(); ++i) {
        sum += prices[i];
        if (i >= static_cast<size_t>(period)) {
            sum -= prices[i - period];
        }
        if (i + 1 >= static_cast<size_t>(period)) {
            out[i] = sum / period;
        }
    }
    return out;
}

std::vector<double> TechnicalIndicators::calculateEMASeries(
    const std::vector<double>& prices,
    int period
) {
    std::vector<double> out(prices.size(), std::numeric_limits<double>::quiet_NaN());
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return out;

    const double multiplier = 2.0 / (period + 1.0);

    // SMA seed
    double ema = 0.0;
    for (int i = 0; i < period; ++i) ema += prices[i];
    ema /= period;
    out[period - 1] = ema;

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        out[i] = ema;
    }
    return out;
}

// Wilder's smoothing: simple average over the first `period` changes, then
// avg = (avg * (period - 1) + current) / period
std::vector<double> TechnicalIndicators::calculateRSISeries(
    const std::vector<double>& prices,
    int period
) {
    std::vector<double> out(prices.size(), 0.0);
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) return out;

    auto rsiFrom = [](double avg_gain, double avg_loss) {
        if (avg_loss <= 0.0) {
            return avg_gain > 0.0 ? 100.0 : 50.0;
        }
        const double rs = avg_gain / avg_loss;
        return 100.0 - (100.0 / (1.0 + rs));
    };

    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (int i = 1; i <= period; ++i) {
        const double change = prices[i] - prices[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss -= change;
    }
    avg_gain /= period;
    avg_loss /= period;
    out[period] = rsiFrom(avg_gain, avg_loss);

    for (size_t i = period + 1; i < prices.size(); ++i) {
        const double change = prices[i] - prices[i - 1];
        const double gain = (change > 0) ? change : 0.0;
        const double loss = (change < 0) ? -change : 0.0;
        avg_gain = ((avg_gain * (period - 1)) + gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + loss) / period;
        out[i] = rsiFrom(avg_gain, avg_loss);
    }
    return out;
}

std::vector<double> TechnicalIndicators::calculateZScoreSeries(
    const std::vector<double>& prices,
    int period
) {
    std::vector<double> out(prices.size(), 0.0);
    if (period <= 1) return out;

    double sum = 0.0;
    double sum_sq = 0.0;
    for (size_t i = 0; i < prices.size(); ++i) {
        const double x = prices[i];
        sum += x;
        sum_sq += x * x;
        if (i >= static_cast<size_t>(period)) {
            const double y = prices[i - period];
            sum -= y;
            sum_sq -= y * y;
        }
        if (i + 1 >= static_cast<size_t>(period)) {
            const double mean = sum / period;
            const double variance = (sum_sq / period) - (mean * mean);
            // floor keeps flat windows finite
            const double std_dev = std::sqrt(std::max(variance, 1e-12));
            out[i] = (x - mean) / std_dev;
        }
    }
    return out;
}

std::vector<double> TechnicalIndicators::calculateRollingStdSeries(
    const std::vector<double>& prices,
    int period
) {
    std::vector<double> out(prices.size(), 0.0);
    if (period <= 1) return out;

    for (size_t i = 0; i < prices.size(); ++i) {
        if (i + 1 < static_cast<size_t>(period)) continue;

        const size_t start = i + 1 - period;
        double mean = 0.0;
        for (size_t k = start; k <= i; ++k) mean += prices[k];
        mean /= period;

        double sq = 0.0;
        for (size_t k = start; k <= i; ++k) {
            const double d = prices[k] - mean;
            sq += d * d;
        }
        out[i] = std::sqrt(sq / period);
    }
    return out;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());

    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }

    return prices;
}

} // namespace analytics
} // namespace microtrend
