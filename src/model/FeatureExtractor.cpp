#include "model/FeatureExtractor.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>

namespace microtrend {
namespace model {

using analytics::TechnicalIndicators;

FeatureVector FeatureExtractor::computeFeatures(const std::vector<Candle>& candles, size_t i) {
    if (i < kMinIndex || i >= candles.size()) {
        return {};
    }

    const auto closes = TechnicalIndicators::extractClosePrices(candles);
    const auto rsi = TechnicalIndicators::calculateRSISeries(closes, kRsiPeriod);
    const auto zscore = TechnicalIndicators::calculateZScoreSeries(closes, kZScorePeriod);
    return featuresAt(closes, rsi, zscore, i);
}

FeatureVector FeatureExtractor::latestFeatures(const std::vector<Candle>& candles) {
    if (candles.empty()) {
        return {};
    }
    return computeFeatures(candles, candles.size() - 1);
}

TrainingSet FeatureExtractor::buildDataset(const std::vector<Candle>& candles) {
    TrainingSet set;
    if (candles.size() < kMinIndex + 2) {
        return set;
    }

    const auto closes = TechnicalIndicators::extractClosePrices(candles);
    const auto rsi = TechnicalIndicators::calculateRSISeries(closes, kRsiPeriod);
    const auto zscore = TechnicalIndicators::calculateZScoreSeries(closes, kZScorePeriod);

    const size_t last = candles.size() - 2;
    set.features.reserve(last - kMinIndex + 1);
    set.labels.reserve(last - kMinIndex + 1);
    set.indices.reserve(last - kMinIndex + 1);

    for (size_t i = kMinIndex; i <= last; ++i) {
        FeatureVector row = featuresAt(closes, rsi, zscore, i);
        if (!isFinite(row)) {
            set.dropped_non_finite++;
            continue;
        }
        set.features.push_back(std::move(row));
        set.labels.push_back(closes[i + 1] > closes[i] ? 1.0 : 0.0);
        set.indices.push_back(i);
    }
    return set;
}

bool FeatureExtractor::isFinite(const FeatureVector& features) {
    return std::all_of(features.begin(), features.end(),
                       [](double v) { return std::isfinite(v); });
}

FeatureVector FeatureExtractor::featuresAt(
    const std::vector<double>& closes,
    const std::vector<double>& rsi,
    const std::vector<double>& zscore,
    size_t i
) {
    const double ret1 = (closes[i] - closes[i - 1]) / closes[i - 1];
    const double ret5 = (closes[i] - closes[i - 5]) / closes[i - 5];
    return {ret1, ret5, rsi[i] / 100.0, zscore[i]};
}

} // namespace model
} // namespace microtrend
