#pragma once

#include <cstddef>
#include <vector>
#include "common/Types.h"

namespace microtrend {
namespace model {

// {ret1, ret5, rsi14 / 100, zscore20}
using FeatureVector = std::vector<double>;

struct TrainingSet {
    std::vector<FeatureVector> features;
    std::vector<double> labels;          // 1.0 if the next candle closed higher
    std::vector<size_t> indices;         // candle index of each row
    size_t dropped_non_finite = 0;

    size_t size() const { return features.size(); }
};

class FeatureExtractor {
public:
    static constexpr size_t kFeatureCount = 4;
    static constexpr size_t kMinIndex = 21;
    static constexpr int kRsiPeriod = 14;
    static constexpr int kZScorePeriod = 20;

    // Features for candle `i`. Returns an empty vector when i < kMinIndex or
    // i >= candles.size(). Zero closes produce non-finite entries; check isFinite().
    static FeatureVector computeFeatures(const std::vector<Candle>& candles, size_t i);

    // Features for the most recent candle
    static FeatureVector latestFeatures(const std::vector<Candle>& candles);

    // Rows for indices kMinIndex..n-2 in chronological order, non-finite rows dropped
    static TrainingSet buildDataset(const std::vector<Candle>& candles);

    static bool isFinite(const FeatureVector& features);

private:
    static FeatureVector featuresAt(
        const std::vector<double>& closes,
        const std::vector<double>& rsi,
        const std::vector<double>& zscore,
        size_t i
    );
};

} // namespace model
} // namespace microtrend
