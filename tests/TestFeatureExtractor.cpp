#include "model/FeatureExtractor.h"
#include "analytics/TechnicalIndicators.h"
#include "CandleFixtures.h"

#include <cassert>
#include <cmath>
#include <iostream>

using microtrend::model::FeatureExtractor;
using microtrend::testing::near;

int main() {
    const auto candles = microtrend::testing::waveCandles(60);

    {
        assert(FeatureExtractor::computeFeatures(candles, 20).empty());
        assert(FeatureExtractor::computeFeatures(candles, 60).empty());

        const auto f = FeatureExtractor::computeFeatures(candles, 30);
        assert(f.size() == FeatureExtractor::kFeatureCount);

        const double c30 = candles[30].close;
        const double c29 = candles[29].close;
        const double c25 = candles[25].close;
        assert(near(f[0], (c30 - c29) / c29, 1e-12));
        assert(near(f[1], (c30 - c25) / c25, 1e-12));
        assert(f[2] >= 0.0 && f[2] <= 1.0);

        const auto closes = microtrend::analytics::TechnicalIndicators::extractClosePrices(candles);
        const auto z = microtrend::analytics::TechnicalIndicators::calculateZScoreSeries(closes, 20);
        assert(near(f[3], z[30], 1e-12));
    }

    {
        const auto latest = FeatureExtractor::latestFeatures(candles);
        const auto direct = FeatureExtractor::computeFeatures(candles, candles.size() - 1);
        assert(latest == direct);
        assert(FeatureExtractor::latestFeatures({}).empty());
    }

    {
        // indices 21..58 -> 38 rows
        const auto set = FeatureExtractor::buildDataset(candles);
        assert(set.size() == 38);
        assert(set.labels.size() == 38);
        assert(set.indices.front() == 21);
        assert(set.indices.back() == 58);
        assert(set.dropped_non_finite == 0);

        for (size_t r = 0; r < set.size(); ++r) {
            const size_t i = set.indices[r];
            const double expected = candles[i + 1].close > candles[i].close ? 1.0 : 0.0;
            assert(set.labels[r] == expected);
            assert(FeatureExtractor::isFinite(set.features[r]));
        }
    }

    {
        // zero close poisons ret1 of the next candle and ret5 five candles later
        auto broken = candles;
        broken[30].close = 0.0;

        const auto set = FeatureExtractor::buildDataset(broken);
        assert(set.dropped_non_finite == 2);
        assert(set.size() == 36);
        for (size_t i : set.indices) {
            assert(i != 31 && i != 35);
        }
        assert(!FeatureExtractor::isFinite(FeatureExtractor::computeFeatures(broken, 31)));
    }

    {
        const auto few = microtrend::testing::waveCandles(22);
        assert(FeatureExtractor::buildDataset(few).size() == 0);
        const auto minimal = microtrend::testing::waveCandles(23);
        assert(FeatureExtractor::buildDataset(minimal).size() == 1);
    }

    std::cout << "[TEST] FeatureExtractor PASSED\n";
    return 0;
}
