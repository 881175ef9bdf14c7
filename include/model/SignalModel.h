#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

#include "common/Types.h"
#include "model/FeatureExtractor.h"
#include "model/SeedProvider.h"

namespace microtrend {
namespace model {

struct ModelState {
    std::vector<double> weights;
    double bias = 0.0;
};

struct FitReport {
    bool applied = false;     // false when history was too short
    size_t samples = 0;
    int epochs = 0;
};

// Online logistic regression producing pUp (probability the next candle closes higher).
// Weights are set once at construction and afterwards only moved by fit().
// All access to weights/bias is serialized; every gradient step is atomic to readers.
class SignalModel {
public:
    static constexpr size_t kMinFitCandles = 40;
    static constexpr double kInitWeightScale = 0.01;
    static constexpr double kLogitClamp = 20.0;

    explicit SignalModel(ISeedProvider& seeds);

    // Warm start from a persisted state
    explicit SignalModel(ModelState initial_state);

    SignalModel(const SignalModel&) = delete;
    SignalModel& operator=(const SignalModel&) = delete;

    // Returns exactly 0.5 when features.size() != weight count
    double predict(const FeatureVector& features) const;

    // Single-sample gradient descent on log loss, samples in chronological order.
    // No-op when fewer than kMinFitCandles candles are supplied.
    FitReport fit(const std::vector<Candle>& candles, double learning_rate, int epochs);

    ModelState snapshot() const;
    size_t featureCount() const;

    // 1 / (1 + e^-z), saturating to exactly 1.0 / 0.0 beyond +-kLogitClamp
    static double sigmoid(double z);

private:
    void initialize(ISeedProvider& seeds);
    double predictLocked(const FeatureVector& features) const;

    mutable std::mutex mutex_;
    std::vector<double> weights_;
    double bias_ = 0.0;
};

} // namespace model
} // namespace microtrend
