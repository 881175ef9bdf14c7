#include "model/SignalModel.h"

#include <cmath>
#include <random>

namespace microtrend {
namespace model {

SignalModel::SignalModel(ISeedProvider& seeds) {
    initialize(seeds);
}

SignalModel::SignalModel(ModelState initial_state)
    : weights_(std::move(initial_state.weights))
    , bias_(initial_state.bias) {}

void SignalModel::initialize(ISeedProvider& seeds) {
    std::mt19937_64 rng(seeds.nextSeed());
    std::normal_distribution<double> dist(0.0, kInitWeightScale);

    weights_.assign(FeatureExtractor::kFeatureCount, 0.0);
    for (auto& w : weights_) {
        w = dist(rng);
    }
    bias_ = 0.0;
}

double SignalModel::sigmoid(double z) {
    if (z > kLogitClamp) {
        return 1.0;
    }
    if (z < -kLogitClamp) {
        return 0.0;
    }
    return 1.0 / (1.0 + std::exp(-z));
}

double SignalModel::predict(const FeatureVector& features) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return predictLocked(features);
}

double SignalModel::predictLocked(const FeatureVector& features) const {
    if (features.size() != weights_.size()) {
        return 0.5;
    }
    double z = bias_;
    for (size_t i = 0; i < features.size(); ++i) {
        z += weights_[i] * features[i];
    }
    return sigmoid(z);
}

FitReport SignalModel::fit(const std::vector<Candle>& candles, double learning_rate, int epochs) {
    FitReport report;
    if (candles.size() < kMinFitCandles || epochs <= 0) {
        return report;
    }

    const TrainingSet data = FeatureExtractor::buildDataset(candles);
    report.samples = data.size();
    if (data.size() == 0) {
        return report;
    }

    for (int e = 0; e < epochs; ++e) {
        for (size_t i = 0; i < data.size(); ++i) {
            const auto& x = data.features[i];

            std::lock_guard<std::mutex> lock(mutex_);
            const double p = predictLocked(x);
            const double grad = p - data.labels[i];
            if (x.size() == weights_.size()) {
                for (size_t j = 0; j < weights_.size(); ++j) {
                    weights_[j] -= learning_rate * grad * x[j];
                }
            }
            bias_ -= learning_rate * grad;
        }
    }

    report.applied = true;
    report.epochs = epochs;
    return report;
}

ModelState SignalModel::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ModelState{weights_, bias_};
}

size_t SignalModel::featureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return weights_.size();
}

} // namespace model
} // namespace microtrend
