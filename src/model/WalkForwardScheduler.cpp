#include "model/WalkForwardScheduler.h"
#include "common/Logger.h"
#include "data/CandleHistory.h"

#include <chrono>

namespace microtrend {
namespace model {

WalkForwardScheduler::WalkForwardScheduler(
    std::shared_ptr<SignalModel> model,
    engine::WalkForwardConfig config,
    std::shared_ptr<core::IMetricsSink> metrics,
    std::shared_ptr<core::IModelStateStore> state_store
)
    : model_(std::move(model))
    , config_(config)
    , metrics_(std::move(metrics))
    , state_store_(std::move(state_store)) {}

bool WalkForwardScheduler::isEnabled() const {
    return config_.interval_minutes > 0 || config_.refit_every_candles > 0;
}

bool WalkForwardScheduler::isDue(Timestamp now) const {
    if (config_.refit_every_candles > 0 && candles_since_refit_ >= config_.refit_every_candles) {
        return true;
    }
    if (config_.interval_minutes > 0) {
        if (!last_refit_) {
            return true;
        }
        return now - *last_refit_ >= std::chrono::minutes(config_.interval_minutes);
    }
    return false;
}

bool WalkForwardScheduler::onCandle(const std::vector<Candle>& history, Timestamp now) {
    if (!isEnabled()) {
        return false;
    }

    candles_since_refit_++;
    if (!isDue(now)) {
        return false;
    }

    (void)trigger(history, now);
    return true;
}

FitReport WalkForwardScheduler::trigger(const std::vector<Candle>& history, Timestamp now) {
    last_refit_ = now;
    candles_since_refit_ = 0;

    if (!model_) {
        skipped_refits_++;
        return {};
    }

    const size_t window = config_.window_candles > 0
        ? static_cast<size_t>(config_.window_candles)
        : history.size();
    const FitReport report = model_->fit(
        data::CandleHistory::tail(history, window), config_.learning_rate, config_.epochs);

    if (!report.applied) {
        skipped_refits_++;
        LOG_WARN("Walk-forward refit skipped: history={} (need >= {})",
                 history.size(), SignalModel::kMinFitCandles);
        return report;
    }

    refits_++;
    if (metrics_) {
        metrics_->onRefit();
    }
    LOG_INFO("Walk-forward refit #{}: samples={}, epochs={}, lr={}",
             refits_.load(), report.samples, report.epochs, config_.learning_rate);

    persist(now);
    return report;
}

void WalkForwardScheduler::persist(Timestamp now) {
    if (!state_store_) {
        return;
    }

    core::ModelStateSnapshot snapshot;
    snapshot.saved_at_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ).count();
    snapshot.state = model_->snapshot();
    snapshot.refit_count = refits_.load();

    if (!state_store_->save(snapshot)) {
        LOG_WARN("Model state save failed after refit #{}", snapshot.refit_count);
    }
}

} // namespace model
} // namespace microtrend
