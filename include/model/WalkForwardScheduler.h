#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IMetricsSink.h"
#include "core/contracts/IModelStateStore.h"
#include "engine/EngineConfig.h"
#include "model/SignalModel.h"

namespace microtrend {
namespace model {

// Periodic warm-start retraining of the shared SignalModel on the newest window.
// refitCount() counts refits that applied gradient updates; triggers that hit the
// short-history no-op are counted by skippedRefitCount() instead.
class WalkForwardScheduler {
public:
    WalkForwardScheduler(
        std::shared_ptr<SignalModel> model,
        engine::WalkForwardConfig config,
        std::shared_ptr<core::IMetricsSink> metrics = nullptr,
        std::shared_ptr<core::IModelStateStore> state_store = nullptr
    );

    // True when a time or candle-count trigger is configured
    bool isEnabled() const;

    // Call once per closed candle. Returns true when a refit was triggered.
    bool onCandle(const std::vector<Candle>& history, Timestamp now);

    // Refit now, regardless of the triggers
    FitReport trigger(const std::vector<Candle>& history, Timestamp now);

    std::uint64_t refitCount() const { return refits_.load(); }
    std::uint64_t skippedRefitCount() const { return skipped_refits_.load(); }

private:
    bool isDue(Timestamp now) const;
    void persist(Timestamp now);

    std::shared_ptr<SignalModel> model_;
    engine::WalkForwardConfig config_;
    std::shared_ptr<core::IMetricsSink> metrics_;
    std::shared_ptr<core::IModelStateStore> state_store_;

    std::optional<Timestamp> last_refit_;
    int candles_since_refit_ = 0;
    std::atomic<std::uint64_t> refits_{0};
    std::atomic<std::uint64_t> skipped_refits_{0};
};

} // namespace model
} // namespace microtrend
