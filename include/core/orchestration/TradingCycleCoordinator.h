#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IMetricsSink.h"
#include "core/contracts/IOrderSink.h"
#include "engine/ThresholdDecisionEngine.h"
#include "model/SignalModel.h"
#include "model/WalkForwardScheduler.h"
#include "risk/RiskSizer.h"

namespace microtrend {
namespace core {

struct CycleOutcome {
    engine::Decision decision;
    double risk_factor = 1.0;
    double risk_pct = 0.0;
    double notional = 0.0;
    bool refit_triggered = false;
    bool order_submitted = false;
};

// One pass per closed candle:
// scheduler tick -> features -> predict -> threshold decision -> sizing -> order sink
class TradingCycleCoordinator {
public:
    static constexpr size_t kMinDecisionCandles = 40;

    TradingCycleCoordinator(
        std::shared_ptr<model::SignalModel> model,
        std::shared_ptr<engine::ThresholdDecisionEngine> decision_engine,
        std::shared_ptr<risk::RiskSizer> risk_sizer,
        std::shared_ptr<model::WalkForwardScheduler> scheduler = nullptr,
        std::shared_ptr<IMetricsSink> metrics = nullptr,
        std::shared_ptr<IOrderSink> order_sink = nullptr
    );

    CycleOutcome runCycle(const std::vector<Candle>& candles, Timestamp now);

    std::uint64_t cycleCount() const { return cycles_.load(); }

private:
    double predictLatest(const std::vector<Candle>& candles) const;

    std::shared_ptr<model::SignalModel> model_;
    std::shared_ptr<engine::ThresholdDecisionEngine> decision_engine_;
    std::shared_ptr<risk::RiskSizer> risk_sizer_;
    std::shared_ptr<model::WalkForwardScheduler> scheduler_;
    std::shared_ptr<IMetricsSink> metrics_;
    std::shared_ptr<IOrderSink> order_sink_;
    std::atomic<std::uint64_t> cycles_{0};
};

} // namespace core
} // namespace microtrend
