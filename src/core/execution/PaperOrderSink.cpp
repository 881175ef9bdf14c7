#include "core/execution/PaperOrderSink.h"
#include "common/Logger.h"

namespace microtrend {
namespace core {

bool PaperOrderSink::submit(const OrderIntent& intent) {
    if (!(intent.notional > 0.0) || !(intent.price > 0.0)) {
        LOG_WARN("Paper order rejected: side={} price={} notional={}",
                 toString(intent.side), intent.price, intent.notional);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        submitted_.push_back(intent);
    }

    LOG_INFO("[PAPER] {} notional={:.2f} @ {:.2f} (pUp={:.4f}, risk={:.3f}%, factor={:.2f})",
             toString(intent.side), intent.notional, intent.price,
             intent.probability, intent.risk_pct, intent.risk_factor);
    Logger::getInstance().logTrade(toString(intent.side), intent.price, intent.probability,
                                   intent.risk_factor, intent.notional);
    return true;
}

std::vector<OrderIntent> PaperOrderSink::submitted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return submitted_;
}

std::optional<OrderIntent> PaperOrderSink::last() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (submitted_.empty()) {
        return std::nullopt;
    }
    return submitted_.back();
}

} // namespace core
} // namespace microtrend
