#pragma once

#include <mutex>
#include <optional>
#include <vector>

#include "core/contracts/IOrderSink.h"

namespace microtrend {
namespace core {

// Records intents and writes them to the trade log instead of an exchange
class PaperOrderSink : public IOrderSink {
public:
    bool submit(const OrderIntent& intent) override;

    std::vector<OrderIntent> submitted() const;
    std::optional<OrderIntent> last() const;

private:
    mutable std::mutex mutex_;
    std::vector<OrderIntent> submitted_;
};

} // namespace core
} // namespace microtrend
