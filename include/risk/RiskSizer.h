#pragma once

#include <atomic>
#include <memory>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IVolatilityEstimator.h"
#include "engine/EngineConfig.h"

namespace microtrend {
namespace risk {

// std20 / close of the last candle
class RollingStdVolatilityEstimator : public core::IVolatilityEstimator {
public:
    explicit RollingStdVolatilityEstimator(int period = 20) : period_(period) {}

    double relativeVolatility(const std::vector<Candle>& candles) const override;

private:
    int period_;
};

// Volatility-adjusted multiplier on the configured risk-per-trade percentage:
// calm markets size up, turbulent markets size down.
class RiskSizer {
public:
    static constexpr size_t kMinCandles = 40;

    explicit RiskSizer(
        engine::RiskSizingConfig config,
        std::shared_ptr<core::IVolatilityEstimator> estimator = nullptr
    );

    // Always positive. 1.0 when adjustment is off or history is short.
    double computeFactor(const std::vector<Candle>& candles);

    double effectiveRiskPct(double factor) const;
    double positionNotional(double equity, double factor) const;

    double lastFactor() const { return last_factor_.load(); }
    double baseRiskPct() const { return config_.risk_per_trade_pct; }
    double equity() const { return config_.equity_usd; }

private:
    double factorFor(double relative_volatility) const;

    engine::RiskSizingConfig config_;
    std::shared_ptr<core::IVolatilityEstimator> estimator_;
    std::atomic<double> last_factor_{1.0};
};

} // namespace risk
} // namespace microtrend
