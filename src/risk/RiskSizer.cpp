#include "risk/RiskSizer.h"
#include "analytics/TechnicalIndicators.h"

#include <cmath>

namespace microtrend {
namespace risk {

double RollingStdVolatilityEstimator::relativeVolatility(const std::vector<Candle>& candles) const {
    if (candles.empty()) {
        return 0.0;
    }
    const auto closes = analytics::TechnicalIndicators::extractClosePrices(candles);
    const auto std_series = analytics::TechnicalIndicators::calculateRollingStdSeries(closes, period_);
    return std_series.back() / (closes.back() + 1e-12);
}

RiskSizer::RiskSizer(
    engine::RiskSizingConfig config,
    std::shared_ptr<core::IVolatilityEstimator> estimator
)
    : config_(config)
    , estimator_(std::move(estimator)) {
    if (!estimator_) {
        estimator_ = std::make_shared<RollingStdVolatilityEstimator>();
    }
}

double RiskSizer::computeFactor(const std::vector<Candle>& candles) {
    double factor = 1.0;
    if (config_.vol_risk_adjust && candles.size() >= kMinCandles) {
        factor = factorFor(estimator_->relativeVolatility(candles));
    }
    last_factor_.store(factor);
    return factor;
}

double RiskSizer::factorFor(double relative_volatility) const {
    if (!std::isfinite(relative_volatility)) {
        return 1.0;
    }
    if (relative_volatility > config_.high_vol_threshold) {
        return config_.high_vol_factor;
    }
    if (relative_volatility > config_.elevated_vol_threshold) {
        return config_.elevated_vol_factor;
    }
    if (relative_volatility < config_.low_vol_threshold) {
        return config_.low_vol_factor;
    }
    return 1.0;
}

double RiskSizer::effectiveRiskPct(double factor) const {
    return config_.risk_per_trade_pct * factor;
}

double RiskSizer::positionNotional(double equity, double factor) const {
    return equity * effectiveRiskPct(factor) / 100.0;
}

} // namespace risk
} // namespace microtrend
