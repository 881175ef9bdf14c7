#include "engine/MetricsRegistry.h"

#include <sstream>

namespace microtrend {
namespace engine {

void MetricsRegistry::onDecision(DecisionKind kind) {
    switch (kind) {
        case DecisionKind::BUY:
            decisions_buy_++;
            break;
        case DecisionKind::SELL:
            decisions_sell_++;
            break;
        default:
            decisions_flat_++;
            break;
    }
}

void MetricsRegistry::onRefit() {
    walk_forward_fits_++;
}

void MetricsRegistry::setRiskFactor(double factor) {
    vol_risk_factor_.store(factor);
}

// one flag backs both series, so a reader always sees exactly one of them at 1
void MetricsRegistry::setModelMode(ModelMode mode) {
    extended_mode_.store(mode == ModelMode::EXTENDED);
}

std::uint64_t MetricsRegistry::decisionCount(DecisionKind kind) const {
    switch (kind) {
        case DecisionKind::BUY:
            return decisions_buy_.load();
        case DecisionKind::SELL:
            return decisions_sell_.load();
        default:
            return decisions_flat_.load();
    }
}

int MetricsRegistry::modelModeGauge(ModelMode mode) const {
    const bool extended = extended_mode_.load();
    return (mode == ModelMode::EXTENDED) == extended ? 1 : 0;
}

std::string MetricsRegistry::exportPrometheusMetrics() const {
    std::ostringstream oss;

    oss << "# HELP bot_decisions_total Decisions taken\n";
    oss << "# TYPE bot_decisions_total counter\n";
    oss << "bot_decisions_total{signal=\"buy\"} " << decisions_buy_.load() << "\n";
    oss << "bot_decisions_total{signal=\"sell\"} " << decisions_sell_.load() << "\n";
    oss << "bot_decisions_total{signal=\"flat\"} " << decisions_flat_.load() << "\n";

    oss << "# HELP bot_walk_forward_fits_total Number of walk-forward refits performed.\n";
    oss << "# TYPE bot_walk_forward_fits_total counter\n";
    oss << "bot_walk_forward_fits_total " << walk_forward_fits_.load() << "\n";

    oss << "# HELP bot_vol_risk_factor Volatility-adjusted risk factor applied to per-trade sizing.\n";
    oss << "# TYPE bot_vol_risk_factor gauge\n";
    oss << "bot_vol_risk_factor " << vol_risk_factor_.load() << "\n";

    oss << "# HELP bot_model_mode Model mode indicator (baseline/extended as separate labeled series).\n";
    oss << "# TYPE bot_model_mode gauge\n";
    const bool extended = extended_mode_.load();
    oss << "bot_model_mode{mode=\"baseline\"} " << (extended ? 0 : 1) << "\n";
    oss << "bot_model_mode{mode=\"extended\"} " << (extended ? 1 : 0) << "\n";

    return oss.str();
}

} // namespace engine
} // namespace microtrend
