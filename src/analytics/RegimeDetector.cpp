#include "analytics/RegimeDetector.h"
#include <algorithm>
#include <cmath>

namespace tugofwar {
namespace analytics {

RegimeDetector::RegimeDetector(const engine::ScoringConfig& config)
    : config_(config) {}

RegimeAnalysis RegimeDetector::analyzeRegime(const std::vector<double>& price_history,
                                             double current_price,
                                             double momentum) const {
    RegimeAnalysis result;
    result.momentum = momentum;

    if (price_history.empty() || !(current_price > 0.0)) {
        result.window_high = current_price;
        result.window_low = current_price;
        result.description = "Insufficient Data";
        return result;
    }

    double high = current_price;
    double low = current_price;
    for (double p : price_history) {
        if (p <= 0.0 || !std::isfinite(p)) {
            continue;
        }
        high = std::max(high, p);
        low = std::min(low, p);
    }
    result.window_high = high;
    result.window_low = low;
    result.range_pct = (high - low) / current_price * 100.0;

    const double from_high_pct = (high - current_price) / current_price * 100.0;
    const double from_low_pct = (current_price - low) / current_price * 100.0;
    const bool wide_enough = result.range_pct > config_.regime_min_range_pct;

    if (wide_enough && from_high_pct <= config_.regime_extreme_pct && momentum > config_.regime_momentum) {
        result.regime = MarketRegime::TRENDING_UP;
        result.description = "Trending up: holding near window high";
    } else if (wide_enough && from_low_pct <= config_.regime_extreme_pct && momentum < -config_.regime_momentum) {
        result.regime = MarketRegime::TRENDING_DOWN;
        result.description = "Trending down: holding near window low";
    } else {
        result.regime = MarketRegime::RANGE_BOUND;
        result.description = "Range bound";
    }

    if (result.regime != MarketRegime::RANGE_BOUND) {
        result.oi_change_weight = 0.30;
        result.total_oi_weight = 0.70;
    }
    return result;
}

const char* RegimeDetector::toString(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::TRENDING_UP: return "trending_up";
        case MarketRegime::TRENDING_DOWN: return "trending_down";
        case MarketRegime::RANGE_BOUND: return "range_bound";
    }
    return "range_bound";
}

MarketRegime RegimeDetector::fromString(const std::string& value) {
    if (value == "trending_up") return MarketRegime::TRENDING_UP;
    if (value == "trending_down") return MarketRegime::TRENDING_DOWN;
    return MarketRegime::RANGE_BOUND;
}

} // namespace analytics
} // namespace tugofwar
