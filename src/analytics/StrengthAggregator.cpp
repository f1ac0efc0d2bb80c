#include "analytics/StrengthAggregator.h"

#include <algorithm>
#include <cmath>

namespace tugofwar {
namespace analytics {

namespace {

double finiteOr(double value, double fallback) {
    return std::isfinite(value) ? value : fallback;
}

} // namespace

StrengthAggregator::StrengthAggregator(const engine::ScoringConfig& config)
    : config_(config) {}

double StrengthAggregator::guardedRatio(double numerator, double denominator) {
    const double safe_den = std::abs(denominator) < 1.0 ? 1.0 : std::abs(denominator);
    return finiteOr(numerator / safe_den, 0.0);
}

StrengthRatios StrengthAggregator::strengthRatios(const ZoneBreakdown& zones) const {
    StrengthRatios out;

    const double put_ratio = guardedRatio(zones.otm_put.force, zones.itm_call.force + zones.otm_call.force);
    const double call_ratio = guardedRatio(zones.otm_call.force, zones.itm_put.force + zones.otm_put.force);

    out.put_strength_score = std::clamp((put_ratio - 1.0) * 50.0, -100.0, 100.0);
    out.call_strength_score = std::clamp((call_ratio - 1.0) * 50.0, -100.0, 100.0);
    out.net_strength = out.put_strength_score - out.call_strength_score;

    if (out.net_strength > config_.strength_direction_threshold) {
        out.direction = Direction::BULLISH;
    } else if (out.net_strength < -config_.strength_direction_threshold) {
        out.direction = Direction::BEARISH;
    }
    return out;
}

LegacyZoneScores StrengthAggregator::legacyZoneScores(const ZoneBreakdown& zones) {
    LegacyZoneScores out;
    const double base = std::max({std::abs(zones.below_spot_force), std::abs(zones.above_spot_force), 1.0});
    out.below_score = std::clamp(finiteOr(zones.below_spot_force / base * 100.0, 0.0), -100.0, 100.0);
    out.above_score = std::clamp(finiteOr(zones.above_spot_force / base * 100.0, 0.0), -100.0, 100.0);
    return out;
}

CombinedScore StrengthAggregator::combine(const LegacyZoneScores& legacy,
                                          const StrengthRatios& strength,
                                          double momentum,
                                          double price_change_pct) const {
    CombinedScore out;
    out.momentum = finiteOr(momentum, 0.0);
    out.price_change_pct = finiteOr(price_change_pct, 0.0);
    out.zone_average = config_.legacy_zone_weight * ((legacy.below_score + legacy.above_score) / 2.0) +
        config_.strength_weight * strength.net_strength;

    if (out.zone_average > 0.0) {
        out.oi_direction = Direction::BULLISH;
    } else if (out.zone_average < 0.0) {
        out.oi_direction = Direction::BEARISH;
    }

    if (out.price_change_pct > config_.price_move_threshold_pct) {
        out.price_direction = Direction::BULLISH;
    } else if (out.price_change_pct < -config_.price_move_threshold_pct) {
        out.price_direction = Direction::BEARISH;
    }

    out.divergence = out.oi_direction != Direction::NEUTRAL &&
        out.price_direction != Direction::NEUTRAL &&
        out.oi_direction != out.price_direction;

    if (out.momentum != 0.0) {
        out.momentum_weight = out.divergence ? config_.divergence_momentum_weight
                                             : config_.normal_momentum_weight;
        out.zone_weight = 1.0 - out.momentum_weight;
    } else {
        out.momentum_weight = 0.0;
        out.zone_weight = 1.0;
    }

    out.combined_score = finiteOr(out.zone_weight * out.zone_average + out.momentum_weight * out.momentum, 0.0);
    return out;
}

} // namespace analytics
} // namespace tugofwar
