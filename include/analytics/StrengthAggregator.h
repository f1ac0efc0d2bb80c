#pragma once

#include "analytics/ForceCalculator.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace tugofwar {
namespace analytics {

struct StrengthRatios {
    double put_strength_score = 0.0;
    double call_strength_score = 0.0;
    double net_strength = 0.0;
    Direction direction = Direction::NEUTRAL;
};

struct LegacyZoneScores {
    double below_score = 0.0;
    double above_score = 0.0;
};

struct CombinedScore {
    double zone_average = 0.0;
    double momentum = 0.0;
    double price_change_pct = 0.0;
    Direction oi_direction = Direction::NEUTRAL;
    Direction price_direction = Direction::NEUTRAL;
    bool divergence = false;
    double momentum_weight = 0.0;
    double zone_weight = 1.0;
    double combined_score = 0.0;
};

class StrengthAggregator {
public:
    explicit StrengthAggregator(const engine::ScoringConfig& config);

    StrengthRatios strengthRatios(const ZoneBreakdown& zones) const;

    static LegacyZoneScores legacyZoneScores(const ZoneBreakdown& zones);

    CombinedScore combine(const LegacyZoneScores& legacy,
                          const StrengthRatios& strength,
                          double momentum,
                          double price_change_pct) const;

    // num / den with |den| < 1 replaced by 1 so the ratio never blows up
    static double guardedRatio(double numerator, double denominator);

private:
    engine::ScoringConfig config_;
};

} // namespace analytics
} // namespace tugofwar
