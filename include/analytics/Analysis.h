#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "analytics/ChainStructure.h"
#include "analytics/ConfidenceScorer.h"
#include "analytics/FlowSignals.h"
#include "analytics/ForceCalculator.h"
#include "analytics/RegimeDetector.h"
#include "analytics/StrengthAggregator.h"
#include "analytics/Verdict.h"
#include "strategy/TradeSetup.h"

namespace tugofwar {
namespace analytics {

// Full engine output for one snapshot. Built once by TugOfWarEngine and
// never mutated afterwards.
struct Analysis {
    bool valid = false;
    std::string error;

    long long timestamp_ms = 0;
    double spot_price = 0.0;
    std::string expiry;
    int atm_strike = 0;

    double combined_score = 0.0;
    Verdict verdict = Verdict::NEUTRAL;
    SignalStrength strength = SignalStrength::NONE;
    double confidence = 0.0;
    ConfidenceBreakdown confidence_breakdown;

    ZoneBreakdown zones;
    StrengthRatios strength_ratios;
    LegacyZoneScores legacy_scores;
    CombinedScore blend;
    RegimeAnalysis regime;
    OiAcceleration oi_acceleration;
    PremiumMomentum premium_momentum;
    double premium_adjustment = 0.0;

    MaxPain max_pain;
    OiClusters clusters;
    IvSkew iv_skew;
    std::optional<double> volume_pcr;
    std::optional<double> pcr;      // total put OI / total call OI
    ConfirmationStatus confirmation = ConfirmationStatus::NEUTRAL;
    TrapWarning trap;

    // Chain-wide OI change totals
    long long call_oi_change = 0;
    long long put_oi_change = 0;

    std::optional<strategy::TradeSetup> trade_setup;

    Direction direction() const { return verdictDirection(verdict); }
};

nlohmann::json toJson(const Analysis& analysis);

// Multi-line human readable report used by the replay tool.
std::string formatSummary(const Analysis& analysis);

} // namespace analytics
} // namespace tugofwar
