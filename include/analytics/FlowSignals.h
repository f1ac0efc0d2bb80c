#pragma once

#include <string>
#include <vector>

#include "engine/EngineConfig.h"
#include "engine/MarketHistory.h"
#include "market/OptionChain.h"

namespace tugofwar {
namespace analytics {

enum class OiPhase { INSUFFICIENT_DATA, UNWINDING, ACCUMULATION, DISTRIBUTION, STEADY };

struct OiAcceleration {
    OiPhase phase = OiPhase::INSUFFICIENT_DATA;
    double prior_call_change = 0.0;     // average over the prior window
    double prior_put_change = 0.0;
    double call_acceleration = 0.0;
    double put_acceleration = 0.0;
    double net_acceleration = 0.0;      // put_acceleration - call_acceleration
    double score_adjustment = 0.0;
    std::string description;
};

struct PremiumMomentum {
    bool valid = false;
    double call_change_pct = 0.0;
    double put_change_pct = 0.0;
    double premium_momentum_score = 0.0;
};

class FlowSignals {
public:
    // (latest - oldest) / oldest in percent; 0 when history is empty
    static double priceChangePct(const std::vector<double>& price_history, double current_price);

    // clamp(price_change_pct * scale, -100, 100)
    static double momentum(const std::vector<double>& price_history, double current_price, double scale);

    static OiAcceleration oiAcceleration(const engine::OiChangePair& current,
                                         const std::vector<engine::OiChangePair>& prior_window,
                                         double momentum,
                                         const engine::ScoringConfig& config);

    static PremiumMomentum premiumMomentum(const market::Snapshot& snapshot,
                                           const market::StrikeMap& previous_strikes,
                                           int atm_strike,
                                           double multiplier);

    // Applies the contradiction rule; returns the amount added to combined_score
    static double premiumAdjustment(double combined_score,
                                    const PremiumMomentum& pm,
                                    const engine::ScoringConfig& config);

    static const char* toString(OiPhase phase);
};

} // namespace analytics
} // namespace tugofwar
