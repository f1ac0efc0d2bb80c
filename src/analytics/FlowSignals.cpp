#include "analytics/FlowSignals.h"

#include <algorithm>
#include <cmath>

namespace tugofwar {
namespace analytics {

double FlowSignals::priceChangePct(const std::vector<double>& price_history, double current_price) {
    if (price_history.empty()) {
        return 0.0;
    }
    const double oldest = price_history.front();
    if (!(oldest > 0.0) || !(current_price > 0.0)) {
        return 0.0;
    }
    const double pct = (current_price - oldest) / oldest * 100.0;
    return std::isfinite(pct) ? pct : 0.0;
}

double FlowSignals::momentum(const std::vector<double>& price_history, double current_price, double scale) {
    return std::clamp(priceChangePct(price_history, current_price) * scale, -100.0, 100.0);
}

OiAcceleration FlowSignals::oiAcceleration(const engine::OiChangePair& current,
                                           const std::vector<engine::OiChangePair>& prior_window,
                                           double momentum,
                                           const engine::ScoringConfig& config) {
    OiAcceleration out;
    if (prior_window.empty()) {
        out.description = "No prior OI window";
        return out;
    }

    double call_sum = 0.0;
    double put_sum = 0.0;
    for (const auto& pair : prior_window) {
        call_sum += static_cast<double>(pair.call_change);
        put_sum += static_cast<double>(pair.put_change);
    }
    out.prior_call_change = call_sum / static_cast<double>(prior_window.size());
    out.prior_put_change = put_sum / static_cast<double>(prior_window.size());

    const double cur_call = static_cast<double>(current.call_change);
    const double cur_put = static_cast<double>(current.put_change);
    out.call_acceleration = cur_call - out.prior_call_change;
    out.put_acceleration = cur_put - out.prior_put_change;
    out.net_acceleration = out.put_acceleration - out.call_acceleration;

    const bool calls_shrinking = std::abs(cur_call) < std::abs(out.prior_call_change);
    const bool puts_shrinking = std::abs(cur_put) < std::abs(out.prior_put_change);

    if (calls_shrinking && puts_shrinking) {
        out.phase = OiPhase::UNWINDING;
        if (momentum > config.unwinding_momentum) {
            out.score_adjustment = config.unwinding_adjust;
            out.description = "Short covering: OI unwinding into rising price";
        } else if (momentum < -config.unwinding_momentum) {
            out.score_adjustment = -config.unwinding_adjust;
            out.description = "Profit booking: OI unwinding into falling price";
        } else {
            out.description = "OI unwinding without price conviction";
        }
        return out;
    }

    const double base = std::abs(out.prior_call_change) + std::abs(out.prior_put_change);
    const double strong = std::max(config.accumulation_min_accel, config.accumulation_rel_accel * base);

    if (out.net_acceleration > strong && (out.put_acceleration > 0.0 || out.call_acceleration < 0.0)) {
        out.phase = OiPhase::ACCUMULATION;
        out.score_adjustment = config.accumulation_adjust;
        out.description = "Accumulation: put writing accelerating";
    } else if (out.net_acceleration < -strong && (out.call_acceleration > 0.0 || out.put_acceleration < 0.0)) {
        out.phase = OiPhase::DISTRIBUTION;
        out.score_adjustment = -config.accumulation_adjust;
        out.description = "Distribution: call writing accelerating";
    } else {
        out.phase = OiPhase::STEADY;
        out.description = "OI flow steady";
    }
    return out;
}

PremiumMomentum FlowSignals::premiumMomentum(const market::Snapshot& snapshot,
                                             const market::StrikeMap& previous_strikes,
                                             int atm_strike,
                                             double multiplier) {
    PremiumMomentum out;
    const auto ce_now = snapshot.premium(atm_strike, OptionSide::CE);
    const auto pe_now = snapshot.premium(atm_strike, OptionSide::PE);
    const auto ce_prev = market::premiumOf(previous_strikes, atm_strike, OptionSide::CE);
    const auto pe_prev = market::premiumOf(previous_strikes, atm_strike, OptionSide::PE);
    if (!ce_now || !pe_now || !ce_prev || !pe_prev) {
        return out;
    }

    out.call_change_pct = (*ce_now - *ce_prev) / *ce_prev * 100.0;
    out.put_change_pct = (*pe_now - *pe_prev) / *pe_prev * 100.0;
    const double raw = (out.call_change_pct - out.put_change_pct) * multiplier;
    out.premium_momentum_score = std::isfinite(raw) ? std::clamp(raw, -100.0, 100.0) : 0.0;
    out.valid = true;
    return out;
}

double FlowSignals::premiumAdjustment(double combined_score,
                                      const PremiumMomentum& pm,
                                      const engine::ScoringConfig& config) {
    if (!pm.valid) {
        return 0.0;
    }
    const double score = pm.premium_momentum_score;
    if (combined_score < -config.premium_trigger_combined && score > config.premium_trigger_score) {
        return score * config.premium_adjust_factor;
    }
    if (combined_score > config.premium_trigger_combined && score < -config.premium_trigger_score) {
        return score * config.premium_adjust_factor;
    }
    return 0.0;
}

const char* FlowSignals::toString(OiPhase phase) {
    switch (phase) {
        case OiPhase::INSUFFICIENT_DATA: return "insufficient_data";
        case OiPhase::UNWINDING: return "unwinding";
        case OiPhase::ACCUMULATION: return "accumulation";
        case OiPhase::DISTRIBUTION: return "distribution";
        case OiPhase::STEADY: return "steady";
    }
    return "steady";
}

} // namespace analytics
} // namespace tugofwar
