#include "strategy/TradeSetupBuilder.h"

#include <cmath>
#include <cstdio>
#include <vector>

namespace tugofwar {
namespace strategy {

namespace {

std::optional<int> nearestBelow(const market::Snapshot& snapshot, int strike) {
    auto it = snapshot.strikes.lower_bound(strike);
    if (it == snapshot.strikes.begin()) {
        return std::nullopt;
    }
    --it;
    return it->first;
}

std::optional<int> nearestAbove(const market::Snapshot& snapshot, int strike) {
    auto it = snapshot.strikes.upper_bound(strike);
    if (it == snapshot.strikes.end()) {
        return std::nullopt;
    }
    return it->first;
}

} // namespace

std::optional<TradeSetup> TradeSetupBuilder::build(const analytics::Analysis& analysis,
                                                   const market::Snapshot& snapshot) {
    const Direction direction = analytics::verdictDirection(analysis.verdict);
    if (!analysis.valid || direction == Direction::NEUTRAL) {
        return std::nullopt;
    }

    const OptionSide side = direction == Direction::BULLISH ? OptionSide::CE : OptionSide::PE;
    const auto candidate = pickStrike(snapshot, analysis.atm_strike, side);
    if (!candidate) {
        return std::nullopt;
    }

    const auto* metrics = snapshot.find(candidate->strike);
    const double entry = round2(*snapshot.premium(candidate->strike, side));
    if (entry <= 0.0) {
        return std::nullopt;
    }
    const double iv = metrics ? metrics->ivOr0(side) : 0.0;
    const double sl_pct = stopLossPctForIv(iv);

    const double sl = round2(entry * (1.0 - sl_pct / 100.0));
    const double risk = entry - sl;

    TradeSetup setup;
    setup.created_at_ms = analysis.timestamp_ms;
    setup.expiry = analysis.expiry;
    setup.direction = side == OptionSide::CE ? TradeDirection::BUY_CALL : TradeDirection::BUY_PUT;
    setup.strike = candidate->strike;
    setup.option_side = side;
    setup.moneyness = candidate->moneyness;
    setup.entry_premium = entry;
    setup.sl_premium = sl;
    setup.target1_premium = round2(entry + risk);
    setup.target2_premium = round2(entry + 2.0 * risk);
    setup.risk_pct = sl_pct;

    setup.spot_at_creation = analysis.spot_price;
    setup.verdict = analysis.verdict;
    setup.signal_confidence = analysis.confidence;
    setup.iv_at_creation = iv;
    setup.regime = analysis.regime.regime;
    setup.call_oi_change = analysis.call_oi_change;
    setup.put_oi_change = analysis.put_oi_change;
    setup.pcr = analysis.pcr.value_or(0.0);
    setup.max_pain = analysis.max_pain.valid ? analysis.max_pain.strike : 0;
    setup.support = analysis.clusters.support.empty() ? 0 : analysis.clusters.support.front().strike;
    setup.resistance = analysis.clusters.resistance.empty() ? 0 : analysis.clusters.resistance.front().strike;
    setup.quality_score = qualityScore(analysis, setup.moneyness, setup.risk_pct);
    setup.reasoning = reasoning(analysis, setup);
    return setup;
}

double TradeSetupBuilder::stopLossPctForIv(double iv) {
    if (!(iv > 0.0) || !std::isfinite(iv)) return 20.0;
    if (iv < 12.0) return 15.0;
    if (iv < 15.0) return 18.0;
    if (iv < 18.0) return 20.0;
    if (iv < 22.0) return 22.0;
    return 25.0;
}

int TradeSetupBuilder::qualityScore(const analytics::Analysis& analysis, Moneyness moneyness, double risk_pct) {
    int score = 0;
    if (analysis.confirmation == analytics::ConfirmationStatus::CONFIRMED) {
        score += 2;
    }

    const double conf = analysis.confidence;
    if (conf >= 60.0 && conf <= 85.0) {
        score += 2;
    } else if ((conf >= 50.0 && conf < 60.0) || (conf > 85.0 && conf <= 95.0)) {
        score += 1;
    }

    if (analysis.strength == analytics::SignalStrength::STRONG ||
        analysis.strength == analytics::SignalStrength::MODERATE) {
        score += 1;
    }
    if (moneyness == Moneyness::ITM) {
        score += 1;
    }
    if (risk_pct <= 15.0) {
        score += 1;
    }

    const double pm = analysis.premium_momentum.premium_momentum_score;
    const bool bullish = analytics::verdictDirection(analysis.verdict) == Direction::BULLISH;
    if ((bullish && pm > 10.0) || (!bullish && pm < -10.0)) {
        score += 1;
    }
    return score;
}

std::string TradeSetupBuilder::reasoning(const analytics::Analysis& analysis, const TradeSetup& setup) {
    const char* direction = setup.direction == TradeDirection::BUY_PUT ? "BUY PUT" : "BUY CALL";
    const double call_lakh = static_cast<double>(analysis.call_oi_change) / 100000.0;
    const double put_lakh = static_cast<double>(analysis.put_oi_change) / 100000.0;
    const int max_pain = analysis.max_pain.valid ? analysis.max_pain.strike : 0;
    const char* spot_vs_mp = analysis.spot_price < max_pain ? "below" : "above";

    char buf[512];
    std::snprintf(buf, sizeof(buf),
                  "%s: %s (%.0f%% confidence). Quality Score: %d/9. "
                  "Call OI %+.1fL vs Put OI %+.1fL. Spot %.0f %s max pain %d. "
                  "Selected %d %s (%s) with %.0f%% risk.",
                  direction, analytics::toString(analysis.verdict), analysis.confidence,
                  setup.quality_score, call_lakh, put_lakh, analysis.spot_price, spot_vs_mp,
                  max_pain, setup.strike, toString(setup.option_side), toString(setup.moneyness),
                  setup.risk_pct);

    std::string text(buf);
    if (setup.iv_at_creation > 0.0) {
        std::snprintf(buf, sizeof(buf), " IV: %.1f%%", setup.iv_at_creation);
        text += buf;
    }
    return text;
}

double TradeSetupBuilder::round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

std::optional<TradeSetupBuilder::Candidate> TradeSetupBuilder::pickStrike(const market::Snapshot& snapshot,
                                                                        int atm_strike,
                                                                        OptionSide side) {
    // Calls are in the money below ATM, puts above
    const auto itm = side == OptionSide::CE ? nearestBelow(snapshot, atm_strike) : nearestAbove(snapshot, atm_strike);
    const auto otm = side == OptionSide::CE ? nearestAbove(snapshot, atm_strike) : nearestBelow(snapshot, atm_strike);

    std::vector<Candidate> order;
    if (itm) order.push_back({*itm, Moneyness::ITM});
    order.push_back({atm_strike, Moneyness::ATM});
    if (otm) order.push_back({*otm, Moneyness::OTM});

    for (const auto& candidate : order) {
        if (snapshot.premium(candidate.strike, side)) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace strategy
} // namespace tugofwar
