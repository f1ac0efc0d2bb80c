#include "analytics/TugOfWarEngine.h"

#include <algorithm>
#include <cmath>

#include "analytics/ConfidenceScorer.h"
#include "analytics/FlowSignals.h"
#include "analytics/Verdict.h"
#include "analytics/ZonePartitioner.h"
#include "common/Logger.h"
#include "strategy/TradeSetupBuilder.h"

namespace tugofwar {
namespace analytics {

TugOfWarEngine::TugOfWarEngine(const engine::ScoringConfig& config)
    : config_(config)
    , forces_(config)
    , aggregator_(config)
    , regime_detector_(config)
    , structure_(config) {}

Analysis TugOfWarEngine::invalid(const market::Snapshot& snapshot, const char* reason) {
    Analysis analysis;
    analysis.valid = false;
    analysis.error = reason;
    analysis.timestamp_ms = snapshot.timestamp_ms;
    analysis.spot_price = snapshot.spot_price;
    analysis.expiry = snapshot.expiry;
    return analysis;
}

Analysis TugOfWarEngine::analyze(const market::Snapshot& snapshot, const engine::MarketHistory& history) const {
    if (snapshot.empty()) {
        return invalid(snapshot, "No strike data available");
    }
    if (!(snapshot.spot_price > 0.0) || !std::isfinite(snapshot.spot_price)) {
        return invalid(snapshot, "Spot price unavailable");
    }

    const ZoneLayout layout = ZonePartitioner::partition(snapshot, config_.zone_width);
    if (!layout.valid) {
        return invalid(snapshot, "ATM strike not found");
    }

    Analysis a;
    a.valid = true;
    a.timestamp_ms = snapshot.timestamp_ms;
    a.spot_price = snapshot.spot_price;
    a.expiry = snapshot.expiry;
    a.atm_strike = layout.atm_strike;

    // 1. Zone forces
    a.zones = forces_.computeZones(snapshot, layout);
    a.strength_ratios = aggregator_.strengthRatios(a.zones);
    a.legacy_scores = StrengthAggregator::legacyZoneScores(a.zones);

    // 2. Price
    const double price_change_pct = FlowSignals::priceChangePct(history.price_history, snapshot.spot_price);
    const double momentum = FlowSignals::momentum(history.price_history, snapshot.spot_price, config_.momentum_scale);
    a.blend = aggregator_.combine(a.legacy_scores, a.strength_ratios, momentum, price_change_pct);
    a.regime = regime_detector_.analyzeRegime(history.price_history, snapshot.spot_price, momentum);

    double combined = a.blend.combined_score;

    // 3. OI flow across the whole chain
    for (const auto& [strike, metrics] : snapshot.strikes) {
        (void)strike;
        a.call_oi_change += metrics.call_oi_change;
        a.put_oi_change += metrics.put_oi_change;
    }
    a.oi_acceleration = FlowSignals::oiAcceleration({a.call_oi_change, a.put_oi_change},
                                                    history.oi_change_history, momentum, config_);
    combined += a.oi_acceleration.score_adjustment;

    // 4. Premium momentum can pull a score back when premiums disagree
    a.premium_momentum = FlowSignals::premiumMomentum(snapshot, history.previous_strikes,
                                                      layout.atm_strike, config_.premium_momentum_multiplier);
    a.premium_adjustment = FlowSignals::premiumAdjustment(combined, a.premium_momentum, config_);
    combined += a.premium_adjustment;

    a.combined_score = std::isfinite(combined) ? std::clamp(combined, -100.0, 100.0) : 0.0;
    const VerdictClassification verdict = classifyVerdict(a.combined_score);
    a.verdict = verdict.verdict;
    a.strength = verdict.strength;

    // 5. Chain structure
    a.max_pain = ChainStructure::maxPain(snapshot);
    a.clusters = structure_.oiClusters(snapshot);
    a.iv_skew = structure_.ivSkew(snapshot, layout);
    a.volume_pcr = ChainStructure::volumePcr(snapshot);
    a.pcr = ChainStructure::oiPcr(snapshot);
    a.confirmation = structure_.confirmationStatus(a.blend.zone_average, price_change_pct);
    a.trap = structure_.detectTrap(snapshot, a.clusters, a.blend.zone_average, price_change_pct);
    if (a.trap.type != TrapType::NONE) {
        LOG_WARN("{}: {}", ChainStructure::toString(a.trap.type), a.trap.message);
    }

    // 6. Confidence
    ConfidenceInputs inputs;
    inputs.combined_score = a.combined_score;
    inputs.signal_direction = verdictDirection(a.verdict);
    inputs.iv_skew_direction = a.iv_skew.direction;
    inputs.volume_pcr = a.volume_pcr;
    if (a.max_pain.valid) {
        inputs.max_pain_distance_pct = a.max_pain.distance_pct;
    }
    inputs.confirmation = a.confirmation;
    inputs.vix = history.vix;
    inputs.futures_oi_change = history.futures_oi_change;
    inputs.momentum = momentum;
    a.confidence_breakdown = ConfidenceScorer::score(inputs);
    a.confidence = a.confidence_breakdown.confidence;

    // 7. Proposal
    a.trade_setup = strategy::TradeSetupBuilder::build(a, snapshot);

    LOG_DEBUG("Analysis spot={:.2f} atm={} score={:.1f} verdict={} conf={:.0f} regime={}",
              a.spot_price, a.atm_strike, a.combined_score, toString(a.verdict), a.confidence,
              RegimeDetector::toString(a.regime.regime));
    return a;
}

} // namespace analytics
} // namespace tugofwar
