#include "analytics/Analysis.h"

#include <iomanip>
#include <sstream>

namespace tugofwar {
namespace analytics {

namespace {

nlohmann::json zoneJson(const Zone& zone) {
    return {
        {"zone", ZonePartitioner::toString(zone.kind)},
        {"strikes", zone.strikes},
        {"force", zone.force},
        {"total_oi", zone.total_oi},
        {"total_oi_change", zone.total_oi_change}
    };
}

nlohmann::json clustersJson(const std::vector<OiCluster>& clusters) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& c : clusters) {
        rows.push_back({{"strike", c.strike}, {"oi", c.oi}, {"distance_pct", c.distance_pct}});
    }
    return rows;
}

} // namespace

nlohmann::json toJson(const Analysis& analysis) {
    nlohmann::json j;
    j["valid"] = analysis.valid;
    if (!analysis.error.empty()) {
        j["error"] = analysis.error;
    }
    j["timestamp_ms"] = analysis.timestamp_ms;
    j["spot_price"] = analysis.spot_price;
    j["expiry"] = analysis.expiry;
    j["atm_strike"] = analysis.atm_strike;
    j["combined_score"] = analysis.combined_score;
    j["verdict"] = toString(analysis.verdict);
    j["strength"] = toString(analysis.strength);
    j["signal_confidence"] = analysis.confidence;

    j["zones"] = {
        {"otm_put", zoneJson(analysis.zones.otm_put)},
        {"itm_call", zoneJson(analysis.zones.itm_call)},
        {"otm_call", zoneJson(analysis.zones.otm_call)},
        {"itm_put", zoneJson(analysis.zones.itm_put)},
        {"below_spot_force", analysis.zones.below_spot_force},
        {"above_spot_force", analysis.zones.above_spot_force}
    };
    j["strength_analysis"] = {
        {"put_strength_score", analysis.strength_ratios.put_strength_score},
        {"call_strength_score", analysis.strength_ratios.call_strength_score},
        {"net_strength", analysis.strength_ratios.net_strength},
        {"direction", toString(analysis.strength_ratios.direction)}
    };
    j["below_spot_score"] = analysis.legacy_scores.below_score;
    j["above_spot_score"] = analysis.legacy_scores.above_score;
    j["weights"] = {
        {"zone_average", analysis.blend.zone_average},
        {"momentum", analysis.blend.momentum},
        {"momentum_weight", analysis.blend.momentum_weight},
        {"zone_weight", analysis.blend.zone_weight},
        {"divergence", analysis.blend.divergence}
    };
    j["price_change_pct"] = analysis.blend.price_change_pct;
    j["market_regime"] = {
        {"regime", RegimeDetector::toString(analysis.regime.regime)},
        {"oi_change_weight", analysis.regime.oi_change_weight},
        {"total_oi_weight", analysis.regime.total_oi_weight},
        {"range_pct", analysis.regime.range_pct}
    };
    j["oi_acceleration"] = {
        {"phase", FlowSignals::toString(analysis.oi_acceleration.phase)},
        {"net_acceleration", analysis.oi_acceleration.net_acceleration},
        {"score_adjustment", analysis.oi_acceleration.score_adjustment}
    };
    j["premium_momentum"] = {
        {"valid", analysis.premium_momentum.valid},
        {"premium_momentum_score", analysis.premium_momentum.premium_momentum_score},
        {"adjustment", analysis.premium_adjustment}
    };
    if (analysis.max_pain.valid) {
        j["max_pain"] = analysis.max_pain.strike;
    } else {
        j["max_pain"] = nullptr;
    }
    j["oi_clusters"] = {
        {"resistance", clustersJson(analysis.clusters.resistance)},
        {"support", clustersJson(analysis.clusters.support)}
    };
    j["iv_skew"] = analysis.iv_skew.skew_score;
    j["volume_pcr"] = analysis.volume_pcr ? nlohmann::json(*analysis.volume_pcr) : nlohmann::json(nullptr);
    j["pcr"] = analysis.pcr ? nlohmann::json(*analysis.pcr) : nlohmann::json(nullptr);
    j["confirmation_status"] = ChainStructure::toString(analysis.confirmation);
    j["trap_warning"] = ChainStructure::toString(analysis.trap.type);
    j["call_oi_change"] = analysis.call_oi_change;
    j["put_oi_change"] = analysis.put_oi_change;
    if (analysis.trade_setup) {
        j["trade_setup"] = strategy::toJson(*analysis.trade_setup);
    }
    return j;
}

std::string formatSummary(const Analysis& analysis) {
    std::ostringstream out;
    if (!analysis.valid) {
        out << "Analysis unavailable: " << analysis.error;
        return out.str();
    }

    out << std::fixed << std::setprecision(2);
    out << "=== OI Tug-of-War ===\n";
    out << "Spot: " << analysis.spot_price << "  ATM: " << analysis.atm_strike
        << "  Regime: " << RegimeDetector::toString(analysis.regime.regime) << "\n";
    out << "Below spot force: " << analysis.zones.below_spot_force
        << "  Above spot force: " << analysis.zones.above_spot_force << "\n";
    out << "Call OI chg: " << analysis.call_oi_change
        << "  Put OI chg: " << analysis.put_oi_change;
    if (analysis.pcr) {
        out << "  PCR: " << *analysis.pcr;
    }
    out << "\n";
    if (analysis.max_pain.valid) {
        out << "Max pain: " << analysis.max_pain.strike << "\n";
    }
    if (analysis.trap.type != TrapType::NONE) {
        out << "Trap: " << analysis.trap.message << "\n";
    }
    out << ">>> " << toString(analysis.verdict) << " (score " << analysis.combined_score
        << ", confidence " << analysis.confidence << ", "
        << ChainStructure::toString(analysis.confirmation) << ") <<<";
    return out.str();
}

} // namespace analytics
} // namespace tugofwar
