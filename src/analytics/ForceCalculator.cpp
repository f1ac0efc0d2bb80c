#include "analytics/ForceCalculator.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace tugofwar {
namespace analytics {

namespace {

std::vector<int> activeStrikes(const ZoneLayout& layout) {
    std::vector<int> out(layout.below.begin(), layout.below.end());
    out.push_back(layout.atm_strike);
    out.insert(out.end(), layout.above.begin(), layout.above.end());
    return out;
}

} // namespace

ForceCalculator::ForceCalculator(const engine::ScoringConfig& config)
    : config_(config) {}

double ForceCalculator::convictionMultiplier(long long volume, long long oi_change) const {
    const long long abs_change = std::llabs(oi_change);
    if (abs_change < config_.noise_oi_change) {
        return config_.conviction_stale;
    }

    const double turnover = static_cast<double>(volume) /
        static_cast<double>(std::max<long long>(1, abs_change));
    if (turnover > config_.fresh_turnover) {
        return config_.conviction_fresh;
    }
    if (turnover > config_.moderate_turnover) {
        return config_.conviction_moderate;
    }
    return config_.conviction_stale;
}

double ForceCalculator::force(const market::StrikeMetrics& metrics, OptionSide side, double scale) const {
    const double w = config_.total_oi_weight;
    const double safe_scale = (std::isfinite(scale) && scale > 0.0) ? scale : 1.0;
    const double conviction = convictionMultiplier(metrics.volume(side), metrics.oiChange(side));
    const double blended = (1.0 - w) * static_cast<double>(metrics.oiChange(side)) +
        w * (static_cast<double>(metrics.oi(side)) / safe_scale);
    return conviction * blended;
}

double ForceCalculator::computeScale(const market::Snapshot& snapshot, const ZoneLayout& layout) {
    if (!layout.valid) {
        return 1.0;
    }

    double oi_sum = 0.0;
    double change_sum = 0.0;
    int samples = 0;
    for (int strike : activeStrikes(layout)) {
        const auto* m = snapshot.find(strike);
        if (m == nullptr) {
            continue;
        }
        oi_sum += static_cast<double>(m->call_oi + m->put_oi);
        change_sum += static_cast<double>(std::llabs(m->call_oi_change) + std::llabs(m->put_oi_change));
        samples += 2;
    }

    if (samples == 0) {
        return 1.0;
    }
    const double avg_oi = oi_sum / samples;
    const double avg_change = change_sum / samples;
    if (avg_oi <= 0.0 || avg_change <= 0.0) {
        return 1.0;
    }
    const double scale = avg_oi / avg_change;
    return std::isfinite(scale) && scale > 0.0 ? scale : 1.0;
}

void ForceCalculator::fillZone(Zone& zone, const market::Snapshot& snapshot, double scale,
                               std::vector<StrikeForce>& details) const {
    const OptionSide side = ZonePartitioner::sideOf(zone.kind);
    for (int strike : zone.strikes) {
        const auto* m = snapshot.find(strike);
        if (m == nullptr) {
            continue;
        }
        StrikeForce sf;
        sf.strike = strike;
        sf.zone = zone.kind;
        sf.conviction = convictionMultiplier(m->volume(side), m->oiChange(side));
        sf.force = force(*m, side, scale);
        details.push_back(sf);

        zone.force += sf.force;
        zone.total_oi += m->oi(side);
        zone.total_oi_change += m->oiChange(side);
    }
}

ZoneBreakdown ForceCalculator::computeZones(const market::Snapshot& snapshot, const ZoneLayout& layout) const {
    ZoneBreakdown out;
    out.otm_put.kind = ZoneKind::OTM_PUT;
    out.itm_call.kind = ZoneKind::ITM_CALL;
    out.otm_call.kind = ZoneKind::OTM_CALL;
    out.itm_put.kind = ZoneKind::ITM_PUT;
    if (!layout.valid) {
        return out;
    }

    out.atm_strike = layout.atm_strike;
    out.scale = computeScale(snapshot, layout);

    out.otm_put.strikes = layout.below;
    out.itm_call.strikes = layout.below;
    out.otm_call.strikes = layout.above;
    out.itm_put.strikes = layout.above;

    fillZone(out.otm_put, snapshot, out.scale, out.details);
    fillZone(out.itm_call, snapshot, out.scale, out.details);
    fillZone(out.otm_call, snapshot, out.scale, out.details);
    fillZone(out.itm_put, snapshot, out.scale, out.details);

    out.below_spot_force = out.otm_put.force - out.itm_call.force;
    out.above_spot_force = out.itm_put.force - out.otm_call.force;

    // ATM sits on whichever side of spot it actually falls
    if (const auto* atm = snapshot.find(layout.atm_strike)) {
        const double atm_net = force(*atm, OptionSide::PE, out.scale) -
            force(*atm, OptionSide::CE, out.scale);
        if (static_cast<double>(layout.atm_strike) <= snapshot.spot_price) {
            out.below_spot_force += atm_net;
        } else {
            out.above_spot_force += atm_net;
        }
    }
    return out;
}

} // namespace analytics
} // namespace tugofwar
