#pragma once

#include <vector>

#include "analytics/ZonePartitioner.h"
#include "engine/EngineConfig.h"
#include "market/OptionChain.h"

namespace tugofwar {
namespace analytics {

struct StrikeForce {
    int strike = 0;
    ZoneKind zone = ZoneKind::OTM_PUT;
    double conviction = 0.0;
    double force = 0.0;
};

struct ZoneBreakdown {
    int atm_strike = 0;
    Zone otm_put;
    Zone itm_call;
    Zone otm_call;
    Zone itm_put;

    double scale = 1.0;             // avg OI / avg |OI change| over active strikes
    double below_spot_force = 0.0;  // net (put - call) force at and below spot
    double above_spot_force = 0.0;  // net (put - call) force above spot
    std::vector<StrikeForce> details;
};

// Turns raw strike metrics into directional force.
//   force = conviction * ((1 - w) * dOI + w * (OI / scale))
class ForceCalculator {
public:
    explicit ForceCalculator(const engine::ScoringConfig& config);

    double convictionMultiplier(long long volume, long long oi_change) const;

    double force(const market::StrikeMetrics& metrics, OptionSide side, double scale) const;

    // Scale is computed over the zone strikes plus the ATM strike; both sides
    // of each strike contribute. Falls back to 1 on any zero average.
    static double computeScale(const market::Snapshot& snapshot, const ZoneLayout& layout);

    ZoneBreakdown computeZones(const market::Snapshot& snapshot, const ZoneLayout& layout) const;

private:
    void fillZone(Zone& zone, const market::Snapshot& snapshot, double scale,
                  std::vector<StrikeForce>& details) const;

    engine::ScoringConfig config_;
};

} // namespace analytics
} // namespace tugofwar
