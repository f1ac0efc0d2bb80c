#pragma once

#include <vector>

#include "common/Types.h"
#include "market/OptionChain.h"

namespace tugofwar {
namespace analytics {

enum class ZoneKind {
    OTM_PUT,    // below ATM, put writers (support)
    ITM_CALL,   // below ATM, call side
    OTM_CALL,   // above ATM, call writers (resistance)
    ITM_PUT     // above ATM, put side
};

struct Zone {
    ZoneKind kind = ZoneKind::OTM_PUT;
    std::vector<int> strikes;   // ascending
    double force = 0.0;
    long long total_oi = 0;
    long long total_oi_change = 0;
};

struct ZoneLayout {
    bool valid = false;
    int atm_strike = 0;
    std::size_t atm_index = 0;
    std::vector<int> below;     // window immediately below ATM, ascending
    std::vector<int> above;     // window immediately above ATM, ascending
};

class ZonePartitioner {
public:
    // Strike with minimum |strike - spot|; ties resolve to the lower strike.
    static int findAtmStrike(double spot_price, const std::vector<int>& sorted_strikes);

    static ZoneLayout partition(const market::Snapshot& snapshot, int zone_width);

    static OptionSide sideOf(ZoneKind kind);
    static const char* toString(ZoneKind kind);
};

} // namespace analytics
} // namespace tugofwar
