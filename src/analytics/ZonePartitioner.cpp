#include "analytics/ZonePartitioner.h"

#include <algorithm>
#include <cmath>

namespace tugofwar {
namespace analytics {

int ZonePartitioner::findAtmStrike(double spot_price, const std::vector<int>& sorted_strikes) {
    if (sorted_strikes.empty()) {
        return 0;
    }

    int best = sorted_strikes.front();
    double best_distance = std::abs(static_cast<double>(best) - spot_price);
    for (int strike : sorted_strikes) {
        const double distance = std::abs(static_cast<double>(strike) - spot_price);
        if (distance < best_distance) {
            best = strike;
            best_distance = distance;
        }
    }
    return best;
}

ZoneLayout ZonePartitioner::partition(const market::Snapshot& snapshot, int zone_width) {
    ZoneLayout layout;
    const auto strikes = snapshot.sortedStrikes();
    if (strikes.empty()) {
        return layout;
    }

    const int width = std::max(0, zone_width);
    layout.atm_strike = findAtmStrike(snapshot.spot_price, strikes);
    const auto it = std::lower_bound(strikes.begin(), strikes.end(), layout.atm_strike);
    layout.atm_index = static_cast<std::size_t>(std::distance(strikes.begin(), it));

    const std::size_t below_begin = layout.atm_index >= static_cast<std::size_t>(width)
        ? layout.atm_index - static_cast<std::size_t>(width)
        : 0;
    layout.below.assign(strikes.begin() + below_begin, strikes.begin() + layout.atm_index);

    const std::size_t above_begin = layout.atm_index + 1;
    const std::size_t above_end = std::min(strikes.size(), above_begin + static_cast<std::size_t>(width));
    if (above_begin < above_end) {
        layout.above.assign(strikes.begin() + above_begin, strikes.begin() + above_end);
    }

    layout.valid = true;
    return layout;
}

OptionSide ZonePartitioner::sideOf(ZoneKind kind) {
    switch (kind) {
        case ZoneKind::OTM_PUT:
        case ZoneKind::ITM_PUT:
            return OptionSide::PE;
        case ZoneKind::ITM_CALL:
        case ZoneKind::OTM_CALL:
            return OptionSide::CE;
    }
    return OptionSide::CE;
}

const char* ZonePartitioner::toString(ZoneKind kind) {
    switch (kind) {
        case ZoneKind::OTM_PUT: return "OTM_PUT";
        case ZoneKind::ITM_CALL: return "ITM_CALL";
        case ZoneKind::OTM_CALL: return "OTM_CALL";
        case ZoneKind::ITM_PUT: return "ITM_PUT";
    }
    return "OTM_PUT";
}

} // namespace analytics
} // namespace tugofwar
