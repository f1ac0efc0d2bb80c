#pragma once

#include <optional>
#include <vector>

#include "market/OptionChain.h"

namespace tugofwar {
namespace engine {

struct OiChangePair {
    long long call_change = 0;
    long long put_change = 0;
};

// Caller-owned rolling context handed to the engine each tick.
// Sequences are oldest first and never include the current snapshot.
struct MarketHistory {
    std::vector<double> price_history;
    std::vector<OiChangePair> oi_change_history;
    market::StrikeMap previous_strikes;
    std::optional<double> vix;
    std::optional<double> futures_oi_change;
};

} // namespace engine
} // namespace tugofwar
