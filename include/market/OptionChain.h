#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace tugofwar {
namespace market {

// Per-strike open-interest book for both option sides.
// IV and last price are optional at the source; an absent value reads as 0
// through the *Or0 accessors, which is what the scoring code uses.
struct StrikeMetrics {
    int strike = 0;

    long long call_oi = 0;
    long long put_oi = 0;
    long long call_oi_change = 0;
    long long put_oi_change = 0;
    long long call_volume = 0;
    long long put_volume = 0;

    std::optional<double> call_iv;
    std::optional<double> put_iv;
    std::optional<double> call_ltp;
    std::optional<double> put_ltp;

    long long oi(OptionSide side) const { return side == OptionSide::CE ? call_oi : put_oi; }
    long long oiChange(OptionSide side) const { return side == OptionSide::CE ? call_oi_change : put_oi_change; }
    long long volume(OptionSide side) const { return side == OptionSide::CE ? call_volume : put_volume; }
    double ivOr0(OptionSide side) const {
        return (side == OptionSide::CE ? call_iv : put_iv).value_or(0.0);
    }
    double ltpOr0(OptionSide side) const {
        return (side == OptionSide::CE ? call_ltp : put_ltp).value_or(0.0);
    }
};

using StrikeMap = std::map<int, StrikeMetrics>;

struct Snapshot {
    long long timestamp_ms = 0;
    double spot_price = 0.0;
    std::string expiry;
    StrikeMap strikes;

    bool empty() const { return strikes.empty(); }
    const StrikeMetrics* find(int strike) const;
    std::vector<int> sortedStrikes() const;

    // Last traded price of one side of one strike; nullopt when missing or <= 0.
    std::optional<double> premium(int strike, OptionSide side) const;
};

std::optional<double> premiumOf(const StrikeMap& strikes, int strike, OptionSide side);

// JSON boundary. Accepts strikes either as an object keyed by strike or as an
// array of rows carrying a "strike" field. Field names follow the chain feed:
// ce_oi, ce_oi_change, ce_volume, ce_iv, ce_ltp and the pe_* counterparts.
class SnapshotParser {
public:
    static std::optional<Snapshot> fromJson(const nlohmann::json& raw);
    static std::optional<StrikeMetrics> strikeFromJson(int strike, const nlohmann::json& row);
    static StrikeMap strikesFromJson(const nlohmann::json& raw_strikes);
    static nlohmann::json toJson(const Snapshot& snapshot);
};

} // namespace market
} // namespace tugofwar
