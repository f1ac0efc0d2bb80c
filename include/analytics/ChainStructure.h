#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analytics/ZonePartitioner.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "market/OptionChain.h"

namespace tugofwar {
namespace analytics {

enum class ConfirmationStatus { CONFIRMED, REVERSAL_ALERT, CONFLICT, NEUTRAL };

enum class TrapType { NONE, BULL_TRAP, BEAR_TRAP };

struct MaxPain {
    bool valid = false;
    int strike = 0;
    double total_payout = 0.0;
    double distance_pct = 0.0;      // |spot - strike| / spot * 100
};

struct OiCluster {
    int strike = 0;
    long long oi = 0;
    double distance_pct = 0.0;      // signed, (strike - spot) / spot * 100
};

struct OiClusters {
    std::vector<OiCluster> resistance;  // calls above spot, OI descending
    std::vector<OiCluster> support;     // puts below spot, OI descending
};

struct IvSkew {
    bool valid = false;
    double otm_put_iv = 0.0;
    double otm_call_iv = 0.0;
    double skew_score = 0.0;        // positive: puts bid, bearish tilt
    Direction direction = Direction::NEUTRAL;
};

struct TrapWarning {
    TrapType type = TrapType::NONE;
    int cluster_strike = 0;
    std::string message;
};

class ChainStructure {
public:
    explicit ChainStructure(const engine::ScoringConfig& config);

    // Settlement strike minimising aggregate writer payout. Brute force over
    // every strike pair.
    static MaxPain maxPain(const market::Snapshot& snapshot);

    OiClusters oiClusters(const market::Snapshot& snapshot) const;

    IvSkew ivSkew(const market::Snapshot& snapshot, const ZoneLayout& layout) const;

    // total put / total call; nullopt when the call side is empty
    static std::optional<double> volumePcr(const market::Snapshot& snapshot);
    static std::optional<double> oiPcr(const market::Snapshot& snapshot);

    Direction oiDirection(double zone_average) const;
    Direction priceDirection(double price_change_pct) const;
    ConfirmationStatus confirmationStatus(double zone_average, double price_change_pct) const;

    TrapWarning detectTrap(const market::Snapshot& snapshot,
                           const OiClusters& clusters,
                           double zone_average,
                           double price_change_pct) const;

    // Linear interpolation between closest ranks
    static double percentile(std::vector<double> values, double pct);

    static const char* toString(ConfirmationStatus status);
    static const char* toString(TrapType type);

private:
    engine::ScoringConfig config_;
};

} // namespace analytics
} // namespace tugofwar
