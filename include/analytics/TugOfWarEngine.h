#pragma once

#include "analytics/Analysis.h"
#include "analytics/ChainStructure.h"
#include "analytics/ForceCalculator.h"
#include "analytics/RegimeDetector.h"
#include "analytics/StrengthAggregator.h"
#include "engine/EngineConfig.h"
#include "engine/MarketHistory.h"
#include "market/OptionChain.h"

namespace tugofwar {
namespace analytics {

// Snapshot + caller-supplied history -> Analysis. Stateless across calls.
class TugOfWarEngine {
public:
    explicit TugOfWarEngine(const engine::ScoringConfig& config = engine::ScoringConfig());

    // Never throws on market data; an empty or unpriced chain yields an
    // Analysis with valid == false and a Neutral verdict.
    Analysis analyze(const market::Snapshot& snapshot, const engine::MarketHistory& history) const;

    const engine::ScoringConfig& config() const { return config_; }

private:
    static Analysis invalid(const market::Snapshot& snapshot, const char* reason);

    engine::ScoringConfig config_;
    ForceCalculator forces_;
    StrengthAggregator aggregator_;
    RegimeDetector regime_detector_;
    ChainStructure structure_;
};

} // namespace analytics
} // namespace tugofwar
