#pragma once

#include <string>
#include <vector>

#include "engine/EngineConfig.h"

namespace tugofwar {
namespace analytics {

enum class MarketRegime {
    TRENDING_UP,        // pinned to window high with strong positive momentum
    TRENDING_DOWN,      // pinned to window low with strong negative momentum
    RANGE_BOUND
};

struct RegimeAnalysis {
    MarketRegime regime = MarketRegime::RANGE_BOUND;
    double momentum = 0.0;
    double window_high = 0.0;
    double window_low = 0.0;
    double range_pct = 0.0;         // (high - low) / price
    // OI-change vs total-OI blend suggested for this regime
    double oi_change_weight = 0.70;
    double total_oi_weight = 0.30;
    std::string description;
};

class RegimeDetector {
public:
    explicit RegimeDetector(const engine::ScoringConfig& config);

    // price_history is oldest first and excludes current_price
    RegimeAnalysis analyzeRegime(const std::vector<double>& price_history,
                                 double current_price,
                                 double momentum) const;

    static const char* toString(MarketRegime regime);
    static MarketRegime fromString(const std::string& value);

private:
    engine::ScoringConfig config_;
};

} // namespace analytics
} // namespace tugofwar
