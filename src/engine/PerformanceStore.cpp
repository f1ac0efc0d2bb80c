#include "engine/PerformanceStore.h"

#include <cmath>

namespace tugofwar {
namespace engine {
namespace {
int qualityBucket(int quality_score) {
    if (quality_score < 4) {
        return 0;
    }
    if (quality_score < 6) {
        return 1;
    }
    return 2;
}

void accumulateStats(SetupPerformanceStats& s, const strategy::TradeSetup& setup) {
    s.setups++;
    switch (setup.status) {
        case strategy::SetupStatus::CANCELLED:
            s.cancelled++;
            return;
        case strategy::SetupStatus::EXPIRED:
            s.expired++;
            return;
        case strategy::SetupStatus::WON:
            s.wins++;
            break;
        case strategy::SetupStatus::LOST:
            s.losses++;
            break;
        default:
            return;
    }

    const double pnl = setup.profit_loss_pct.value_or(0.0);
    s.net_pnl_pct += pnl;
    if (pnl > 0.0) {
        s.gross_profit_pct += pnl;
    } else if (pnl < 0.0) {
        s.gross_loss_pct_abs += std::abs(pnl);
    }
}
}

void PerformanceStore::rebuild(const std::vector<strategy::TradeSetup>& setups) {
    overall_ = SetupPerformanceStats();
    by_verdict_.clear();
    by_bucket_.clear();

    for (const auto& setup : setups) {
        record(setup);
    }
}

void PerformanceStore::record(const strategy::TradeSetup& setup) {
    if (setup.isOpen()) {
        return;
    }
    accumulateStats(overall_, setup);
    accumulateStats(by_verdict_[setup.verdict], setup);

    PerformanceBucketKey key;
    key.verdict = setup.verdict;
    key.regime = setup.regime;
    key.quality_bucket = qualityBucket(setup.quality_score);
    accumulateStats(by_bucket_[key], setup);
}

} // namespace engine
} // namespace tugofwar
