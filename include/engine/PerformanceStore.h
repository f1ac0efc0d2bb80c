#pragma once

#include "analytics/RegimeDetector.h"
#include "analytics/Verdict.h"
#include "strategy/TradeSetup.h"
#include <functional>
#include <unordered_map>
#include <vector>

namespace tugofwar {
namespace engine {

struct SetupPerformanceStats {
    int setups = 0;
    int wins = 0;
    int losses = 0;
    int cancelled = 0;
    int expired = 0;
    double net_pnl_pct = 0.0;
    double gross_profit_pct = 0.0;
    double gross_loss_pct_abs = 0.0;

    int resolved() const { return wins + losses; }
    double winRate() const {
        return (resolved() > 0) ? (static_cast<double>(wins) / static_cast<double>(resolved())) : 0.0;
    }
    double averagePnlPct() const {
        return (resolved() > 0) ? (net_pnl_pct / static_cast<double>(resolved())) : 0.0;
    }
    double profitFactor() const {
        return (gross_loss_pct_abs > 1e-12) ? (gross_profit_pct / gross_loss_pct_abs) : 0.0;
    }
};

struct PerformanceBucketKey {
    analytics::Verdict verdict = analytics::Verdict::NEUTRAL;
    analytics::MarketRegime regime = analytics::MarketRegime::RANGE_BOUND;
    int quality_bucket = 0; // 0: <4, 1: 4-5, 2: >=6

    bool operator==(const PerformanceBucketKey& other) const {
        return verdict == other.verdict &&
               regime == other.regime &&
               quality_bucket == other.quality_bucket;
    }
};

struct PerformanceBucketKeyHash {
    std::size_t operator()(const PerformanceBucketKey& key) const {
        std::size_t h1 = std::hash<int>{}(static_cast<int>(key.verdict));
        std::size_t h2 = std::hash<int>{}(static_cast<int>(key.regime));
        std::size_t h3 = std::hash<int>{}(key.quality_bucket);
        return h1 ^ (h2 << 1) ^ (h3 << 2);
    }
};

struct VerdictHash {
    std::size_t operator()(analytics::Verdict verdict) const {
        return std::hash<int>{}(static_cast<int>(verdict));
    }
};

// Aggregates finished setups. Open setups are ignored.
class PerformanceStore {
public:
    void rebuild(const std::vector<strategy::TradeSetup>& setups);
    void record(const strategy::TradeSetup& setup);

    const SetupPerformanceStats& overall() const { return overall_; }
    const std::unordered_map<analytics::Verdict, SetupPerformanceStats, VerdictHash>& byVerdict() const {
        return by_verdict_;
    }
    const std::unordered_map<PerformanceBucketKey, SetupPerformanceStats, PerformanceBucketKeyHash>& byBucket() const {
        return by_bucket_;
    }

private:
    SetupPerformanceStats overall_;
    std::unordered_map<analytics::Verdict, SetupPerformanceStats, VerdictHash> by_verdict_;
    std::unordered_map<PerformanceBucketKey, SetupPerformanceStats, PerformanceBucketKeyHash> by_bucket_;
};

} // namespace engine
} // namespace tugofwar
