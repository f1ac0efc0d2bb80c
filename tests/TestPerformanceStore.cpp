#include "engine/PerformanceStore.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace tugofwar;
using strategy::SetupStatus;

namespace {

strategy::TradeSetup finished(long long id, analytics::Verdict verdict, SetupStatus status,
                              std::optional<double> pnl, int quality) {
    strategy::TradeSetup s;
    s.id = id;
    s.verdict = verdict;
    s.status = status;
    s.profit_loss_pct = pnl;
    s.quality_score = quality;
    return s;
}

} // namespace

int main() {
    engine::PerformanceStore store;
    store.rebuild({
        finished(1, analytics::Verdict::BULLS_WINNING, SetupStatus::WON, 20.0, 6),
        finished(2, analytics::Verdict::BULLS_WINNING, SetupStatus::LOST, -10.0, 3),
        finished(3, analytics::Verdict::BEARS_WINNING, SetupStatus::CANCELLED, std::nullopt, 5),
        finished(4, analytics::Verdict::BEARS_WINNING, SetupStatus::EXPIRED, std::nullopt, 5),
        finished(5, analytics::Verdict::BULLS_WINNING, SetupStatus::PENDING, std::nullopt, 7),
    });

    const auto& overall = store.overall();
    if (overall.setups != 4) {
        std::cerr << "[TEST] open setups must not be counted, got " << overall.setups << "\n";
        return 1;
    }
    assert(overall.wins == 1);
    assert(overall.losses == 1);
    assert(overall.cancelled == 1);
    assert(overall.expired == 1);
    assert(std::abs(overall.winRate() - 0.5) < 1e-12);
    assert(std::abs(overall.averagePnlPct() - 5.0) < 1e-12);
    assert(std::abs(overall.profitFactor() - 2.0) < 1e-12);

    const auto& bulls = store.byVerdict().at(analytics::Verdict::BULLS_WINNING);
    assert(bulls.setups == 2);
    const auto& bears = store.byVerdict().at(analytics::Verdict::BEARS_WINNING);
    assert(bears.resolved() == 0);
    assert(bears.winRate() == 0.0);

    engine::PerformanceBucketKey key;
    key.verdict = analytics::Verdict::BULLS_WINNING;
    key.regime = analytics::MarketRegime::RANGE_BOUND;
    key.quality_bucket = 2;
    assert(store.byBucket().at(key).wins == 1);

    store.record(finished(6, analytics::Verdict::BULLS_WINNING, SetupStatus::WON, 10.0, 6));
    assert(store.overall().wins == 2);
    assert(store.byBucket().at(key).setups == 2);

    store.rebuild({});
    assert(store.overall().setups == 0);
    assert(store.byVerdict().empty());

    std::cout << "[TEST] PerformanceStore PASSED\n";
    return 0;
}
