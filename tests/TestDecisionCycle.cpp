#include "core/orchestration/DecisionCycleCoordinator.h"
#include "core/learning/EmaAccuracyLearner.h"

#include <cassert>
#include <iostream>
#include <map>
#include <memory>

using namespace tugofwar;

namespace {

constexpr long long kTenAmIst = 1705293000000LL;
constexpr long long kMinute = 60000LL;

class MemorySetupStore : public core::ITradeSetupStore {
public:
    bool create(const strategy::TradeSetup& setup) override {
        if (rows.count(setup.id) > 0) {
            return false;
        }
        rows[setup.id] = setup;
        return true;
    }
    bool update(const strategy::TradeSetup& setup) override {
        if (rows.count(setup.id) == 0) {
            return false;
        }
        rows[setup.id] = setup;
        return true;
    }
    std::optional<strategy::TradeSetup> findById(long long id) const override {
        auto it = rows.find(id);
        if (it == rows.end()) {
            return std::nullopt;
        }
        return it->second;
    }
    std::vector<strategy::TradeSetup> list() const override {
        std::vector<strategy::TradeSetup> out;
        for (const auto& [id, setup] : rows) {
            (void)id;
            out.push_back(setup);
        }
        return out;
    }

    std::map<long long, strategy::TradeSetup> rows;
};

class MemoryJournal : public core::IEventJournal {
public:
    bool append(const core::JournalEvent& event) override {
        core::JournalEvent copy = event;
        copy.seq = events.size() + 1;
        events.push_back(copy);
        return true;
    }
    std::vector<core::JournalEvent> readFrom(std::uint64_t seq_inclusive) override {
        std::vector<core::JournalEvent> out;
        for (const auto& e : events) {
            if (e.seq >= seq_inclusive) {
                out.push_back(e);
            }
        }
        return out;
    }
    std::uint64_t lastSeq() const override { return events.size(); }

    std::vector<core::JournalEvent> events;
};

market::Snapshot chainAt(long long ts_ms, double itm_call_ltp) {
    market::Snapshot s;
    s.timestamp_ms = ts_ms;
    s.spot_price = 24020.0;
    s.expiry = "2024-01-18";
    const long long ce_oi[] = {80000, 110000, 250000, 190000, 280000, 240000, 330000};
    const long long ce_chg[] = {2000, 3000, 15000, 6000, 4000, 2500, 1800};
    const long long pe_oi[] = {310000, 260000, 220000, 120000, 70000, 40000, 30000};
    const long long pe_chg[] = {45000, 38000, 20000, 9000, 1500, 800, 300};
    for (int i = 0; i < 7; ++i) {
        market::StrikeMetrics m;
        m.strike = 23900 + 50 * i;
        m.call_oi = ce_oi[i];
        m.call_oi_change = ce_chg[i];
        m.call_volume = ce_chg[i];
        m.put_oi = pe_oi[i];
        m.put_oi_change = pe_chg[i];
        m.put_volume = pe_chg[i];
        m.call_iv = 11.0;
        m.put_iv = 11.0;
        m.call_ltp = 200.0 - 25.0 * i;
        m.put_ltp = 50.0 + 25.0 * i;
        s.strikes[m.strike] = m;
    }
    s.strikes[23950].call_ltp = itm_call_ltp;
    return s;
}

} // namespace

int main() {
    engine::LifecycleConfig lifecycle;
    lifecycle.require_regime_alignment = false;
    lifecycle.min_confirmations = 1;
    engine::LearnerConfig learner_config;
    learner_config.min_confidence = 0.0;

    auto learner = std::make_shared<core::learning::EmaAccuracyLearner>(learner_config);
    auto store = std::make_shared<MemorySetupStore>();
    auto journal = std::make_shared<MemoryJournal>();

    core::DecisionCycleCoordinator coordinator(
        analytics::TugOfWarEngine(),
        engine::SetupLifecycleManager(lifecycle, engine::SessionConfig()),
        learner, store, journal);
    coordinator.restore();

    engine::MarketHistory history;
    history.price_history = {23950.0, 23975.0, 24000.0, 24010.0};

    // Proposal
    const auto first = coordinator.runCycle(chainAt(kTenAmIst, 175.0), history);
    assert(first.analysis.valid);
    if (first.outcome.events.size() != 1 ||
        first.outcome.events[0].type != engine::LifecycleEventType::CREATED) {
        std::cerr << "[TEST] expected a created setup, gate said "
                  << (first.outcome.gate ? first.outcome.gate->reason : "nothing") << "\n";
        return 1;
    }
    const auto& created = first.outcome.events[0].setup;
    assert(created.strike == 23950);
    assert(created.moneyness == Moneyness::ITM);
    assert(created.risk_pct == 15.0);
    assert(store->rows.size() == 1);
    assert(journal->events.size() == 1);
    assert(journal->events[0].type == core::JournalEventType::SETUP_CREATED);
    assert(journal->events[0].entity_id == "setup-1");
    assert(first.live_pnl && first.live_pnl->status == strategy::SetupStatus::PENDING);

    // Fill at entry
    const auto second = coordinator.runCycle(chainAt(kTenAmIst + kMinute, 175.0), history);
    assert(second.outcome.events.size() == 1);
    assert(second.outcome.events[0].type == engine::LifecycleEventType::ACTIVATED);
    assert(store->rows.at(1).status == strategy::SetupStatus::ACTIVE);

    // Target
    const auto third = coordinator.runCycle(chainAt(kTenAmIst + 2 * kMinute, 210.0), history);
    assert(third.outcome.events.size() == 1);
    assert(third.outcome.events[0].type == engine::LifecycleEventType::WON);
    assert(third.outcome.gate && third.outcome.gate->reason == "resolution_cooldown");
    assert(!third.live_pnl.has_value());
    assert(store->rows.at(1).status == strategy::SetupStatus::WON);
    assert(journal->events.back().type == core::JournalEventType::SETUP_RESOLVED);
    assert(journal->events.back().payload["reason"] == "target1");
    assert(coordinator.performance().overall().wins == 1);
    assert(learner->emaAccuracy() > 0.5);

    // A fresh coordinator picks up where the store left off
    core::DecisionCycleCoordinator restarted(
        analytics::TugOfWarEngine(),
        engine::SetupLifecycleManager(lifecycle, engine::SessionConfig()),
        nullptr, store, nullptr);
    restarted.restore();
    assert(!restarted.state().hasOpenSetup());
    assert(restarted.state().next_setup_id == 2);
    assert(restarted.performance().overall().wins == 1);

    // Empty chains are skipped without touching the lifecycle
    market::Snapshot empty;
    empty.timestamp_ms = kTenAmIst + 3 * kMinute;
    empty.spot_price = 24000.0;
    const auto skipped = restarted.runCycle(empty, history);
    assert(!skipped.analysis.valid);
    assert(skipped.outcome.events.empty());
    assert(skipped.outcome.gate && skipped.outcome.gate->reason == "analysis_invalid");

    std::cout << "[TEST] DecisionCycle PASSED\n";
    return 0;
}
