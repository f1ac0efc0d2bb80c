#pragma once

#include <memory>
#include <optional>

#include "analytics/TugOfWarEngine.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/ILearner.h"
#include "core/contracts/ITradeSetupStore.h"
#include "engine/MarketHistory.h"
#include "engine/PerformanceStore.h"
#include "engine/SetupLifecycleManager.h"

namespace tugofwar {
namespace core {

struct CycleResult {
    analytics::Analysis analysis;
    engine::TickOutcome outcome;
    std::optional<engine::LivePnl> live_pnl;
};

// Owns the cross-tick lifecycle state and wires the pure engine/manager to
// the learner, setup store and event journal. Any collaborator may be null.
class DecisionCycleCoordinator {
public:
    DecisionCycleCoordinator(
        analytics::TugOfWarEngine engine,
        engine::SetupLifecycleManager manager,
        std::shared_ptr<ILearner> learner,
        std::shared_ptr<ITradeSetupStore> store,
        std::shared_ptr<IEventJournal> journal
    );

    // Reloads lifecycle state and statistics from the setup store.
    void restore();

    CycleResult runCycle(const market::Snapshot& snapshot, const engine::MarketHistory& history);

    const engine::LifecycleState& state() const { return state_; }
    const engine::PerformanceStore& performance() const { return performance_; }

private:
    void dispatch(const engine::LifecycleEvent& event);
    void persist(const engine::LifecycleEvent& event);
    void journal(const engine::LifecycleEvent& event);

    analytics::TugOfWarEngine engine_;
    engine::SetupLifecycleManager manager_;
    std::shared_ptr<ILearner> learner_;
    std::shared_ptr<ITradeSetupStore> store_;
    std::shared_ptr<IEventJournal> journal_;

    engine::LifecycleState state_;
    engine::PerformanceStore performance_;
};

} // namespace core
} // namespace tugofwar
