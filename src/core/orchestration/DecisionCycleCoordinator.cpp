#include "core/orchestration/DecisionCycleCoordinator.h"

#include <string>

#include "common/Logger.h"

namespace tugofwar {
namespace core {

namespace {
JournalEventType journalTypeFor(engine::LifecycleEventType type) {
    switch (type) {
        case engine::LifecycleEventType::CREATED: return JournalEventType::SETUP_CREATED;
        case engine::LifecycleEventType::ACTIVATED: return JournalEventType::SETUP_ACTIVATED;
        case engine::LifecycleEventType::WON:
        case engine::LifecycleEventType::LOST: return JournalEventType::SETUP_RESOLVED;
        case engine::LifecycleEventType::CANCELLED: return JournalEventType::SETUP_CANCELLED;
        case engine::LifecycleEventType::EXPIRED: return JournalEventType::SETUP_EXPIRED;
    }
    return JournalEventType::SETUP_CREATED;
}
} // namespace

DecisionCycleCoordinator::DecisionCycleCoordinator(
    analytics::TugOfWarEngine engine,
    engine::SetupLifecycleManager manager,
    std::shared_ptr<ILearner> learner,
    std::shared_ptr<ITradeSetupStore> store,
    std::shared_ptr<IEventJournal> journal
)
    : engine_(std::move(engine))
    , manager_(std::move(manager))
    , learner_(std::move(learner))
    , store_(std::move(store))
    , journal_(std::move(journal)) {}

void DecisionCycleCoordinator::restore() {
    if (!store_) {
        return;
    }
    const auto setups = store_->list();
    state_ = engine::SetupLifecycleManager::restore(setups);
    performance_.rebuild(setups);
    if (state_.open_setup) {
        LOG_INFO("Restored open setup #{} ({})", state_.open_setup->id,
                 strategy::toString(state_.open_setup->status));
    }
}

CycleResult DecisionCycleCoordinator::runCycle(const market::Snapshot& snapshot,
                                               const engine::MarketHistory& history) {
    CycleResult result;
    result.analysis = engine_.analyze(snapshot, history);
    if (!result.analysis.valid) {
        LOG_WARN("Analysis skipped: {}", result.analysis.error);
    }

    result.outcome = manager_.processTick(state_, result.analysis, snapshot, history, learner_.get());
    for (const auto& event : result.outcome.events) {
        dispatch(event);
    }

    if (state_.open_setup) {
        result.live_pnl = engine::SetupLifecycleManager::livePnl(*state_.open_setup, snapshot);
    }
    return result;
}

void DecisionCycleCoordinator::dispatch(const engine::LifecycleEvent& event) {
    persist(event);
    journal(event);

    if (strategy::isTerminal(event.setup.status)) {
        performance_.record(event.setup);
        if (learner_) {
            learner_->onSetupResolved(event.setup);
        }
    }
}

void DecisionCycleCoordinator::persist(const engine::LifecycleEvent& event) {
    if (!store_) {
        return;
    }
    const bool ok = event.type == engine::LifecycleEventType::CREATED
        ? store_->create(event.setup)
        : store_->update(event.setup);
    if (!ok) {
        LOG_WARN("Failed to persist setup #{} ({})", event.setup.id,
                 engine::SetupLifecycleManager::toString(event.type));
    }
}

void DecisionCycleCoordinator::journal(const engine::LifecycleEvent& event) {
    if (!journal_) {
        return;
    }
    JournalEvent entry;
    entry.ts_ms = event.setup.resolved_at_ms.value_or(
        event.setup.activated_at_ms.value_or(event.setup.created_at_ms));
    entry.type = journalTypeFor(event.type);
    entry.expiry = event.setup.expiry;
    entry.entity_id = "setup-" + std::to_string(event.setup.id);
    entry.payload = strategy::toJson(event.setup);
    entry.payload["event"] = engine::SetupLifecycleManager::toString(event.type);
    entry.payload["reason"] = event.reason;
    if (!journal_->append(entry)) {
        LOG_WARN("Failed to journal setup #{} event", event.setup.id);
    }
}

} // namespace core
} // namespace tugofwar
