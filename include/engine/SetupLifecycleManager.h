#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analytics/Analysis.h"
#include "core/contracts/ILearner.h"
#include "core/execution/SetupLifecycleStateMachine.h"
#include "engine/EngineConfig.h"
#include "engine/MarketHistory.h"
#include "market/OptionChain.h"
#include "strategy/TradeSetup.h"

namespace tugofwar {
namespace engine {

// Cross-tick lifecycle state. Owned by the caller and passed into every call.
struct LifecycleState {
    std::optional<strategy::TradeSetup> open_setup;     // only ever PENDING or ACTIVE
    long long next_setup_id = 1;

    std::optional<int> ticks_since_resolution;
    std::optional<long long> last_resolved_at_ms;
    std::optional<long long> last_cancelled_at_ms;
    std::optional<TradeDirection> last_proposed_direction;
    std::optional<long long> last_proposal_at_ms;

    bool hasOpenSetup() const { return open_setup.has_value(); }
};

struct GateDecision {
    bool allowed = false;
    std::string reason;
};

enum class LifecycleEventType { CREATED, ACTIVATED, WON, LOST, CANCELLED, EXPIRED };

struct LifecycleEvent {
    LifecycleEventType type = LifecycleEventType::CREATED;
    strategy::TradeSetup setup;     // copy after the change was applied
    std::string reason;
};

struct TickOutcome {
    std::vector<LifecycleEvent> events;
    std::optional<GateDecision> gate;   // set when creation was evaluated
};

struct LivePnl {
    long long setup_id = 0;
    strategy::SetupStatus status = strategy::SetupStatus::PENDING;
    double current_premium = 0.0;
    double pnl_pct = 0.0;           // ACTIVE: vs activation, PENDING: vs entry
    double pnl_points = 0.0;
};

class SetupLifecycleManager {
public:
    SetupLifecycleManager(const LifecycleConfig& lifecycle, const SessionConfig& session);

    // One scheduler tick. Order: advance the open setup with the current
    // premium, withdraw it on a direction flip or learner pause, expire /
    // force-close on session cutoffs, then evaluate the creation gate.
    TickOutcome processTick(LifecycleState& state,
                            const analytics::Analysis& analysis,
                            const market::Snapshot& snapshot,
                            const MarketHistory& history,
                            const core::ILearner* learner) const;

    std::optional<LifecycleEvent> updateWithPremium(LifecycleState& state, double premium, long long now_ms) const;
    std::optional<LifecycleEvent> cancelOnDirectionChange(LifecycleState& state, analytics::Verdict verdict,
                                                          long long now_ms) const;
    std::optional<LifecycleEvent> cancelOnLearnerPause(LifecycleState& state, const core::ILearner* learner,
                                                       long long now_ms) const;
    std::optional<LifecycleEvent> expirePending(LifecycleState& state, long long now_ms) const;
    std::optional<LifecycleEvent> forceCloseActive(LifecycleState& state, std::optional<double> premium,
                                                   long long now_ms) const;

    GateDecision shouldCreateSetup(const LifecycleState& state,
                                   const analytics::Analysis& analysis,
                                   const std::vector<double>& price_history,
                                   const core::ILearner* learner) const;

    // Opens the analysis' candidate as a new PENDING setup. Callers gate first.
    std::optional<LifecycleEvent> createSetup(LifecycleState& state, const analytics::Analysis& analysis) const;

    // OI/price confirmation, regime, premium momentum, IV skew
    int countConfirmations(const analytics::Analysis& analysis) const;

    bool withinSetupHours(long long ts_ms) const;

    static std::optional<LivePnl> livePnl(const strategy::TradeSetup& setup, const market::Snapshot& snapshot);

    // Rebuilds state from persisted setups after a restart.
    static LifecycleState restore(const std::vector<strategy::TradeSetup>& setups);

    static const char* toString(LifecycleEventType type);

private:
    std::optional<LifecycleEvent> apply(LifecycleState& state, core::execution::SetupEvent event,
                                        std::optional<double> premium, long long now_ms,
                                        const std::string& reason) const;

    bool isMoveAlreadyHappened(Direction direction, double spot, const std::vector<double>& price_history) const;
    bool isBounceInProgress(Direction direction, double spot, const std::vector<double>& price_history) const;

    LifecycleConfig config_;
    SessionConfig session_;
};

} // namespace engine
} // namespace tugofwar
