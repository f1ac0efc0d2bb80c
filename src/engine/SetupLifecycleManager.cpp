#include "engine/SetupLifecycleManager.h"

#include <algorithm>
#include <cmath>

#include "common/Logger.h"
#include "strategy/TradeSetupBuilder.h"

namespace tugofwar {
namespace engine {

using core::execution::SetupEvent;
using core::execution::SetupLifecycleStateMachine;
using strategy::SetupStatus;
using strategy::TradeSetup;

namespace {

LifecycleEventType eventTypeFor(SetupStatus status) {
    switch (status) {
        case SetupStatus::ACTIVE: return LifecycleEventType::ACTIVATED;
        case SetupStatus::WON: return LifecycleEventType::WON;
        case SetupStatus::LOST: return LifecycleEventType::LOST;
        case SetupStatus::CANCELLED: return LifecycleEventType::CANCELLED;
        case SetupStatus::EXPIRED: return LifecycleEventType::EXPIRED;
        case SetupStatus::PENDING: break;
    }
    return LifecycleEventType::CREATED;
}

GateDecision reject(const std::string& reason) {
    LOG_INFO("Setup gate rejected: {}", reason);
    return GateDecision{false, reason};
}

} // namespace

SetupLifecycleManager::SetupLifecycleManager(const LifecycleConfig& lifecycle, const SessionConfig& session)
    : config_(lifecycle)
    , session_(session) {}

TickOutcome SetupLifecycleManager::processTick(LifecycleState& state,
                                               const analytics::Analysis& analysis,
                                               const market::Snapshot& snapshot,
                                               const MarketHistory& history,
                                               const core::ILearner* learner) const {
    TickOutcome outcome;
    const long long now_ms = analysis.timestamp_ms != 0 ? analysis.timestamp_ms : snapshot.timestamp_ms;

    if (state.ticks_since_resolution) {
        ++(*state.ticks_since_resolution);
    }

    auto collect = [&outcome](std::optional<LifecycleEvent> event) {
        if (event) {
            outcome.events.push_back(std::move(*event));
        }
    };

    std::optional<double> premium;
    if (state.open_setup) {
        premium = snapshot.premium(state.open_setup->strike, state.open_setup->option_side);
        if (premium) {
            collect(updateWithPremium(state, *premium, now_ms));
        }
    }

    if (analysis.valid) {
        collect(cancelOnDirectionChange(state, analysis.verdict, now_ms));
    }
    collect(cancelOnLearnerPause(state, learner, now_ms));
    collect(expirePending(state, now_ms));
    collect(forceCloseActive(state, premium, now_ms));

    outcome.gate = shouldCreateSetup(state, analysis, history.price_history, learner);
    if (outcome.gate->allowed) {
        collect(createSetup(state, analysis));
    }
    return outcome;
}

std::optional<LifecycleEvent> SetupLifecycleManager::apply(LifecycleState& state,
                                                           SetupEvent event,
                                                           std::optional<double> premium,
                                                           long long now_ms,
                                                           const std::string& reason) const {
    if (!state.open_setup) {
        return std::nullopt;
    }
    TradeSetup& setup = *state.open_setup;

    const auto result = SetupLifecycleStateMachine::transition(setup.status, event);
    if (!result.changed) {
        return std::nullopt;
    }
    setup.status = result.status;

    if (premium) {
        setup.last_checked_premium = *premium;
        setup.last_checked_at_ms = now_ms;
    }

    if (setup.status == SetupStatus::ACTIVE) {
        setup.activation_premium = premium;
        setup.activated_at_ms = now_ms;
        setup.max_premium_reached = premium;
        setup.min_premium_reached = premium;
    } else if (result.terminal) {
        setup.resolved_at_ms = now_ms;
        setup.resolution_reason = reason;
        if (premium && (setup.status == SetupStatus::WON || setup.status == SetupStatus::LOST)) {
            const double base = setup.activation_premium.value_or(setup.entry_premium);
            setup.exit_premium = *premium;
            setup.profit_loss_points = *premium - base;
            setup.profit_loss_pct = base > 0.0 ? (*premium - base) / base * 100.0 : 0.0;
        }
    }

    if (setup.status == SetupStatus::WON || setup.status == SetupStatus::LOST) {
        state.ticks_since_resolution = 0;
        state.last_resolved_at_ms = now_ms;
    } else if (setup.status == SetupStatus::CANCELLED) {
        state.last_cancelled_at_ms = now_ms;
    }

    LifecycleEvent out;
    out.type = eventTypeFor(setup.status);
    out.setup = setup;
    out.reason = reason;

    LOG_INFO("Setup #{} {} ({}) {} {} @ {:.2f}", setup.id, strategy::toString(setup.status), reason,
             setup.strike, tugofwar::toString(setup.option_side), premium.value_or(0.0));
    Logger::getInstance().logSetup(setup.id, strategy::toString(setup.status), setup.strike,
                                   tugofwar::toString(setup.option_side), premium.value_or(0.0),
                                   setup.profit_loss_pct.value_or(0.0));

    if (result.terminal) {
        state.open_setup.reset();
    }
    return out;
}

std::optional<LifecycleEvent> SetupLifecycleManager::updateWithPremium(LifecycleState& state,
                                                                       double premium,
                                                                       long long now_ms) const {
    if (!state.open_setup || !(premium > 0.0) || !std::isfinite(premium)) {
        return std::nullopt;
    }
    TradeSetup& setup = *state.open_setup;

    if (setup.status == SetupStatus::PENDING) {
        const double chase_cap = setup.entry_premium * (1.0 + config_.max_chase);
        if (premium <= chase_cap) {
            const bool at_entry = premium <= setup.entry_premium * (1.0 + config_.entry_tolerance);
            return apply(state, SetupEvent::ACTIVATE, premium, now_ms, at_entry ? "at_entry" : "within_chase");
        }
        setup.last_checked_premium = premium;
        setup.last_checked_at_ms = now_ms;
        LOG_DEBUG("Setup #{} not activated, premium {:.2f} beyond chase cap {:.2f}",
                  setup.id, premium, chase_cap);
        return std::nullopt;
    }

    if (setup.status != SetupStatus::ACTIVE) {
        return std::nullopt;
    }

    setup.max_premium_reached = std::max(setup.max_premium_reached.value_or(premium), premium);
    setup.min_premium_reached = std::min(setup.min_premium_reached.value_or(premium), premium);
    setup.last_checked_premium = premium;
    setup.last_checked_at_ms = now_ms;

    // Stop first: one print through both levels counts as a loss
    if (premium <= setup.sl_premium) {
        return apply(state, SetupEvent::STOP_HIT, premium, now_ms, "stop_loss");
    }
    if (premium >= setup.target1_premium) {
        return apply(state, SetupEvent::TARGET_HIT, premium, now_ms, "target1");
    }
    return std::nullopt;
}

std::optional<LifecycleEvent> SetupLifecycleManager::cancelOnDirectionChange(LifecycleState& state,
                                                                             analytics::Verdict verdict,
                                                                             long long now_ms) const {
    if (!state.open_setup || state.open_setup->status != SetupStatus::PENDING) {
        return std::nullopt;
    }
    const Direction current = analytics::verdictDirection(verdict);
    if (current == Direction::NEUTRAL || current == state.open_setup->signalDirection()) {
        return std::nullopt;
    }
    return apply(state, SetupEvent::CANCEL, std::nullopt, now_ms, "direction_flip");
}

std::optional<LifecycleEvent> SetupLifecycleManager::cancelOnLearnerPause(LifecycleState& state,
                                                                          const core::ILearner* learner,
                                                                          long long now_ms) const {
    if (!learner || !state.open_setup || state.open_setup->status != SetupStatus::PENDING) {
        return std::nullopt;
    }
    if (!learner->isPaused()) {
        return std::nullopt;
    }
    return apply(state, SetupEvent::CANCEL, std::nullopt, now_ms, "learner_paused");
}

std::optional<LifecycleEvent> SetupLifecycleManager::expirePending(LifecycleState& state, long long now_ms) const {
    if (!state.open_setup || state.open_setup->status != SetupStatus::PENDING) {
        return std::nullopt;
    }
    const bool past_close = minuteOfDay(now_ms, session_.utc_offset_minutes) >= session_.market_close_minute;
    const bool carried_over = sessionDay(now_ms, session_.utc_offset_minutes) >
        sessionDay(state.open_setup->created_at_ms, session_.utc_offset_minutes);
    if (!past_close && !carried_over) {
        return std::nullopt;
    }
    return apply(state, SetupEvent::EXPIRE, std::nullopt, now_ms, "market_close");
}

std::optional<LifecycleEvent> SetupLifecycleManager::forceCloseActive(LifecycleState& state,
                                                                      std::optional<double> premium,
                                                                      long long now_ms) const {
    if (!state.open_setup || state.open_setup->status != SetupStatus::ACTIVE) {
        return std::nullopt;
    }
    const TradeSetup& setup = *state.open_setup;
    const bool past_cutoff = minuteOfDay(now_ms, session_.utc_offset_minutes) >= session_.force_close_minute;
    const bool carried_over = sessionDay(now_ms, session_.utc_offset_minutes) >
        sessionDay(setup.activated_at_ms.value_or(setup.created_at_ms), session_.utc_offset_minutes);
    if (!past_cutoff && !carried_over) {
        return std::nullopt;
    }

    const double base = setup.activation_premium.value_or(setup.entry_premium);
    double exit = base;
    if (premium && *premium > 0.0) {
        exit = *premium;
    } else if (setup.last_checked_premium) {
        exit = *setup.last_checked_premium;
    }
    const double pnl = base > 0.0 ? (exit - base) / base * 100.0 : 0.0;
    return apply(state, pnl > 0.0 ? SetupEvent::CLOSE_IN_PROFIT : SetupEvent::CLOSE_IN_LOSS,
                 exit, now_ms, "force_close");
}

GateDecision SetupLifecycleManager::shouldCreateSetup(const LifecycleState& state,
                                                      const analytics::Analysis& analysis,
                                                      const std::vector<double>& price_history,
                                                      const core::ILearner* learner) const {
    if (!analysis.valid) {
        return reject("analysis_invalid");
    }
    const long long now_ms = analysis.timestamp_ms;

    if (!withinSetupHours(now_ms)) {
        return reject("outside_trading_hours");
    }
    if (state.open_setup) {
        return reject("setup_already_open");
    }

    if (learner) {
        const auto decision = learner->shouldTrade(analysis.confidence, analysis.verdict);
        if (!decision.allowed) {
            return reject("learner_paused: " + decision.reason);
        }
        const auto band = learner->learnedConfidenceThresholds();
        if (analysis.confidence < band.min_confidence || analysis.confidence > band.max_confidence) {
            return reject("confidence_out_of_band");
        }
        for (const auto& [lo, hi] : band.exclude_ranges) {
            if (analysis.confidence >= lo && analysis.confidence <= hi) {
                return reject("confidence_excluded");
            }
        }
    }

    if (state.ticks_since_resolution) {
        if (*state.ticks_since_resolution < config_.resolution_cooldown_cycles) {
            return reject("resolution_cooldown");
        }
    } else if (state.last_resolved_at_ms &&
               now_ms - *state.last_resolved_at_ms <
                   static_cast<long long>(config_.resolution_cooldown_cycles) * config_.tick_interval_seconds * 1000LL) {
        return reject("resolution_cooldown");
    }
    if (state.last_cancelled_at_ms &&
        now_ms - *state.last_cancelled_at_ms < config_.cancellation_cooldown_minutes * 60000LL) {
        return reject("cancellation_cooldown");
    }

    const Direction direction = analysis.direction();
    if (direction != Direction::NEUTRAL && state.last_proposed_direction && state.last_proposal_at_ms) {
        const TradeDirection proposed = direction == Direction::BULLISH ? TradeDirection::BUY_CALL
                                                                        : TradeDirection::BUY_PUT;
        if (proposed != *state.last_proposed_direction &&
            now_ms - *state.last_proposal_at_ms < config_.direction_flip_cooldown_minutes * 60000LL) {
            return reject("direction_flip_cooldown");
        }
    }

    if (isMoveAlreadyHappened(direction, analysis.spot_price, price_history)) {
        return reject("move_already_happened");
    }
    if (isBounceInProgress(direction, analysis.spot_price, price_history)) {
        return reject("bounce_in_progress");
    }

    if (!analysis.trade_setup) {
        return reject("no_trade_candidate");
    }
    const TradeSetup& candidate = *analysis.trade_setup;

    if (learner) {
        const auto skip = learner->shouldSkipVerdict(analysis.verdict);
        if (!skip.allowed) {
            return reject("verdict_underperforming: " + skip.reason);
        }
    }

    const auto regime = analysis.regime.regime;
    if (regime == analytics::MarketRegime::RANGE_BOUND) {
        if (candidate.moneyness == Moneyness::OTM) {
            return reject("range_bound_otm");
        }
        if (candidate.risk_pct > config_.range_bound_max_sl_pct) {
            return reject("range_bound_wide_stop");
        }
    }

    if (config_.require_regime_alignment) {
        const bool aligned = candidate.direction == TradeDirection::BUY_CALL
            ? regime == analytics::MarketRegime::TRENDING_UP
            : regime == analytics::MarketRegime::TRENDING_DOWN;
        if (!aligned) {
            return reject("regime_misaligned");
        }
    }

    if (analysis.confirmation != analytics::ConfirmationStatus::CONFIRMED &&
        analysis.confirmation != analytics::ConfirmationStatus::REVERSAL_ALERT) {
        return reject("unconfirmed");
    }
    if (countConfirmations(analysis) < config_.min_confirmations) {
        return reject("insufficient_confirmations");
    }

    return GateDecision{true, "ok"};
}

std::optional<LifecycleEvent> SetupLifecycleManager::createSetup(LifecycleState& state,
                                                                 const analytics::Analysis& analysis) const {
    if (state.open_setup || !analysis.trade_setup) {
        return std::nullopt;
    }

    TradeSetup setup = *analysis.trade_setup;
    setup.id = state.next_setup_id++;
    setup.status = SetupStatus::PENDING;
    setup.created_at_ms = analysis.timestamp_ms;

    state.last_proposed_direction = setup.direction;
    state.last_proposal_at_ms = analysis.timestamp_ms;
    state.open_setup = setup;

    LOG_INFO("Setup #{} created: {} {} {} entry={:.2f} sl={:.2f} t1={:.2f} quality={}/9",
             setup.id, tugofwar::toString(setup.direction), setup.strike,
             tugofwar::toString(setup.option_side), setup.entry_premium, setup.sl_premium,
             setup.target1_premium, setup.quality_score);
    Logger::getInstance().logSetup(setup.id, "CREATED", setup.strike,
                                   tugofwar::toString(setup.option_side), setup.entry_premium, 0.0);

    LifecycleEvent event;
    event.type = LifecycleEventType::CREATED;
    event.setup = setup;
    event.reason = "gate_passed";
    return event;
}

int SetupLifecycleManager::countConfirmations(const analytics::Analysis& analysis) const {
    const bool bullish = analysis.direction() == Direction::BULLISH;
    int count = 0;

    if (analysis.confirmation == analytics::ConfirmationStatus::CONFIRMED) {
        ++count;
    }
    const auto regime = analysis.regime.regime;
    if ((bullish && regime == analytics::MarketRegime::TRENDING_UP) ||
        (!bullish && regime == analytics::MarketRegime::TRENDING_DOWN)) {
        ++count;
    }
    const double pm = analysis.premium_momentum.premium_momentum_score;
    if ((bullish && pm > config_.premium_alignment_score) ||
        (!bullish && pm < -config_.premium_alignment_score)) {
        ++count;
    }
    const double skew = analysis.iv_skew.skew_score;
    if ((bullish && skew < -config_.iv_skew_alignment_score) ||
        (!bullish && skew > config_.iv_skew_alignment_score)) {
        ++count;
    }
    return count;
}

bool SetupLifecycleManager::withinSetupHours(long long ts_ms) const {
    const int minute = minuteOfDay(ts_ms, session_.utc_offset_minutes);
    return minute >= session_.setup_start_minute && minute <= session_.setup_end_minute;
}

bool SetupLifecycleManager::isMoveAlreadyHappened(Direction direction, double spot,
                                                  const std::vector<double>& price_history) const {
    if (price_history.size() < 2 || direction == Direction::NEUTRAL) {
        return false;
    }
    const double past = price_history.front();
    if (past <= 0.0 || spot <= 0.0) {
        return false;
    }
    const double move_pct = (spot - past) / past * 100.0;
    if (direction == Direction::BULLISH) {
        return move_pct > config_.move_threshold_pct;
    }
    return move_pct < -config_.move_threshold_pct;
}

bool SetupLifecycleManager::isBounceInProgress(Direction direction, double spot,
                                               const std::vector<double>& price_history) const {
    if (price_history.size() < 2 || direction != Direction::BEARISH || spot <= 0.0) {
        return false;
    }
    double low = 0.0;
    for (double p : price_history) {
        if (p > 0.0 && (low == 0.0 || p < low)) {
            low = p;
        }
    }
    if (low <= 0.0) {
        return false;
    }
    return (spot - low) / low * 100.0 > config_.bounce_threshold_pct;
}

std::optional<LivePnl> SetupLifecycleManager::livePnl(const TradeSetup& setup, const market::Snapshot& snapshot) {
    if (!setup.isOpen()) {
        return std::nullopt;
    }
    const auto premium = snapshot.premium(setup.strike, setup.option_side);
    if (!premium) {
        return std::nullopt;
    }

    LivePnl out;
    out.setup_id = setup.id;
    out.status = setup.status;
    out.current_premium = strategy::TradeSetupBuilder::round2(*premium);
    const double base = (setup.status == SetupStatus::ACTIVE && setup.activation_premium)
        ? *setup.activation_premium : setup.entry_premium;
    if (base > 0.0) {
        out.pnl_pct = strategy::TradeSetupBuilder::round2((*premium - base) / base * 100.0);
        out.pnl_points = strategy::TradeSetupBuilder::round2(*premium - base);
    }
    return out;
}

LifecycleState SetupLifecycleManager::restore(const std::vector<TradeSetup>& setups) {
    LifecycleState state;
    long long max_id = 0;
    for (const auto& setup : setups) {
        max_id = std::max(max_id, setup.id);

        if (setup.isOpen()) {
            if (!state.open_setup || setup.id > state.open_setup->id) {
                state.open_setup = setup;
            }
        } else if (setup.resolved_at_ms) {
            if (setup.status == SetupStatus::CANCELLED) {
                state.last_cancelled_at_ms = std::max(state.last_cancelled_at_ms.value_or(0LL), *setup.resolved_at_ms);
            } else if (setup.status == SetupStatus::WON || setup.status == SetupStatus::LOST) {
                state.last_resolved_at_ms = std::max(state.last_resolved_at_ms.value_or(0LL), *setup.resolved_at_ms);
            }
        }

        if (!state.last_proposal_at_ms || setup.created_at_ms >= *state.last_proposal_at_ms) {
            state.last_proposal_at_ms = setup.created_at_ms;
            state.last_proposed_direction = setup.direction;
        }
    }
    state.next_setup_id = max_id + 1;
    return state;
}

const char* SetupLifecycleManager::toString(LifecycleEventType type) {
    switch (type) {
        case LifecycleEventType::CREATED: return "CREATED";
        case LifecycleEventType::ACTIVATED: return "ACTIVATED";
        case LifecycleEventType::WON: return "WON";
        case LifecycleEventType::LOST: return "LOST";
        case LifecycleEventType::CANCELLED: return "CANCELLED";
        case LifecycleEventType::EXPIRED: return "EXPIRED";
    }
    return "CREATED";
}

} // namespace engine
} // namespace tugofwar
