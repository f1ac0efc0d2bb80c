#include "core/execution/SetupLifecycleStateMachine.h"

#include "common/Logger.h"

namespace tugofwar {
namespace core {
namespace execution {

using strategy::SetupStatus;

namespace {
SetupStatus targetOf(SetupEvent event) {
    switch (event) {
        case SetupEvent::ACTIVATE: return SetupStatus::ACTIVE;
        case SetupEvent::STOP_HIT: return SetupStatus::LOST;
        case SetupEvent::TARGET_HIT: return SetupStatus::WON;
        case SetupEvent::CLOSE_IN_PROFIT: return SetupStatus::WON;
        case SetupEvent::CLOSE_IN_LOSS: return SetupStatus::LOST;
        case SetupEvent::CANCEL: return SetupStatus::CANCELLED;
        case SetupEvent::EXPIRE: return SetupStatus::EXPIRED;
    }
    return SetupStatus::PENDING;
}
} // namespace

bool SetupLifecycleStateMachine::canTransition(SetupStatus from, SetupStatus to) {
    switch (from) {
        case SetupStatus::PENDING:
            return to == SetupStatus::ACTIVE ||
                   to == SetupStatus::CANCELLED ||
                   to == SetupStatus::EXPIRED;
        case SetupStatus::ACTIVE:
            return to == SetupStatus::WON || to == SetupStatus::LOST;
        case SetupStatus::WON:
        case SetupStatus::LOST:
        case SetupStatus::CANCELLED:
        case SetupStatus::EXPIRED:
            return false;
    }
    return false;
}

SetupTransitionResult SetupLifecycleStateMachine::transition(SetupStatus current, SetupEvent event) {
    SetupTransitionResult result;
    result.status = current;
    result.terminal = strategy::isTerminal(current);

    const SetupStatus target = targetOf(event);
    if (!canTransition(current, target)) {
        LOG_DEBUG("Ignoring {} on {} setup", toString(event), strategy::toString(current));
        return result;
    }

    result.status = target;
    result.changed = true;
    result.terminal = strategy::isTerminal(target);
    return result;
}

const char* SetupLifecycleStateMachine::toString(SetupEvent event) {
    switch (event) {
        case SetupEvent::ACTIVATE: return "activate";
        case SetupEvent::STOP_HIT: return "stop_hit";
        case SetupEvent::TARGET_HIT: return "target_hit";
        case SetupEvent::CLOSE_IN_PROFIT: return "close_in_profit";
        case SetupEvent::CLOSE_IN_LOSS: return "close_in_loss";
        case SetupEvent::CANCEL: return "cancel";
        case SetupEvent::EXPIRE: return "expire";
    }
    return "unknown";
}

} // namespace execution
} // namespace core
} // namespace tugofwar
