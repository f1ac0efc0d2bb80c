#pragma once

#include <string>

#include "strategy/TradeSetup.h"

namespace tugofwar {
namespace core {
namespace execution {

enum class SetupEvent {
    ACTIVATE,
    STOP_HIT,
    TARGET_HIT,
    CLOSE_IN_PROFIT,    // session force-close
    CLOSE_IN_LOSS,
    CANCEL,
    EXPIRE
};

struct SetupTransitionResult {
    strategy::SetupStatus status = strategy::SetupStatus::PENDING;
    bool changed = false;
    bool terminal = false;
};

class SetupLifecycleStateMachine {
public:
    static bool canTransition(strategy::SetupStatus from, strategy::SetupStatus to);

    // Events that do not apply to the current status leave it untouched;
    // terminal statuses absorb everything.
    static SetupTransitionResult transition(strategy::SetupStatus current, SetupEvent event);

    static const char* toString(SetupEvent event);
};

} // namespace execution
} // namespace core
} // namespace tugofwar
