#pragma once

#include "analytics/Verdict.h"
#include "core/model/ContractTypes.h"
#include "strategy/TradeSetup.h"

namespace tugofwar {
namespace core {

class ILearner {
public:
    virtual ~ILearner() = default;

    virtual LearnerDecision shouldTrade(double confidence, analytics::Verdict verdict) const = 0;
    virtual ConfidenceBand learnedConfidenceThresholds() const = 0;
    virtual LearnerDecision shouldSkipVerdict(analytics::Verdict verdict) const = 0;

    // Trading pause in force; pending setups are withdrawn while set
    virtual bool isPaused() const = 0;

    virtual void onSetupResolved(const strategy::TradeSetup& setup) { (void)setup; }
};

} // namespace core
} // namespace tugofwar
