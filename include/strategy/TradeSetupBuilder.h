#pragma once

#include <optional>
#include <string>

#include "analytics/Analysis.h"
#include "market/OptionChain.h"
#include "strategy/TradeSetup.h"

namespace tugofwar {
namespace strategy {

// Option-buying proposal from a finished analysis.
// Strike preference is ITM, then ATM, then OTM; the first candidate with a
// positive last price wins. Stops widen with implied volatility.
class TradeSetupBuilder {
public:
    static std::optional<TradeSetup> build(const analytics::Analysis& analysis,
                                           const market::Snapshot& snapshot);

    // IV in percent, 0 or less means unknown
    static double stopLossPctForIv(double iv);

    // 0..9
    static int qualityScore(const analytics::Analysis& analysis, Moneyness moneyness, double risk_pct);

    static std::string reasoning(const analytics::Analysis& analysis, const TradeSetup& setup);

    static double round2(double value);

private:
    struct Candidate {
        int strike = 0;
        Moneyness moneyness = Moneyness::ATM;
    };

    static std::optional<Candidate> pickStrike(const market::Snapshot& snapshot,
                                               int atm_strike,
                                               OptionSide side);
};

} // namespace strategy
} // namespace tugofwar
