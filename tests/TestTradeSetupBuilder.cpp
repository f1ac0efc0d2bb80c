#include "strategy/TradeSetupBuilder.h"
#include "engine/SetupLifecycleManager.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace tugofwar;
using strategy::TradeSetupBuilder;

namespace {

constexpr long long kTenAmIst = 1705293000000LL;

market::Snapshot chain() {
    market::Snapshot s;
    s.timestamp_ms = kTenAmIst;
    s.spot_price = 24010.0;
    s.expiry = "2024-01-18";
    for (int strike = 23900; strike <= 24100; strike += 50) {
        market::StrikeMetrics m;
        m.strike = strike;
        m.call_oi = 100000;
        m.put_oi = 100000;
        m.call_ltp = 150.0 - (strike - 23900) * 0.5;
        m.put_ltp = 50.0 + (strike - 23900) * 0.5;
        m.call_iv = 13.0;
        m.put_iv = 16.5;
        s.strikes[strike] = m;
    }
    return s;
}

analytics::Analysis analysisFor(analytics::Verdict verdict) {
    analytics::Analysis a;
    a.valid = true;
    a.timestamp_ms = kTenAmIst;
    a.spot_price = 24010.0;
    a.expiry = "2024-01-18";
    a.atm_strike = 24000;
    a.verdict = verdict;
    a.strength = analytics::classifyVerdict(verdict == analytics::Verdict::BULLS_WINNING ? 30.0 : -30.0).strength;
    a.confidence = 72.0;
    a.confirmation = analytics::ConfirmationStatus::CONFIRMED;
    return a;
}

} // namespace

int main() {
    // IV buckets
    {
        assert(TradeSetupBuilder::stopLossPctForIv(0.0) == 20.0);
        assert(TradeSetupBuilder::stopLossPctForIv(11.9) == 15.0);
        assert(TradeSetupBuilder::stopLossPctForIv(12.0) == 18.0);
        assert(TradeSetupBuilder::stopLossPctForIv(15.0) == 20.0);
        assert(TradeSetupBuilder::stopLossPctForIv(21.9) == 22.0);
        assert(TradeSetupBuilder::stopLossPctForIv(30.0) == 25.0);
    }

    // Bullish picks the ITM call just below ATM
    {
        const auto snapshot = chain();
        const auto setup = TradeSetupBuilder::build(analysisFor(analytics::Verdict::BULLS_WINNING), snapshot);
        if (!setup) {
            std::cerr << "[TEST] bullish analysis should produce a setup\n";
            return 1;
        }
        assert(setup->direction == TradeDirection::BUY_CALL);
        assert(setup->option_side == OptionSide::CE);
        assert(setup->strike == 23950);
        assert(setup->moneyness == Moneyness::ITM);
        assert(setup->entry_premium == 125.0);
        assert(setup->risk_pct == 18.0);     // call IV 13
        assert(setup->sl_premium == 102.5);
        assert(setup->target1_premium == 147.5);
        assert(setup->target2_premium == 170.0);
        assert(setup->status == strategy::SetupStatus::PENDING);
        assert(setup->sl_premium < setup->entry_premium);
        assert(setup->entry_premium < setup->target1_premium);
        assert(setup->target1_premium < setup->target2_premium);
        assert(setup->reasoning.find("BUY CALL") == 0);
        // confirmed 2, confidence band 2, moderate 1, ITM 1
        if (setup->quality_score != 6) {
            std::cerr << "[TEST] quality expected 6, got " << setup->quality_score << "\n";
            return 1;
        }
    }

    // Bearish picks the ITM put just above ATM
    {
        const auto setup = TradeSetupBuilder::build(analysisFor(analytics::Verdict::BEARS_WINNING), chain());
        assert(setup.has_value());
        assert(setup->direction == TradeDirection::BUY_PUT);
        assert(setup->strike == 24050);
        assert(setup->moneyness == Moneyness::ITM);
        assert(setup->risk_pct == 20.0);     // put IV 16.5
    }

    // Falls through to ATM then OTM when prices are missing
    {
        auto snapshot = chain();
        snapshot.strikes[23950].call_ltp.reset();
        auto setup = TradeSetupBuilder::build(analysisFor(analytics::Verdict::BULLS_WINNING), snapshot);
        assert(setup && setup->strike == 24000 && setup->moneyness == Moneyness::ATM);

        snapshot.strikes[24000].call_ltp = 0.0;
        setup = TradeSetupBuilder::build(analysisFor(analytics::Verdict::BULLS_WINNING), snapshot);
        assert(setup && setup->strike == 24050 && setup->moneyness == Moneyness::OTM);

        snapshot.strikes[24050].call_ltp.reset();
        setup = TradeSetupBuilder::build(analysisFor(analytics::Verdict::BULLS_WINNING), snapshot);
        if (setup) {
            std::cerr << "[TEST] no priced candidate should yield no setup\n";
            return 1;
        }
    }

    // Neutral and invalid analyses never propose
    {
        assert(!TradeSetupBuilder::build(analysisFor(analytics::Verdict::NEUTRAL), chain()));
        auto invalid = analysisFor(analytics::Verdict::BULLS_WINNING);
        invalid.valid = false;
        assert(!TradeSetupBuilder::build(invalid, chain()));
    }

    // A built setup activates when its entry premium is quoted back
    {
        const auto setup = TradeSetupBuilder::build(analysisFor(analytics::Verdict::BULLS_WINNING), chain());
        assert(setup.has_value());

        engine::SetupLifecycleManager manager{engine::LifecycleConfig(), engine::SessionConfig()};
        engine::LifecycleState state;
        state.open_setup = *setup;
        state.open_setup->id = 1;
        const auto event = manager.updateWithPremium(state, setup->entry_premium, kTenAmIst + 60000);
        assert(event.has_value());
        assert(event->type == engine::LifecycleEventType::ACTIVATED);
        assert(state.open_setup->status == strategy::SetupStatus::ACTIVE);
        assert(*state.open_setup->activation_premium == setup->entry_premium);
    }

    std::cout << "[TEST] TradeSetupBuilder PASSED\n";
    return 0;
}
