#include "analytics/ConfidenceScorer.h"

#include <cassert>
#include <iostream>

using namespace tugofwar;
using analytics::ConfidenceInputs;
using analytics::ConfidenceScorer;
using analytics::ConfirmationStatus;

int main() {
    // Agreeing skew, confirmed, calm VIX beats conflict with a high VIX
    {
        ConfidenceInputs calm;
        calm.combined_score = 30.0;
        calm.signal_direction = Direction::BULLISH;
        calm.iv_skew_direction = Direction::BULLISH;
        calm.volume_pcr = 1.0;
        calm.max_pain_distance_pct = 0.8;
        calm.confirmation = ConfirmationStatus::CONFIRMED;
        calm.vix = 10.0;
        calm.momentum = 12.0;

        ConfidenceInputs stressed = calm;
        stressed.confirmation = ConfirmationStatus::CONFLICT;
        stressed.vix = 30.0;

        const auto a = ConfidenceScorer::score(calm);
        const auto b = ConfidenceScorer::score(stressed);
        if (!(a.confidence > b.confidence)) {
            std::cerr << "[TEST] confirmed/calm " << a.confidence
                      << " should beat conflict/stressed " << b.confidence << "\n";
            return 1;
        }
        // 50 + 15 strength + 15 skew + 0 pcr + 5 max pain + 15 confirmed + 5 vix
        assert(a.confidence == 100.0);
        // 50 + 15 + 15 + 0 + 5 - 15 - 20
        assert(b.confidence == 50.0);
    }

    // Always inside [0, 100]
    {
        ConfidenceInputs worst;
        worst.combined_score = 2.0;
        worst.signal_direction = Direction::BEARISH;
        worst.iv_skew_direction = Direction::BULLISH;
        worst.volume_pcr = 0.5;
        worst.max_pain_distance_pct = 3.0;
        worst.confirmation = ConfirmationStatus::CONFLICT;
        worst.vix = 40.0;
        worst.futures_oi_change = 50000.0;
        worst.momentum = 20.0;
        const auto w = ConfidenceScorer::score(worst);
        assert(w.confidence >= 0.0 && w.confidence <= 100.0);
        // 50 - 10 - 15 - 10 - 5 - 15 - 20 - 15 = -40 before clamping
        assert(w.confidence == 0.0);
        assert(w.futures_oi == -15.0);

        ConfidenceInputs best;
        best.combined_score = 90.0;
        best.signal_direction = Direction::BEARISH;
        best.iv_skew_direction = Direction::BEARISH;
        best.volume_pcr = 1.6;
        best.max_pain_distance_pct = 0.1;
        best.confirmation = ConfirmationStatus::CONFIRMED;
        best.vix = 11.0;
        best.futures_oi_change = 25000.0;
        best.momentum = -30.0;
        const auto b = ConfidenceScorer::score(best);
        assert(b.confidence == 100.0);
        assert(b.futures_oi == 15.0);
    }

    // Individual factors
    {
        assert(ConfidenceScorer::scoreStrengthPoints(-45.0) == 25.0);
        assert(ConfidenceScorer::scoreStrengthPoints(9.9) == -10.0);
        assert(ConfidenceScorer::ivSkewPoints(Direction::NEUTRAL, Direction::BULLISH) == 0.0);
        assert(ConfidenceScorer::volumePcrPoints(Direction::BULLISH, std::nullopt) == 0.0);
        assert(ConfidenceScorer::volumePcrPoints(Direction::BEARISH, 1.2) == 5.0);
        assert(ConfidenceScorer::maxPainPoints(std::nullopt) == 0.0);
        assert(ConfidenceScorer::maxPainPoints(1.5) == 0.0);
        assert(ConfidenceScorer::confirmationPoints(ConfirmationStatus::REVERSAL_ALERT) == 10.0);
        assert(ConfidenceScorer::vixPoints(std::nullopt) == 0.0);
        assert(ConfidenceScorer::vixPoints(22.0) == -10.0);
        assert(ConfidenceScorer::futuresOiPoints(Direction::BULLISH, 10.0, -5000.0) == 0.0);
        assert(ConfidenceScorer::futuresOiPoints(Direction::BULLISH, -10.0, -5000.0) == -10.0);
        assert(ConfidenceScorer::futuresOiPoints(Direction::BULLISH, 0.0, 5000.0) == 0.0);
    }

    // Missing optionals leave the base untouched
    {
        ConfidenceInputs bare;
        bare.combined_score = 12.0;
        const auto s = ConfidenceScorer::score(bare);
        if (s.confidence != 55.0) {
            std::cerr << "[TEST] bare inputs expected 55, got " << s.confidence << "\n";
            return 1;
        }
    }

    std::cout << "[TEST] ConfidenceScorer PASSED\n";
    return 0;
}
