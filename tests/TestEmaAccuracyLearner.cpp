#include "core/learning/EmaAccuracyLearner.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>

using namespace tugofwar;
using core::learning::EmaAccuracyLearner;

int main() {
    // Accuracy drifting under the threshold pauses trading
    {
        EmaAccuracyLearner learner;
        assert(std::abs(learner.emaAccuracy() - 0.5) < 1e-12);
        learner.update(true);
        learner.update(true);
        assert(std::abs(learner.emaAccuracy() - 0.755) < 1e-9);
        learner.update(false);
        assert(!learner.isPaused());
        learner.update(false);
        if (!learner.isPaused()) {
            std::cerr << "[TEST] learner should pause at ema " << learner.emaAccuracy() << "\n";
            return 1;
        }
        const auto decision = learner.shouldTrade(80.0, analytics::Verdict::BULLS_WINNING);
        assert(!decision.allowed);
        assert(decision.reason.find("accuracy") == 0);

        learner.resetPause();
        assert(!learner.isPaused());
        assert(learner.consecutiveErrors() == 0);
        assert(learner.shouldTrade(80.0, analytics::Verdict::BULLS_WINNING).allowed);
    }

    // Consecutive losses pause regardless of accuracy
    {
        engine::LearnerConfig config;
        config.pause_threshold = 0.0;
        EmaAccuracyLearner learner(config);
        learner.update(false);
        learner.update(false);
        assert(!learner.isPaused());
        learner.update(false);
        assert(learner.isPaused());
        assert(learner.shouldTrade(70.0, analytics::Verdict::BEARS_WINNING).reason == "3 consecutive losses");
        learner.update(true);
        assert(!learner.isPaused());
    }

    // Verdicts with a poor record are skipped once enough samples exist
    {
        EmaAccuracyLearner learner;
        for (int i = 0; i < 4; ++i) {
            learner.recordVerdict(analytics::Verdict::BEARS_WINNING, i == 0);
        }
        assert(learner.shouldSkipVerdict(analytics::Verdict::BEARS_WINNING).allowed);
        learner.recordVerdict(analytics::Verdict::BEARS_WINNING, false);
        const auto skip = learner.shouldSkipVerdict(analytics::Verdict::BEARS_WINNING);
        assert(!skip.allowed);
        assert(!skip.reason.empty());
        assert(learner.shouldSkipVerdict(analytics::Verdict::BULLS_WINNING).allowed);
    }

    // Only won/lost setups feed the learner
    {
        EmaAccuracyLearner learner;
        strategy::TradeSetup setup;
        setup.verdict = analytics::Verdict::SLIGHTLY_BULLISH;
        setup.status = strategy::SetupStatus::CANCELLED;
        learner.onSetupResolved(setup);
        assert(learner.verdictRecords().empty());

        setup.status = strategy::SetupStatus::WON;
        learner.onSetupResolved(setup);
        assert(learner.verdictRecords().at(analytics::Verdict::SLIGHTLY_BULLISH).wins == 1);
        assert(learner.emaAccuracy() > 0.5);
    }

    // Band comes from config
    {
        engine::LearnerConfig config;
        config.min_confidence = 60.0;
        config.exclude_confidence_ranges = {{72.0, 78.0}};
        EmaAccuracyLearner learner(config);
        const auto band = learner.learnedConfidenceThresholds();
        assert(band.min_confidence == 60.0);
        assert(band.max_confidence == 100.0);
        assert(band.exclude_ranges.size() == 1);
    }

    // State survives a save/load
    {
        const auto path = std::filesystem::temp_directory_path() / "tugofwar_test" / "test_learner_state.json";
        std::error_code ec;
        std::filesystem::remove(path, ec);

        EmaAccuracyLearner learner;
        learner.update(true);
        learner.recordVerdict(analytics::Verdict::BULLS_STRONGLY_WINNING, true);
        if (!learner.save(path)) {
            std::cerr << "[TEST] learner save failed\n";
            return 1;
        }

        EmaAccuracyLearner restored;
        assert(restored.load(path));
        assert(std::abs(restored.emaAccuracy() - learner.emaAccuracy()) < 1e-12);
        assert(restored.verdictRecords().at(analytics::Verdict::BULLS_STRONGLY_WINNING).samples == 1);

        EmaAccuracyLearner missing;
        assert(!missing.load(path.parent_path() / "no_such_state.json"));
    }

    std::cout << "[TEST] EmaAccuracyLearner PASSED\n";
    return 0;
}
