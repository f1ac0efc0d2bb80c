#pragma once

#include <filesystem>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "core/contracts/ILearner.h"
#include "engine/EngineConfig.h"

namespace tugofwar {
namespace core {
namespace learning {

struct VerdictRecord {
    int samples = 0;
    int wins = 0;

    double winRate() const {
        return samples > 0 ? static_cast<double>(wins) / static_cast<double>(samples) : 0.0;
    }
};

// Reference learner: exponential moving accuracy over resolved setups with a
// conservative auto-pause, plus per-verdict win tracking.
class EmaAccuracyLearner : public ILearner {
public:
    explicit EmaAccuracyLearner(const engine::LearnerConfig& config = engine::LearnerConfig());

    LearnerDecision shouldTrade(double confidence, analytics::Verdict verdict) const override;
    ConfidenceBand learnedConfidenceThresholds() const override;
    LearnerDecision shouldSkipVerdict(analytics::Verdict verdict) const override;
    bool isPaused() const override { return paused_; }

    // WON counts as correct, LOST as wrong; other statuses are ignored.
    void onSetupResolved(const strategy::TradeSetup& setup) override;

    void update(bool was_correct);
    void recordVerdict(analytics::Verdict verdict, bool won);

    // Start of a new session
    void resetPause();

    double emaAccuracy() const { return ema_accuracy_; }
    int consecutiveErrors() const { return consecutive_errors_; }
    const std::map<analytics::Verdict, VerdictRecord>& verdictRecords() const { return by_verdict_; }

    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& raw);

    bool save(const std::filesystem::path& file_path) const;
    bool load(const std::filesystem::path& file_path);

private:
    void checkPauseConditions();

    engine::LearnerConfig config_;
    double ema_accuracy_ = 0.5;
    int consecutive_errors_ = 0;
    bool paused_ = false;
    std::map<analytics::Verdict, VerdictRecord> by_verdict_;
};

} // namespace learning
} // namespace core
} // namespace tugofwar
