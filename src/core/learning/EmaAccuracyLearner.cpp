#include "core/learning/EmaAccuracyLearner.h"

#include <algorithm>
#include <cstdio>

#include "common/Logger.h"
#include "core/state/JsonFileIo.h"

namespace tugofwar {
namespace core {
namespace learning {

EmaAccuracyLearner::EmaAccuracyLearner(const engine::LearnerConfig& config)
    : config_(config) {}

LearnerDecision EmaAccuracyLearner::shouldTrade(double confidence, analytics::Verdict verdict) const {
    (void)confidence;
    (void)verdict;
    if (!paused_) {
        return {true, ""};
    }

    char buf[128];
    if (consecutive_errors_ >= config_.max_consecutive_errors) {
        std::snprintf(buf, sizeof(buf), "%d consecutive losses", consecutive_errors_);
    } else {
        std::snprintf(buf, sizeof(buf), "accuracy %.1f%% below %.1f%%",
                      ema_accuracy_ * 100.0, config_.pause_threshold * 100.0);
    }
    return {false, buf};
}

ConfidenceBand EmaAccuracyLearner::learnedConfidenceThresholds() const {
    ConfidenceBand band;
    band.min_confidence = config_.min_confidence;
    band.max_confidence = config_.max_confidence;
    band.exclude_ranges = config_.exclude_confidence_ranges;
    return band;
}

LearnerDecision EmaAccuracyLearner::shouldSkipVerdict(analytics::Verdict verdict) const {
    auto it = by_verdict_.find(verdict);
    if (it == by_verdict_.end() || it->second.samples < config_.min_verdict_samples) {
        return {true, ""};
    }
    if (it->second.winRate() < config_.min_verdict_win_rate) {
        char buf[128];
        std::snprintf(buf, sizeof(buf), "%s wins %.0f%% of %d setups",
                      analytics::toString(verdict), it->second.winRate() * 100.0, it->second.samples);
        return {false, buf};
    }
    return {true, ""};
}

void EmaAccuracyLearner::onSetupResolved(const strategy::TradeSetup& setup) {
    if (setup.status != strategy::SetupStatus::WON && setup.status != strategy::SetupStatus::LOST) {
        return;
    }
    const bool won = setup.status == strategy::SetupStatus::WON;
    update(won);
    recordVerdict(setup.verdict, won);
}

void EmaAccuracyLearner::update(bool was_correct) {
    const double value = was_correct ? 1.0 : 0.0;
    ema_accuracy_ = config_.ema_alpha * value + (1.0 - config_.ema_alpha) * ema_accuracy_;
    consecutive_errors_ = was_correct ? 0 : consecutive_errors_ + 1;
    checkPauseConditions();
}

void EmaAccuracyLearner::recordVerdict(analytics::Verdict verdict, bool won) {
    auto& record = by_verdict_[verdict];
    ++record.samples;
    if (won) {
        ++record.wins;
    }
}

void EmaAccuracyLearner::checkPauseConditions() {
    const bool was_paused = paused_;
    if (consecutive_errors_ >= config_.max_consecutive_errors) {
        paused_ = true;
    } else {
        paused_ = ema_accuracy_ < config_.pause_threshold;
    }

    if (paused_ && !was_paused) {
        LOG_WARN("Learner paused: ema_accuracy={:.3f} consecutive_errors={}", ema_accuracy_, consecutive_errors_);
    } else if (!paused_ && was_paused) {
        LOG_INFO("Learner resumed: ema_accuracy={:.3f}", ema_accuracy_);
    }
}

void EmaAccuracyLearner::resetPause() {
    paused_ = false;
    consecutive_errors_ = 0;
    LOG_INFO("Learner pause reset");
}

nlohmann::json EmaAccuracyLearner::toJson() const {
    nlohmann::json raw;
    raw["schema_version"] = 1;
    raw["ema_accuracy"] = ema_accuracy_;
    raw["consecutive_errors"] = consecutive_errors_;
    raw["is_paused"] = paused_;
    nlohmann::json verdicts = nlohmann::json::object();
    for (const auto& [verdict, record] : by_verdict_) {
        verdicts[analytics::toString(verdict)] = {{"samples", record.samples}, {"wins", record.wins}};
    }
    raw["verdicts"] = verdicts;
    return raw;
}

void EmaAccuracyLearner::fromJson(const nlohmann::json& raw) {
    try {
        ema_accuracy_ = std::clamp(raw.value("ema_accuracy", 0.5), 0.0, 1.0);
        consecutive_errors_ = std::max(0, raw.value("consecutive_errors", 0));
        paused_ = raw.value("is_paused", false);
        by_verdict_.clear();
        const auto verdicts = raw.value("verdicts", nlohmann::json::object());
        for (auto it = verdicts.begin(); it != verdicts.end(); ++it) {
            VerdictRecord record;
            record.samples = it.value().value("samples", 0);
            record.wins = it.value().value("wins", 0);
            by_verdict_[analytics::verdictFromString(it.key())] = record;
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Learner state ignored: {}", e.what());
    }
}

bool EmaAccuracyLearner::save(const std::filesystem::path& file_path) const {
    return writeJsonFileAtomic(file_path, toJson());
}

bool EmaAccuracyLearner::load(const std::filesystem::path& file_path) {
    const auto raw = readJsonFile(file_path);
    if (!raw) {
        return false;
    }
    fromJson(*raw);
    return true;
}

} // namespace learning
} // namespace core
} // namespace tugofwar
