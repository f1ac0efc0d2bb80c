#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace tugofwar {

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);

    // Applies one parsed document over the current values; missing keys keep defaults.
    void apply(const nlohmann::json& j);
    void reset();

    engine::ScoringConfig getScoringConfig() const { return scoring_; }
    engine::LifecycleConfig getLifecycleConfig() const { return lifecycle_; }
    engine::LearnerConfig getLearnerConfig() const { return learner_; }
    engine::SessionConfig getSessionConfig() const { return session_; }
    engine::HistoryConfig getHistoryConfig() const { return history_; }

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getSetupStorePath() const { return setup_store_path_; }
    std::string getJournalPath() const { return journal_path_; }
    std::string getLearnerStatePath() const { return learner_state_path_; }

    // "HH:MM" -> minute of day, fallback on malformed input
    static int parseClock(const std::string& value, int fallback);

private:
    Config() = default;

    engine::ScoringConfig scoring_;
    engine::LifecycleConfig lifecycle_;
    engine::LearnerConfig learner_;
    engine::SessionConfig session_;
    engine::HistoryConfig history_;

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    std::string setup_store_path_ = "state/trade_setups.json";
    std::string journal_path_ = "state/setup_events.jsonl";
    std::string learner_state_path_ = "state/learner_state.json";
};

} // namespace tugofwar
