#include "common/Config.h"
#include "common/PathUtils.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace tugofwar {

namespace {
std::string clockString(int minute_of_day) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", minute_of_day / 60, minute_of_day % 60);
    return buf;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

int Config::parseClock(const std::string& value, int fallback) {
    int hour = 0;
    int minute = 0;
    if (std::sscanf(value.c_str(), "%d:%d", &hour, &minute) != 2) {
        return fallback;
    }
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        return fallback;
    }
    return hhmm(hour, minute);
}

void Config::reset() {
    scoring_ = engine::ScoringConfig();
    lifecycle_ = engine::LifecycleConfig();
    learner_ = engine::LearnerConfig();
    session_ = engine::SessionConfig();
    history_ = engine::HistoryConfig();
    log_level_ = "info";
    log_dir_ = "logs";
    setup_store_path_ = "state/trade_setups.json";
    journal_path_ = "state/setup_events.jsonl";
    learner_state_path_ = "state/learner_state.json";
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cout << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Warning: config file not found: " << config_path << std::endl;
            std::cout << "Using defaults." << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: cannot open config file." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;
        apply(j);

        std::cout << "Config loaded: zone_width=" << scoring_.zone_width
                  << ", setup window " << clockString(session_.setup_start_minute)
                  << "-" << clockString(session_.setup_end_minute) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
}

void Config::apply(const nlohmann::json& j) {
    if (j.contains("engine")) {
        auto& e = j["engine"];

        scoring_.zone_width = e.value("zone_width", scoring_.zone_width);
        scoring_.total_oi_weight = e.value("total_oi_weight", scoring_.total_oi_weight);
        scoring_.noise_oi_change = e.value("noise_oi_change", scoring_.noise_oi_change);
        scoring_.fresh_turnover = e.value("fresh_turnover", scoring_.fresh_turnover);
        scoring_.moderate_turnover = e.value("moderate_turnover", scoring_.moderate_turnover);
        scoring_.conviction_fresh = e.value("conviction_fresh", scoring_.conviction_fresh);
        scoring_.conviction_moderate = e.value("conviction_moderate", scoring_.conviction_moderate);
        scoring_.conviction_stale = e.value("conviction_stale", scoring_.conviction_stale);
        scoring_.strength_direction_threshold = e.value("strength_direction_threshold", scoring_.strength_direction_threshold);

        scoring_.momentum_scale = e.value("momentum_scale", scoring_.momentum_scale);
        scoring_.regime_extreme_pct = e.value("regime_extreme_pct", scoring_.regime_extreme_pct);
        scoring_.regime_momentum = e.value("regime_momentum", scoring_.regime_momentum);
        scoring_.regime_min_range_pct = e.value("regime_min_range_pct", scoring_.regime_min_range_pct);
        scoring_.price_move_threshold_pct = e.value("price_move_threshold_pct", scoring_.price_move_threshold_pct);

        scoring_.legacy_zone_weight = e.value("legacy_zone_weight", scoring_.legacy_zone_weight);
        scoring_.strength_weight = e.value("strength_weight", scoring_.strength_weight);
        scoring_.divergence_momentum_weight = e.value("divergence_momentum_weight", scoring_.divergence_momentum_weight);
        scoring_.normal_momentum_weight = e.value("normal_momentum_weight", scoring_.normal_momentum_weight);

        scoring_.unwinding_momentum = e.value("unwinding_momentum", scoring_.unwinding_momentum);
        scoring_.unwinding_adjust = e.value("unwinding_adjust", scoring_.unwinding_adjust);
        scoring_.accumulation_adjust = e.value("accumulation_adjust", scoring_.accumulation_adjust);
        scoring_.accumulation_min_accel = e.value("accumulation_min_accel", scoring_.accumulation_min_accel);
        scoring_.accumulation_rel_accel = e.value("accumulation_rel_accel", scoring_.accumulation_rel_accel);

        scoring_.premium_momentum_multiplier = e.value("premium_momentum_multiplier", scoring_.premium_momentum_multiplier);
        scoring_.premium_trigger_score = e.value("premium_trigger_score", scoring_.premium_trigger_score);
        scoring_.premium_trigger_combined = e.value("premium_trigger_combined", scoring_.premium_trigger_combined);
        scoring_.premium_adjust_factor = e.value("premium_adjust_factor", scoring_.premium_adjust_factor);

        scoring_.cluster_percentile = e.value("cluster_percentile", scoring_.cluster_percentile);
        scoring_.cluster_top_n = e.value("cluster_top_n", scoring_.cluster_top_n);
        scoring_.trap_proximity_pct = e.value("trap_proximity_pct", scoring_.trap_proximity_pct);
        scoring_.strong_oi_score = e.value("strong_oi_score", scoring_.strong_oi_score);
        scoring_.oi_direction_threshold = e.value("oi_direction_threshold", scoring_.oi_direction_threshold);
        scoring_.iv_skew_threshold = e.value("iv_skew_threshold", scoring_.iv_skew_threshold);
    }

    if (j.contains("lifecycle")) {
        auto& l = j["lifecycle"];

        lifecycle_.entry_tolerance = l.value("entry_tolerance", lifecycle_.entry_tolerance);
        lifecycle_.max_chase = l.value("max_chase", lifecycle_.max_chase);
        lifecycle_.resolution_cooldown_cycles = l.value("resolution_cooldown_cycles", lifecycle_.resolution_cooldown_cycles);
        lifecycle_.tick_interval_seconds = l.value("tick_interval_seconds", lifecycle_.tick_interval_seconds);
        lifecycle_.cancellation_cooldown_minutes = l.value("cancellation_cooldown_minutes", lifecycle_.cancellation_cooldown_minutes);
        lifecycle_.direction_flip_cooldown_minutes = l.value("direction_flip_cooldown_minutes", lifecycle_.direction_flip_cooldown_minutes);
        lifecycle_.move_threshold_pct = l.value("move_threshold_pct", lifecycle_.move_threshold_pct);
        lifecycle_.bounce_threshold_pct = l.value("bounce_threshold_pct", lifecycle_.bounce_threshold_pct);
        lifecycle_.range_bound_max_sl_pct = l.value("range_bound_max_sl_pct", lifecycle_.range_bound_max_sl_pct);
        lifecycle_.require_regime_alignment = l.value("require_regime_alignment", lifecycle_.require_regime_alignment);
        lifecycle_.min_confirmations = l.value("min_confirmations", lifecycle_.min_confirmations);
        lifecycle_.premium_alignment_score = l.value("premium_alignment_score", lifecycle_.premium_alignment_score);
        lifecycle_.iv_skew_alignment_score = l.value("iv_skew_alignment_score", lifecycle_.iv_skew_alignment_score);
    }

    if (j.contains("learner")) {
        auto& l = j["learner"];

        learner_.ema_alpha = l.value("ema_alpha", learner_.ema_alpha);
        learner_.pause_threshold = l.value("pause_threshold", learner_.pause_threshold);
        learner_.max_consecutive_errors = l.value("max_consecutive_errors", learner_.max_consecutive_errors);
        learner_.min_confidence = l.value("min_confidence", learner_.min_confidence);
        learner_.max_confidence = l.value("max_confidence", learner_.max_confidence);
        learner_.min_verdict_samples = l.value("min_verdict_samples", learner_.min_verdict_samples);
        learner_.min_verdict_win_rate = l.value("min_verdict_win_rate", learner_.min_verdict_win_rate);
        if (l.contains("exclude_confidence_ranges") && l["exclude_confidence_ranges"].is_array()) {
            learner_.exclude_confidence_ranges.clear();
            for (const auto& range : l["exclude_confidence_ranges"]) {
                if (range.is_array() && range.size() == 2) {
                    learner_.exclude_confidence_ranges.emplace_back(range[0].get<double>(), range[1].get<double>());
                }
            }
        }
        learner_state_path_ = l.value("state_path", learner_state_path_);
    }

    if (j.contains("session")) {
        auto& s = j["session"];

        session_.utc_offset_minutes = s.value("utc_offset_minutes", session_.utc_offset_minutes);
        session_.setup_start_minute = parseClock(s.value("setup_start", std::string()), session_.setup_start_minute);
        session_.setup_end_minute = parseClock(s.value("setup_end", std::string()), session_.setup_end_minute);
        session_.force_close_minute = parseClock(s.value("force_close", std::string()), session_.force_close_minute);
        session_.market_close_minute = parseClock(s.value("market_close", std::string()), session_.market_close_minute);
    }

    if (j.contains("history")) {
        auto& h = j["history"];

        history_.price_window = h.value("price_window", history_.price_window);
        history_.oi_change_window = h.value("oi_change_window", history_.oi_change_window);
    }

    if (j.contains("logging")) {
        auto& g = j["logging"];

        log_level_ = g.value("level", log_level_);
        log_dir_ = g.value("dir", log_dir_);
    }

    if (j.contains("storage")) {
        auto& s = j["storage"];

        setup_store_path_ = s.value("setups", setup_store_path_);
        journal_path_ = s.value("journal", journal_path_);
    }
}

} // namespace tugofwar
