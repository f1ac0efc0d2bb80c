#pragma once

#include <string>
#include <utility>
#include <vector>

#include "common/Types.h"

namespace tugofwar {
namespace engine {

// Scoring engine parameters
struct ScoringConfig {
    int zone_width = 3;                     // strikes per side of ATM
    double total_oi_weight = 0.15;          // w in the force blend

    // Conviction multiplier
    long long noise_oi_change = 100;
    double fresh_turnover = 0.5;
    double moderate_turnover = 0.2;
    double conviction_fresh = 1.5;
    double conviction_moderate = 1.0;
    double conviction_stale = 0.5;

    double strength_direction_threshold = 15.0;

    // Momentum / regime
    double momentum_scale = 20.0;
    double regime_extreme_pct = 0.1;        // price within 0.1% of window high/low
    double regime_momentum = 25.0;
    double regime_min_range_pct = 0.2;
    double price_move_threshold_pct = 0.05;

    // Combining
    double legacy_zone_weight = 0.7;
    double strength_weight = 0.3;
    double divergence_momentum_weight = 0.45;
    double normal_momentum_weight = 0.20;

    // OI acceleration
    double unwinding_momentum = 15.0;
    double unwinding_adjust = 15.0;
    double accumulation_adjust = 10.0;
    double accumulation_min_accel = 1000.0;
    double accumulation_rel_accel = 0.10;

    // Premium momentum
    double premium_momentum_multiplier = 5.0;
    double premium_trigger_score = 20.0;
    double premium_trigger_combined = 10.0;
    double premium_adjust_factor = 0.3;

    // Chain structure
    double cluster_percentile = 75.0;
    int cluster_top_n = 5;
    double trap_proximity_pct = 1.0;
    double strong_oi_score = 40.0;
    double oi_direction_threshold = 10.0;
    double iv_skew_threshold = 5.0;
};

// Market session, all times are minutes of the exchange-local day
struct SessionConfig {
    int utc_offset_minutes = 330;
    int setup_start_minute = hhmm(9, 30);
    int setup_end_minute = hhmm(15, 15);
    int force_close_minute = hhmm(15, 20);
    int market_close_minute = hhmm(15, 25);
};

struct LifecycleConfig {
    double entry_tolerance = 0.02;          // activate at <= entry * 1.02
    double max_chase = 0.10;                // never activate above entry * 1.10

    int resolution_cooldown_cycles = 12;
    int tick_interval_seconds = 60;         // cooldown by wall clock when the tick count is unknown
    int cancellation_cooldown_minutes = 30;
    int direction_flip_cooldown_minutes = 15;

    double move_threshold_pct = 0.8;
    double bounce_threshold_pct = 0.3;

    double range_bound_max_sl_pct = 15.0;
    bool require_regime_alignment = true;
    int min_confirmations = 3;
    double premium_alignment_score = 10.0;
    double iv_skew_alignment_score = 5.0;
};

struct LearnerConfig {
    double ema_alpha = 0.3;
    double pause_threshold = 0.5;
    int max_consecutive_errors = 3;
    double min_confidence = 65.0;
    double max_confidence = 100.0;
    std::vector<std::pair<double, double>> exclude_confidence_ranges;
    int min_verdict_samples = 5;
    double min_verdict_win_rate = 0.40;
};

// Caller-side rolling history limits
struct HistoryConfig {
    int price_window = 10;
    int oi_change_window = 5;
};

} // namespace engine
} // namespace tugofwar
