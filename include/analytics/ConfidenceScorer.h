#pragma once

#include <optional>

#include "analytics/ChainStructure.h"
#include "common/Types.h"

namespace tugofwar {
namespace analytics {

struct ConfidenceInputs {
    double combined_score = 0.0;
    Direction signal_direction = Direction::NEUTRAL;
    Direction iv_skew_direction = Direction::NEUTRAL;
    std::optional<double> volume_pcr;
    std::optional<double> max_pain_distance_pct;
    ConfirmationStatus confirmation = ConfirmationStatus::NEUTRAL;
    std::optional<double> vix;
    std::optional<double> futures_oi_change;
    double momentum = 0.0;
};

// Per-factor contributions, kept for diagnostics and tests.
struct ConfidenceBreakdown {
    double base = 50.0;
    double score_strength = 0.0;
    double iv_skew = 0.0;
    double volume_pcr = 0.0;
    double max_pain = 0.0;
    double confirmation = 0.0;
    double vix = 0.0;
    double futures_oi = 0.0;
    double confidence = 50.0;   // clamped sum
};

class ConfidenceScorer {
public:
    static ConfidenceBreakdown score(const ConfidenceInputs& inputs);

    static double scoreStrengthPoints(double combined_score);
    static double ivSkewPoints(Direction signal, Direction skew);
    static double volumePcrPoints(Direction signal, const std::optional<double>& pcr);
    static double maxPainPoints(const std::optional<double>& distance_pct);
    static double confirmationPoints(ConfirmationStatus status);
    static double vixPoints(const std::optional<double>& vix);
    static double futuresOiPoints(Direction signal, double momentum,
                                  const std::optional<double>& futures_oi_change);
};

} // namespace analytics
} // namespace tugofwar
