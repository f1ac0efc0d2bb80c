#include "analytics/ConfidenceScorer.h"

#include <algorithm>
#include <cmath>

namespace tugofwar {
namespace analytics {

ConfidenceBreakdown ConfidenceScorer::score(const ConfidenceInputs& inputs) {
    ConfidenceBreakdown out;
    out.score_strength = scoreStrengthPoints(inputs.combined_score);
    out.iv_skew = ivSkewPoints(inputs.signal_direction, inputs.iv_skew_direction);
    out.volume_pcr = volumePcrPoints(inputs.signal_direction, inputs.volume_pcr);
    out.max_pain = maxPainPoints(inputs.max_pain_distance_pct);
    out.confirmation = confirmationPoints(inputs.confirmation);
    out.vix = vixPoints(inputs.vix);
    out.futures_oi = futuresOiPoints(inputs.signal_direction, inputs.momentum, inputs.futures_oi_change);

    const double total = out.base + out.score_strength + out.iv_skew + out.volume_pcr +
                         out.max_pain + out.confirmation + out.vix + out.futures_oi;
    out.confidence = std::isfinite(total) ? std::clamp(total, 0.0, 100.0) : 50.0;
    return out;
}

double ConfidenceScorer::scoreStrengthPoints(double combined_score) {
    const double magnitude = std::abs(combined_score);
    if (!std::isfinite(magnitude)) return -10.0;
    if (magnitude >= 40.0) return 25.0;
    if (magnitude >= 25.0) return 15.0;
    if (magnitude >= 10.0) return 5.0;
    return -10.0;
}

double ConfidenceScorer::ivSkewPoints(Direction signal, Direction skew) {
    if (signal == Direction::NEUTRAL || skew == Direction::NEUTRAL) {
        return 0.0;
    }
    return signal == skew ? 15.0 : -15.0;
}

double ConfidenceScorer::volumePcrPoints(Direction signal, const std::optional<double>& pcr) {
    if (!pcr || !std::isfinite(*pcr) || signal == Direction::NEUTRAL) {
        return 0.0;
    }
    const double v = *pcr;
    // Heavy call volume backs a bullish read, heavy put volume a bearish one
    if (signal == Direction::BULLISH) {
        if (v < 0.7) return 10.0;
        if (v < 0.9) return 5.0;
        if (v > 1.3) return -10.0;
        if (v > 1.1) return -5.0;
        return 0.0;
    }
    if (v > 1.3) return 10.0;
    if (v > 1.1) return 5.0;
    if (v < 0.7) return -10.0;
    if (v < 0.9) return -5.0;
    return 0.0;
}

double ConfidenceScorer::maxPainPoints(const std::optional<double>& distance_pct) {
    if (!distance_pct || !std::isfinite(*distance_pct)) {
        return 0.0;
    }
    const double d = std::abs(*distance_pct);
    if (d < 0.5) return 10.0;
    if (d < 1.0) return 5.0;
    if (d > 2.0) return -5.0;
    return 0.0;
}

double ConfidenceScorer::confirmationPoints(ConfirmationStatus status) {
    switch (status) {
        case ConfirmationStatus::CONFIRMED: return 15.0;
        case ConfirmationStatus::REVERSAL_ALERT: return 10.0;
        case ConfirmationStatus::CONFLICT: return -15.0;
        case ConfirmationStatus::NEUTRAL: return 0.0;
    }
    return 0.0;
}

double ConfidenceScorer::vixPoints(const std::optional<double>& vix) {
    if (!vix || !std::isfinite(*vix) || *vix <= 0.0) {
        return 0.0;
    }
    if (*vix > 25.0) return -20.0;
    if (*vix > 20.0) return -10.0;
    if (*vix < 12.0) return 5.0;
    return 0.0;
}

double ConfidenceScorer::futuresOiPoints(Direction signal, double momentum,
                                         const std::optional<double>& futures_oi_change) {
    if (!futures_oi_change || !std::isfinite(*futures_oi_change) || *futures_oi_change == 0.0 ||
        signal == Direction::NEUTRAL || momentum == 0.0) {
        return 0.0;
    }

    const Direction price = momentum > 0.0 ? Direction::BULLISH : Direction::BEARISH;
    if (*futures_oi_change > 0.0) {
        // fresh long build-up (price up) or short build-up (price down)
        return price == signal ? 15.0 : -15.0;
    }
    // OI shedding: short covering or long unwinding, weak against the signal
    return price == signal ? 0.0 : -10.0;
}

} // namespace analytics
} // namespace tugofwar
