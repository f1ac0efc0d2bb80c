#include "analytics/Verdict.h"

namespace tugofwar {
namespace analytics {

VerdictClassification classifyVerdict(double combined_score) {
    VerdictClassification out;
    if (combined_score > 40.0) {
        out.verdict = Verdict::BULLS_STRONGLY_WINNING;
        out.strength = SignalStrength::STRONG;
    } else if (combined_score > 15.0) {
        out.verdict = Verdict::BULLS_WINNING;
        out.strength = SignalStrength::MODERATE;
    } else if (combined_score > 0.0) {
        out.verdict = Verdict::SLIGHTLY_BULLISH;
        out.strength = SignalStrength::WEAK;
    } else if (combined_score < -40.0) {
        out.verdict = Verdict::BEARS_STRONGLY_WINNING;
        out.strength = SignalStrength::STRONG;
    } else if (combined_score < -15.0) {
        out.verdict = Verdict::BEARS_WINNING;
        out.strength = SignalStrength::MODERATE;
    } else if (combined_score < 0.0) {
        out.verdict = Verdict::SLIGHTLY_BEARISH;
        out.strength = SignalStrength::WEAK;
    }
    return out;
}

Direction verdictDirection(Verdict verdict) {
    switch (verdict) {
        case Verdict::BULLS_STRONGLY_WINNING:
        case Verdict::BULLS_WINNING:
        case Verdict::SLIGHTLY_BULLISH:
            return Direction::BULLISH;
        case Verdict::BEARS_STRONGLY_WINNING:
        case Verdict::BEARS_WINNING:
        case Verdict::SLIGHTLY_BEARISH:
            return Direction::BEARISH;
        case Verdict::NEUTRAL:
            break;
    }
    return Direction::NEUTRAL;
}

const char* toString(Verdict verdict) {
    switch (verdict) {
        case Verdict::BULLS_STRONGLY_WINNING: return "Bulls Strongly Winning";
        case Verdict::BULLS_WINNING: return "Bulls Winning";
        case Verdict::SLIGHTLY_BULLISH: return "Slightly Bullish";
        case Verdict::NEUTRAL: return "Neutral";
        case Verdict::SLIGHTLY_BEARISH: return "Slightly Bearish";
        case Verdict::BEARS_WINNING: return "Bears Winning";
        case Verdict::BEARS_STRONGLY_WINNING: return "Bears Strongly Winning";
    }
    return "Neutral";
}

const char* toString(SignalStrength strength) {
    switch (strength) {
        case SignalStrength::STRONG: return "strong";
        case SignalStrength::MODERATE: return "moderate";
        case SignalStrength::WEAK: return "weak";
        case SignalStrength::NONE: return "none";
    }
    return "none";
}

Verdict verdictFromString(const std::string& value) {
    if (value == "Bulls Strongly Winning") return Verdict::BULLS_STRONGLY_WINNING;
    if (value == "Bulls Winning") return Verdict::BULLS_WINNING;
    if (value == "Slightly Bullish") return Verdict::SLIGHTLY_BULLISH;
    if (value == "Slightly Bearish") return Verdict::SLIGHTLY_BEARISH;
    if (value == "Bears Winning") return Verdict::BEARS_WINNING;
    if (value == "Bears Strongly Winning") return Verdict::BEARS_STRONGLY_WINNING;
    return Verdict::NEUTRAL;
}

} // namespace analytics
} // namespace tugofwar
