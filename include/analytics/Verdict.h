#pragma once

#include <string>

#include "common/Types.h"

namespace tugofwar {
namespace analytics {

enum class Verdict {
    BULLS_STRONGLY_WINNING,
    BULLS_WINNING,
    SLIGHTLY_BULLISH,
    NEUTRAL,
    SLIGHTLY_BEARISH,
    BEARS_WINNING,
    BEARS_STRONGLY_WINNING
};

enum class SignalStrength { STRONG, MODERATE, WEAK, NONE };

struct VerdictClassification {
    Verdict verdict = Verdict::NEUTRAL;
    SignalStrength strength = SignalStrength::NONE;
};

// Pure threshold classifier over the final combined score.
VerdictClassification classifyVerdict(double combined_score);

Direction verdictDirection(Verdict verdict);

const char* toString(Verdict verdict);
const char* toString(SignalStrength strength);
Verdict verdictFromString(const std::string& value);

} // namespace analytics
} // namespace tugofwar
