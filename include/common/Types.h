#pragma once

#include <chrono>
#include <string>

namespace tugofwar {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;

enum class OptionSide { CE, PE };
enum class TradeDirection { BUY_CALL, BUY_PUT };
enum class Moneyness { ITM, ATM, OTM };
enum class Direction { BULLISH, BEARISH, NEUTRAL };

inline const char* toString(OptionSide side) {
    return side == OptionSide::CE ? "CE" : "PE";
}

inline const char* toString(TradeDirection direction) {
    return direction == TradeDirection::BUY_CALL ? "BUY_CALL" : "BUY_PUT";
}

inline const char* toString(Moneyness moneyness) {
    switch (moneyness) {
        case Moneyness::ITM: return "ITM";
        case Moneyness::ATM: return "ATM";
        case Moneyness::OTM: return "OTM";
    }
    return "ATM";
}

inline const char* toString(Direction direction) {
    switch (direction) {
        case Direction::BULLISH: return "BULLISH";
        case Direction::BEARISH: return "BEARISH";
        case Direction::NEUTRAL: return "NEUTRAL";
    }
    return "NEUTRAL";
}

inline long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Minute of the market's local day for an epoch-ms timestamp.
inline int minuteOfDay(long long ts_ms, int utc_offset_minutes) {
    const long long minutes = ts_ms / 60000LL + utc_offset_minutes;
    long long m = minutes % 1440LL;
    if (m < 0) {
        m += 1440LL;
    }
    return static_cast<int>(m);
}

// Index of the market's local calendar day, floored for pre-epoch minutes.
inline long long sessionDay(long long ts_ms, int utc_offset_minutes) {
    const long long minutes = ts_ms / 60000LL + utc_offset_minutes;
    return minutes >= 0 ? minutes / 1440LL : (minutes - 1439LL) / 1440LL;
}

inline int hhmm(int hour, int minute) {
    return hour * 60 + minute;
}

} // namespace tugofwar
