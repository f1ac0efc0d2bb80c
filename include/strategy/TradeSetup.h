#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "analytics/RegimeDetector.h"
#include "analytics/Verdict.h"
#include "common/Types.h"

namespace tugofwar {
namespace strategy {

enum class SetupStatus {
    PENDING,    // proposed, waiting for the premium to come back to entry
    ACTIVE,
    WON,
    LOST,
    CANCELLED,
    EXPIRED
};

bool isTerminal(SetupStatus status);
const char* toString(SetupStatus status);
std::optional<SetupStatus> setupStatusFromString(const std::string& value);

struct TradeSetup {
    long long id = 0;
    long long created_at_ms = 0;
    std::string expiry;

    TradeDirection direction = TradeDirection::BUY_CALL;
    int strike = 0;
    OptionSide option_side = OptionSide::CE;
    Moneyness moneyness = Moneyness::ATM;

    double entry_premium = 0.0;
    double sl_premium = 0.0;
    double target1_premium = 0.0;
    double target2_premium = 0.0;
    double risk_pct = 0.0;

    SetupStatus status = SetupStatus::PENDING;

    // Creation context
    double spot_at_creation = 0.0;
    analytics::Verdict verdict = analytics::Verdict::NEUTRAL;
    double signal_confidence = 0.0;
    double iv_at_creation = 0.0;
    analytics::MarketRegime regime = analytics::MarketRegime::RANGE_BOUND;
    long long call_oi_change = 0;
    long long put_oi_change = 0;
    double pcr = 0.0;
    int max_pain = 0;
    int support = 0;
    int resistance = 0;
    int quality_score = 0;
    std::string reasoning;

    // Lifecycle
    std::optional<double> activation_premium;
    std::optional<long long> activated_at_ms;
    std::optional<double> exit_premium;
    std::optional<long long> resolved_at_ms;
    std::optional<double> profit_loss_pct;      // vs activation premium
    std::optional<double> profit_loss_points;
    std::optional<double> max_premium_reached;
    std::optional<double> min_premium_reached;
    std::optional<double> last_checked_premium;
    std::optional<long long> last_checked_at_ms;
    std::string resolution_reason;

    bool isOpen() const { return !isTerminal(status); }
    Direction signalDirection() const {
        return direction == TradeDirection::BUY_CALL ? Direction::BULLISH : Direction::BEARISH;
    }
};

nlohmann::json toJson(const TradeSetup& setup);

// Missing lifecycle keys read as unset; a missing or unknown status rejects the row.
std::optional<TradeSetup> tradeSetupFromJson(const nlohmann::json& row);

} // namespace strategy
} // namespace tugofwar
