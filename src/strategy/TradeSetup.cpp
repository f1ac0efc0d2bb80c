#include "strategy/TradeSetup.h"

#include "common/Logger.h"

namespace tugofwar {
namespace strategy {

namespace {

template <typename T>
void putOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template <typename T>
std::optional<T> getOptional(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

} // namespace

bool isTerminal(SetupStatus status) {
    return status == SetupStatus::WON ||
           status == SetupStatus::LOST ||
           status == SetupStatus::CANCELLED ||
           status == SetupStatus::EXPIRED;
}

const char* toString(SetupStatus status) {
    switch (status) {
        case SetupStatus::PENDING: return "PENDING";
        case SetupStatus::ACTIVE: return "ACTIVE";
        case SetupStatus::WON: return "WON";
        case SetupStatus::LOST: return "LOST";
        case SetupStatus::CANCELLED: return "CANCELLED";
        case SetupStatus::EXPIRED: return "EXPIRED";
    }
    return "PENDING";
}

std::optional<SetupStatus> setupStatusFromString(const std::string& value) {
    if (value == "PENDING") return SetupStatus::PENDING;
    if (value == "ACTIVE") return SetupStatus::ACTIVE;
    if (value == "WON") return SetupStatus::WON;
    if (value == "LOST") return SetupStatus::LOST;
    if (value == "CANCELLED") return SetupStatus::CANCELLED;
    if (value == "EXPIRED") return SetupStatus::EXPIRED;
    return std::nullopt;
}

nlohmann::json toJson(const TradeSetup& setup) {
    nlohmann::json j;
    j["id"] = setup.id;
    j["created_at_ms"] = setup.created_at_ms;
    j["expiry"] = setup.expiry;
    j["direction"] = toString(setup.direction);
    j["strike"] = setup.strike;
    j["option_type"] = toString(setup.option_side);
    j["moneyness"] = toString(setup.moneyness);
    j["entry_premium"] = setup.entry_premium;
    j["sl_premium"] = setup.sl_premium;
    j["target1_premium"] = setup.target1_premium;
    j["target2_premium"] = setup.target2_premium;
    j["risk_pct"] = setup.risk_pct;
    j["status"] = toString(setup.status);

    j["spot_at_creation"] = setup.spot_at_creation;
    j["verdict_at_creation"] = analytics::toString(setup.verdict);
    j["signal_confidence"] = setup.signal_confidence;
    j["iv_at_creation"] = setup.iv_at_creation;
    j["regime"] = analytics::RegimeDetector::toString(setup.regime);
    j["call_oi_change"] = setup.call_oi_change;
    j["put_oi_change"] = setup.put_oi_change;
    j["pcr"] = setup.pcr;
    j["max_pain"] = setup.max_pain;
    j["support"] = setup.support;
    j["resistance"] = setup.resistance;
    j["quality_score"] = setup.quality_score;
    j["trade_reasoning"] = setup.reasoning;

    putOptional(j, "activation_premium", setup.activation_premium);
    putOptional(j, "activated_at_ms", setup.activated_at_ms);
    putOptional(j, "exit_premium", setup.exit_premium);
    putOptional(j, "resolved_at_ms", setup.resolved_at_ms);
    putOptional(j, "profit_loss_pct", setup.profit_loss_pct);
    putOptional(j, "profit_loss_points", setup.profit_loss_points);
    putOptional(j, "max_premium_reached", setup.max_premium_reached);
    putOptional(j, "min_premium_reached", setup.min_premium_reached);
    putOptional(j, "last_checked_premium", setup.last_checked_premium);
    putOptional(j, "last_checked_at_ms", setup.last_checked_at_ms);
    j["resolution_reason"] = setup.resolution_reason;
    return j;
}

std::optional<TradeSetup> tradeSetupFromJson(const nlohmann::json& row) {
    try {
        if (!row.is_object()) {
            return std::nullopt;
        }
        const auto status = setupStatusFromString(row.value("status", std::string()));
        if (!status) {
            LOG_WARN("Trade setup row has unknown status, skipped");
            return std::nullopt;
        }

        TradeSetup setup;
        setup.id = row.value("id", 0LL);
        setup.created_at_ms = row.value("created_at_ms", 0LL);
        setup.expiry = row.value("expiry", std::string());
        setup.direction = row.value("direction", std::string("BUY_CALL")) == "BUY_PUT"
            ? TradeDirection::BUY_PUT : TradeDirection::BUY_CALL;
        setup.strike = row.value("strike", 0);
        setup.option_side = row.value("option_type", std::string("CE")) == "PE"
            ? OptionSide::PE : OptionSide::CE;
        const std::string moneyness = row.value("moneyness", std::string("ATM"));
        setup.moneyness = moneyness == "ITM" ? Moneyness::ITM
                        : moneyness == "OTM" ? Moneyness::OTM : Moneyness::ATM;
        setup.entry_premium = row.value("entry_premium", 0.0);
        setup.sl_premium = row.value("sl_premium", 0.0);
        setup.target1_premium = row.value("target1_premium", 0.0);
        setup.target2_premium = row.value("target2_premium", 0.0);
        setup.risk_pct = row.value("risk_pct", 0.0);
        setup.status = *status;

        setup.spot_at_creation = row.value("spot_at_creation", 0.0);
        setup.verdict = analytics::verdictFromString(row.value("verdict_at_creation", std::string()));
        setup.signal_confidence = row.value("signal_confidence", 0.0);
        setup.iv_at_creation = row.value("iv_at_creation", 0.0);
        setup.regime = analytics::RegimeDetector::fromString(row.value("regime", std::string()));
        setup.call_oi_change = row.value("call_oi_change", 0LL);
        setup.put_oi_change = row.value("put_oi_change", 0LL);
        setup.pcr = row.value("pcr", 0.0);
        setup.max_pain = row.value("max_pain", 0);
        setup.support = row.value("support", 0);
        setup.resistance = row.value("resistance", 0);
        setup.quality_score = row.value("quality_score", 0);
        setup.reasoning = row.value("trade_reasoning", std::string());

        setup.activation_premium = getOptional<double>(row, "activation_premium");
        setup.activated_at_ms = getOptional<long long>(row, "activated_at_ms");
        setup.exit_premium = getOptional<double>(row, "exit_premium");
        setup.resolved_at_ms = getOptional<long long>(row, "resolved_at_ms");
        setup.profit_loss_pct = getOptional<double>(row, "profit_loss_pct");
        setup.profit_loss_points = getOptional<double>(row, "profit_loss_points");
        setup.max_premium_reached = getOptional<double>(row, "max_premium_reached");
        setup.min_premium_reached = getOptional<double>(row, "min_premium_reached");
        setup.last_checked_premium = getOptional<double>(row, "last_checked_premium");
        setup.last_checked_at_ms = getOptional<long long>(row, "last_checked_at_ms");
        setup.resolution_reason = row.value("resolution_reason", std::string());
        return setup;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Trade setup row parse failed: {}", e.what());
        return std::nullopt;
    }
}

} // namespace strategy
} // namespace tugofwar
