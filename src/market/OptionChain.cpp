#include "market/OptionChain.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace tugofwar {
namespace market {

namespace {

long long readCount(const nlohmann::json& row, const char* key, bool allow_negative) {
    if (!row.contains(key) || !row[key].is_number()) {
        return 0;
    }
    const double value = row[key].get<double>();
    // 2^63 itself is not representable, so the upper bound is exclusive
    constexpr double kMaxCount = static_cast<double>(std::numeric_limits<long long>::max());
    if (!std::isfinite(value) || value >= kMaxCount || value < -kMaxCount) {
        return 0;
    }
    const long long count = static_cast<long long>(std::llround(value));
    if (!allow_negative && count < 0) {
        return 0;
    }
    return count;
}

std::optional<double> readPositive(const nlohmann::json& row, const char* key) {
    if (!row.contains(key) || !row[key].is_number()) {
        return std::nullopt;
    }
    const double value = row[key].get<double>();
    if (!std::isfinite(value) || value <= 0.0) {
        return std::nullopt;
    }
    return value;
}

void putOptional(nlohmann::json& row, const char* key, const std::optional<double>& value) {
    if (value) {
        row[key] = *value;
    }
}

} // namespace

const StrikeMetrics* Snapshot::find(int strike) const {
    const auto it = strikes.find(strike);
    return it == strikes.end() ? nullptr : &it->second;
}

std::vector<int> Snapshot::sortedStrikes() const {
    std::vector<int> out;
    out.reserve(strikes.size());
    for (const auto& [strike, metrics] : strikes) {
        (void)metrics;
        out.push_back(strike);
    }
    return out;
}

std::optional<double> Snapshot::premium(int strike, OptionSide side) const {
    return premiumOf(strikes, strike, side);
}

std::optional<double> premiumOf(const StrikeMap& strikes, int strike, OptionSide side) {
    const auto it = strikes.find(strike);
    if (it == strikes.end()) {
        return std::nullopt;
    }
    const double ltp = it->second.ltpOr0(side);
    if (ltp <= 0.0) {
        return std::nullopt;
    }
    return ltp;
}

std::optional<StrikeMetrics> SnapshotParser::strikeFromJson(int strike, const nlohmann::json& row) {
    if (strike <= 0 || !row.is_object()) {
        return std::nullopt;
    }

    StrikeMetrics m;
    m.strike = strike;
    m.call_oi = readCount(row, "ce_oi", false);
    m.put_oi = readCount(row, "pe_oi", false);
    m.call_oi_change = readCount(row, "ce_oi_change", true);
    m.put_oi_change = readCount(row, "pe_oi_change", true);
    m.call_volume = readCount(row, "ce_volume", false);
    m.put_volume = readCount(row, "pe_volume", false);
    m.call_iv = readPositive(row, "ce_iv");
    m.put_iv = readPositive(row, "pe_iv");
    m.call_ltp = readPositive(row, "ce_ltp");
    m.put_ltp = readPositive(row, "pe_ltp");
    return m;
}

StrikeMap SnapshotParser::strikesFromJson(const nlohmann::json& raw_strikes) {
    StrikeMap out;
    if (raw_strikes.is_object()) {
        for (auto it = raw_strikes.begin(); it != raw_strikes.end(); ++it) {
            int strike = 0;
            try {
                strike = std::stoi(it.key());
            } catch (const std::exception&) {
                LOG_WARN("Skipping strike with non-numeric key: {}", it.key());
                continue;
            }
            auto metrics = strikeFromJson(strike, it.value());
            if (metrics) {
                out[strike] = *metrics;
            }
        }
    } else if (raw_strikes.is_array()) {
        for (const auto& row : raw_strikes) {
            if (!row.is_object()) {
                continue;
            }
            const long long raw_strike = readCount(row, "strike", false);
            if (raw_strike > std::numeric_limits<int>::max()) {
                LOG_WARN("Skipping out-of-range strike: {}", raw_strike);
                continue;
            }
            const int strike = static_cast<int>(raw_strike);
            auto metrics = strikeFromJson(strike, row);
            if (metrics) {
                out[strike] = *metrics;
            }
        }
    }
    return out;
}

std::optional<Snapshot> SnapshotParser::fromJson(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        return std::nullopt;
    }

    Snapshot snapshot;
    try {
        snapshot.timestamp_ms = raw.value("timestamp", 0LL);
        snapshot.spot_price = raw.value("spot_price", 0.0);
        snapshot.expiry = raw.value("expiry", std::string());
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Snapshot rejected: {}", e.what());
        return std::nullopt;
    }

    if (!std::isfinite(snapshot.spot_price) || snapshot.spot_price <= 0.0) {
        LOG_WARN("Snapshot rejected: invalid spot price");
        return std::nullopt;
    }

    if (raw.contains("strikes")) {
        snapshot.strikes = strikesFromJson(raw["strikes"]);
    }
    if (snapshot.strikes.empty()) {
        LOG_WARN("Snapshot at {} has no usable strikes", snapshot.timestamp_ms);
    }
    return snapshot;
}

nlohmann::json SnapshotParser::toJson(const Snapshot& snapshot) {
    nlohmann::json raw;
    raw["timestamp"] = snapshot.timestamp_ms;
    raw["spot_price"] = snapshot.spot_price;
    raw["expiry"] = snapshot.expiry;

    nlohmann::json strikes = nlohmann::json::object();
    for (const auto& [strike, m] : snapshot.strikes) {
        nlohmann::json row;
        row["ce_oi"] = m.call_oi;
        row["pe_oi"] = m.put_oi;
        row["ce_oi_change"] = m.call_oi_change;
        row["pe_oi_change"] = m.put_oi_change;
        row["ce_volume"] = m.call_volume;
        row["pe_volume"] = m.put_volume;
        putOptional(row, "ce_iv", m.call_iv);
        putOptional(row, "pe_iv", m.put_iv);
        putOptional(row, "ce_ltp", m.call_ltp);
        putOptional(row, "pe_ltp", m.put_ltp);
        strikes[std::to_string(strike)] = row;
    }
    raw["strikes"] = strikes;
    return raw;
}

} // namespace market
} // namespace tugofwar
