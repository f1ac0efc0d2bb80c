#include "core/state/TradeSetupStoreJson.h"

#include "common/Logger.h"
#include "core/state/JsonFileIo.h"

namespace tugofwar {
namespace core {

TradeSetupStoreJson::TradeSetupStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    const auto raw = readJsonFile(file_path_);
    if (!raw || !raw->is_object()) {
        return;
    }

    loaded_schema_version_ = raw->value("schema_version", 1);
    const nlohmann::json doc = migrate(*raw);

    const auto rows = doc.value("setups", nlohmann::json::array());
    for (const auto& row : rows) {
        auto setup = strategy::tradeSetupFromJson(row);
        if (!setup) {
            continue;
        }
        setups_[setup->id] = *setup;
    }

    if (loaded_schema_version_ < kSchemaVersion) {
        LOG_INFO("Trade setup store migrated v{} -> v{} ({} rows)",
                 loaded_schema_version_, kSchemaVersion, setups_.size());
        std::lock_guard<std::mutex> lock(mutex_);
        if (!persistLocked()) {
            LOG_WARN("Failed to persist migrated trade setup store {}", file_path_.string());
        }
    }
}

nlohmann::json TradeSetupStoreJson::migrate(const nlohmann::json& doc) {
    nlohmann::json out = doc;
    int version = out.value("schema_version", 1);

    if (version < 2) {
        auto rows = out.value("setups", nlohmann::json::array());
        for (auto& row : rows) {
            if (!row.is_object()) {
                continue;
            }
            // v1 kept a single last_premium column
            if (!row.contains("last_checked_premium")) {
                row["last_checked_premium"] = row.value("last_premium", nlohmann::json());
            }
            row.erase("last_premium");
            for (const char* key : {"max_premium_reached", "min_premium_reached",
                                    "last_checked_at_ms", "quality_score", "trade_reasoning"}) {
                if (!row.contains(key)) {
                    row[key] = nullptr;
                }
            }
            if (row["quality_score"].is_null()) {
                row["quality_score"] = 0;
            }
            if (row["trade_reasoning"].is_null()) {
                row["trade_reasoning"] = "";
            }
        }
        out["setups"] = rows;
        version = 2;
    }

    out["schema_version"] = version;
    return out;
}

bool TradeSetupStoreJson::create(const strategy::TradeSetup& setup) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (setups_.count(setup.id) > 0) {
        LOG_WARN("Trade setup #{} already stored", setup.id);
        return false;
    }
    setups_[setup.id] = setup;
    return persistLocked();
}

bool TradeSetupStoreJson::update(const strategy::TradeSetup& setup) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = setups_.find(setup.id);
    if (it == setups_.end()) {
        LOG_WARN("Trade setup #{} not found for update", setup.id);
        return false;
    }
    it->second = setup;
    return persistLocked();
}

std::optional<strategy::TradeSetup> TradeSetupStoreJson::findById(long long id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = setups_.find(id);
    if (it == setups_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<strategy::TradeSetup> TradeSetupStoreJson::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<strategy::TradeSetup> out;
    out.reserve(setups_.size());
    for (const auto& [id, setup] : setups_) {
        (void)id;
        out.push_back(setup);
    }
    return out;
}

bool TradeSetupStoreJson::persistLocked() const {
    nlohmann::json doc;
    doc["schema_version"] = kSchemaVersion;
    doc["saved_at_ms"] = nowMs();
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& [id, setup] : setups_) {
        (void)id;
        rows.push_back(strategy::toJson(setup));
    }
    doc["setups"] = rows;
    return writeJsonFileAtomic(file_path_, doc);
}

} // namespace core
} // namespace tugofwar
