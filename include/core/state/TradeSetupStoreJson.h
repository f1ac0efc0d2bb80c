#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/contracts/ITradeSetupStore.h"

namespace tugofwar {
namespace core {

// Single JSON document holding every setup row, keyed by id. The schema is
// migrated once when the file is opened; every write saves atomically.
class TradeSetupStoreJson : public ITradeSetupStore {
public:
    static constexpr int kSchemaVersion = 2;

    explicit TradeSetupStoreJson(std::filesystem::path file_path);

    bool create(const strategy::TradeSetup& setup) override;
    bool update(const strategy::TradeSetup& setup) override;
    std::optional<strategy::TradeSetup> findById(long long id) const override;
    std::vector<strategy::TradeSetup> list() const override;

    int loadedSchemaVersion() const { return loaded_schema_version_; }

    // v1 rows predate running premium tracking; returns the upgraded document
    static nlohmann::json migrate(const nlohmann::json& doc);

private:
    bool persistLocked() const;

    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::map<long long, strategy::TradeSetup> setups_;
    int loaded_schema_version_ = kSchemaVersion;
};

} // namespace core
} // namespace tugofwar
