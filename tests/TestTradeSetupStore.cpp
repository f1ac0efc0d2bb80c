#include "core/state/TradeSetupStoreJson.h"
#include "core/state/JsonFileIo.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace tugofwar;

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "tugofwar_test";
    std::filesystem::create_directories(dir);

    // Create, update, reload
    {
        const auto path = dir / "test_trade_setups.json";
        std::error_code ec;
        std::filesystem::remove(path, ec);

        strategy::TradeSetup setup;
        setup.id = 7;
        setup.created_at_ms = 1705293000000LL;
        setup.expiry = "2024-01-18";
        setup.direction = TradeDirection::BUY_PUT;
        setup.option_side = OptionSide::PE;
        setup.strike = 24050;
        setup.moneyness = Moneyness::ITM;
        setup.entry_premium = 120.0;
        setup.sl_premium = 96.0;
        setup.target1_premium = 144.0;
        setup.target2_premium = 168.0;
        setup.verdict = analytics::Verdict::BEARS_WINNING;
        setup.regime = analytics::MarketRegime::TRENDING_DOWN;
        setup.reasoning = "BUY PUT: Bears Winning";

        {
            core::TradeSetupStoreJson store(path);
            assert(store.list().empty());
            if (!store.create(setup)) {
                std::cerr << "[TEST] create failed\n";
                return 1;
            }
            assert(!store.create(setup));

            setup.status = strategy::SetupStatus::ACTIVE;
            setup.activation_premium = 121.0;
            setup.activated_at_ms = setup.created_at_ms + 300000;
            assert(store.update(setup));

            strategy::TradeSetup missing = setup;
            missing.id = 99;
            assert(!store.update(missing));
        }

        core::TradeSetupStoreJson reloaded(path);
        assert(reloaded.loadedSchemaVersion() == core::TradeSetupStoreJson::kSchemaVersion);
        const auto row = reloaded.findById(7);
        if (!row) {
            std::cerr << "[TEST] setup 7 missing after reload\n";
            return 1;
        }
        assert(row->status == strategy::SetupStatus::ACTIVE);
        assert(row->direction == TradeDirection::BUY_PUT);
        assert(row->option_side == OptionSide::PE);
        assert(row->verdict == analytics::Verdict::BEARS_WINNING);
        assert(row->regime == analytics::MarketRegime::TRENDING_DOWN);
        assert(row->activation_premium && std::abs(*row->activation_premium - 121.0) < 1e-9);
        assert(!row->exit_premium.has_value());
        assert(row->reasoning == "BUY PUT: Bears Winning");
    }

    // Version 1 documents are upgraded on open
    {
        const auto path = dir / "test_trade_setups_v1.json";
        nlohmann::json v1;
        v1["setups"] = nlohmann::json::array();
        v1["setups"].push_back({
            {"id", 3},
            {"created_at_ms", 1705293000000LL},
            {"direction", "BUY_CALL"},
            {"strike", 24000},
            {"option_type", "CE"},
            {"entry_premium", 100.0},
            {"sl_premium", 80.0},
            {"target1_premium", 120.0},
            {"target2_premium", 140.0},
            {"status", "ACTIVE"},
            {"activation_premium", 101.0},
            {"last_premium", 108.5}
        });
        v1["setups"].push_back({{"id", 4}, {"status", "BOGUS"}});
        {
            std::ofstream out(path, std::ios::trunc);
            out << v1.dump();
        }

        core::TradeSetupStoreJson store(path);
        if (store.loadedSchemaVersion() != 1) {
            std::cerr << "[TEST] expected v1 on disk, got " << store.loadedSchemaVersion() << "\n";
            return 1;
        }
        assert(store.list().size() == 1);
        const auto row = store.findById(3);
        assert(row.has_value());
        assert(row->last_checked_premium && std::abs(*row->last_checked_premium - 108.5) < 1e-9);
        assert(!row->max_premium_reached.has_value());
        assert(row->quality_score == 0);
        assert(row->reasoning.empty());

        const auto saved = core::readJsonFile(path);
        assert(saved.has_value());
        assert(saved->value("schema_version", 0) == 2);
        assert(!(*saved)["setups"][0].contains("last_premium"));

        const auto migrated = core::TradeSetupStoreJson::migrate(v1);
        assert(migrated["schema_version"] == 2);
        assert(migrated["setups"][0]["trade_reasoning"] == "");
    }

    std::cout << "[TEST] TradeSetupStore PASSED\n";
    return 0;
}
