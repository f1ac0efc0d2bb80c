#include "backtest/SnapshotHistory.h"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace tugofwar;

int main() {
    // Parser boundary: keyed object, missing IV, negative OI
    {
        const auto raw = nlohmann::json::parse(R"({
            "timestamp": 1705293000000,
            "spot_price": 24025.5,
            "expiry": "2024-01-18",
            "vix": 13.2,
            "strikes": {
                "24000": {"ce_oi": 250000, "ce_oi_change": 15000, "ce_ltp": 142.25,
                          "pe_oi": 220000, "pe_oi_change": -2000, "pe_ltp": 118.5, "pe_iv": 14.1},
                "24050": {"ce_oi": -5, "ce_ltp": 0},
                "abc": {"ce_oi": 1}
            }
        })");
        const auto frame = backtest::SnapshotHistory::frameFromJson(raw);
        if (!frame) {
            std::cerr << "[TEST] valid snapshot rejected\n";
            return 1;
        }
        const auto& s = frame->snapshot;
        assert(s.strikes.size() == 2);
        assert(s.timestamp_ms == 1705293000000LL);
        assert(frame->vix && *frame->vix == 13.2);
        assert(!frame->futures_oi_change.has_value());

        const auto* atm = s.find(24000);
        assert(atm != nullptr);
        assert(atm->put_oi_change == -2000);
        assert(!atm->call_iv.has_value());
        assert(atm->ivOr0(OptionSide::CE) == 0.0);
        assert(atm->put_iv && *atm->put_iv == 14.1);

        const auto* upper = s.find(24050);
        assert(upper->call_oi == 0);
        assert(!s.premium(24050, OptionSide::CE).has_value());
        assert(*s.premium(24000, OptionSide::CE) == 142.25);

        const auto reparsed = market::SnapshotParser::fromJson(market::SnapshotParser::toJson(s));
        assert(reparsed && reparsed->strikes.size() == 2);
        assert(reparsed->strikes.at(24000).put_iv == atm->put_iv);
    }

    // Rows as an array, bad spot rejected
    {
        const auto rows = nlohmann::json::parse(R"({
            "timestamp": 1, "spot_price": 100.0,
            "strikes": [{"strike": 100, "ce_oi": 10, "pe_oi": 20}, {"ce_oi": 3}]
        })");
        const auto snapshot = market::SnapshotParser::fromJson(rows);
        assert(snapshot && snapshot->strikes.size() == 1);

        assert(!market::SnapshotParser::fromJson(nlohmann::json::parse(R"({"spot_price": 0})")));
        assert(!market::SnapshotParser::fromJson(nlohmann::json::parse(R"({"spot_price": "x"})")));
        assert(!market::SnapshotParser::fromJson(nlohmann::json::array()));
    }

    // Values too large for their integer fields
    {
        const auto rows = nlohmann::json::parse(R"({
            "timestamp": 1, "spot_price": 100.0,
            "strikes": [
                {"strike": 100, "ce_oi": 1e30, "pe_oi": 20, "ce_oi_change": -1e300},
                {"strike": 5000000000, "ce_oi": 7},
                {"strike": 1e40, "pe_oi": 9}
            ]
        })");
        const auto snapshot = market::SnapshotParser::fromJson(rows);
        assert(snapshot && snapshot->strikes.size() == 1);
        const auto& m = snapshot->strikes.at(100);
        assert(m.call_oi == 0);
        assert(m.call_oi_change == 0);
        assert(m.put_oi == 20);
    }

    // JSONL loading sorts by time and skips broken lines
    {
        const auto dir = std::filesystem::temp_directory_path() / "tugofwar_test";
        std::filesystem::create_directories(dir);
        const auto path = dir / "test_snapshots.jsonl";
        {
            std::ofstream out(path, std::ios::trunc);
            out << R"({"timestamp": 2000, "spot_price": 101.0, "strikes": {"100": {"ce_oi": 5}}})" << "\n";
            out << "not json\n\n";
            out << R"({"timestamp": 1000, "spot_price": 100.0, "strikes": {"100": {"ce_oi": 4}}})" << "\n";
        }
        const auto frames = backtest::SnapshotHistory::load(path.string());
        if (frames.size() != 2) {
            std::cerr << "[TEST] expected 2 frames, got " << frames.size() << "\n";
            return 1;
        }
        assert(frames[0].snapshot.timestamp_ms == 1000);
        assert(backtest::SnapshotHistory::filterByTime(frames, 1500, 0).size() == 1);
        assert(backtest::SnapshotHistory::load((dir / "missing.jsonl").string()).empty());
    }

    // Rolling context never includes the frame being analysed
    {
        engine::HistoryConfig config;
        config.price_window = 3;
        config.oi_change_window = 2;
        backtest::RollingHistory rolling(config);

        for (int i = 0; i < 5; ++i) {
            market::Snapshot s;
            s.timestamp_ms = 1000 * (i + 1);
            s.spot_price = 100.0 + i;
            market::StrikeMetrics m;
            m.strike = 100;
            m.call_oi_change = 10 * (i + 1);
            m.put_oi_change = 20 * (i + 1);
            m.call_ltp = 5.0 + i;
            s.strikes[100] = m;

            backtest::ReplayFrame frame;
            frame.snapshot = s;
            const auto history = rolling.contextFor(frame);
            assert(history.price_history.size() == static_cast<std::size_t>(std::min(i, 3)));
            if (i > 0) {
                assert(history.price_history.back() == 100.0 + i - 1);
                assert(market::premiumOf(history.previous_strikes, 100, OptionSide::CE) == 5.0 + i - 1);
            }
            rolling.push(s);
        }

        backtest::ReplayFrame last;
        last.vix = 15.0;
        const auto history = rolling.contextFor(last);
        assert(history.price_history.size() == 3);
        assert(history.price_history.front() == 102.0);
        assert(history.oi_change_history.size() == 2);
        assert(history.oi_change_history.back().put_change == 100);
        assert(history.vix && *history.vix == 15.0);

        rolling.clear();
        assert(rolling.size() == 0);
    }

    std::cout << "[TEST] SnapshotHistory PASSED\n";
    return 0;
}
