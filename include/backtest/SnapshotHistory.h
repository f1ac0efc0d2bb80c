#pragma once

#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "engine/EngineConfig.h"
#include "engine/MarketHistory.h"
#include "market/OptionChain.h"

namespace tugofwar {
namespace backtest {

// One recorded tick: the chain plus the index-level extras that travel with it.
struct ReplayFrame {
    market::Snapshot snapshot;
    std::optional<double> vix;
    std::optional<double> futures_oi_change;
};

class SnapshotHistory {
public:
    // One JSON snapshot per line
    static std::vector<ReplayFrame> loadJsonl(const std::string& file_path);

    // A JSON array of snapshots
    static std::vector<ReplayFrame> loadJson(const std::string& file_path);

    // Picks loader by extension; frames come back sorted by timestamp
    static std::vector<ReplayFrame> load(const std::string& file_path);

    static std::optional<ReplayFrame> frameFromJson(const nlohmann::json& raw);

    static std::vector<ReplayFrame> filterByTime(const std::vector<ReplayFrame>& frames,
                                                 long long start_ms,
                                                 long long end_ms);
};

// Caller-side rolling context: recent spot prices, recent chain-wide OI
// change pairs and the previous strike map.
class RollingHistory {
public:
    explicit RollingHistory(const engine::HistoryConfig& config = engine::HistoryConfig());

    engine::MarketHistory contextFor(const ReplayFrame& frame) const;

    // Call after the frame has been processed.
    void push(const market::Snapshot& snapshot);

    void clear();
    std::size_t size() const { return prices_.size(); }

private:
    engine::HistoryConfig config_;
    std::deque<double> prices_;
    std::deque<engine::OiChangePair> oi_changes_;
    market::StrikeMap previous_strikes_;
};

} // namespace backtest
} // namespace tugofwar
