#include "backtest/SnapshotHistory.h"

#include <algorithm>
#include <cmath>
#include <fstream>

#include <nlohmann/json.hpp>

#include "common/Logger.h"

namespace tugofwar {
namespace backtest {

namespace {
std::optional<double> optionalNumber(const nlohmann::json& raw, const char* key) {
    auto it = raw.find(key);
    if (it == raw.end() || !it->is_number()) {
        return std::nullopt;
    }
    const double value = it->get<double>();
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

void sortFrames(std::vector<ReplayFrame>& frames) {
    std::stable_sort(frames.begin(), frames.end(), [](const ReplayFrame& a, const ReplayFrame& b) {
        return a.snapshot.timestamp_ms < b.snapshot.timestamp_ms;
    });
}
}

std::optional<ReplayFrame> SnapshotHistory::frameFromJson(const nlohmann::json& raw) {
    auto snapshot = market::SnapshotParser::fromJson(raw);
    if (!snapshot) {
        return std::nullopt;
    }
    ReplayFrame frame;
    frame.snapshot = std::move(*snapshot);
    frame.vix = optionalNumber(raw, "vix");
    frame.futures_oi_change = optionalNumber(raw, "futures_oi_change");
    return frame;
}

std::vector<ReplayFrame> SnapshotHistory::loadJsonl(const std::string& file_path) {
    std::vector<ReplayFrame> frames;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open snapshot file: {}", file_path);
        return frames;
    }

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }
        try {
            auto frame = frameFromJson(nlohmann::json::parse(line));
            if (frame) {
                frames.push_back(std::move(*frame));
            } else {
                LOG_WARN("Snapshot line {} rejected", line_no);
            }
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Error parsing snapshot line {}: {}", line_no, e.what());
        }
    }

    sortFrames(frames);
    LOG_INFO("Loaded {} snapshots from {}", frames.size(), file_path);
    return frames;
}

std::vector<ReplayFrame> SnapshotHistory::loadJson(const std::string& file_path) {
    std::vector<ReplayFrame> frames;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open snapshot file: {}", file_path);
        return frames;
    }

    try {
        nlohmann::json data;
        file >> data;
        if (!data.is_array()) {
            LOG_ERROR("Snapshot file {} is not an array", file_path);
            return frames;
        }
        for (const auto& item : data) {
            auto frame = frameFromJson(item);
            if (frame) {
                frames.push_back(std::move(*frame));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing snapshot file {}: {}", file_path, e.what());
    }

    sortFrames(frames);
    LOG_INFO("Loaded {} snapshots from {}", frames.size(), file_path);
    return frames;
}

std::vector<ReplayFrame> SnapshotHistory::load(const std::string& file_path) {
    const auto dot = file_path.find_last_of('.');
    if (dot != std::string::npos && file_path.substr(dot) == ".json") {
        return loadJson(file_path);
    }
    return loadJsonl(file_path);
}

std::vector<ReplayFrame> SnapshotHistory::filterByTime(const std::vector<ReplayFrame>& frames,
                                                       long long start_ms,
                                                       long long end_ms) {
    std::vector<ReplayFrame> out;
    for (const auto& frame : frames) {
        const long long ts = frame.snapshot.timestamp_ms;
        if (ts >= start_ms && (end_ms <= 0 || ts <= end_ms)) {
            out.push_back(frame);
        }
    }
    return out;
}

RollingHistory::RollingHistory(const engine::HistoryConfig& config)
    : config_(config) {}

engine::MarketHistory RollingHistory::contextFor(const ReplayFrame& frame) const {
    engine::MarketHistory history;
    history.price_history.assign(prices_.begin(), prices_.end());
    history.oi_change_history.assign(oi_changes_.begin(), oi_changes_.end());
    history.previous_strikes = previous_strikes_;
    history.vix = frame.vix;
    history.futures_oi_change = frame.futures_oi_change;
    return history;
}

void RollingHistory::push(const market::Snapshot& snapshot) {
    if (snapshot.spot_price > 0.0) {
        prices_.push_back(snapshot.spot_price);
        while (prices_.size() > static_cast<std::size_t>(std::max(1, config_.price_window))) {
            prices_.pop_front();
        }
    }

    engine::OiChangePair pair;
    for (const auto& [strike, metrics] : snapshot.strikes) {
        (void)strike;
        pair.call_change += metrics.call_oi_change;
        pair.put_change += metrics.put_oi_change;
    }
    oi_changes_.push_back(pair);
    while (oi_changes_.size() > static_cast<std::size_t>(std::max(1, config_.oi_change_window))) {
        oi_changes_.pop_front();
    }

    previous_strikes_ = snapshot.strikes;
}

void RollingHistory::clear() {
    prices_.clear();
    oi_changes_.clear();
    previous_strikes_.clear();
}

} // namespace backtest
} // namespace tugofwar
