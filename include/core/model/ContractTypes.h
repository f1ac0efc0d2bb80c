#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace tugofwar {
namespace core {

enum class JournalEventType {
    SETUP_CREATED,
    SETUP_ACTIVATED,
    SETUP_RESOLVED,
    SETUP_CANCELLED,
    SETUP_EXPIRED
};

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::SETUP_CREATED;
    std::string expiry;
    std::string entity_id;
    nlohmann::json payload;
};

struct LearnerDecision {
    bool allowed = true;
    std::string reason;
};

struct ConfidenceBand {
    double min_confidence = 0.0;
    double max_confidence = 100.0;
    std::vector<std::pair<double, double>> exclude_ranges;   // inclusive
};

} // namespace core
} // namespace tugofwar
