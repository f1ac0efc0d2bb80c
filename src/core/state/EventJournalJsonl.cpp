#include "core/state/EventJournalJsonl.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <utility>

#include "common/Logger.h"

namespace tugofwar {
namespace core {

namespace {

constexpr std::array<std::pair<JournalEventType, const char*>, 5> kTypeNames{{
    {JournalEventType::SETUP_CREATED, "SETUP_CREATED"},
    {JournalEventType::SETUP_ACTIVATED, "SETUP_ACTIVATED"},
    {JournalEventType::SETUP_RESOLVED, "SETUP_RESOLVED"},
    {JournalEventType::SETUP_CANCELLED, "SETUP_CANCELLED"},
    {JournalEventType::SETUP_EXPIRED, "SETUP_EXPIRED"},
}};

nlohmann::json encodeLine(const JournalEvent& event, std::uint64_t seq) {
    return nlohmann::json{
        {"seq", seq},
        {"ts_ms", event.ts_ms},
        {"type", EventJournalJsonl::toString(event.type)},
        {"expiry", event.expiry},
        {"entity_id", event.entity_id},
        {"payload", event.payload.is_null() ? nlohmann::json::object() : event.payload},
    };
}

// A line counts only when it carries a positive seq and a known event type.
std::optional<JournalEvent> decodeLine(const std::string& row) {
    nlohmann::json line;
    try {
        line = nlohmann::json::parse(row);
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
    if (!line.is_object() || !line.contains("seq") || !line["seq"].is_number_unsigned()) {
        return std::nullopt;
    }
    if (!line.contains("type") || !line["type"].is_string()) {
        return std::nullopt;
    }
    const auto type = EventJournalJsonl::fromString(line["type"].get<std::string>());
    if (!type) {
        return std::nullopt;
    }

    JournalEvent event;
    try {
        event.seq = line["seq"].get<std::uint64_t>();
        event.ts_ms = line.value("ts_ms", 0LL);
        event.type = *type;
        event.expiry = line.value("expiry", std::string());
        event.entity_id = line.value("entity_id", std::string());
        event.payload = line.value("payload", nlohmann::json::object());
    } catch (const nlohmann::json::type_error&) {
        return std::nullopt;
    }
    if (event.seq == 0) {
        return std::nullopt;
    }
    return event;
}

} // namespace

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    const auto events = scanLocked([](const JournalEvent&) { return true; }, &skipped_lines_);
    for (const auto& event : events) {
        last_seq_ = std::max(last_seq_, event.seq);
    }
    if (skipped_lines_ > 0) {
        LOG_WARN("Journal {}: ignored {} undecodable lines", file_path_.string(), skipped_lines_);
    }
}

std::vector<JournalEvent> EventJournalJsonl::scanLocked(const Filter& keep, std::size_t* skipped) const {
    std::vector<JournalEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        auto event = decodeLine(row);
        if (!event) {
            if (skipped) {
                ++(*skipped);
            }
            continue;
        }
        if (keep(*event)) {
            out.push_back(std::move(*event));
        }
    }

    std::stable_sort(out.begin(), out.end(), [](const JournalEvent& a, const JournalEvent& b) {
        return a.seq < b.seq;
    });
    return out;
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Journal directory {} unavailable: {}", file_path_.parent_path().string(), ec.message());
            return false;
        }
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Journal {} could not be opened for append", file_path_.string());
        return false;
    }

    const std::uint64_t seq = last_seq_ + 1;
    out << encodeLine(event, seq).dump() << "\n";
    out.flush();
    if (!out.good()) {
        LOG_ERROR("Journal {} write failed at seq {}", file_path_.string(), seq);
        return false;
    }
    last_seq_ = seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);
    return scanLocked([seq_inclusive](const JournalEvent& e) { return e.seq >= seq_inclusive; }, nullptr);
}

std::vector<JournalEvent> EventJournalJsonl::readEntity(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return scanLocked([&entity_id](const JournalEvent& e) { return e.entity_id == entity_id; }, nullptr);
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::size_t EventJournalJsonl::skippedLines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return skipped_lines_;
}

std::string EventJournalJsonl::toString(JournalEventType type) {
    for (const auto& [value, name] : kTypeNames) {
        if (value == type) {
            return name;
        }
    }
    return "SETUP_CREATED";
}

std::optional<JournalEventType> EventJournalJsonl::fromString(const std::string& value) {
    for (const auto& [type, name] : kTypeNames) {
        if (value == name) {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace core
} // namespace tugofwar
