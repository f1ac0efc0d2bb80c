#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "core/contracts/IEventJournal.h"

namespace tugofwar {
namespace core {

// One JSON object per line. seq numbering continues from the highest seq
// found on disk; lines that fail to decode are counted and ignored.
class EventJournalJsonl : public IEventJournal {
public:
    explicit EventJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEvent& event) override;
    std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    // Every event recorded for one setup, in seq order
    std::vector<JournalEvent> readEntity(const std::string& entity_id);

    std::size_t skippedLines() const;

    static std::string toString(JournalEventType type);
    static std::optional<JournalEventType> fromString(const std::string& value);

private:
    using Filter = std::function<bool(const JournalEvent&)>;

    std::vector<JournalEvent> scanLocked(const Filter& keep, std::size_t* skipped) const;

    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
    std::size_t skipped_lines_ = 0;
};

} // namespace core
} // namespace tugofwar
