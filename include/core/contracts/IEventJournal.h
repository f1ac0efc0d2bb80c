#pragma once

#include <cstdint>
#include <vector>

#include "core/model/ContractTypes.h"

namespace tugofwar {
namespace core {

// Outbound sink for setup creation/resolution events. Fire-and-forget: a
// failed append is reported through the return value only.
class IEventJournal {
public:
    virtual ~IEventJournal() = default;

    virtual bool append(const JournalEvent& event) = 0;
    virtual std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace tugofwar
