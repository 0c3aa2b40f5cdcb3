#pragma once

#include "protocol_types.hpp"
#include "sealed_value.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace cb {

struct Record {
    RecordId id = 0;
    ActorId submitter;
    SealedValue content;
    SealedValue score;
    std::uint64_t createdAt = 0;
    bool highRisk = false;
    RiskState riskState = RiskState::EVALUATING;
    bool closed = false;
};

struct Alert {
    RecordId recordId = 0;
    std::string content;
    bool revealed = false;
    RevealState revealState = RevealState::NOT_REVEALED;
};

struct RecordStats {
    std::size_t total = 0;
    std::size_t evaluating = 0;
    std::size_t lowRisk = 0;
    std::size_t highRisk = 0;
    std::size_t revealed = 0;
    std::size_t closed = 0;
};

// Every submitted record and its alert. Identifiers start at 1 and are
// never reused; entries are never removed.
class RecordStore {
public:
    RecordId create(const ActorId& submitter,
                    const SealedValue& content,
                    const SealedValue& score,
                    std::uint64_t now);

    std::optional<Record> find(RecordId id) const;
    Record get(RecordId id) const;
    Alert getAlert(RecordId id) const;

    void markHighRisk(RecordId id, bool value);
    void markRevealRequested(RecordId id);
    void setAlertContent(RecordId id, const std::string& content);
    void markClosed(RecordId id);

    std::size_t size() const;
    RecordStats stats() const;

private:
    struct Entry {
        Record record;
        Alert alert;
    };

    Entry& entryLocked(RecordId id);
    const Entry& entryLocked(RecordId id) const;

    mutable std::mutex mutex_;
    std::map<RecordId, Entry> entries_;
    RecordId nextId_ = 1;
};

} // namespace cb
