#include "record_store.hpp"

#include "errors.hpp"

#include <spdlog/spdlog.h>

namespace cb {

RecordId RecordStore::create(const ActorId& submitter,
                             const SealedValue& content,
                             const SealedValue& score,
                             std::uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    RecordId id = nextId_++;

    Entry entry;
    entry.record.id = id;
    entry.record.submitter = submitter;
    entry.record.content = content;
    entry.record.score = score;
    entry.record.createdAt = now;
    entry.alert.recordId = id;
    entries_.emplace(id, std::move(entry));

    spdlog::debug("record store: allocated record {}", id);
    return id;
}

std::optional<Record> RecordStore::find(RecordId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

Record RecordStore::get(RecordId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entryLocked(id).record;
}

Alert RecordStore::getAlert(RecordId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entryLocked(id).alert;
}

void RecordStore::markHighRisk(RecordId id, bool value) {
    std::lock_guard<std::mutex> lock(mutex_);
    Record& record = entryLocked(id).record;
    record.highRisk = value;
    record.riskState = value ? RiskState::HIGH_RISK : RiskState::LOW_RISK;
}

void RecordStore::markRevealRequested(RecordId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Alert& alert = entryLocked(id).alert;
    if (alert.revealed) {
        throw ProtocolError(ErrorCode::ALREADY_REVEALED, "record " + std::to_string(id));
    }
    alert.revealState = RevealState::REVEAL_REQUESTED;
}

void RecordStore::setAlertContent(RecordId id, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    Alert& alert = entryLocked(id).alert;
    if (alert.revealed) {
        throw ProtocolError(ErrorCode::ALREADY_REVEALED, "record " + std::to_string(id));
    }
    alert.content = content;
    alert.revealed = true;
    alert.revealState = RevealState::REVEALED;
}

void RecordStore::markClosed(RecordId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Record& record = entryLocked(id).record;
    if (record.closed) {
        throw ProtocolError(ErrorCode::ALREADY_CLOSED, "record " + std::to_string(id));
    }
    record.closed = true;
}

std::size_t RecordStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

RecordStats RecordStore::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RecordStats out;
    out.total = entries_.size();
    for (const auto& [id, entry] : entries_) {
        switch (entry.record.riskState) {
        case RiskState::EVALUATING:
            ++out.evaluating;
            break;
        case RiskState::LOW_RISK:
            ++out.lowRisk;
            break;
        case RiskState::HIGH_RISK:
            ++out.highRisk;
            break;
        }
        if (entry.alert.revealed) {
            ++out.revealed;
        }
        if (entry.record.closed) {
            ++out.closed;
        }
    }
    return out;
}

RecordStore::Entry& RecordStore::entryLocked(RecordId id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        throw ProtocolError(ErrorCode::NOT_FOUND, "record " + std::to_string(id));
    }
    return it->second;
}

const RecordStore::Entry& RecordStore::entryLocked(RecordId id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        throw ProtocolError(ErrorCode::NOT_FOUND, "record " + std::to_string(id));
    }
    return it->second;
}

} // namespace cb
