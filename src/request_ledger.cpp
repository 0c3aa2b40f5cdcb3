#include "request_ledger.hpp"

#include "errors.hpp"

#include <spdlog/spdlog.h>

namespace cb {

void RequestLedger::registerRequest(const RequestId& requestId, RecordId recordId, RequestKind kind) {
    if (requestId.empty()) {
        throw std::invalid_argument("request id must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (retired_.count(requestId) != 0) {
        throw ProtocolError(ErrorCode::DUPLICATE_REQUEST, requestId);
    }
    PendingRequest entry{ requestId, recordId, kind };
    if (!pending_.emplace(requestId, std::move(entry)).second) {
        throw ProtocolError(ErrorCode::DUPLICATE_REQUEST, requestId);
    }
    spdlog::debug("ledger: registered {} request {} for record {}", toString(kind), requestId, recordId);
}

std::optional<PendingRequest> RequestLedger::lookup(const RequestId& requestId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(requestId);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    return it->second;
}

PendingRequest RequestLedger::resolve(const RequestId& requestId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(requestId);
    if (it == pending_.end()) {
        throw ProtocolError(ErrorCode::UNKNOWN_REQUEST, requestId);
    }
    PendingRequest out = std::move(it->second);
    pending_.erase(it);
    retired_.insert(requestId);
    spdlog::debug("ledger: resolved request {} for record {}", requestId, out.recordId);
    return out;
}

bool RequestLedger::contains(const RequestId& requestId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(requestId) != 0 || retired_.count(requestId) != 0;
}

bool RequestLedger::isRetired(const RequestId& requestId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retired_.count(requestId) != 0;
}

std::size_t RequestLedger::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace cb
