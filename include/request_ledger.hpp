#pragma once

#include "protocol_types.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace cb {

struct PendingRequest {
    RequestId requestId;
    RecordId recordId = 0;
    RequestKind kind = RequestKind::RISK_EVALUATION;
};

// Correlates outstanding oracle requests with the record they belong to.
// resolve() moves the id to a retired set, so an id is accepted at most once
// and can never be registered again. Pending entries cannot be enumerated.
class RequestLedger {
public:
    void registerRequest(const RequestId& requestId, RecordId recordId, RequestKind kind);

    std::optional<PendingRequest> lookup(const RequestId& requestId) const;
    PendingRequest resolve(const RequestId& requestId);

    // True while pending or after it was resolved.
    bool contains(const RequestId& requestId) const;
    bool isRetired(const RequestId& requestId) const;
    std::size_t pendingCount() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<RequestId, PendingRequest> pending_;
    std::unordered_set<RequestId> retired_;
};

} // namespace cb
