#pragma once

#include "protocol_types.hpp"
#include "sealed_value.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cb {

struct OracleRequest {
    RequestId requestId;
    RequestKind kind = RequestKind::RISK_EVALUATION;
    std::vector<SealedValue> operands;
};

// What the oracle eventually pushes back for a request.
struct OracleCallback {
    RequestId requestId;
    std::string cleartext;
    std::string proofHex;
};

// Issues an evaluation/decryption request and returns its correlation token
// without waiting for the result.
class OracleClient {
public:
    virtual ~OracleClient() = default;
    virtual RequestId request(RequestKind kind, const std::vector<SealedValue>& operands) = 0;
};

using OracleClientPtr = std::shared_ptr<OracleClient>;

// Queues outbound requests for a transport to drain. Tokens are
// "<sequence>-<random>", so they cannot repeat within a process even if the
// random part collides.
class RelayOracleClient : public OracleClient {
public:
    RelayOracleClient();

    RequestId request(RequestKind kind, const std::vector<SealedValue>& operands) override;

    std::vector<OracleRequest> takePending();
    std::size_t queuedCount() const;
    std::uint64_t issuedCount() const { return sequence_.load(); }

private:
    std::atomic<std::uint64_t> sequence_;
    mutable std::mutex mutex_;
    std::deque<OracleRequest> outbound_;
};

} // namespace cb
