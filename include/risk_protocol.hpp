#pragma once

#include "callback_verifier.hpp"
#include "oracle.hpp"
#include "protocol_types.hpp"
#include "record_store.hpp"
#include "request_ledger.hpp"
#include "sealed_value.hpp"
#include "transcript_log.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cb {

struct ProtocolConfig {
    ActorId counselorId;
    std::string oraclePublicKeyHex;
    std::string deploymentId = "local";
};

struct AlertView {
    std::string content;
    bool revealed = false;
};

struct RecordStatus {
    RecordId id = 0;
    RiskState riskState = RiskState::EVALUATING;
    RevealState revealState = RevealState::NOT_REVEALED;
    bool closed = false;
    std::uint64_t createdAt = 0;
};

// Submission -> oracle risk evaluation -> alert -> counselor-requested
// reveal. Every oracle round trip is two-phase: an issuing call registers a
// request id, and a callback entry point consumes it once its proof checks
// out. Callbacks that fail leave the request pending.
class RiskAssessmentProtocol {
public:
    RiskAssessmentProtocol(ProtocolConfig config, OracleClientPtr oracle);

    void setThreshold(const ActorId& caller, const SealedValue& threshold);
    bool hasThreshold() const;

    RecordId submit(const ActorId& caller,
                    const SealedValue& content,
                    const SealedValue& score,
                    std::uint64_t now);

    void resolveRiskEvaluation(const RequestId& requestId,
                               const std::string& cleartext,
                               const std::string& proofHex);

    RequestId requestReveal(const ActorId& caller, RecordId recordId);

    void resolveReveal(const RequestId& requestId,
                       const std::string& cleartext,
                       const std::string& proofHex);

    AlertView readAlert(const ActorId& caller, RecordId recordId) const;

    void closeCase(const ActorId& caller, RecordId recordId);

    // Routes a callback to the matching resolve entry point by the kind the
    // request was registered with.
    void handleCallback(const OracleCallback& callback);

    RecordStatus status(RecordId recordId) const;
    RecordStats stats() const;
    std::size_t pendingRequests() const;

    std::string transcriptRoot() const;
    std::size_t transcriptSize() const;
    TranscriptLog transcript() const;

    bool isCounselor(const ActorId& actor) const { return actor == config_.counselorId; }
    const RecordStore& records() const { return records_; }

private:
    void requireCounselor(const ActorId& caller, const char* operation) const;
    PendingRequest pendingOfKind(const RequestId& requestId, RequestKind kind) const;
    DecodedPayload verifyCallback(RequestKind kind,
                                  const RequestId& requestId,
                                  const std::string& cleartext,
                                  const std::string& proofHex) const;
    RequestId issueRequest(RequestKind kind, const std::vector<SealedValue>& operands);

    ProtocolConfig config_;
    OracleClientPtr oracle_;
    CallbackVerifier verifier_;

    RecordStore records_;
    RequestLedger ledger_;
    std::optional<SealedValue> threshold_;
    TranscriptLog transcript_;

    mutable std::mutex mutex_;
};

} // namespace cb
