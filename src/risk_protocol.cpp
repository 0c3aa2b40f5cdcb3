#include "risk_protocol.hpp"

#include "errors.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace cb {

namespace {

std::string recordTag(RecordId id) {
    return "record " + std::to_string(id);
}

std::string eventLine(const char* name, RecordId recordId, const std::string& extra = {}) {
    std::ostringstream oss;
    oss << name << "|record=" << recordId;
    if (!extra.empty()) {
        oss << '|' << extra;
    }
    return oss.str();
}

ProtocolConfig validated(ProtocolConfig config) {
    if (config.counselorId.empty()) {
        throw std::invalid_argument("counselorId must not be empty");
    }
    if (config.oraclePublicKeyHex.empty()) {
        throw std::invalid_argument("oraclePublicKeyHex must not be empty");
    }
    return config;
}

} // namespace

RiskAssessmentProtocol::RiskAssessmentProtocol(ProtocolConfig config, OracleClientPtr oracle)
    : config_(validated(std::move(config)))
    , oracle_(std::move(oracle))
    , verifier_(config_.oraclePublicKeyHex, config_.deploymentId) {
    if (!oracle_) {
        throw std::invalid_argument("RiskAssessmentProtocol requires an oracle client");
    }
    spdlog::info("protocol ready: deployment={} counselor={}", config_.deploymentId, config_.counselorId);
}

void RiskAssessmentProtocol::setThreshold(const ActorId& caller, const SealedValue& threshold) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireCounselor(caller, "setThreshold");
    if (threshold_) {
        throw ProtocolError(ErrorCode::THRESHOLD_ALREADY_SET, "threshold is immutable once set");
    }
    if (threshold.empty()) {
        throw std::invalid_argument("sealed threshold must not be empty");
    }
    threshold_ = threshold;
    transcript_.append("threshold-set");
    spdlog::info("threshold configured");
}

bool RiskAssessmentProtocol::hasThreshold() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_.has_value();
}

RecordId RiskAssessmentProtocol::submit(const ActorId& caller,
                                        const SealedValue& content,
                                        const SealedValue& score,
                                        std::uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!threshold_) {
        throw ProtocolError(ErrorCode::THRESHOLD_NOT_SET, "submission rejected");
    }
    if (content.empty() || score.empty()) {
        throw std::invalid_argument("submission requires sealed content and sealed score");
    }

    RequestId requestId = issueRequest(RequestKind::RISK_EVALUATION, { score, *threshold_ });
    RecordId recordId = records_.create(caller, content, score, now);
    ledger_.registerRequest(requestId, recordId, RequestKind::RISK_EVALUATION);

    transcript_.append(eventLine("submitted", recordId, "request=" + requestId));
    spdlog::info("{} submitted, risk evaluation pending as {}", recordTag(recordId), requestId);
    return recordId;
}

void RiskAssessmentProtocol::resolveRiskEvaluation(const RequestId& requestId,
                                                   const std::string& cleartext,
                                                   const std::string& proofHex) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pendingOfKind(requestId, RequestKind::RISK_EVALUATION);
    }
    DecodedPayload decoded = verifyCallback(RequestKind::RISK_EVALUATION, requestId, cleartext, proofHex);

    std::lock_guard<std::mutex> lock(mutex_);
    // A concurrent callback for the same id may have won while we verified.
    PendingRequest entry = ledger_.resolve(requestId);
    records_.markHighRisk(entry.recordId, decoded.flag);

    RiskState state = decoded.flag ? RiskState::HIGH_RISK : RiskState::LOW_RISK;
    transcript_.append(eventLine("risk-evaluated", entry.recordId, std::string("result=") + toString(state)));
    spdlog::info("{} evaluated as {}", recordTag(entry.recordId), toString(state));
}

RequestId RiskAssessmentProtocol::requestReveal(const ActorId& caller, RecordId recordId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Record record = records_.get(recordId);
    // Checked ahead of identity: the answer must not depend on who asks.
    if (record.riskState != RiskState::HIGH_RISK) {
        throw ProtocolError(ErrorCode::NOT_HIGH_RISK, recordTag(recordId));
    }
    requireCounselor(caller, "requestReveal");
    if (records_.getAlert(recordId).revealState != RevealState::NOT_REVEALED) {
        throw ProtocolError(ErrorCode::ALREADY_REVEALED, recordTag(recordId) + " reveal already requested");
    }

    RequestId requestId = issueRequest(RequestKind::CONTENT_REVEAL, { record.content });
    ledger_.registerRequest(requestId, recordId, RequestKind::CONTENT_REVEAL);
    records_.markRevealRequested(recordId);

    transcript_.append(eventLine("reveal-requested", recordId, "request=" + requestId));
    spdlog::info("{} reveal requested as {}", recordTag(recordId), requestId);
    return requestId;
}

void RiskAssessmentProtocol::resolveReveal(const RequestId& requestId,
                                           const std::string& cleartext,
                                           const std::string& proofHex) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pendingOfKind(requestId, RequestKind::CONTENT_REVEAL);
    }
    DecodedPayload decoded = verifyCallback(RequestKind::CONTENT_REVEAL, requestId, cleartext, proofHex);

    std::lock_guard<std::mutex> lock(mutex_);
    PendingRequest entry = pendingOfKind(requestId, RequestKind::CONTENT_REVEAL);
    if (records_.get(entry.recordId).riskState != RiskState::HIGH_RISK) {
        throw ProtocolError(ErrorCode::NOT_HIGH_RISK, recordTag(entry.recordId));
    }
    if (records_.getAlert(entry.recordId).revealed) {
        throw ProtocolError(ErrorCode::ALREADY_REVEALED, recordTag(entry.recordId));
    }

    ledger_.resolve(requestId);
    records_.setAlertContent(entry.recordId, decoded.text);

    transcript_.append(eventLine("revealed", entry.recordId));
    spdlog::info("{} content revealed", recordTag(entry.recordId));
}

AlertView RiskAssessmentProtocol::readAlert(const ActorId& caller, RecordId recordId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    requireCounselor(caller, "readAlert");
    Alert alert = records_.getAlert(recordId);

    AlertView view;
    view.revealed = alert.revealed;
    if (alert.revealed) {
        view.content = alert.content;
    }
    return view;
}

void RiskAssessmentProtocol::closeCase(const ActorId& caller, RecordId recordId) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireCounselor(caller, "closeCase");
    if (records_.get(recordId).riskState != RiskState::HIGH_RISK) {
        throw ProtocolError(ErrorCode::NOT_HIGH_RISK, recordTag(recordId));
    }
    records_.markClosed(recordId);

    transcript_.append(eventLine("closed", recordId));
    spdlog::info("{} closed", recordTag(recordId));
}

void RiskAssessmentProtocol::handleCallback(const OracleCallback& callback) {
    std::optional<PendingRequest> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending = ledger_.lookup(callback.requestId);
    }
    if (!pending) {
        spdlog::warn("rejected callback for unknown request {}", callback.requestId);
        throw ProtocolError(ErrorCode::UNKNOWN_REQUEST, callback.requestId);
    }
    if (pending->kind == RequestKind::RISK_EVALUATION) {
        resolveRiskEvaluation(callback.requestId, callback.cleartext, callback.proofHex);
    } else {
        resolveReveal(callback.requestId, callback.cleartext, callback.proofHex);
    }
}

RecordStatus RiskAssessmentProtocol::status(RecordId recordId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Record record = records_.get(recordId);
    Alert alert = records_.getAlert(recordId);

    RecordStatus out;
    out.id = record.id;
    out.riskState = record.riskState;
    out.revealState = alert.revealState;
    out.closed = record.closed;
    out.createdAt = record.createdAt;
    return out;
}

RecordStats RiskAssessmentProtocol::stats() const {
    return records_.stats();
}

std::size_t RiskAssessmentProtocol::pendingRequests() const {
    return ledger_.pendingCount();
}

std::string RiskAssessmentProtocol::transcriptRoot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcript_.merkleRoot();
}

std::size_t RiskAssessmentProtocol::transcriptSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcript_.size();
}

TranscriptLog RiskAssessmentProtocol::transcript() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcript_;
}

void RiskAssessmentProtocol::requireCounselor(const ActorId& caller, const char* operation) const {
    if (!isCounselor(caller)) {
        spdlog::warn("{} refused for actor {}", operation, caller);
        throw ProtocolError(ErrorCode::UNAUTHORIZED, std::string(operation) + " is counselor-only");
    }
}

PendingRequest RiskAssessmentProtocol::pendingOfKind(const RequestId& requestId, RequestKind kind) const {
    auto pending = ledger_.lookup(requestId);
    if (!pending || pending->kind != kind) {
        spdlog::warn("rejected {} callback for unknown request {}", toString(kind), requestId);
        throw ProtocolError(ErrorCode::UNKNOWN_REQUEST, requestId);
    }
    return *pending;
}

DecodedPayload RiskAssessmentProtocol::verifyCallback(RequestKind kind,
                                                      const RequestId& requestId,
                                                      const std::string& cleartext,
                                                      const std::string& proofHex) const {
    try {
        return verifier_.verify(kind, requestId, cleartext, proofHex);
    } catch (const ProtocolError& ex) {
        spdlog::warn("rejected {} callback for {}: {}", toString(kind), requestId, ex.what());
        throw;
    }
}

// Caller holds mutex_. Runs before any record is touched so a misbehaving
// client cannot leave a half-created submission behind.
RequestId RiskAssessmentProtocol::issueRequest(RequestKind kind, const std::vector<SealedValue>& operands) {
    RequestId requestId = oracle_->request(kind, operands);
    if (requestId.empty()) {
        throw std::runtime_error("oracle client returned an empty request id");
    }
    if (ledger_.contains(requestId)) {
        throw ProtocolError(ErrorCode::DUPLICATE_REQUEST, requestId);
    }
    return requestId;
}

} // namespace cb
