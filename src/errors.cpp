#include "errors.hpp"

namespace cb {

namespace {

std::string formatMessage(ErrorCode code, const std::string& detail) {
    std::string message = errorCodeName(code);
    if (!detail.empty()) {
        message += ": ";
        message += detail;
    }
    return message;
}

} // namespace

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::THRESHOLD_NOT_SET:
        return "ThresholdNotSet";
    case ErrorCode::THRESHOLD_ALREADY_SET:
        return "ThresholdAlreadySet";
    case ErrorCode::UNAUTHORIZED:
        return "Unauthorized";
    case ErrorCode::NOT_FOUND:
        return "NotFound";
    case ErrorCode::NOT_HIGH_RISK:
        return "NotHighRisk";
    case ErrorCode::ALREADY_REVEALED:
        return "AlreadyRevealed";
    case ErrorCode::ALREADY_CLOSED:
        return "AlreadyClosed";
    case ErrorCode::UNKNOWN_REQUEST:
        return "UnknownRequest";
    case ErrorCode::DUPLICATE_REQUEST:
        return "DuplicateRequest";
    case ErrorCode::INVALID_PROOF:
        return "InvalidProof";
    case ErrorCode::MALFORMED_PAYLOAD:
        return "MalformedPayload";
    }
    return "Unknown";
}

ProtocolError::ProtocolError(ErrorCode code, const std::string& detail)
    : std::runtime_error(formatMessage(code, detail))
    , code_(code) {}

} // namespace cb
