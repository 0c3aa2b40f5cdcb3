#pragma once

#include <stdexcept>
#include <string>

namespace cb {

enum class ErrorCode {
    THRESHOLD_NOT_SET,
    THRESHOLD_ALREADY_SET,
    UNAUTHORIZED,
    NOT_FOUND,
    NOT_HIGH_RISK,
    ALREADY_REVEALED,
    ALREADY_CLOSED,
    UNKNOWN_REQUEST,
    DUPLICATE_REQUEST,
    INVALID_PROOF,
    MALFORMED_PAYLOAD
};

const char* errorCodeName(ErrorCode code);

// Caller-visible failure of a protocol operation. State is left untouched
// whenever one of these escapes.
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ErrorCode code, const std::string& detail);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace cb
