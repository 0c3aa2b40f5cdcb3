#pragma once

#include <cstdint>
#include <string>

namespace cb {

using RecordId = std::uint64_t;
using ActorId = std::string;

// Opaque correlation token handed out by an OracleClient. Only equality
// and ordering are meaningful.
using RequestId = std::string;

enum class RequestKind {
    RISK_EVALUATION,
    CONTENT_REVEAL
};

enum class RiskState {
    EVALUATING,
    LOW_RISK,
    HIGH_RISK
};

enum class RevealState {
    NOT_REVEALED,
    REVEAL_REQUESTED,
    REVEALED
};

const char* toString(RequestKind kind);
const char* toString(RiskState state);
const char* toString(RevealState state);

} // namespace cb
