#include "protocol_types.hpp"

namespace cb {

const char* toString(RequestKind kind) {
    switch (kind) {
    case RequestKind::RISK_EVALUATION:
        return "risk-evaluation";
    case RequestKind::CONTENT_REVEAL:
        return "content-reveal";
    }
    return "unknown";
}

const char* toString(RiskState state) {
    switch (state) {
    case RiskState::EVALUATING:
        return "evaluating";
    case RiskState::LOW_RISK:
        return "low-risk";
    case RiskState::HIGH_RISK:
        return "high-risk";
    }
    return "unknown";
}

const char* toString(RevealState state) {
    switch (state) {
    case RevealState::NOT_REVEALED:
        return "not-revealed";
    case RevealState::REVEAL_REQUESTED:
        return "reveal-requested";
    case RevealState::REVEALED:
        return "revealed";
    }
    return "unknown";
}

} // namespace cb
