#include "callback_verifier.hpp"
#include "oracle.hpp"
#include "sealed_value.hpp"
#include "simulated_oracle.hpp"
#include "test_support.hpp"

#include <set>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

using namespace cb;
using namespace cbtest;

namespace {

void relayIssuesUniqueTokens() {
    RelayOracleClient relay;
    SealedValue operand{ "00ff", "score" };

    std::set<RequestId> seen;
    for (int i = 0; i < 1000; ++i) {
        RequestId id = relay.request(RequestKind::RISK_EVALUATION, { operand });
        expect(!id.empty(), "empty token");
        expect(seen.insert(id).second, "token issued twice");
    }
    expect(relay.issuedCount() == 1000, "issued counter");
    expect(relay.queuedCount() == 1000, "every request should be queued");

    auto drained = relay.takePending();
    expect(drained.size() == 1000, "drain size");
    expect(drained.front().operands.front().ciphertextHex == "00ff", "operands not forwarded");
    expect(relay.queuedCount() == 0, "drain must empty the queue");
    expect(relay.takePending().empty(), "second drain must be empty");

    bool rejected = false;
    try {
        relay.request(RequestKind::CONTENT_REVEAL, {});
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    expect(rejected, "request without operands accepted");
    expect(relay.issuedCount() == 1000, "rejected request consumed a token");
}

void simulatedOracleAnswers() {
    OracleKeyPair keys = deriveOracleKeypairFromSeed(kOracleSeed);
    SimulatedOracle oracle(keys, kDeployment);
    SealedBoxProvider sealer(oracle.sealingPublicKeyHex());
    CallbackVerifier verifier(keys.publicKeyHex, kDeployment);

    SealedValue first = sealer.seal("42", "score");
    SealedValue second = sealer.seal("42", "score");
    expect(first.ciphertextHex != second.ciphertextHex, "sealing must be randomized");
    expect(first.label == "score", "label not kept");

    SealedValue threshold = sealer.seal("40", "threshold");
    OracleCallback high = oracle.answer(OracleRequest{ "r1", RequestKind::RISK_EVALUATION, { first, threshold } });
    expect(high.requestId == "r1" && high.cleartext == "bool:1", "42 > 40 should be high risk");
    expect(verifier.authenticate(high.requestId, high.cleartext, high.proofHex), "oracle proof must verify");

    SealedValue low = sealer.seal("-5", "score");
    OracleCallback lowAnswer = oracle.answer(OracleRequest{ "r2", RequestKind::RISK_EVALUATION, { low, threshold } });
    expect(lowAnswer.cleartext == "bool:0", "-5 > 40 should be low risk");

    SealedValue content = sealer.seal("please call me", "content");
    OracleCallback reveal = oracle.answer(OracleRequest{ "r3", RequestKind::CONTENT_REVEAL, { content } });
    expect(reveal.cleartext == "text:please call me", "reveal plaintext mismatch");

    auto batch = oracle.answerAll({ OracleRequest{ "r4", RequestKind::CONTENT_REVEAL, { content } },
                                    OracleRequest{ "r5", RequestKind::RISK_EVALUATION, { first, threshold } } });
    expect(batch.size() == 2 && batch[0].requestId == "r4" && batch[1].requestId == "r5", "batch order");

    bool badScore = false;
    try {
        oracle.answer(OracleRequest{ "r6", RequestKind::RISK_EVALUATION, { sealer.seal("12abc", "score"), threshold } });
    } catch (const std::invalid_argument&) {
        badScore = true;
    }
    expect(badScore, "non-integer score accepted");

    SimulatedOracle otherOracle(keys, kDeployment);
    bool foreign = false;
    try {
        otherOracle.answer(OracleRequest{ "r7", RequestKind::CONTENT_REVEAL, { content } });
    } catch (const std::runtime_error&) {
        foreign = true;
    }
    expect(foreign, "a different oracle opened a value not sealed to it");
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::warn);

    relayIssuesUniqueTokens();
    simulatedOracleAnswers();

    std::cout << "oracle tests passed\n";
    return 0;
}
