#pragma once

#include "callback_verifier.hpp"
#include "oracle.hpp"
#include "sodium_support.hpp"

#include <string>
#include <vector>

namespace cb {

// In-process stand-in for the off-chain oracle: opens sealed operands with
// its X25519 secret key, evaluates the request and signs the answer.
//
// Risk evaluation expects operands (score, threshold), both sealed decimal
// integers, and answers score > threshold. Content reveal expects a single
// sealed operand and answers with its plaintext.
class SimulatedOracle {
public:
    SimulatedOracle(const OracleKeyPair& signingKeys, std::string deploymentId);

    // Public key submitters seal to.
    const std::string& sealingPublicKeyHex() const { return sealingPublicKeyHex_; }
    const std::string& signingPublicKeyHex() const { return signer_.publicKeyHex(); }

    OracleCallback answer(const OracleRequest& request) const;
    std::vector<OracleCallback> answerAll(const std::vector<OracleRequest>& requests) const;

private:
    std::string open(const SealedValue& value) const;
    static long long parseInteger(const std::string& text, const std::string& label);

    OracleSigner signer_;
    std::string sealingPublicKeyHex_;
    SecretBytes sealingSecretKey_;
};

} // namespace cb
