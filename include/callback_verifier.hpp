#pragma once

#include "protocol_types.hpp"
#include "sodium_support.hpp"

#include <optional>
#include <string>

namespace cb {

// Cleartext encodings the oracle uses for each request kind.
std::string encodeBooleanPayload(bool value);
std::string encodeTextPayload(const std::string& text);
std::optional<bool> decodeBooleanPayload(const std::string& cleartext);
std::optional<std::string> decodeTextPayload(const std::string& cleartext);

// Bytes the oracle signs for a callback. Length-prefixed and scoped to a
// deployment so a proof cannot be replayed across ids or deployments.
std::string buildCallbackMessage(const std::string& deploymentId,
                                 const RequestId& requestId,
                                 const std::string& cleartext);

struct DecodedPayload {
    RequestKind kind = RequestKind::RISK_EVALUATION;
    bool flag = false;
    std::string text;
};

class CallbackVerifier {
public:
    CallbackVerifier(const std::string& oraclePublicKeyHex, std::string deploymentId);

    // True when proofHex is a valid Ed25519 signature by the oracle over the
    // callback message. Never throws on malformed input.
    bool authenticate(const RequestId& requestId,
                      const std::string& cleartext,
                      const std::string& proofHex) const;

    // Throws ProtocolError(INVALID_PROOF) or ProtocolError(MALFORMED_PAYLOAD).
    DecodedPayload verify(RequestKind expected,
                          const RequestId& requestId,
                          const std::string& cleartext,
                          const std::string& proofHex) const;

private:
    std::vector<unsigned char> publicKey_;
    std::string deploymentId_;
};

// Oracle side: holds the Ed25519 secret key and signs callbacks.
struct OracleKeyPair {
    std::string publicKeyHex;
    std::string secretKeyHex;
};

OracleKeyPair generateOracleKeypair();
OracleKeyPair deriveOracleKeypairFromSeed(const std::string& seedHex);

class OracleSigner {
public:
    OracleSigner(std::string secretKeyHex, std::string deploymentId);

    std::string sign(const RequestId& requestId, const std::string& cleartext) const;

    const std::string& publicKeyHex() const { return publicKeyHex_; }

private:
    SecretBytes secretKey_;
    std::string publicKeyHex_;
    std::string deploymentId_;
};

} // namespace cb
