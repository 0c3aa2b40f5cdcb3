#include "callback_verifier.hpp"

#include "errors.hpp"

#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <sodium.h>

namespace cb {

namespace {

constexpr std::string_view kCallbackDomainTag = "crisis-beacon:callback:v1";
constexpr std::string_view kBooleanPrefix = "bool:";
constexpr std::string_view kTextPrefix = "text:";

void appendLengthPrefixed(std::ostringstream& oss, const std::string& value) {
    oss << value.size() << ':';
    oss.write(value.data(), static_cast<std::streamsize>(value.size()));
    oss << ';';
}

bool startsWith(const std::string& value, std::string_view prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

void requireDeploymentId(const std::string& deploymentId) {
    if (deploymentId.empty()) {
        throw std::invalid_argument("deploymentId must not be empty for callback domain separation");
    }
}

} // namespace

std::string encodeBooleanPayload(bool value) {
    return std::string(kBooleanPrefix) + (value ? "1" : "0");
}

std::string encodeTextPayload(const std::string& text) {
    return std::string(kTextPrefix) + text;
}

std::optional<bool> decodeBooleanPayload(const std::string& cleartext) {
    if (cleartext.size() != kBooleanPrefix.size() + 1 || !startsWith(cleartext, kBooleanPrefix)) {
        return std::nullopt;
    }
    char digit = cleartext.back();
    if (digit == '1') {
        return true;
    }
    if (digit == '0') {
        return false;
    }
    return std::nullopt;
}

std::optional<std::string> decodeTextPayload(const std::string& cleartext) {
    if (!startsWith(cleartext, kTextPrefix)) {
        return std::nullopt;
    }
    return cleartext.substr(kTextPrefix.size());
}

std::string buildCallbackMessage(const std::string& deploymentId,
                                 const RequestId& requestId,
                                 const std::string& cleartext) {
    std::ostringstream oss;
    oss << kCallbackDomainTag << '|' << deploymentId << '|';
    appendLengthPrefixed(oss, requestId);
    appendLengthPrefixed(oss, cleartext);
    return oss.str();
}

CallbackVerifier::CallbackVerifier(const std::string& oraclePublicKeyHex, std::string deploymentId)
    : publicKey_(hexToBytes(oraclePublicKeyHex))
    , deploymentId_(std::move(deploymentId)) {
    requireSodium();
    requireDeploymentId(deploymentId_);
    if (publicKey_.size() != crypto_sign_PUBLICKEYBYTES) {
        throw std::invalid_argument("oracle public key length invalid");
    }
}

bool CallbackVerifier::authenticate(const RequestId& requestId,
                                    const std::string& cleartext,
                                    const std::string& proofHex) const {
    std::vector<unsigned char> signature;
    try {
        signature = hexToBytes(proofHex);
    } catch (const std::invalid_argument&) {
        return false;
    }
    if (signature.size() != crypto_sign_BYTES) {
        return false;
    }

    std::string message = buildCallbackMessage(deploymentId_, requestId, cleartext);
    return crypto_sign_verify_detached(signature.data(),
                                       reinterpret_cast<const unsigned char*>(message.data()),
                                       message.size(),
                                       publicKey_.data()) == 0;
}

DecodedPayload CallbackVerifier::verify(RequestKind expected,
                                        const RequestId& requestId,
                                        const std::string& cleartext,
                                        const std::string& proofHex) const {
    if (!authenticate(requestId, cleartext, proofHex)) {
        throw ProtocolError(ErrorCode::INVALID_PROOF, "callback for " + requestId);
    }

    DecodedPayload out;
    out.kind = expected;
    if (expected == RequestKind::RISK_EVALUATION) {
        auto flag = decodeBooleanPayload(cleartext);
        if (!flag) {
            throw ProtocolError(ErrorCode::MALFORMED_PAYLOAD, "expected boolean payload for " + requestId);
        }
        out.flag = *flag;
    } else {
        auto text = decodeTextPayload(cleartext);
        if (!text) {
            throw ProtocolError(ErrorCode::MALFORMED_PAYLOAD, "expected text payload for " + requestId);
        }
        out.text = std::move(*text);
    }
    return out;
}

OracleKeyPair generateOracleKeypair() {
    requireSodium();

    std::vector<unsigned char> publicKey(crypto_sign_PUBLICKEYBYTES);
    SecretBytes secretKey(crypto_sign_SECRETKEYBYTES);
    if (crypto_sign_keypair(publicKey.data(), secretKey.data()) != 0) {
        throw std::runtime_error("Failed to generate oracle keypair");
    }

    return OracleKeyPair{ bytesToHex(publicKey), secretKey.toHex() };
}

OracleKeyPair deriveOracleKeypairFromSeed(const std::string& seedHex) {
    requireSodium();

    SecretBytes seed = SecretBytes::fromHex(seedHex);
    if (seed.size() != crypto_sign_SEEDBYTES) {
        throw std::invalid_argument("Seed must decode to crypto_sign_SEEDBYTES bytes");
    }

    std::vector<unsigned char> publicKey(crypto_sign_PUBLICKEYBYTES);
    SecretBytes secretKey(crypto_sign_SECRETKEYBYTES);
    if (crypto_sign_seed_keypair(publicKey.data(), secretKey.data(), seed.data()) != 0) {
        throw std::runtime_error("Failed to derive oracle keypair from seed");
    }
    return OracleKeyPair{ bytesToHex(publicKey), secretKey.toHex() };
}

OracleSigner::OracleSigner(std::string secretKeyHex, std::string deploymentId)
    : secretKey_(SecretBytes::fromHex(secretKeyHex))
    , deploymentId_(std::move(deploymentId)) {
    sodium_memzero(secretKeyHex.data(), secretKeyHex.size());
    requireSodium();
    requireDeploymentId(deploymentId_);
    if (secretKey_.size() != crypto_sign_SECRETKEYBYTES) {
        throw std::invalid_argument("oracle secret key length invalid");
    }

    std::vector<unsigned char> publicKey(crypto_sign_PUBLICKEYBYTES);
    if (crypto_sign_ed25519_sk_to_pk(publicKey.data(), secretKey_.data()) != 0) {
        throw std::runtime_error("Unable to derive public key from secret key");
    }
    publicKeyHex_ = bytesToHex(publicKey);
}

std::string OracleSigner::sign(const RequestId& requestId, const std::string& cleartext) const {
    std::string message = buildCallbackMessage(deploymentId_, requestId, cleartext);
    std::vector<unsigned char> signature(crypto_sign_BYTES);
    unsigned long long sigLen = 0;
    if (crypto_sign_detached(signature.data(),
                             &sigLen,
                             reinterpret_cast<const unsigned char*>(message.data()),
                             message.size(),
                             secretKey_.data()) != 0) {
        throw std::runtime_error("Signing failed");
    }
    return bytesToHex(signature.data(), static_cast<std::size_t>(sigLen));
}

} // namespace cb
