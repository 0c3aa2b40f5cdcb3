#include "callback_verifier.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

using namespace cb;
using namespace cbtest;

namespace {

template <typename Fn>
bool throwsInvalidArgument(Fn&& fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void payloadCodecs() {
    expect(encodeBooleanPayload(true) == "bool:1", "true encoding");
    expect(encodeBooleanPayload(false) == "bool:0", "false encoding");
    expect(decodeBooleanPayload("bool:1") == std::optional<bool>(true), "decode true");
    expect(decodeBooleanPayload("bool:0") == std::optional<bool>(false), "decode false");
    expect(!decodeBooleanPayload("bool:").has_value(), "empty boolean");
    expect(!decodeBooleanPayload("bool:10").has_value(), "long boolean");
    expect(!decodeBooleanPayload("true").has_value(), "unprefixed boolean");

    expect(decodeTextPayload(encodeTextPayload("I need help")) == std::optional<std::string>("I need help"),
           "text round trip");
    expect(decodeTextPayload("text:") == std::optional<std::string>(""), "empty text is valid");
    expect(!decodeTextPayload("bool:1").has_value(), "boolean is not text");
}

void keyDerivation() {
    OracleKeyPair a = deriveOracleKeypairFromSeed(kOracleSeed);
    OracleKeyPair b = deriveOracleKeypairFromSeed(kOracleSeed);
    expect(a.publicKeyHex == b.publicKeyHex && a.secretKeyHex == b.secretKeyHex, "seeded keys must be stable");
    expect(a.publicKeyHex.size() == 64, "Ed25519 public key is 32 bytes");

    OracleKeyPair random = generateOracleKeypair();
    expect(random.publicKeyHex != a.publicKeyHex, "random key collided with seeded key");
    expect(throwsInvalidArgument([] { deriveOracleKeypairFromSeed("abcd"); }), "short seed accepted");
    expect(throwsInvalidArgument([] { deriveOracleKeypairFromSeed("zz"); }), "non-hex seed accepted");

    OracleSigner signer(a.secretKeyHex, kDeployment);
    expect(signer.publicKeyHex() == a.publicKeyHex, "signer must derive the matching public key");
}

void authenticateBindsEveryField() {
    OracleKeyPair keys = deriveOracleKeypairFromSeed(kOracleSeed);
    OracleSigner signer(keys.secretKeyHex, kDeployment);
    CallbackVerifier verifier(keys.publicKeyHex, kDeployment);

    std::string proof = signer.sign("req-1", "bool:1");
    expect(verifier.authenticate("req-1", "bool:1", proof), "genuine proof rejected");
    expect(!verifier.authenticate("req-2", "bool:1", proof), "proof accepted for another request id");
    expect(!verifier.authenticate("req-1", "bool:0", proof), "proof accepted for another cleartext");

    CallbackVerifier otherDeployment(keys.publicKeyHex, "elsewhere");
    expect(!otherDeployment.authenticate("req-1", "bool:1", proof), "proof accepted across deployments");

    OracleKeyPair stranger = generateOracleKeypair();
    CallbackVerifier wrongKey(stranger.publicKeyHex, kDeployment);
    expect(!wrongKey.authenticate("req-1", "bool:1", proof), "proof accepted under another key");

    expect(!verifier.authenticate("req-1", "bool:1", ""), "empty proof accepted");
    expect(!verifier.authenticate("req-1", "bool:1", "not-hex"), "non-hex proof accepted");
    expect(!verifier.authenticate("req-1", "bool:1", proof.substr(0, 64)), "truncated proof accepted");

    std::string flipped = proof;
    flipped[0] = (flipped[0] == '0') ? '1' : '0';
    expect(!verifier.authenticate("req-1", "bool:1", flipped), "tampered proof accepted");

    // Length prefixes keep (id, cleartext) splits unambiguous.
    std::string shifted = signer.sign("req-1b", "ool:1");
    expect(!verifier.authenticate("req-1", "bool:1", shifted), "boundary-shifted message accepted");
}

void verifyReportsProofBeforeShape() {
    OracleKeyPair keys = deriveOracleKeypairFromSeed(kOracleSeed);
    OracleSigner signer(keys.secretKeyHex, kDeployment);
    CallbackVerifier verifier(keys.publicKeyHex, kDeployment);

    DecodedPayload risk = verifier.verify(RequestKind::RISK_EVALUATION, "r", "bool:1", signer.sign("r", "bool:1"));
    expect(risk.flag, "risk payload decoded wrong");

    DecodedPayload reveal =
        verifier.verify(RequestKind::CONTENT_REVEAL, "c", "text:hello", signer.sign("c", "text:hello"));
    expect(reveal.text == "hello", "reveal payload decoded wrong");

    expectError(ErrorCode::MALFORMED_PAYLOAD,
                [&] { verifier.verify(RequestKind::RISK_EVALUATION, "r", "text:x", signer.sign("r", "text:x")); },
                "text where boolean expected");
    expectError(ErrorCode::MALFORMED_PAYLOAD,
                [&] { verifier.verify(RequestKind::CONTENT_REVEAL, "c", "bool:1", signer.sign("c", "bool:1")); },
                "boolean where text expected");
    expectError(ErrorCode::INVALID_PROOF,
                [&] { verifier.verify(RequestKind::RISK_EVALUATION, "r", "garbage", signer.sign("r", "other")); },
                "bad proof on malformed payload must report InvalidProof");
}

void constructorValidation() {
    OracleKeyPair keys = deriveOracleKeypairFromSeed(kOracleSeed);
    expect(throwsInvalidArgument([] { CallbackVerifier("abcd", kDeployment); }), "short public key accepted");
    expect(throwsInvalidArgument([&] { CallbackVerifier(keys.publicKeyHex, ""); }), "empty deployment accepted");
    expect(throwsInvalidArgument([&] { OracleSigner(keys.publicKeyHex, kDeployment); }),
           "public key accepted as secret key");
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::warn);

    payloadCodecs();
    keyDerivation();
    authenticateBindsEveryField();
    verifyReportsProofBeforeShape();
    constructorValidation();

    std::cout << "callback verifier tests passed\n";
    return 0;
}
