#include "simulated_oracle.hpp"

#include <stdexcept>

#include <sodium.h>
#include <spdlog/spdlog.h>

namespace cb {

SimulatedOracle::SimulatedOracle(const OracleKeyPair& signingKeys, std::string deploymentId)
    : signer_(signingKeys.secretKeyHex, std::move(deploymentId))
    , sealingSecretKey_(crypto_box_SECRETKEYBYTES) {
    std::vector<unsigned char> publicKey(crypto_box_PUBLICKEYBYTES);
    if (crypto_box_keypair(publicKey.data(), sealingSecretKey_.data()) != 0) {
        throw std::runtime_error("Failed to generate oracle sealing keypair");
    }
    sealingPublicKeyHex_ = bytesToHex(publicKey);
}

OracleCallback SimulatedOracle::answer(const OracleRequest& request) const {
    std::string cleartext;
    if (request.kind == RequestKind::RISK_EVALUATION) {
        if (request.operands.size() != 2) {
            throw std::invalid_argument("risk evaluation needs (score, threshold) operands");
        }
        long long score = parseInteger(open(request.operands[0]), "score");
        long long threshold = parseInteger(open(request.operands[1]), "threshold");
        cleartext = encodeBooleanPayload(score > threshold);
    } else {
        if (request.operands.size() != 1) {
            throw std::invalid_argument("content reveal needs exactly one operand");
        }
        cleartext = encodeTextPayload(open(request.operands[0]));
    }

    OracleCallback out;
    out.requestId = request.requestId;
    out.proofHex = signer_.sign(request.requestId, cleartext);
    out.cleartext = std::move(cleartext);
    spdlog::debug("simulated oracle answered {} request {}", toString(request.kind), request.requestId);
    return out;
}

std::vector<OracleCallback> SimulatedOracle::answerAll(const std::vector<OracleRequest>& requests) const {
    std::vector<OracleCallback> out;
    out.reserve(requests.size());
    for (const auto& request : requests) {
        out.push_back(answer(request));
    }
    return out;
}

std::string SimulatedOracle::open(const SealedValue& value) const {
    auto ciphertext = hexToBytes(value.ciphertextHex);
    if (ciphertext.size() < crypto_box_SEALBYTES) {
        throw std::invalid_argument("sealed value too short: " + value.label);
    }

    std::vector<unsigned char> publicKey = hexToBytes(sealingPublicKeyHex_);
    std::vector<unsigned char> plaintext(ciphertext.size() - crypto_box_SEALBYTES);
    if (crypto_box_seal_open(plaintext.data(),
                             ciphertext.data(),
                             ciphertext.size(),
                             publicKey.data(),
                             sealingSecretKey_.data()) != 0) {
        throw std::runtime_error("Unable to open sealed value: " + value.label);
    }
    std::string out(plaintext.begin(), plaintext.end());
    sodium_memzero(plaintext.data(), plaintext.size());
    return out;
}

long long SimulatedOracle::parseInteger(const std::string& text, const std::string& label) {
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("sealed " + label + " is not an integer");
    }
    if (consumed != text.size()) {
        throw std::invalid_argument("sealed " + label + " has trailing characters");
    }
    return value;
}

} // namespace cb
