#pragma once

#include <string>

namespace cb {

// Handle to a value held in a form the protocol cannot read. The protocol
// copies and forwards it; only the oracle side ever opens it.
struct SealedValue {
    std::string ciphertextHex;
    std::string label;

    bool empty() const { return ciphertextHex.empty(); }
};

class SealingProvider {
public:
    virtual ~SealingProvider() = default;
    virtual SealedValue seal(const std::string& plaintext, const std::string& label) = 0;
};

// Anonymous public-key sealing (crypto_box_seal) to the oracle's X25519 key.
// Submitters can seal; only the holder of the matching secret key can open.
class SealedBoxProvider : public SealingProvider {
public:
    explicit SealedBoxProvider(const std::string& recipientPublicKeyHex);

    SealedValue seal(const std::string& plaintext, const std::string& label) override;

private:
    std::string recipientPublicKeyHex_;
};

} // namespace cb
