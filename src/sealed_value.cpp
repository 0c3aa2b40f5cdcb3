#include "sealed_value.hpp"

#include "sodium_support.hpp"

#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace cb {

SealedBoxProvider::SealedBoxProvider(const std::string& recipientPublicKeyHex)
    : recipientPublicKeyHex_(recipientPublicKeyHex) {
    requireSodium();
    if (hexToBytes(recipientPublicKeyHex_).size() != crypto_box_PUBLICKEYBYTES) {
        throw std::invalid_argument("recipient public key length invalid");
    }
}

SealedValue SealedBoxProvider::seal(const std::string& plaintext, const std::string& label) {
    auto recipient = hexToBytes(recipientPublicKeyHex_);

    std::vector<unsigned char> ciphertext(plaintext.size() + crypto_box_SEALBYTES);
    if (crypto_box_seal(ciphertext.data(),
                        reinterpret_cast<const unsigned char*>(plaintext.data()),
                        plaintext.size(),
                        recipient.data()) != 0) {
        throw std::runtime_error("crypto_box_seal failed");
    }

    SealedValue out;
    out.ciphertextHex = bytesToHex(ciphertext);
    out.label = label;
    return out;
}

} // namespace cb
