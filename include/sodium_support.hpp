#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace cb {

// Initializes libsodium once per process. Throws std::runtime_error if the
// library cannot be brought up.
void requireSodium();

std::string bytesToHex(const unsigned char* data, std::size_t len);
std::string bytesToHex(const std::vector<unsigned char>& bytes);

// Rejects odd lengths and non-hex characters with std::invalid_argument.
std::vector<unsigned char> hexToBytes(const std::string& hex);

// Hex of numBytes from randombytes_buf.
std::string randomHex(std::size_t numBytes);

// Owning byte buffer that wipes itself with sodium_memzero. Used for every
// secret key held in memory.
class SecretBytes {
public:
    SecretBytes() = default;
    explicit SecretBytes(std::size_t count) : bytes_(count) {}

    static SecretBytes fromHex(const std::string& hex);

    SecretBytes(const SecretBytes&) = delete;
    SecretBytes& operator=(const SecretBytes&) = delete;

    SecretBytes(SecretBytes&& other) noexcept;
    SecretBytes& operator=(SecretBytes&& other) noexcept;

    ~SecretBytes();

    std::size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

    unsigned char* data() { return bytes_.data(); }
    const unsigned char* data() const { return bytes_.data(); }

    std::string toHex() const { return bytesToHex(bytes_); }

private:
    void wipe() noexcept;

    std::vector<unsigned char> bytes_;
};

} // namespace cb
