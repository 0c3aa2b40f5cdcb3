#include "sodium_support.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <sodium.h>

namespace cb {

namespace {

bool sodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

int hexValue(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    const auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (lower >= 'a' && lower <= 'f') {
        return lower - 'a' + 10;
    }
    return -1;
}

} // namespace

void requireSodium() {
    if (!sodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
}

std::string bytesToHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string bytesToHex(const std::vector<unsigned char>& bytes) {
    return bytesToHex(bytes.data(), bytes.size());
}

std::vector<unsigned char> hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }

    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = hexValue(hex[i]);
        int low = hexValue(hex[i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("hex string contains a non-hex character");
        }
        out.push_back(static_cast<unsigned char>((high << 4) | low));
    }
    return out;
}

std::string randomHex(std::size_t numBytes) {
    requireSodium();
    std::vector<unsigned char> buffer(numBytes);
    if (!buffer.empty()) {
        randombytes_buf(buffer.data(), buffer.size());
    }
    return bytesToHex(buffer);
}

SecretBytes SecretBytes::fromHex(const std::string& hex) {
    auto decoded = hexToBytes(hex);
    SecretBytes out(decoded.size());
    std::copy(decoded.begin(), decoded.end(), out.bytes_.begin());
    if (!decoded.empty()) {
        sodium_memzero(decoded.data(), decoded.size());
    }
    return out;
}

SecretBytes::SecretBytes(SecretBytes&& other) noexcept : bytes_(std::move(other.bytes_)) {
    other.bytes_.clear();
}

SecretBytes& SecretBytes::operator=(SecretBytes&& other) noexcept {
    if (this != &other) {
        wipe();
        bytes_ = std::move(other.bytes_);
        other.bytes_.clear();
    }
    return *this;
}

SecretBytes::~SecretBytes() {
    wipe();
}

void SecretBytes::wipe() noexcept {
    if (!bytes_.empty()) {
        sodium_memzero(bytes_.data(), bytes_.size());
    }
}

} // namespace cb
