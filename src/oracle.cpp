#include "oracle.hpp"

#include "sodium_support.hpp"

#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace cb {

namespace {

constexpr std::size_t kTokenRandomBytes = 16;

std::string buildToken(std::uint64_t sequence) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << sequence << '-' << randomHex(kTokenRandomBytes);
    return oss.str();
}

} // namespace

RelayOracleClient::RelayOracleClient()
    : sequence_(0) {
    requireSodium();
}

RequestId RelayOracleClient::request(RequestKind kind, const std::vector<SealedValue>& operands) {
    if (operands.empty()) {
        throw std::invalid_argument("oracle request needs at least one sealed operand");
    }
    for (const auto& operand : operands) {
        if (operand.empty()) {
            throw std::invalid_argument("oracle request operand is empty");
        }
    }

    OracleRequest outbound;
    outbound.requestId = buildToken(++sequence_);
    outbound.kind = kind;
    outbound.operands = operands;

    RequestId id = outbound.requestId;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outbound_.push_back(std::move(outbound));
    }
    spdlog::debug("oracle: queued {} request {}", toString(kind), id);
    return id;
}

std::vector<OracleRequest> RelayOracleClient::takePending() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OracleRequest> out(std::make_move_iterator(outbound_.begin()),
                                   std::make_move_iterator(outbound_.end()));
    outbound_.clear();
    return out;
}

std::size_t RelayOracleClient::queuedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outbound_.size();
}

} // namespace cb
