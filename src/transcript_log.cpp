#include "transcript_log.hpp"

#include "picosha2.h"

#include <vector>

namespace cb {

namespace {

std::string hashBytes(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

} // namespace

void TranscriptLog::append(const std::string& event) {
    leaves_.push_back(hashEvent(event));
}

std::string TranscriptLog::getLeaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string TranscriptLog::hashEvent(const std::string& event) {
    return hashBytes(event);
}

std::string TranscriptLog::hashPair(const std::string& left, const std::string& right) {
    return hashBytes(left + right);
}

// Odd layers duplicate their last node.
std::string TranscriptLog::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }

    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
    }
    return layer.front();
}

std::vector<MerkleProofStep> TranscriptLog::merkleProof(std::size_t leafIndex) const {
    std::vector<MerkleProofStep> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& left = layer[i];
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            if (i == index || i + 1 == index) {
                bool isLeftChild = (i == index);
                proof.push_back({ isLeftChild ? right : left, !isLeftChild });
            }
            next.push_back(hashPair(left, right));
        }
        index /= 2;
        layer = std::move(next);
    }
    return proof;
}

bool TranscriptLog::verifyProof(const std::string& leafHash,
                                const std::vector<MerkleProofStep>& proof,
                                const std::string& root) {
    if (leafHash.empty() || root.empty()) {
        return false;
    }
    std::string current = leafHash;
    for (const auto& step : proof) {
        current = step.siblingIsLeft ? hashPair(step.siblingHash, current)
                                     : hashPair(current, step.siblingHash);
    }
    return current == root;
}

} // namespace cb
