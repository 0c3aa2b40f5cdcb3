#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace cb {

struct MerkleProofStep {
    std::string siblingHash;
    bool siblingIsLeft = false;
};

// Append-only log of protocol events. Leaves are SHA-256 of the event text;
// the root commits to the full history in order.
class TranscriptLog {
public:
    void append(const std::string& event);
    std::string getLeaf(std::size_t index) const;

    std::string merkleRoot() const;
    std::vector<MerkleProofStep> merkleProof(std::size_t leafIndex) const;

    static std::string hashEvent(const std::string& event);
    static bool verifyProof(const std::string& leafHash,
                            const std::vector<MerkleProofStep>& proof,
                            const std::string& root);

    std::size_t size() const { return leaves_.size(); }

private:
    static std::string hashPair(const std::string& left, const std::string& right);

    std::vector<std::string> leaves_;
};

} // namespace cb
