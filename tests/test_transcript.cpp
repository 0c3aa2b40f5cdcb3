#include "test_support.hpp"
#include "transcript_log.hpp"

#include <string>
#include <vector>

using namespace cb;
using namespace cbtest;

int main() {
    TranscriptLog empty;
    expect(empty.merkleRoot().empty(), "empty log has no root");
    expect(empty.merkleProof(0).empty(), "empty log has no proofs");
    expect(empty.getLeaf(0).empty(), "empty log has no leaves");

    for (std::size_t count = 1; count <= 9; ++count) {
        TranscriptLog log;
        for (std::size_t i = 0; i < count; ++i) {
            log.append("event-" + std::to_string(i));
        }
        expect(log.size() == count, "size mismatch");
        const std::string root = log.merkleRoot();
        expect(root.size() == 64, "root must be a SHA-256 hex digest");

        for (std::size_t i = 0; i < count; ++i) {
            auto proof = log.merkleProof(i);
            expect(TranscriptLog::verifyProof(log.getLeaf(i), proof, root),
                   "proof failed for leaf " + std::to_string(i) + " of " + std::to_string(count));
            expect(!TranscriptLog::verifyProof(TranscriptLog::hashEvent("forged"), proof, root),
                   "forged leaf verified");
        }
    }

    TranscriptLog single;
    single.append("only");
    expect(single.merkleRoot() == TranscriptLog::hashEvent("only"), "single-leaf root is the leaf");

    TranscriptLog a;
    TranscriptLog b;
    a.append("x");
    a.append("y");
    b.append("y");
    b.append("x");
    expect(a.merkleRoot() != b.merkleRoot(), "root must commit to event order");

    std::string before = a.merkleRoot();
    a.append("z");
    expect(a.merkleRoot() != before, "appending must change the root");

    std::cout << "transcript tests passed\n";
    return 0;
}
