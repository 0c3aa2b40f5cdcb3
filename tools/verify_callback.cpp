#include "callback_verifier.hpp"
#include "config.hpp"
#include "errors.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 5) {
        std::cerr << "Usage: verify_callback <request_id> <cleartext> <proof_hex> <public_key_hex>\n";
        std::cerr << "Environment: CB_DEPLOYMENT_ID must match the signer's.\n";
        return 1;
    }

    std::string requestId = argv[1];
    std::string cleartext = argv[2];
    std::string proof = argv[3];

    try {
        cb::CallbackVerifier verifier(argv[4], cb::requireDeploymentId());
        bool ok = verifier.authenticate(requestId, cleartext, proof);
        std::cout << "Proof: " << (ok ? "valid" : "INVALID") << '\n';
        if (!ok) {
            return 2;
        }

        if (auto flag = cb::decodeBooleanPayload(cleartext)) {
            std::cout << "Risk evaluation result: " << (*flag ? "high-risk" : "low-risk") << '\n';
        } else if (cb::decodeTextPayload(cleartext)) {
            std::cout << "Content reveal payload" << '\n';
        } else {
            std::cout << "Payload: " << cb::errorCodeName(cb::ErrorCode::MALFORMED_PAYLOAD) << '\n';
            return 3;
        }
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }
    return 0;
}
