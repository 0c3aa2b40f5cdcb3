#include "callback_verifier.hpp"
#include "config.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

void writeJson(const std::string& path, const std::string& jsonPayload) {
    if (path.empty()) {
        std::cout << jsonPayload;
        return;
    }
    std::ofstream ofs(path);
    if (!ofs) {
        throw std::runtime_error("Unable to open output path: " + path);
    }
    ofs << jsonPayload;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: sign_callback <request_id> <cleartext> <secret_key_hex> [output.json]\n";
        std::cerr << "Cleartext is bool:1, bool:0 or text:<content>. CB_DEPLOYMENT_ID is required.\n";
        return 1;
    }

    std::string requestId = argv[1];
    std::string cleartext = argv[2];
    std::string outputPath = (argc >= 5) ? argv[4] : "";

    try {
        std::string deploymentId = cb::requireDeploymentId();
        if (!cb::decodeBooleanPayload(cleartext) && !cb::decodeTextPayload(cleartext)) {
            throw std::invalid_argument("cleartext must be bool:1, bool:0 or text:<content>");
        }

        cb::OracleSigner signer(argv[3], deploymentId);
        std::string proof = signer.sign(requestId, cleartext);

        std::ostringstream json;
        json << "{\n";
        json << "  \"request_id\": \"" << cb::jsonEscape(requestId) << "\",\n";
        json << "  \"cleartext\": \"" << cb::jsonEscape(cleartext) << "\",\n";
        json << "  \"deployment_id\": \"" << cb::jsonEscape(deploymentId) << "\",\n";
        json << "  \"proof\": \"" << proof << "\",\n";
        json << "  \"public_key\": \"" << signer.publicKeyHex() << "\"\n";
        json << "}\n";
        writeJson(outputPath, json.str());
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    return 0;
}
