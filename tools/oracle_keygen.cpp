#include "callback_verifier.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    try {
        cb::OracleKeyPair keys =
            (argc > 1) ? cb::deriveOracleKeypairFromSeed(argv[1]) : cb::generateOracleKeypair();
        std::cout << "public_key " << keys.publicKeyHex << '\n';
        std::cout << "secret_key " << keys.secretKeyHex << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "Usage: oracle_keygen [seedHex]\n" << ex.what() << '\n';
        return 1;
    }
    return 0;
}
