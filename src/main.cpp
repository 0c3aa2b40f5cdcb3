#include "callback_verifier.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "oracle.hpp"
#include "risk_protocol.hpp"
#include "sealed_value.hpp"
#include "simulated_oracle.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

using namespace cb;

namespace {

std::uint64_t unixNow() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

void printHelp(const std::string& counselorId) {
    std::cout << "Commands (counselor is \"" << counselorId << "\"):\n"
              << "  threshold <actor> <n>            set the sealed risk threshold once\n"
              << "  submit <actor> <score> <text...> seal and submit a message\n"
              << "  deliver                          let the oracle answer every queued request\n"
              << "  reveal <actor> <id>              request content reveal for a high-risk record\n"
              << "  read <actor> <id>                read an alert\n"
              << "  close <actor> <id>               mark a high-risk case as handled\n"
              << "  status <id>                      show a record's state\n"
              << "  stats                            aggregate counters\n"
              << "  root                             transcript Merkle root\n"
              << "  help | quit\n";
}

RecordId parseRecordId(std::istringstream& args) {
    RecordId id = 0;
    if (!(args >> id)) {
        throw std::invalid_argument("expected a record id");
    }
    return id;
}

std::string requireWord(std::istringstream& args, const char* what) {
    std::string word;
    if (!(args >> word)) {
        throw std::invalid_argument(std::string("expected ") + what);
    }
    return word;
}

void deliverAll(RiskAssessmentProtocol& protocol, RelayOracleClient& relay, const SimulatedOracle& oracle) {
    auto requests = relay.takePending();
    if (requests.empty()) {
        std::cout << "No oracle requests queued.\n";
        return;
    }
    for (const auto& callback : oracle.answerAll(requests)) {
        try {
            protocol.handleCallback(callback);
            std::cout << "Delivered " << callback.requestId << "\n";
        } catch (const ProtocolError& ex) {
            std::cout << "Callback " << callback.requestId << " rejected: " << ex.what() << "\n";
        }
    }
}

} // namespace

int main() {
    ConsoleConfig config;
    OracleKeyPair oracleKeys;
    try {
        config = ConsoleConfig::fromEnv();
        config.validate();
        configureLogging(config.logLevel);
        oracleKeys = config.oracleSeedHex.empty() ? generateOracleKeypair()
                                                  : deriveOracleKeypairFromSeed(config.oracleSeedHex);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }

    SimulatedOracle oracle(oracleKeys, config.deploymentId);
    SealedBoxProvider sealer(oracle.sealingPublicKeyHex());

    auto relay = std::make_shared<RelayOracleClient>();
    ProtocolConfig protocolConfig;
    protocolConfig.counselorId = config.counselorId;
    protocolConfig.oraclePublicKeyHex = oracle.signingPublicKeyHex();
    protocolConfig.deploymentId = config.deploymentId;
    RiskAssessmentProtocol protocol(protocolConfig, relay);

    std::cout << "crisis-beacon console, deployment " << config.deploymentId << "\n";
    std::cout << "Oracle signing key: " << oracle.signingPublicKeyHex() << "\n";
    printHelp(config.counselorId);

    std::string line;
    while (std::cout << "> " && std::getline(std::cin, line)) {
        std::istringstream args(line);
        std::string command;
        if (!(args >> command)) {
            continue;
        }

        try {
            if (command == "quit" || command == "exit") {
                break;
            } else if (command == "help") {
                printHelp(config.counselorId);
            } else if (command == "threshold") {
                std::string actor = requireWord(args, "actor");
                long long value = 0;
                if (!(args >> value)) {
                    throw std::invalid_argument("expected an integer threshold");
                }
                protocol.setThreshold(actor, sealer.seal(std::to_string(value), "threshold"));
                std::cout << "Threshold sealed and set.\n";
            } else if (command == "submit") {
                std::string actor = requireWord(args, "actor");
                long long score = 0;
                if (!(args >> score)) {
                    throw std::invalid_argument("expected an integer score");
                }
                std::string text;
                std::getline(args, text);
                text = trim(text);
                RecordId id = protocol.submit(actor,
                                              sealer.seal(text, "content"),
                                              sealer.seal(std::to_string(score), "score"),
                                              unixNow());
                std::cout << "Submitted record " << id << "; evaluation pending.\n";
            } else if (command == "deliver") {
                deliverAll(protocol, *relay, oracle);
            } else if (command == "reveal") {
                std::string actor = requireWord(args, "actor");
                RequestId requestId = protocol.requestReveal(actor, parseRecordId(args));
                std::cout << "Reveal requested as " << requestId << "\n";
            } else if (command == "read") {
                std::string actor = requireWord(args, "actor");
                AlertView view = protocol.readAlert(actor, parseRecordId(args));
                if (view.revealed) {
                    std::cout << "Revealed: " << view.content << "\n";
                } else {
                    std::cout << "Not revealed.\n";
                }
            } else if (command == "close") {
                std::string actor = requireWord(args, "actor");
                protocol.closeCase(actor, parseRecordId(args));
                std::cout << "Case closed.\n";
            } else if (command == "status") {
                RecordStatus status = protocol.status(parseRecordId(args));
                std::cout << "Record " << status.id << ": " << toString(status.riskState) << ", "
                          << toString(status.revealState) << (status.closed ? ", closed" : "") << "\n";
            } else if (command == "stats") {
                RecordStats stats = protocol.stats();
                std::cout << "total=" << stats.total << " evaluating=" << stats.evaluating
                          << " low=" << stats.lowRisk << " high=" << stats.highRisk
                          << " revealed=" << stats.revealed << " closed=" << stats.closed
                          << " pending=" << protocol.pendingRequests() << "\n";
            } else if (command == "root") {
                std::cout << "Transcript root (" << protocol.transcriptSize()
                          << " events): " << protocol.transcriptRoot() << "\n";
            } else {
                std::cout << "Unknown command. Type help.\n";
            }
        } catch (const ProtocolError& ex) {
            std::cout << "Refused: " << ex.what() << "\n";
        } catch (const std::exception& ex) {
            std::cout << "Error: " << ex.what() << "\n";
        }
    }

    spdlog::info("console exiting");
    return 0;
}
