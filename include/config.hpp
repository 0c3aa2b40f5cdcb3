#pragma once

#include "protocol_types.hpp"

#include <string>

namespace cb {

// Settings for the interactive console, read from CB_* environment variables.
struct ConsoleConfig {
    ActorId counselorId;
    std::string deploymentId = "local-console";
    std::string logLevel = "info";
    std::string oracleSeedHex;

    static ConsoleConfig fromEnv();
    void validate() const;
};

std::string trim(const std::string& value);

// Escapes a value for a JSON string literal; control bytes become \u00XX.
std::string jsonEscape(const std::string& value);

// CB_DEPLOYMENT_ID for tools that sign or verify; refuses empty or "default".
std::string requireDeploymentId();

// Routes spdlog output to stderr at the given level name.
void configureLogging(const std::string& level);

} // namespace cb
