#include "config.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace cb {

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return fallback;
    }
    std::string trimmed = trim(value);
    return trimmed.empty() ? fallback : trimmed;
}

} // namespace

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::string jsonEscape(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                out += buf;
            } else {
                out += ch;
            }
        }
    }
    return out;
}

ConsoleConfig ConsoleConfig::fromEnv() {
    ConsoleConfig config;
    config.counselorId = envOr("CB_COUNSELOR_ID", "");
    config.deploymentId = envOr("CB_DEPLOYMENT_ID", config.deploymentId);
    config.logLevel = envOr("CB_LOG_LEVEL", config.logLevel);
    config.oracleSeedHex = envOr("CB_ORACLE_SEED", "");
    return config;
}

void ConsoleConfig::validate() const {
    if (counselorId.empty()) {
        throw std::runtime_error("CB_COUNSELOR_ID must be set to the counselor's identity");
    }
    if (deploymentId.empty()) {
        throw std::runtime_error("CB_DEPLOYMENT_ID must not be empty");
    }
    if (!oracleSeedHex.empty()) {
        bool allHex = true;
        for (char ch : oracleSeedHex) {
            allHex = allHex && std::isxdigit(static_cast<unsigned char>(ch)) != 0;
        }
        if (oracleSeedHex.size() != 64 || !allHex) {
            throw std::runtime_error("CB_ORACLE_SEED must be 32 bytes of hex");
        }
    }
}

std::string requireDeploymentId() {
    const char* deploymentEnv = std::getenv("CB_DEPLOYMENT_ID");
    if (deploymentEnv == nullptr) {
        throw std::runtime_error("CB_DEPLOYMENT_ID must be set to a non-empty deployment scope");
    }
    std::string deploymentId = trim(deploymentEnv);
    if (deploymentId.empty()) {
        throw std::runtime_error("CB_DEPLOYMENT_ID is empty or whitespace");
    }
    if (deploymentId == "default") {
        throw std::runtime_error(
            "CB_DEPLOYMENT_ID cannot be \"default\"; set a deployment-specific value like \"production\"");
    }
    return deploymentId;
}

void configureLogging(const std::string& level) {
    auto logger = spdlog::get("crisis_beacon");
    if (!logger) {
        logger = spdlog::stderr_color_mt("crisis_beacon");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

} // namespace cb
