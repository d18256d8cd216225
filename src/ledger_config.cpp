#include "ledger_config.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fl {
namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

// '|' and ':' delimit the identity parts.
void requireNoDelimiters(const std::string& value, const char* field) {
    if (value.find_first_of("|:") != std::string::npos) {
        throw std::invalid_argument(std::string(field) + " must not contain '|' or ':'");
    }
}

} // namespace

std::string resolveDeploymentId(const LedgerConfig& cfg) {
    std::string deployment = trim(cfg.deploymentId);
    if (deployment.empty() || deployment == "default") {
        const char* env = std::getenv("FL_DEPLOYMENT_ID");
        if (env != nullptr) {
            deployment = trim(env);
        }
    }
    if (deployment.empty()) {
        throw std::runtime_error(
            "Ledger requires a deploymentId (set LedgerConfig::deploymentId or FL_DEPLOYMENT_ID)");
    }
    if (deployment == "default") {
        throw std::runtime_error(
            "Ledger deploymentId cannot be \"default\"; set an environment-specific value such as \"mainnet\" or \"testnet\"");
    }
    return deployment;
}

std::string resolveChainId(const LedgerConfig& cfg) {
    if (!cfg.chainId.empty()) {
        return trim(cfg.chainId);
    }
    const char* env = std::getenv("FL_CHAIN_ID");
    if (env == nullptr) {
        return "";
    }
    return trim(env);
}

std::string buildContractIdentity(const LedgerConfig& cfg) {
    std::string address = trim(cfg.contractAddress);
    if (address.empty()) {
        throw std::invalid_argument("contractAddress must not be empty");
    }
    requireNoDelimiters(address, "contractAddress");
    std::string deploymentId = resolveDeploymentId(cfg);
    requireNoDelimiters(deploymentId, "deploymentId");
    std::string chainId = resolveChainId(cfg);
    requireNoDelimiters(chainId, "chainId");

    std::ostringstream oss;
    oss << deploymentId;
    if (!chainId.empty()) {
        oss << "|" << chainId;
    }
    oss << ":" << address;
    return oss.str();
}

} // namespace fl
