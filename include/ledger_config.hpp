#pragma once

#include "access_control.hpp"
#include "cooldown_gate.hpp"

#include <cstdint>
#include <string>

namespace fl {

struct LedgerConfig {
    ActorId owner;
    // Deployment scope. Empty or "default" falls back to FL_DEPLOYMENT_ID.
    std::string deploymentId = "default";
    // Optional chain scope; empty falls back to FL_CHAIN_ID.
    std::string chainId;
    std::string contractAddress;
    std::uint64_t cooldownInterval = kDefaultCooldownInterval;
    std::uint64_t initialModelVersion = 1;
    Clock clock; // defaults to systemClock() when empty
};

std::string resolveDeploymentId(const LedgerConfig& cfg);
std::string resolveChainId(const LedgerConfig& cfg);

// "<deploymentId>[|<chainId>]:<contractAddress>". Folded into every state
// hash and oracle request so proofs cannot be replayed across deployments.
// Parts containing '|' or ':' are rejected with std::invalid_argument.
std::string buildContractIdentity(const LedgerConfig& cfg);

} // namespace fl
