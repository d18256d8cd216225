#pragma once

#include "access_control.hpp"
#include "batch_lifecycle.hpp"
#include "encoding.hpp"
#include "encrypted_accumulator.hpp"
#include "fhe_backend.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fl {

struct BatchAggregates {
    std::int64_t demand = 0;
    std::int64_t supply = 0;
    std::int64_t profit = 0;
};

struct DecryptionContext {
    std::uint64_t requestId = 0;
    std::uint64_t batchId = 0;
    std::uint64_t modelVersion = 0;
    Digest stateHash{};
    bool processed = false;
    ActorId requester;
    std::uint64_t requestedAt = 0;
    EncryptedTotals snapshot;
    std::optional<BatchAggregates> revealed;
};

// Binding commitment over a batch's ciphertext handles and the identity of the
// ledger instance that requested the decryption.
Digest computeStateHash(const EncryptedTotals& totals, const std::string& contractIdentity);

// Two-phase decrypt-and-verify protocol. The state hash captured at request
// time acts as an optimistic-concurrency token: finalization recomputes it
// from the batch's current totals and rejects on any drift.
class DecryptionProtocol {
public:
    DecryptionProtocol(EncryptedAccumulator& accumulator,
                       DecryptionOraclePtr oracle,
                       std::string contractIdentity);

    const DecryptionContext& request(const Batch& batch,
                                     std::uint64_t liveModelVersion,
                                     const ActorId& requester,
                                     std::uint64_t now);

    // Checks run in order: ReplayAttempt, StaleWrite, InvalidStateHash,
    // InvalidProof, InvalidCleartext. A context is marked processed only
    // when every check passes.
    const DecryptionContext& finalize(std::uint64_t requestId,
                                      const Batch& batch,
                                      std::uint64_t liveModelVersion,
                                      const std::string& cleartexts,
                                      const std::string& proof);

    const DecryptionContext* findContext(std::uint64_t requestId) const;
    const DecryptionContext& requireContext(std::uint64_t requestId) const;

private:
    EncryptedAccumulator& accumulator_;
    DecryptionOraclePtr oracle_;
    std::string contractIdentity_;
    std::map<std::uint64_t, DecryptionContext> contexts_;
};

} // namespace fl
