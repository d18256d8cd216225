#include "decryption_protocol.hpp"

#include "decryption_oracle.hpp"
#include "ledger_error.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace fl {
namespace {

constexpr const char* kStateHashDomainTag = "freight-ledger:state:v1";
constexpr std::size_t kAggregateCount = 3;

} // namespace

Digest computeStateHash(const EncryptedTotals& totals, const std::string& contractIdentity) {
    std::string preimage = kStateHashDomainTag;
    appendLengthPrefixed(preimage, contractIdentity);
    for (const auto& handle : totals.handles()) {
        preimage += handle.toCommitmentBytes();
    }
    return sha256(preimage);
}

DecryptionProtocol::DecryptionProtocol(EncryptedAccumulator& accumulator,
                                       DecryptionOraclePtr oracle,
                                       std::string contractIdentity)
    : accumulator_(accumulator)
    , oracle_(std::move(oracle))
    , contractIdentity_(std::move(contractIdentity)) {
    if (!oracle_) {
        throw std::invalid_argument("decryption protocol requires an oracle");
    }
    if (contractIdentity_.empty()) {
        throw std::invalid_argument("contract identity must not be empty");
    }
}

const DecryptionContext& DecryptionProtocol::request(const Batch& batch,
                                                     std::uint64_t liveModelVersion,
                                                     const ActorId& requester,
                                                     std::uint64_t now) {
    if (batch.modelVersion != liveModelVersion) {
        throw LedgerError(ErrorCode::StaleWrite, "model v" + std::to_string(batch.modelVersion));
    }

    EncryptedTotals snapshot = accumulator_.readTotals(batch.totals);
    Digest stateHash = computeStateHash(snapshot, contractIdentity_);

    std::uint64_t requestId = oracle_->requestDecryption(snapshot.handles(), contractIdentity_);
    if (contexts_.count(requestId) != 0) {
        throw std::runtime_error("decryption oracle reissued request id " + std::to_string(requestId));
    }

    DecryptionContext context;
    context.requestId = requestId;
    context.batchId = batch.id;
    context.modelVersion = batch.modelVersion;
    context.stateHash = stateHash;
    context.requester = requester;
    context.requestedAt = now;
    context.snapshot = snapshot;

    auto inserted = contexts_.emplace(requestId, std::move(context));
    return inserted.first->second;
}

const DecryptionContext& DecryptionProtocol::finalize(std::uint64_t requestId,
                                                      const Batch& batch,
                                                      std::uint64_t liveModelVersion,
                                                      const std::string& cleartexts,
                                                      const std::string& proof) {
    auto it = contexts_.find(requestId);
    if (it == contexts_.end()) {
        throw LedgerError(ErrorCode::UnknownRequest, std::to_string(requestId));
    }
    DecryptionContext& context = it->second;
    if (context.batchId != batch.id) {
        throw std::invalid_argument("finalize called with a batch that does not match the request");
    }

    if (context.processed) {
        throw LedgerError(ErrorCode::ReplayAttempt, std::to_string(requestId));
    }
    if (context.modelVersion != batch.modelVersion || context.modelVersion != liveModelVersion) {
        throw LedgerError(ErrorCode::StaleWrite, "model v" + std::to_string(context.modelVersion));
    }

    EncryptedTotals current = accumulator_.readTotals(batch.totals);
    if (computeStateHash(current, contractIdentity_) != context.stateHash) {
        throw LedgerError(ErrorCode::InvalidStateHash, std::to_string(requestId));
    }

    if (!oracle_->verify(requestId, current.handles(), contractIdentity_, cleartexts, proof)) {
        throw LedgerError(ErrorCode::InvalidProof, std::to_string(requestId));
    }

    std::vector<std::int64_t> values;
    try {
        values = decodeCleartexts(cleartexts, kAggregateCount);
    } catch (const std::invalid_argument& ex) {
        throw LedgerError(ErrorCode::InvalidCleartext, ex.what());
    }

    BatchAggregates aggregates;
    aggregates.demand = values[0];
    aggregates.supply = values[1];
    aggregates.profit = values[2];

    context.revealed = aggregates;
    context.processed = true;
    return context;
}

const DecryptionContext* DecryptionProtocol::findContext(std::uint64_t requestId) const {
    auto it = contexts_.find(requestId);
    if (it == contexts_.end()) {
        return nullptr;
    }
    return &it->second;
}

const DecryptionContext& DecryptionProtocol::requireContext(std::uint64_t requestId) const {
    const DecryptionContext* context = findContext(requestId);
    if (context == nullptr) {
        throw LedgerError(ErrorCode::UnknownRequest, std::to_string(requestId));
    }
    return *context;
}

} // namespace fl
