#pragma once

#include "access_control.hpp"
#include "batch_lifecycle.hpp"
#include "cooldown_gate.hpp"
#include "decryption_protocol.hpp"
#include "encrypted_accumulator.hpp"
#include "fhe_backend.hpp"
#include "ledger_config.hpp"
#include "ledger_events.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fl {

// Top-level state container for the confidential cargo market.
//
// Owns the provider registry, cooldown table, batches and decryption
// contexts; nothing else mutates them. Every entry point either commits all
// of its effects (and emits its event) or throws LedgerError and commits
// nothing. Each entry point reads the clock once; that reading stamps the
// cooldown, the batch and the emitted event alike.
//
// Execution model: single writer. Calls must be serialized by the caller;
// the class performs no locking. The only race the protocol defends against
// is drift between requestBatchDecryption() and the oracle's later
// finalizeBatchDecryption(), which the state hash turns into a rejection.
class CargoLedger {
public:
    CargoLedger(const LedgerConfig& cfg, BackendPtr backend, DecryptionOraclePtr oracle);

    CargoLedger(const CargoLedger&) = delete;
    CargoLedger& operator=(const CargoLedger&) = delete;

    // Owner administration.
    void addProvider(const ActorId& caller, const ActorId& provider);
    void removeProvider(const ActorId& caller, const ActorId& provider);
    void pause(const ActorId& caller);
    void unpause(const ActorId& caller);
    void setCooldownInterval(const ActorId& caller, std::uint64_t interval);
    std::uint64_t openNewBatch(const ActorId& caller);
    void closeCurrentBatch(const ActorId& caller);
    std::uint64_t bumpModelVersion(const ActorId& caller);
    void transferOwnership(const ActorId& caller, const ActorId& newOwner);

    // Provider-facing.
    void submitEncryptedCargo(const ActorId& caller,
                              const CiphertextHandle& demand,
                              const CiphertextHandle& supply,
                              const CiphertextHandle& profit);

    // Public trigger; returns the oracle-assigned request id.
    std::uint64_t requestBatchDecryption(const ActorId& caller, std::uint64_t batchId);

    // Oracle callback. Authenticated by the proof, not by the caller.
    BatchAggregates finalizeBatchDecryption(std::uint64_t requestId,
                                            const std::string& cleartexts,
                                            const std::string& proof);

    const ActorId& owner() const { return access_.owner(); }
    bool isProvider(const ActorId& actor) const { return access_.isProvider(actor); }
    bool isPaused() const { return access_.isPaused(); }
    bool isAvailable() const;
    std::uint64_t cooldownInterval() const { return cooldown_.interval(); }
    std::optional<std::uint64_t> lastActionOf(const ActorId& actor) const {
        return cooldown_.lastAction(actor);
    }
    std::uint64_t currentBatchId() const { return batches_.currentBatchId(); }
    std::uint64_t currentModelVersion() const { return modelVersion_; }
    const Batch& getBatch(std::uint64_t batchId) const { return batches_.requireBatch(batchId); }
    bool hasSubmitted(std::uint64_t batchId, const ActorId& provider) const {
        return batches_.hasSubmitted(batchId, provider);
    }
    const DecryptionContext& getDecryptionContext(std::uint64_t requestId) const {
        return decryption_.requireContext(requestId);
    }
    const std::string& contractIdentity() const { return contractIdentity_; }

    void subscribe(EventListener listener) { events_.subscribe(std::move(listener)); }
    const std::vector<LedgerEvent>& events() const { return events_.events(); }
    const EventLog& eventLog() const { return events_; }
    std::string transcriptRoot() const { return events_.transcriptRoot(); }

private:
    LedgerEvent makeEvent(EventKind kind, const ActorId& actor, std::uint64_t now) const;

    std::string contractIdentity_;
    BackendPtr backend_;
    AccessControl access_;
    CooldownGate cooldown_;
    EncryptedAccumulator accumulator_;
    BatchLifecycle batches_;
    DecryptionProtocol decryption_;
    EventLog events_;
    std::uint64_t modelVersion_;
};

} // namespace fl
