#include "cargo_ledger.hpp"

#include "ledger_error.hpp"

#include <stdexcept>
#include <utility>

namespace fl {
namespace {

Clock resolveClock(const LedgerConfig& cfg) {
    if (cfg.clock) {
        return cfg.clock;
    }
    return systemClock();
}

} // namespace

CargoLedger::CargoLedger(const LedgerConfig& cfg, BackendPtr backend, DecryptionOraclePtr oracle)
    : contractIdentity_(buildContractIdentity(cfg))
    , backend_(std::move(backend))
    , access_(cfg.owner)
    , cooldown_(resolveClock(cfg), cfg.cooldownInterval)
    , accumulator_(backend_)
    , batches_(accumulator_)
    , decryption_(accumulator_, std::move(oracle), contractIdentity_)
    , modelVersion_(cfg.initialModelVersion) {
    if (modelVersion_ == 0) {
        throw std::invalid_argument("initial model version must be positive");
    }
}

LedgerEvent CargoLedger::makeEvent(EventKind kind, const ActorId& actor, std::uint64_t now) const {
    LedgerEvent event;
    event.kind = kind;
    event.timestamp = now;
    event.actor = actor;
    return event;
}

void CargoLedger::addProvider(const ActorId& caller, const ActorId& provider) {
    if (!access_.addProvider(caller, provider)) {
        return;
    }
    LedgerEvent event = makeEvent(EventKind::ProviderAdded, caller, cooldown_.now());
    event.subject = provider;
    events_.emit(std::move(event));
}

void CargoLedger::removeProvider(const ActorId& caller, const ActorId& provider) {
    if (!access_.removeProvider(caller, provider)) {
        return;
    }
    LedgerEvent event = makeEvent(EventKind::ProviderRemoved, caller, cooldown_.now());
    event.subject = provider;
    events_.emit(std::move(event));
}

void CargoLedger::pause(const ActorId& caller) {
    access_.pause(caller);
    events_.emit(makeEvent(EventKind::Paused, caller, cooldown_.now()));
}

void CargoLedger::unpause(const ActorId& caller) {
    access_.unpause(caller);
    events_.emit(makeEvent(EventKind::Unpaused, caller, cooldown_.now()));
}

void CargoLedger::setCooldownInterval(const ActorId& caller, std::uint64_t interval) {
    access_.requireOwner(caller);
    cooldown_.setCooldownInterval(interval);
    LedgerEvent event = makeEvent(EventKind::CooldownUpdated, caller, cooldown_.now());
    event.value = interval;
    events_.emit(std::move(event));
}

std::uint64_t CargoLedger::openNewBatch(const ActorId& caller) {
    access_.requireOwner(caller);
    const std::uint64_t now = cooldown_.now();
    const Batch& batch = batches_.openNewBatch(modelVersion_, now);

    LedgerEvent event = makeEvent(EventKind::BatchOpened, caller, now);
    event.batchId = batch.id;
    event.modelVersion = batch.modelVersion;
    event.handles = batch.totals.handles();
    events_.emit(std::move(event));
    return batch.id;
}

void CargoLedger::closeCurrentBatch(const ActorId& caller) {
    access_.requireOwner(caller);
    const std::uint64_t now = cooldown_.now();
    const Batch& batch = batches_.closeCurrentBatch(now);

    LedgerEvent event = makeEvent(EventKind::BatchClosed, caller, now);
    event.batchId = batch.id;
    event.modelVersion = batch.modelVersion;
    event.value = batch.submissionCount;
    events_.emit(std::move(event));
}

std::uint64_t CargoLedger::bumpModelVersion(const ActorId& caller) {
    access_.requireOwner(caller);
    modelVersion_ += 1;

    LedgerEvent event = makeEvent(EventKind::ModelVersionBumped, caller, cooldown_.now());
    event.modelVersion = modelVersion_;
    events_.emit(std::move(event));
    return modelVersion_;
}

void CargoLedger::transferOwnership(const ActorId& caller, const ActorId& newOwner) {
    access_.transferOwnership(caller, newOwner);
    LedgerEvent event = makeEvent(EventKind::OwnershipTransferred, caller, cooldown_.now());
    event.subject = newOwner;
    events_.emit(std::move(event));
}

void CargoLedger::submitEncryptedCargo(const ActorId& caller,
                                       const CiphertextHandle& demand,
                                       const CiphertextHandle& supply,
                                       const CiphertextHandle& profit) {
    access_.requireNotPaused();
    access_.requireProvider(caller);
    const std::uint64_t now = cooldown_.now();
    cooldown_.ensureReady(caller, now);

    const Batch& batch = batches_.submit(caller, demand, supply, profit);
    cooldown_.record(caller, now);

    LedgerEvent event = makeEvent(EventKind::CargoSubmitted, caller, now);
    event.batchId = batch.id;
    event.modelVersion = batch.modelVersion;
    event.value = batch.submissionCount;
    event.handles = { demand, supply, profit };
    events_.emit(std::move(event));
}

std::uint64_t CargoLedger::requestBatchDecryption(const ActorId& caller, std::uint64_t batchId) {
    access_.requireNotPaused();
    const std::uint64_t now = cooldown_.now();
    cooldown_.ensureReady(caller, now);

    const Batch& batch = batches_.requireBatch(batchId);
    const DecryptionContext& context = decryption_.request(batch, modelVersion_, caller, now);
    cooldown_.record(caller, now);

    LedgerEvent event = makeEvent(EventKind::DecryptionRequested, caller, now);
    event.batchId = context.batchId;
    event.requestId = context.requestId;
    event.modelVersion = context.modelVersion;
    event.handles = context.snapshot.handles();
    event.stateHash = context.stateHash;
    events_.emit(std::move(event));
    return context.requestId;
}

BatchAggregates CargoLedger::finalizeBatchDecryption(std::uint64_t requestId,
                                                     const std::string& cleartexts,
                                                     const std::string& proof) {
    const DecryptionContext& pending = decryption_.requireContext(requestId);
    const Batch& batch = batches_.requireBatch(pending.batchId);
    const DecryptionContext& context =
        decryption_.finalize(requestId, batch, modelVersion_, cleartexts, proof);

    LedgerEvent event = makeEvent(EventKind::DecryptionCompleted, context.requester, cooldown_.now());
    event.batchId = context.batchId;
    event.requestId = context.requestId;
    event.modelVersion = context.modelVersion;
    event.stateHash = context.stateHash;
    event.aggregates = context.revealed;
    events_.emit(std::move(event));
    return *context.revealed;
}

bool CargoLedger::isAvailable() const {
    return !access_.isPaused() && batches_.hasActiveBatch();
}

} // namespace fl
