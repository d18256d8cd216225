#include "batch_lifecycle.hpp"

#include "ledger_error.hpp"

#include <string>
#include <utility>

namespace fl {

BatchLifecycle::BatchLifecycle(EncryptedAccumulator& accumulator)
    : accumulator_(accumulator) {}

const Batch& BatchLifecycle::openNewBatch(std::uint64_t modelVersion, std::uint64_t now) {
    if (hasActiveBatch()) {
        throw LedgerError(ErrorCode::BatchStillOpen, std::to_string(currentBatchId_));
    }

    Batch batch;
    batch.id = currentBatchId_ + 1;
    batch.isActive = true;
    batch.modelVersion = modelVersion;
    batch.openedAt = now;
    batch.totals = accumulator_.zeroTotals();

    currentBatchId_ = batch.id;
    auto inserted = batches_.emplace(batch.id, std::move(batch));
    return inserted.first->second;
}

const Batch& BatchLifecycle::closeCurrentBatch(std::uint64_t now) {
    auto it = batches_.find(currentBatchId_);
    if (it == batches_.end() || !it->second.isActive) {
        throw LedgerError(ErrorCode::InvalidBatch, std::to_string(currentBatchId_));
    }
    it->second.isActive = false;
    it->second.closedAt = now;
    return it->second;
}

const Batch& BatchLifecycle::submit(const ActorId& provider,
                                    const CiphertextHandle& demand,
                                    const CiphertextHandle& supply,
                                    const CiphertextHandle& profit) {
    auto it = batches_.find(currentBatchId_);
    if (it == batches_.end() || !it->second.isActive) {
        throw LedgerError(ErrorCode::BatchClosed, std::to_string(currentBatchId_));
    }
    Batch& batch = it->second;
    if (batch.hasSubmitted.count(provider) != 0) {
        throw LedgerError(ErrorCode::DuplicateSubmission, provider);
    }

    accumulator_.accumulate(batch.totals, demand, supply, profit);
    batch.submissionCount += 1;
    batch.hasSubmitted.insert(provider);
    return batch;
}

const Batch* BatchLifecycle::findBatch(std::uint64_t batchId) const {
    auto it = batches_.find(batchId);
    if (it == batches_.end()) {
        return nullptr;
    }
    return &it->second;
}

const Batch& BatchLifecycle::requireBatch(std::uint64_t batchId) const {
    const Batch* batch = findBatch(batchId);
    if (batch == nullptr) {
        throw LedgerError(ErrorCode::InvalidBatch, std::to_string(batchId));
    }
    return *batch;
}

bool BatchLifecycle::hasActiveBatch() const {
    const Batch* current = findBatch(currentBatchId_);
    return current != nullptr && current->isActive;
}

bool BatchLifecycle::hasSubmitted(std::uint64_t batchId, const ActorId& provider) const {
    const Batch* batch = findBatch(batchId);
    return batch != nullptr && batch->hasSubmitted.count(provider) != 0;
}

} // namespace fl
