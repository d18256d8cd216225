#pragma once

#include "access_control.hpp"
#include "encrypted_accumulator.hpp"

#include <cstdint>
#include <map>
#include <set>

namespace fl {

struct Batch {
    std::uint64_t id = 0;
    bool isActive = false;
    std::uint64_t modelVersion = 0;
    std::uint64_t openedAt = 0;
    std::uint64_t closedAt = 0;
    std::uint64_t submissionCount = 0;
    EncryptedTotals totals;
    // Retained for every historical batch; never pruned.
    std::set<ActorId> hasSubmitted;
};

// Active -> Closed state machine over monotonically numbered batches.
// Authorization, pause and cooldown gates are applied by the caller.
class BatchLifecycle {
public:
    explicit BatchLifecycle(EncryptedAccumulator& accumulator);

    const Batch& openNewBatch(std::uint64_t modelVersion, std::uint64_t now);
    const Batch& closeCurrentBatch(std::uint64_t now);

    // Throws BatchClosed, DuplicateSubmission or Uninitialized:<field>;
    // on any throw the batch is unchanged.
    const Batch& submit(const ActorId& provider,
                        const CiphertextHandle& demand,
                        const CiphertextHandle& supply,
                        const CiphertextHandle& profit);

    std::uint64_t currentBatchId() const { return currentBatchId_; }
    const Batch* findBatch(std::uint64_t batchId) const;
    const Batch& requireBatch(std::uint64_t batchId) const;
    bool hasActiveBatch() const;
    bool hasSubmitted(std::uint64_t batchId, const ActorId& provider) const;

private:
    EncryptedAccumulator& accumulator_;
    std::map<std::uint64_t, Batch> batches_;
    std::uint64_t currentBatchId_ = 0;
};

} // namespace fl
