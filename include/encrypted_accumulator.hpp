#pragma once

#include "ciphertext.hpp"
#include "fhe_backend.hpp"

#include <vector>

namespace fl {

struct EncryptedTotals {
    CiphertextHandle demand;
    CiphertextHandle supply;
    CiphertextHandle profit;

    // Fixed order: demand, supply, profit.
    std::vector<CiphertextHandle> handles() const { return { demand, supply, profit }; }
};

// Running homomorphic sums for a batch. Never observes plaintext.
class EncryptedAccumulator {
public:
    explicit EncryptedAccumulator(BackendPtr backend);

    EncryptedTotals zeroTotals();

    // Adds one submission into the totals. Every handle must be initialized;
    // otherwise throws Uninitialized:<field> and leaves the totals untouched.
    void accumulate(EncryptedTotals& totals,
                    const CiphertextHandle& demand,
                    const CiphertextHandle& supply,
                    const CiphertextHandle& profit);

    // Decryption-path read: uninitialized totals read as the canonical zero.
    EncryptedTotals readTotals(const EncryptedTotals& totals) const;

private:
    void requireInitialized(const CiphertextHandle& handle, const char* field) const;

    BackendPtr backend_;
};

} // namespace fl
