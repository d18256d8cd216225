#include "encrypted_accumulator.hpp"

#include "ledger_error.hpp"

#include <stdexcept>
#include <utility>

namespace fl {

EncryptedAccumulator::EncryptedAccumulator(BackendPtr backend)
    : backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("encrypted accumulator requires a homomorphic backend");
    }
}

EncryptedTotals EncryptedAccumulator::zeroTotals() {
    EncryptedTotals totals;
    totals.demand = backend_->encryptZero();
    totals.supply = backend_->encryptZero();
    totals.profit = backend_->encryptZero();
    return totals;
}

void EncryptedAccumulator::accumulate(EncryptedTotals& totals,
                                      const CiphertextHandle& demand,
                                      const CiphertextHandle& supply,
                                      const CiphertextHandle& profit) {
    requireInitialized(demand, "demand");
    requireInitialized(supply, "supply");
    requireInitialized(profit, "profit");

    // An uninitialized total adds onto the canonical zero.
    EncryptedTotals current = readTotals(totals);

    EncryptedTotals next;
    next.demand = backend_->add(current.demand, demand);
    next.supply = backend_->add(current.supply, supply);
    next.profit = backend_->add(current.profit, profit);
    totals = next;
}

EncryptedTotals EncryptedAccumulator::readTotals(const EncryptedTotals& totals) const {
    EncryptedTotals out = totals;
    if (!backend_->isInitialized(out.demand)) {
        out.demand = backend_->canonicalZero();
    }
    if (!backend_->isInitialized(out.supply)) {
        out.supply = backend_->canonicalZero();
    }
    if (!backend_->isInitialized(out.profit)) {
        out.profit = backend_->canonicalZero();
    }
    return out;
}

void EncryptedAccumulator::requireInitialized(const CiphertextHandle& handle, const char* field) const {
    if (!backend_->isInitialized(handle)) {
        throw LedgerError(ErrorCode::Uninitialized, field);
    }
}

} // namespace fl
