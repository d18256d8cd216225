#pragma once

#include "ciphertext.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fl {

// Contract of the homomorphic coprocessor. The ledger only ever combines
// handles; plaintext never crosses this interface.
class HomomorphicBackend {
public:
    virtual ~HomomorphicBackend() = default;

    virtual CiphertextHandle add(const CiphertextHandle& lhs, const CiphertextHandle& rhs) = 0;

    // Fresh encryption of zero, used to seed batch totals.
    virtual CiphertextHandle encryptZero() = 0;

    // Stable handle standing in for an uninitialized total when it is read for
    // decryption. Must return the same handle on every call.
    virtual CiphertextHandle canonicalZero() = 0;

    virtual bool isInitialized(const CiphertextHandle& handle) const = 0;
};

struct DecryptionResponse {
    std::uint64_t requestId = 0;
    std::string cleartexts; // three little-endian int64 words
    std::string proof;      // oracle signature over the request and cleartexts
};

// Asynchronous decryption service. requestDecryption() returns immediately;
// the response is delivered later as an independent call into the ledger.
class DecryptionOracle {
public:
    virtual ~DecryptionOracle() = default;

    virtual std::uint64_t requestDecryption(const std::vector<CiphertextHandle>& handles,
                                            const std::string& requesterIdentity) = 0;

    virtual bool verify(std::uint64_t requestId,
                        const std::vector<CiphertextHandle>& handles,
                        const std::string& requesterIdentity,
                        const std::string& cleartexts,
                        const std::string& proof) const = 0;
};

using BackendPtr = std::shared_ptr<HomomorphicBackend>;
using DecryptionOraclePtr = std::shared_ptr<DecryptionOracle>;

} // namespace fl
