#pragma once

#include "fhe_backend.hpp"
#include "paillier_backend.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fl {

struct OracleKeyPair {
    std::string publicKeyHex; // ed25519, 32 bytes
    std::string secretKeyHex; // ed25519, 64 bytes
};

OracleKeyPair generateOracleKeypair();

// Builds the message an oracle signs for a decryption response:
// domain | requester | requestId | handle commitments | cleartexts.
std::string buildDecryptionMessage(std::uint64_t requestId,
                                   const std::vector<CiphertextHandle>& handles,
                                   const std::string& requesterIdentity,
                                   const std::string& cleartexts);

// Stateless check usable by any third party holding the oracle public key.
bool verifyDecryptionProof(const std::string& publicKeyHex,
                           std::uint64_t requestId,
                           const std::vector<CiphertextHandle>& handles,
                           const std::string& requesterIdentity,
                           const std::string& cleartexts,
                           const std::string& proof);

std::string encodeCleartexts(const std::vector<std::int64_t>& values);
std::vector<std::int64_t> decodeCleartexts(const std::string& payload, std::size_t expected);

// Key-management oracle over a Paillier backend. Requests are queued and only
// answered when fulfill() is called, which models the asynchronous gap
// between request and callback.
class SignedDecryptionOracle : public DecryptionOracle {
public:
    struct PendingRequest {
        std::vector<CiphertextHandle> handles;
        std::string requesterIdentity;
        bool fulfilled = false;
    };

    SignedDecryptionOracle(std::shared_ptr<PaillierBackend> backend, const OracleKeyPair& keys);
    ~SignedDecryptionOracle() override;

    SignedDecryptionOracle(const SignedDecryptionOracle&) = delete;
    SignedDecryptionOracle& operator=(const SignedDecryptionOracle&) = delete;

    std::uint64_t requestDecryption(const std::vector<CiphertextHandle>& handles,
                                    const std::string& requesterIdentity) override;

    bool verify(std::uint64_t requestId,
                const std::vector<CiphertextHandle>& handles,
                const std::string& requesterIdentity,
                const std::string& cleartexts,
                const std::string& proof) const override;

    // Decrypts the handles captured at request time and signs the result.
    // Fulfilling the same request again yields an identical response.
    DecryptionResponse fulfill(std::uint64_t requestId);

    const std::string& publicKeyHex() const { return publicKeyHex_; }
    std::vector<std::uint64_t> pendingRequestIds() const;
    const PendingRequest* findRequest(std::uint64_t requestId) const;

private:
    std::string sign(const std::string& message) const;

    std::shared_ptr<PaillierBackend> backend_;
    std::string publicKeyHex_;
    std::vector<unsigned char> secretKey_;
    std::map<std::uint64_t, PendingRequest> requests_;
    std::uint64_t nextRequestId_ = 1;
};

} // namespace fl
