#include "decryption_oracle.hpp"

#include "encoding.hpp"

#include <stdexcept>
#include <utility>

#include <sodium.h>

namespace fl {
namespace {

constexpr const char* kDecryptionDomainTag = "freight-ledger:decrypt:v1";

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

} // namespace

OracleKeyPair generateOracleKeypair() {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium for oracle key generation");
    }
    std::vector<unsigned char> publicKey(crypto_sign_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_sign_SECRETKEYBYTES);
    if (crypto_sign_keypair(publicKey.data(), secretKey.data()) != 0) {
        throw std::runtime_error("Failed to generate oracle signing keypair");
    }
    OracleKeyPair keys;
    keys.publicKeyHex = bytesToHex(publicKey.data(), publicKey.size());
    keys.secretKeyHex = bytesToHex(secretKey.data(), secretKey.size());
    sodium_memzero(secretKey.data(), secretKey.size());
    return keys;
}

std::string buildDecryptionMessage(std::uint64_t requestId,
                                   const std::vector<CiphertextHandle>& handles,
                                   const std::string& requesterIdentity,
                                   const std::string& cleartexts) {
    std::string message = kDecryptionDomainTag;
    appendLengthPrefixed(message, requesterIdentity);
    appendU64(message, requestId);
    appendU64(message, static_cast<std::uint64_t>(handles.size()));
    for (const auto& handle : handles) {
        message += handle.toCommitmentBytes();
    }
    appendLengthPrefixed(message, cleartexts);
    return message;
}

bool verifyDecryptionProof(const std::string& publicKeyHex,
                           std::uint64_t requestId,
                           const std::vector<CiphertextHandle>& handles,
                           const std::string& requesterIdentity,
                           const std::string& cleartexts,
                           const std::string& proof) {
    if (!ensureSodiumReady()) {
        return false;
    }
    if (proof.size() != crypto_sign_BYTES) {
        return false;
    }
    std::vector<unsigned char> publicKey;
    try {
        publicKey = hexToBytes(publicKeyHex);
    } catch (const std::invalid_argument&) {
        return false;
    }
    if (publicKey.size() != crypto_sign_PUBLICKEYBYTES) {
        return false;
    }

    std::string message = buildDecryptionMessage(requestId, handles, requesterIdentity, cleartexts);
    return crypto_sign_verify_detached(reinterpret_cast<const unsigned char*>(proof.data()),
                                       reinterpret_cast<const unsigned char*>(message.data()),
                                       message.size(),
                                       publicKey.data()) == 0;
}

std::string encodeCleartexts(const std::vector<std::int64_t>& values) {
    std::string out;
    out.reserve(values.size() * 8);
    for (auto value : values) {
        appendI64(out, value);
    }
    return out;
}

std::vector<std::int64_t> decodeCleartexts(const std::string& payload, std::size_t expected) {
    if (payload.size() != expected * 8) {
        throw std::invalid_argument("cleartext payload has unexpected length");
    }
    std::vector<std::int64_t> values;
    values.reserve(expected);
    for (std::size_t i = 0; i < expected; ++i) {
        values.push_back(static_cast<std::int64_t>(readU64(payload, i * 8)));
    }
    return values;
}

SignedDecryptionOracle::SignedDecryptionOracle(std::shared_ptr<PaillierBackend> backend,
                                               const OracleKeyPair& keys)
    : backend_(std::move(backend))
    , publicKeyHex_(keys.publicKeyHex) {
    if (!backend_) {
        throw std::invalid_argument("decryption oracle requires a backend");
    }
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium for decryption oracle");
    }
    secretKey_ = hexToBytes(keys.secretKeyHex);
    if (secretKey_.size() != crypto_sign_SECRETKEYBYTES) {
        sodium_memzero(secretKey_.data(), secretKey_.size());
        throw std::invalid_argument("oracle secret key length invalid");
    }
    if (hexToBytes(publicKeyHex_).size() != crypto_sign_PUBLICKEYBYTES) {
        throw std::invalid_argument("oracle public key length invalid");
    }
}

SignedDecryptionOracle::~SignedDecryptionOracle() {
    if (!secretKey_.empty()) {
        sodium_memzero(secretKey_.data(), secretKey_.size());
    }
}

std::uint64_t SignedDecryptionOracle::requestDecryption(const std::vector<CiphertextHandle>& handles,
                                                        const std::string& requesterIdentity) {
    if (handles.empty()) {
        throw std::invalid_argument("decryption request must name at least one handle");
    }
    for (const auto& handle : handles) {
        if (!backend_->isInitialized(handle)) {
            throw std::invalid_argument("decryption request names an unknown ciphertext handle");
        }
    }
    std::uint64_t requestId = nextRequestId_++;
    requests_[requestId] = PendingRequest{ handles, requesterIdentity, false };
    return requestId;
}

bool SignedDecryptionOracle::verify(std::uint64_t requestId,
                                    const std::vector<CiphertextHandle>& handles,
                                    const std::string& requesterIdentity,
                                    const std::string& cleartexts,
                                    const std::string& proof) const {
    return verifyDecryptionProof(publicKeyHex_, requestId, handles, requesterIdentity, cleartexts, proof);
}

DecryptionResponse SignedDecryptionOracle::fulfill(std::uint64_t requestId) {
    auto it = requests_.find(requestId);
    if (it == requests_.end()) {
        throw std::runtime_error("Unknown decryption request " + std::to_string(requestId));
    }

    std::vector<std::int64_t> plaintexts;
    plaintexts.reserve(it->second.handles.size());
    for (const auto& handle : it->second.handles) {
        plaintexts.push_back(backend_->decrypt(handle));
    }

    DecryptionResponse response;
    response.requestId = requestId;
    response.cleartexts = encodeCleartexts(plaintexts);
    response.proof = sign(buildDecryptionMessage(
        requestId, it->second.handles, it->second.requesterIdentity, response.cleartexts));
    it->second.fulfilled = true;
    return response;
}

std::vector<std::uint64_t> SignedDecryptionOracle::pendingRequestIds() const {
    std::vector<std::uint64_t> ids;
    for (const auto& [id, request] : requests_) {
        if (!request.fulfilled) {
            ids.push_back(id);
        }
    }
    return ids;
}

const SignedDecryptionOracle::PendingRequest* SignedDecryptionOracle::findRequest(
    std::uint64_t requestId) const {
    auto it = requests_.find(requestId);
    if (it == requests_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string SignedDecryptionOracle::sign(const std::string& message) const {
    std::vector<unsigned char> signature(crypto_sign_BYTES);
    unsigned long long sigLen = 0;
    if (crypto_sign_detached(signature.data(),
                             &sigLen,
                             reinterpret_cast<const unsigned char*>(message.data()),
                             message.size(),
                             secretKey_.data()) != 0) {
        throw std::runtime_error("Oracle signing failed");
    }
    return std::string(reinterpret_cast<const char*>(signature.data()), static_cast<std::size_t>(sigLen));
}

} // namespace fl
