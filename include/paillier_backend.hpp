#pragma once

#include "fhe_backend.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace fl {

// Reference additively-homomorphic backend built on the Paillier scheme.
//
// The backend plays the role of the coprocessor: it owns every ciphertext and
// hands out 32-byte handles. Each stored ciphertext gets a fresh handle, so
// adding into a total always yields a handle distinct from the old one.
// Signed values are encoded modulo n; results above n/2 decode as negative.
//
// decrypt() exposes the secret key path and must only be reachable from the
// decryption oracle.
class PaillierBackend : public HomomorphicBackend {
public:
    struct Config {
        std::uint32_t primeBits = 1024;
        std::uint32_t millerRabinRounds = 25;
    };

    explicit PaillierBackend(const Config& cfg);
    ~PaillierBackend() override;

    PaillierBackend(const PaillierBackend&) = delete;
    PaillierBackend& operator=(const PaillierBackend&) = delete;

    CiphertextHandle add(const CiphertextHandle& lhs, const CiphertextHandle& rhs) override;
    CiphertextHandle encryptZero() override;
    CiphertextHandle canonicalZero() override;
    bool isInitialized(const CiphertextHandle& handle) const override;

    // Client-side encryption under the public key.
    CiphertextHandle encrypt(std::int64_t value);
    std::int64_t decrypt(const CiphertextHandle& handle) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fl
