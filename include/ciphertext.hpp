#pragma once

#include "encoding.hpp"

#include <string>

namespace fl {

// Opaque reference to an encrypted integer held by a homomorphic backend.
// A default-constructed handle is "uninitialized" and refers to nothing.
class CiphertextHandle {
public:
    CiphertextHandle() = default;
    explicit CiphertextHandle(const Digest& id) : id_(id), initialized_(true) {}

    static CiphertextHandle fromHex(const std::string& hex);

    bool isInitialized() const { return initialized_; }
    const Digest& id() const { return id_; }
    std::string toHex() const;

    // Bytes folded into state hashes and oracle signatures. Uninitialized
    // handles commit to 32 zero bytes.
    std::string toCommitmentBytes() const;

    bool operator==(const CiphertextHandle& other) const {
        return initialized_ == other.initialized_ && id_ == other.id_;
    }
    bool operator!=(const CiphertextHandle& other) const { return !(*this == other); }

private:
    Digest id_{};
    bool initialized_ = false;
};

} // namespace fl
