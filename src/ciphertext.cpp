#include "ciphertext.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace fl {

CiphertextHandle CiphertextHandle::fromHex(const std::string& hex) {
    std::vector<unsigned char> bytes = hexToBytes(hex);
    Digest id{};
    if (bytes.size() != id.size()) {
        throw std::invalid_argument("ciphertext handle must be 32 bytes");
    }
    std::copy(bytes.begin(), bytes.end(), id.begin());
    return CiphertextHandle(id);
}

std::string CiphertextHandle::toHex() const {
    if (!initialized_) {
        return {};
    }
    return bytesToHex(id_.data(), id_.size());
}

std::string CiphertextHandle::toCommitmentBytes() const {
    return std::string(reinterpret_cast<const char*>(id_.data()), id_.size());
}

} // namespace fl
