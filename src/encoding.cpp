#include "encoding.hpp"

#include "picosha2.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fl {

std::string bytesToHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::vector<unsigned char> hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }
    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        std::string byteString = hex.substr(i, 2);
        unsigned int byte = 0;
        std::istringstream iss(byteString);
        iss >> std::hex >> byte;
        if (iss.fail() || !iss.eof()) {
            throw std::invalid_argument("Invalid hex string");
        }
        out.push_back(static_cast<unsigned char>(byte));
    }
    return out;
}

Digest sha256(const std::string& data) {
    Digest hash{};
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return hash;
}

std::string sha256Hex(const std::string& data) {
    auto hash = sha256(data);
    return bytesToHex(hash.data(), hash.size());
}

void appendU64(std::string& out, std::uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

void appendI64(std::string& out, std::int64_t value) {
    appendU64(out, static_cast<std::uint64_t>(value));
}

void appendLengthPrefixed(std::string& out, const std::string& value) {
    appendU64(out, static_cast<std::uint64_t>(value.size()));
    out.append(value);
}

std::uint64_t readU64(const std::string& in, std::size_t offset) {
    if (offset > in.size() || in.size() - offset < 8) {
        throw std::out_of_range("u64 read past end of buffer");
    }
    std::uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | static_cast<unsigned char>(in[offset + static_cast<std::size_t>(i)]);
    }
    return value;
}

} // namespace fl
