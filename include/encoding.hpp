#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fl {

using Digest = std::array<std::uint8_t, 32>;

std::string bytesToHex(const unsigned char* data, std::size_t len);
std::vector<unsigned char> hexToBytes(const std::string& hex);

Digest sha256(const std::string& data);
std::string sha256Hex(const std::string& data);

// Canonical little-endian wire helpers shared by commitments, cleartext
// payloads and the event transcript.
void appendU64(std::string& out, std::uint64_t value);
void appendI64(std::string& out, std::int64_t value);
void appendLengthPrefixed(std::string& out, const std::string& value);
std::uint64_t readU64(const std::string& in, std::size_t offset);

} // namespace fl
