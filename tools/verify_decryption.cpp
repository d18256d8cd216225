#include "ciphertext.hpp"
#include "decryption_oracle.hpp"
#include "encoding.hpp"

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::vector<fl::CiphertextHandle> parseHandles(const std::string& csv) {
    std::vector<fl::CiphertextHandle> handles;
    std::istringstream iss(csv);
    std::string item;
    while (std::getline(iss, item, ',')) {
        handles.push_back(fl::CiphertextHandle::fromHex(item));
    }
    return handles;
}

std::string hexToString(const std::string& hex) {
    std::vector<unsigned char> bytes = fl::hexToBytes(hex);
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 7) {
        std::cerr << "Usage: verify_decryption <oraclePublicKeyHex> <requestId> <contractIdentity> "
                     "<handleHex,handleHex,handleHex> <cleartextsHex> <proofHex>\n";
        std::cerr << "contractIdentity has the form <deploymentId>[|<chainId>]:<contractAddress>.\n";
        return 1;
    }

    std::string publicKey = argv[1];
    std::string contractIdentity = argv[3];
    std::uint64_t requestId = 0;
    std::vector<fl::CiphertextHandle> handles;
    std::string cleartexts;
    std::string proof;
    try {
        requestId = std::stoull(argv[2]);
        handles = parseHandles(argv[4]);
        cleartexts = hexToString(argv[5]);
        proof = hexToString(argv[6]);
    } catch (const std::exception& ex) {
        std::cerr << "Argument parse error: " << ex.what() << '\n';
        return 1;
    }

    bool ok = fl::verifyDecryptionProof(publicKey, requestId, handles, contractIdentity, cleartexts, proof);
    std::cout << "Decryption proof: " << (ok ? "valid" : "INVALID") << '\n';
    if (!ok) {
        return 2;
    }

    try {
        auto values = fl::decodeCleartexts(cleartexts, handles.size());
        for (std::size_t i = 0; i < values.size(); ++i) {
            std::cout << "  [" << i << "] " << handles[i].toHex() << " = " << values[i] << '\n';
        }
    } catch (const std::exception& ex) {
        std::cerr << "Cleartext payload does not match handle count: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
