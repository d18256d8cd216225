#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace fl {

struct MerkleProofNode {
    std::string hash;
    bool siblingIsLeft = false;
};

// Append-only Merkle transcript. Leaves are SHA-256 hex digests of the raw
// records; odd layers duplicate their last node.
class TranscriptLog {
public:
    void append(const std::string& record);
    std::string getLeaf(std::size_t index) const;

    std::string merkleRoot() const;
    std::vector<MerkleProofNode> merkleProof(std::size_t leafIndex) const;

    static std::string leafHash(const std::string& record);
    static bool verifyInclusion(const std::string& leafHash,
                                const std::vector<MerkleProofNode>& proof,
                                const std::string& root);

    std::size_t size() const { return leaves_.size(); }

private:
    static std::string hashPair(const std::string& left, const std::string& right);

    std::vector<std::string> leaves_;
};

} // namespace fl
