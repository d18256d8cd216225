#include "transcript_log.hpp"

#include "encoding.hpp"

#include <utility>

namespace fl {

void TranscriptLog::append(const std::string& record) {
    leaves_.push_back(leafHash(record));
}

std::string TranscriptLog::getLeaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string TranscriptLog::leafHash(const std::string& record) {
    return sha256Hex(record);
}

std::string TranscriptLog::hashPair(const std::string& left, const std::string& right) {
    return sha256Hex(left + right);
}

std::string TranscriptLog::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }

    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
    }
    return layer.front();
}

std::vector<MerkleProofNode> TranscriptLog::merkleProof(std::size_t leafIndex) const {
    std::vector<MerkleProofNode> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::size_t siblingIndex = (index % 2 == 0) ? index + 1 : index - 1;
        if (siblingIndex >= layer.size()) {
            siblingIndex = index;
        }
        proof.push_back({ layer[siblingIndex], index % 2 == 1 });

        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
        index /= 2;
    }
    return proof;
}

bool TranscriptLog::verifyInclusion(const std::string& leafHash,
                                    const std::vector<MerkleProofNode>& proof,
                                    const std::string& root) {
    if (leafHash.empty() || root.empty()) {
        return false;
    }
    std::string current = leafHash;
    for (const auto& node : proof) {
        current = node.siblingIsLeft ? hashPair(node.hash, current) : hashPair(current, node.hash);
    }
    return current == root;
}

} // namespace fl
