/**
 * @file merkle.cpp
 * @brief Реализация Merkle дерева транзакций
 */

#include "merkle.hpp"
#include "../../crypto/sha256.hpp"

#include <array>
#include <cstring>

namespace arbor::core {

MerkleRoot compute_merkle_root(std::vector<Hash256> leaves) {
    MerkleRoot result;
    if (leaves.empty()) {
        return result;
    }

    while (leaves.size() > 1) {
        for (std::size_t i = 0; i + 1 < leaves.size(); i += 2) {
            if (leaves[i] == leaves[i + 1]) {
                result.mutated = true;
            }
        }

        // Дублируем последний при нечётном количестве
        if (leaves.size() % 2 != 0) {
            leaves.push_back(leaves.back());
        }

        std::vector<Hash256> next_level;
        next_level.reserve(leaves.size() / 2);

        for (std::size_t i = 0; i < leaves.size(); i += 2) {
            next_level.push_back(merkle_hash(leaves[i], leaves[i + 1]));
        }

        leaves = std::move(next_level);
    }

    result.root = leaves[0];
    return result;
}

Hash256 merkle_hash(const Hash256& left, const Hash256& right) noexcept {
    std::array<uint8_t, 64> combined;
    std::memcpy(combined.data(), left.data(), 32);
    std::memcpy(combined.data() + 32, right.data(), 32);
    return crypto::sha256d(combined);
}

Hash256 compute_witness_merkle_root(const std::vector<Hash256>& wtxids) {
    if (wtxids.empty()) {
        return Hash256{};
    }

    std::vector<Hash256> leaves = wtxids;
    leaves[0] = Hash256{};

    return compute_merkle_root(std::move(leaves)).root;
}

} // namespace arbor::core
