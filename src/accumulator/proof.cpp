/**
 * @file proof.cpp
 * @brief Реализация batch доказательств
 */

#include "proof.hpp"

#include <format>
#include <map>

namespace arbor::accumulator {

using core::serialization::ReadStream;
using core::serialization::WriteStream;

Error ProofError::to_error() const {
    return Error{
        ErrorCode::ProofInvalid,
        std::format("Доказательство отклонено ({}) на позиции {}", to_string(reason), position)
    };
}

// =============================================================================
// BatchProof
// =============================================================================

ProofResult<BatchProof> BatchProof::from_paths(std::span<const InclusionPath> paths) {
    // Все известные из путей узлы: (row, index) -> hash
    std::map<std::pair<uint8_t, uint64_t>, Hash256> known;
    std::vector<TargetNode> targets;
    targets.reserve(paths.size());

    for (const auto& path : paths) {
        if (path.siblings.size() > 63) {
            return std::unexpected(ProofError{ProofFailure::Malformed, path.position});
        }
        for (std::size_t row = 0; row < path.siblings.size(); ++row) {
            const auto key = std::pair{static_cast<uint8_t>(row), (path.position >> row) ^ 1};
            auto [it, inserted] = known.emplace(key, path.siblings[row]);
            if (!inserted && it->second != path.siblings[row]) {
                return std::unexpected(ProofError{ProofFailure::HashMismatch, path.position});
            }
        }
        targets.push_back({path.position, path.leaf,
                           static_cast<uint8_t>(path.siblings.size())});
    }

    auto walk = walk_batch(std::move(targets),
        [&](uint8_t row, uint64_t index) -> ProofResult<Hash256> {
            auto it = known.find({row, index});
            if (it == known.end()) {
                return std::unexpected(ProofError{ProofFailure::Malformed, index << row});
            }
            return it->second;
        });
    if (!walk) {
        return std::unexpected(walk.error());
    }

    BatchProof proof;
    proof.targets.reserve(paths.size());
    for (const auto& path : paths) {
        proof.targets.push_back(path.position);
    }
    proof.hashes.reserve(walk->siblings.size());
    for (const auto& sibling : walk->siblings) {
        proof.hashes.push_back(sibling.hash);
    }
    return proof;
}

void BatchProof::serialize(WriteStream& out) const {
    out.write_varint(targets.size());
    for (auto target : targets) {
        out.write_u64_le(target);
    }
    out.write_varint(hashes.size());
    for (const auto& hash : hashes) {
        out.write_hash256(hash);
    }
}

BatchProof BatchProof::deserialize(ReadStream& in) {
    BatchProof proof;
    const std::size_t target_count = in.read_count(1'000'000);
    proof.targets.reserve(target_count);
    for (std::size_t i = 0; i < target_count; ++i) {
        proof.targets.push_back(in.read_u64_le());
    }
    const std::size_t hash_count = in.read_count(64'000'000);
    proof.hashes.reserve(hash_count);
    for (std::size_t i = 0; i < hash_count; ++i) {
        proof.hashes.push_back(in.read_hash256());
    }
    return proof;
}

// =============================================================================
// Проверка
// =============================================================================

ProofResult<BatchWalk> verify_detailed(
    const Forest& forest,
    const BatchProof& proof,
    std::span<const Hash256> leaf_hashes
) {
    if (proof.targets.size() != leaf_hashes.size()) {
        return std::unexpected(ProofError{ProofFailure::Malformed, 0});
    }

    std::vector<TargetNode> targets;
    targets.reserve(proof.targets.size());
    for (std::size_t i = 0; i < proof.targets.size(); ++i) {
        const uint64_t position = proof.targets[i];
        if (position >= forest.num_leaves) {
            return std::unexpected(ProofError{ProofFailure::LeafNotFound, position});
        }
        auto root_idx = forest.find_root(position);
        if (!root_idx) {
            // Позиция в пределах леса, но уже удалена
            return std::unexpected(ProofError{ProofFailure::Stale, position});
        }
        targets.push_back({position, leaf_hashes[i], forest.roots[*root_idx].row});
    }

    std::size_t next_hash = 0;
    auto walk = walk_batch(std::move(targets),
        [&](uint8_t row, uint64_t index) -> ProofResult<Hash256> {
            if (next_hash >= proof.hashes.size()) {
                return std::unexpected(ProofError{ProofFailure::Stale, index << row});
            }
            return proof.hashes[next_hash++];
        });
    if (!walk) {
        return walk;
    }

    if (next_hash != proof.hashes.size()) {
        return std::unexpected(ProofError{ProofFailure::Stale, 0});
    }

    for (const auto& top : walk->tops) {
        auto root_idx = forest.find_root(top.start());
        if (!root_idx || forest.roots[*root_idx] != top) {
            return std::unexpected(ProofError{ProofFailure::HashMismatch, top.start()});
        }
    }

    return walk;
}

ProofResult<void> verify(
    const Forest& forest,
    const BatchProof& proof,
    std::span<const Hash256> leaf_hashes
) {
    auto walk = verify_detailed(forest, proof, leaf_hashes);
    if (!walk) {
        return std::unexpected(walk.error());
    }
    return {};
}

} // namespace arbor::accumulator
