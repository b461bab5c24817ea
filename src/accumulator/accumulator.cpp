/**
 * @file accumulator.cpp
 * @brief Реализация операций аккумулятора
 */

#include "accumulator.hpp"
#include "../core/constants.hpp"

#include <algorithm>
#include <format>
#include <set>

namespace arbor::accumulator {

using core::serialization::ReadStream;
using core::serialization::WriteStream;

// =============================================================================
// UndoData
// =============================================================================

void UndoData::serialize(WriteStream& out) const {
    out.write_varint(targets.size());
    for (std::size_t i = 0; i < targets.size(); ++i) {
        out.write_u64_le(targets[i]);
        out.write_u8(target_rows[i]);
        out.write_hash256(leaf_hashes[i]);
    }
    out.write_varint(proof_hashes.size());
    for (const auto& hash : proof_hashes) {
        out.write_hash256(hash);
    }
    out.write_varint(absorbed_roots.size());
    for (const auto& root : absorbed_roots) {
        out.write_u8(root.row);
        out.write_u64_le(root.index);
        out.write_hash256(root.hash);
    }
    out.write_u64_le(num_added);
}

UndoData UndoData::deserialize(ReadStream& in) {
    UndoData undo;
    const std::size_t target_count = in.read_count(1'000'000);
    undo.targets.reserve(target_count);
    undo.target_rows.reserve(target_count);
    undo.leaf_hashes.reserve(target_count);
    for (std::size_t i = 0; i < target_count; ++i) {
        undo.targets.push_back(in.read_u64_le());
        undo.target_rows.push_back(in.read_u8());
        undo.leaf_hashes.push_back(in.read_hash256());
    }
    const std::size_t hash_count = in.read_count(64'000'000);
    undo.proof_hashes.reserve(hash_count);
    for (std::size_t i = 0; i < hash_count; ++i) {
        undo.proof_hashes.push_back(in.read_hash256());
    }
    const std::size_t absorbed_count = in.read_count(4096);
    undo.absorbed_roots.reserve(absorbed_count);
    for (std::size_t i = 0; i < absorbed_count; ++i) {
        Root root;
        root.row = in.read_u8();
        root.index = in.read_u64_le();
        root.hash = in.read_hash256();
        undo.absorbed_roots.push_back(root);
    }
    undo.num_added = in.read_u64_le();
    return undo;
}

Bytes UndoData::serialize() const {
    WriteStream out;
    serialize(out);
    return out.take_data();
}

Result<UndoData> UndoData::deserialize(ByteSpan data) {
    return core::serialization::decode(
        data, ErrorCode::StoreCorruption,
        [](ReadStream& in) { return UndoData::deserialize(in); });
}

// =============================================================================
// Добавление
// =============================================================================

Result<Forest> add_leaves(
    const Forest& forest,
    std::span<const Hash256> leaves,
    std::vector<Root>* absorbed
) {
    if (leaves.size() > (uint64_t{1} << constants::MAX_FOREST_ROWS) - forest.num_leaves) {
        return Err<Forest>(ErrorCode::MalformedForest, "Переполнение позиций леса");
    }

    Forest result = forest;
    const uint64_t original_leaves = forest.num_leaves;

    for (const auto& leaf : leaves) {
        Root node{0, result.num_leaves, leaf};
        ++result.num_leaves;

        // Перенос: нечётный узел сливается с левым братом, если тот - последний корень
        while ((node.index & 1) == 1 && !result.roots.empty()) {
            const Root& last = result.roots.back();
            if (last.row != node.row || last.index != node.index - 1) {
                break;
            }
            if (absorbed != nullptr && last.end() <= original_leaves) {
                absorbed->push_back(last);
            }
            node = Root{static_cast<uint8_t>(node.row + 1), node.index >> 1,
                        parent_hash(last.hash, node.hash)};
            result.roots.pop_back();
        }
        result.roots.push_back(node);
    }

    return result;
}

// =============================================================================
// Удаление
// =============================================================================

namespace {

/**
 * @brief Заменить вершины затронутых деревьев на нетронутые поддеревья
 */
[[nodiscard]] std::vector<Root> replace_tops(
    const std::vector<Root>& roots,
    const std::vector<Root>& removed,
    const std::vector<Root>& inserted
) {
    std::set<std::pair<uint8_t, uint64_t>> removed_keys;
    for (const auto& root : removed) {
        removed_keys.emplace(root.row, root.index);
    }

    std::vector<Root> result;
    result.reserve(roots.size() + inserted.size());
    for (const auto& root : roots) {
        if (!removed_keys.contains({root.row, root.index})) {
            result.push_back(root);
        }
    }
    result.insert(result.end(), inserted.begin(), inserted.end());
    sort_roots(result);
    return result;
}

} // namespace

ProofResult<Forest> delete_leaves(
    const Forest& forest,
    const BatchProof& proof,
    std::span<const Hash256> leaf_hashes
) {
    auto walk = verify_detailed(forest, proof, leaf_hashes);
    if (!walk) {
        return std::unexpected(walk.error());
    }

    Forest result;
    result.num_leaves = forest.num_leaves;
    result.roots = replace_tops(forest.roots, walk->tops, walk->siblings);
    return result;
}

// =============================================================================
// Блок целиком
// =============================================================================

Result<BlockModification> apply_block(
    const Forest& forest,
    const BatchProof& proof,
    std::span<const Hash256> spent_leaf_hashes,
    std::span<const Hash256> new_leaves
) {
    BlockModification mod;

    // Высоты деревьев целей до удаления
    mod.undo.targets = proof.targets;
    mod.undo.target_rows.reserve(proof.targets.size());
    for (auto position : proof.targets) {
        auto root_idx = forest.find_root(position);
        mod.undo.target_rows.push_back(root_idx ? forest.roots[*root_idx].row : 0);
    }
    mod.undo.leaf_hashes.assign(spent_leaf_hashes.begin(), spent_leaf_hashes.end());
    mod.undo.proof_hashes = proof.hashes;

    auto deleted = delete_leaves(forest, proof, spent_leaf_hashes);
    if (!deleted) {
        return std::unexpected(deleted.error().to_error());
    }

    auto added = add_leaves(*deleted, new_leaves, &mod.undo.absorbed_roots);
    if (!added) {
        return std::unexpected(added.error());
    }

    mod.forest = std::move(*added);
    mod.undo.num_added = new_leaves.size();
    return mod;
}

Result<Forest> undo_block(const Forest& forest, const UndoData& undo) {
    if (undo.num_added > forest.num_leaves ||
        undo.targets.size() != undo.target_rows.size() ||
        undo.targets.size() != undo.leaf_hashes.size()) {
        return Err<Forest>(ErrorCode::MalformedForest, "Undo данные не соответствуют лесу");
    }

    // 1. Откат добавления: убираем корни, задевающие новые позиции
    const uint64_t base_leaves = forest.num_leaves - undo.num_added;
    Forest result;
    result.num_leaves = base_leaves;
    for (const auto& root : forest.roots) {
        if (root.end() <= base_leaves) {
            result.roots.push_back(root);
        }
    }
    result.roots.insert(result.roots.end(), undo.absorbed_roots.begin(), undo.absorbed_roots.end());
    sort_roots(result.roots);

    // 2. Откат удаления: заново поднимаем удалённые листья до исходных корней
    if (!undo.targets.empty()) {
        std::vector<TargetNode> targets;
        targets.reserve(undo.targets.size());
        for (std::size_t i = 0; i < undo.targets.size(); ++i) {
            targets.push_back({undo.targets[i], undo.leaf_hashes[i], undo.target_rows[i]});
        }

        std::size_t next_hash = 0;
        auto walk = walk_batch(std::move(targets),
            [&](uint8_t row, uint64_t index) -> ProofResult<Hash256> {
                if (next_hash >= undo.proof_hashes.size()) {
                    return std::unexpected(ProofError{ProofFailure::Malformed, index << row});
                }
                return undo.proof_hashes[next_hash++];
            });
        if (!walk || next_hash != undo.proof_hashes.size()) {
            return Err<Forest>(ErrorCode::MalformedForest, "Undo данные удаления некорректны");
        }

        // Братья из доказательства обязаны быть корнями леса после удаления
        for (const auto& sibling : walk->siblings) {
            auto root_idx = result.find_root(sibling.start());
            if (!root_idx || result.roots[*root_idx] != sibling) {
                return Err<Forest>(
                    ErrorCode::MalformedForest,
                    std::format("Корень ({}, {}) из undo данных отсутствует в лесу",
                                sibling.row, sibling.index));
            }
        }

        result.roots = replace_tops(result.roots, walk->siblings, walk->tops);
    }

    if (auto valid = validate_forest(result); !valid) {
        return std::unexpected(valid.error());
    }
    return result;
}

} // namespace arbor::accumulator
