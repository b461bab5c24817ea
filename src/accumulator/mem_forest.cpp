/**
 * @file mem_forest.cpp
 * @brief Реализация полного леса в памяти
 */

#include "mem_forest.hpp"

#include <format>

namespace arbor::accumulator {

bool MemForest::present(uint8_t row, uint64_t index) const noexcept {
    return row < rows_.size() && index < rows_[row].size() && rows_[row][index].present;
}

uint8_t MemForest::tree_row(uint64_t position) const noexcept {
    uint8_t row = 0;
    uint64_t index = position;
    while (present(static_cast<uint8_t>(row + 1), index >> 1)) {
        ++row;
        index >>= 1;
    }
    return row;
}

uint64_t MemForest::add(const Hash256& leaf) {
    if (rows_.empty()) {
        rows_.emplace_back();
    }
    const uint64_t position = rows_[0].size();
    rows_[0].push_back(Node{leaf, true});
    positions_[leaf] = position;

    uint8_t row = 0;
    uint64_t index = position;
    while ((index & 1) == 1 && present(row, index - 1)) {
        const Hash256 parent = parent_hash(rows_[row][index - 1].hash, rows_[row][index].hash);
        ++row;
        index >>= 1;
        if (rows_.size() <= row) {
            rows_.emplace_back();
        }
        if (rows_[row].size() <= index) {
            rows_[row].resize(index + 1);
        }
        rows_[row][index] = Node{parent, true};
    }
    return position;
}

void MemForest::add(std::span<const Hash256> leaves) {
    for (const auto& leaf : leaves) {
        add(leaf);
    }
}

Result<void> MemForest::remove(uint64_t position) {
    if (!present(0, position)) {
        return Err<void>(ErrorCode::MalformedForest,
                         std::format("Позиция {} вне леса или уже удалена", position));
    }

    auto it = positions_.find(rows_[0][position].hash);
    if (it != positions_.end() && it->second == position) {
        positions_.erase(it);
    }

    uint8_t row = 0;
    uint64_t index = position;
    while (present(row, index)) {
        rows_[row][index].present = false;
        ++row;
        index >>= 1;
    }
    return {};
}

Result<void> MemForest::remove(std::span<const uint64_t> positions) {
    for (auto position : positions) {
        if (auto result = remove(position); !result) {
            return result;
        }
    }
    return {};
}

Result<BatchProof> MemForest::prove(std::span<const uint64_t> positions) const {
    std::vector<TargetNode> targets;
    targets.reserve(positions.size());
    for (auto position : positions) {
        if (!present(0, position)) {
            return Err<BatchProof>(ErrorCode::ProofInvalid,
                                   std::format("Позиция {} не является живым листом", position));
        }
        targets.push_back({position, rows_[0][position].hash, tree_row(position)});
    }

    auto walk = walk_batch(std::move(targets),
        [this](uint8_t row, uint64_t index) -> ProofResult<Hash256> {
            if (!present(row, index)) {
                return std::unexpected(ProofError{ProofFailure::Malformed, index << row});
            }
            return rows_[row][index].hash;
        });
    if (!walk) {
        return std::unexpected(walk.error().to_error());
    }

    BatchProof proof;
    proof.targets.assign(positions.begin(), positions.end());
    proof.hashes.reserve(walk->siblings.size());
    for (const auto& sibling : walk->siblings) {
        proof.hashes.push_back(sibling.hash);
    }
    return proof;
}

Result<InclusionPath> MemForest::prove_path(uint64_t position) const {
    if (!present(0, position)) {
        return Err<InclusionPath>(ErrorCode::ProofInvalid,
                                  std::format("Позиция {} не является живым листом", position));
    }

    InclusionPath path;
    path.leaf = rows_[0][position].hash;
    path.position = position;

    const uint8_t height = tree_row(position);
    uint64_t index = position;
    for (uint8_t row = 0; row < height; ++row) {
        path.siblings.push_back(rows_[row][index ^ 1].hash);
        index >>= 1;
    }
    return path;
}

Forest MemForest::forest() const {
    Forest result;
    result.num_leaves = num_leaves();
    for (std::size_t row = 0; row < rows_.size(); ++row) {
        for (uint64_t index = 0; index < rows_[row].size(); ++index) {
            if (rows_[row][index].present &&
                !present(static_cast<uint8_t>(row + 1), index >> 1)) {
                result.roots.push_back(
                    Root{static_cast<uint8_t>(row), index, rows_[row][index].hash});
            }
        }
    }
    sort_roots(result.roots);
    return result;
}

std::optional<Hash256> MemForest::leaf(uint64_t position) const {
    if (!present(0, position)) {
        return std::nullopt;
    }
    return rows_[0][position].hash;
}

std::optional<uint64_t> MemForest::position_of(const Hash256& leaf) const {
    auto it = positions_.find(leaf);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::pair<uint64_t, Hash256>> MemForest::live_leaves() const {
    std::vector<std::pair<uint64_t, Hash256>> result;
    if (rows_.empty()) {
        return result;
    }
    for (uint64_t position = 0; position < rows_[0].size(); ++position) {
        if (rows_[0][position].present) {
            result.emplace_back(position, rows_[0][position].hash);
        }
    }
    return result;
}

} // namespace arbor::accumulator
