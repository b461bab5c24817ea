/**
 * @file forest.cpp
 * @brief Реализация состояния леса
 */

#include "forest.hpp"
#include "../core/constants.hpp"
#include "../crypto/sha512.hpp"

#include <algorithm>
#include <format>

namespace arbor::accumulator {

using core::serialization::ReadStream;
using core::serialization::StreamError;
using core::serialization::WriteStream;

Hash256 parent_hash(const Hash256& left, const Hash256& right) noexcept {
    crypto::Sha512_256 hasher;
    hasher.write(left).write(right);
    return hasher.finalize();
}

// =============================================================================
// Forest
// =============================================================================

uint64_t Forest::live_leaves() const noexcept {
    uint64_t total = 0;
    for (const auto& root : roots) {
        total += uint64_t{1} << root.row;
    }
    return total;
}

std::optional<std::size_t> Forest::find_root(uint64_t position) const noexcept {
    // Первый корень, начинающийся правее позиции; искомый - предыдущий
    auto it = std::upper_bound(
        roots.begin(), roots.end(), position,
        [](uint64_t pos, const Root& root) { return pos < root.start(); });
    if (it == roots.begin()) {
        return std::nullopt;
    }
    --it;
    if (!it->covers(position)) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - roots.begin());
}

void Forest::serialize(WriteStream& out) const {
    out.write_u64_le(num_leaves);
    out.write_varint(roots.size());
    for (const auto& root : roots) {
        out.write_u8(root.row);
        out.write_u64_le(root.index);
        out.write_hash256(root.hash);
    }
}

Forest Forest::deserialize(ReadStream& in) {
    Forest forest;
    forest.num_leaves = in.read_u64_le();
    const std::size_t count = in.read_count(4096);
    forest.roots.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        Root root;
        root.row = in.read_u8();
        root.index = in.read_u64_le();
        root.hash = in.read_hash256();
        forest.roots.push_back(root);
    }
    return forest;
}

Bytes Forest::serialize() const {
    WriteStream out(16 + roots.size() * 41);
    serialize(out);
    return out.take_data();
}

Result<Forest> Forest::deserialize(ByteSpan data) {
    auto forest = core::serialization::decode(
        data, ErrorCode::StoreCorruption,
        [](ReadStream& in) { return Forest::deserialize(in); });
    if (!forest) {
        return forest;
    }
    if (auto valid = validate_forest(*forest); !valid) {
        return Err<Forest>(ErrorCode::StoreCorruption, valid.error().message);
    }
    return forest;
}

// =============================================================================
// Проверка и пересчёт
// =============================================================================

Result<void> validate_forest(const Forest& forest) {
    uint64_t prev_end = 0;
    for (const auto& root : forest.roots) {
        if (root.row > constants::MAX_FOREST_ROWS) {
            return Err<void>(ErrorCode::MalformedForest,
                             std::format("Высота корня {} превышает максимум", root.row));
        }
        // index << row не должен переполняться
        if (root.index > (UINT64_MAX >> root.row) - 1) {
            return Err<void>(ErrorCode::MalformedForest,
                             std::format("Индекс корня {} вне диапазона", root.index));
        }
        if (root.start() < prev_end) {
            return Err<void>(ErrorCode::MalformedForest,
                             std::format("Корень ({}, {}) пересекается с предыдущим или нарушает порядок",
                                         root.row, root.index));
        }
        if (root.end() > forest.num_leaves) {
            return Err<void>(ErrorCode::MalformedForest,
                             std::format("Корень ({}, {}) выходит за num_leaves={}",
                                         root.row, root.index, forest.num_leaves));
        }
        prev_end = root.end();
    }
    return {};
}

void sort_roots(std::vector<Root>& roots) {
    std::sort(roots.begin(), roots.end(), [](const Root& a, const Root& b) {
        return a.start() < b.start();
    });
}

Result<Forest> recompute_forest(
    uint64_t num_leaves,
    std::vector<std::pair<uint64_t, Hash256>> leaves
) {
    std::sort(leaves.begin(), leaves.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    for (std::size_t i = 0; i < leaves.size(); ++i) {
        if (leaves[i].first >= num_leaves) {
            return Err<Forest>(ErrorCode::MalformedForest,
                               std::format("Позиция {} вне num_leaves={}", leaves[i].first, num_leaves));
        }
        if (i > 0 && leaves[i].first == leaves[i - 1].first) {
            return Err<Forest>(ErrorCode::MalformedForest,
                               std::format("Повтор позиции {}", leaves[i].first));
        }
    }

    Forest forest;
    forest.num_leaves = num_leaves;

    // Узлы текущей строки, отсортированные по индексу
    std::vector<std::pair<uint64_t, Hash256>> row_nodes = std::move(leaves);
    for (uint8_t row = 0; !row_nodes.empty(); ++row) {
        std::vector<std::pair<uint64_t, Hash256>> next;
        for (std::size_t i = 0; i < row_nodes.size(); ++i) {
            const auto& [index, hash] = row_nodes[i];
            const bool has_pair = (index % 2 == 0) &&
                                  i + 1 < row_nodes.size() &&
                                  row_nodes[i + 1].first == index + 1;
            if (has_pair) {
                next.emplace_back(index >> 1, parent_hash(hash, row_nodes[i + 1].second));
                ++i;
            } else {
                // Брат отсутствует: узел - максимальное полное поддерево
                forest.roots.push_back(Root{row, index, hash});
            }
        }
        row_nodes = std::move(next);
    }

    sort_roots(forest.roots);
    return forest;
}

} // namespace arbor::accumulator
