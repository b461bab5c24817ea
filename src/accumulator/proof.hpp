/**
 * @file proof.hpp
 * @brief Batch доказательства включения и их проверка
 *
 * BatchProof содержит позиции доказываемых листьев и недостающие
 * хеши братьев. Хеши дедуплицированы: узел, который вычисляется
 * из других целей, в доказательство не входит. Порядок хешей
 * канонический: по строкам снизу вверх, внутри строки по индексу.
 */

#pragma once

#include "forest.hpp"

#include <algorithm>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace arbor::accumulator {

// =============================================================================
// Ошибки доказательств
// =============================================================================

/**
 * @brief Причина отказа доказательства
 */
enum class ProofFailure {
    /// @brief Позиция за пределами леса
    LeafNotFound,
    /// @brief Доказательство построено для другого состояния леса
    Stale,
    /// @brief Вычисленный корень не совпал с корнем леса
    HashMismatch,
    /// @brief Структурно некорректное доказательство
    Malformed
};

[[nodiscard]] constexpr std::string_view to_string(ProofFailure failure) noexcept {
    switch (failure) {
        case ProofFailure::LeafNotFound: return "leaf not found";
        case ProofFailure::Stale: return "stale proof";
        case ProofFailure::HashMismatch: return "hash mismatch";
        case ProofFailure::Malformed: return "malformed proof";
        default: return "unknown";
    }
}

/**
 * @brief Ошибка доказательства с позицией
 */
struct ProofError {
    ProofFailure reason;
    uint64_t position{0};

    /**
     * @brief Свести к общей ошибке ProofInvalid (причина - в сообщении)
     */
    [[nodiscard]] Error to_error() const;

    [[nodiscard]] bool operator==(const ProofError&) const noexcept = default;
};

template<typename T>
using ProofResult = std::expected<T, ProofError>;

// =============================================================================
// Доказательства
// =============================================================================

/**
 * @brief Путь включения одного листа
 */
struct InclusionPath {
    Hash256 leaf{};
    uint64_t position{0};

    /// @brief Хеши братьев от строки 0 до корня дерева
    std::vector<Hash256> siblings;
};

/**
 * @brief Batch доказательство включения
 */
struct BatchProof {
    /// @brief Позиции листьев (порядок совпадает с порядком хешей листьев)
    std::vector<uint64_t> targets;

    /// @brief Дедуплицированные хеши братьев в каноническом порядке
    std::vector<Hash256> hashes;

    /**
     * @brief Собрать batch из отдельных путей
     *
     * Общие узлы берутся один раз. Расхождение хешей одного и того же
     * узла в разных путях - HashMismatch.
     */
    [[nodiscard]] static ProofResult<BatchProof> from_paths(
        std::span<const InclusionPath> paths
    );

    void serialize(core::serialization::WriteStream& out) const;

    [[nodiscard]] static BatchProof deserialize(core::serialization::ReadStream& in);

    [[nodiscard]] bool operator==(const BatchProof&) const noexcept = default;
};

// =============================================================================
// Обход batch доказательства
// =============================================================================

/**
 * @brief Доказываемый лист и высота его дерева
 */
struct TargetNode {
    uint64_t position{0};
    Hash256 hash{};
    uint8_t tree_row{0};
};

/**
 * @brief Результат обхода
 */
struct BatchWalk {
    /// @brief Вычисленные вершины деревьев (по одной на затронутое дерево)
    std::vector<Root> tops;

    /// @brief Узлы, взятые из источника братьев, в порядке запроса
    std::vector<Root> siblings;
};

/**
 * @brief Поднять цели до вершин их деревьев
 *
 * Строки обходятся снизу вверх, внутри строки по возрастанию индекса.
 * Брат, который не вычисляется из других целей, запрашивается у source.
 *
 * @param targets Цели (будут отсортированы по позиции)
 * @param source Callable (uint8_t row, uint64_t index) -> ProofResult<Hash256>
 */
template<typename SiblingSource>
[[nodiscard]] ProofResult<BatchWalk> walk_batch(
    std::vector<TargetNode> targets,
    SiblingSource&& source
) {
    struct Active {
        uint64_t index;
        Hash256 hash;
        uint8_t tree_row;
        uint64_t origin;
    };

    std::sort(targets.begin(), targets.end(),
              [](const TargetNode& a, const TargetNode& b) { return a.position < b.position; });

    std::vector<Active> active;
    active.reserve(targets.size());
    for (std::size_t i = 0; i < targets.size(); ++i) {
        if (i > 0 && targets[i].position == targets[i - 1].position) {
            return std::unexpected(ProofError{ProofFailure::Malformed, targets[i].position});
        }
        active.push_back({targets[i].position, targets[i].hash, targets[i].tree_row,
                          targets[i].position});
    }

    BatchWalk walk;
    for (uint8_t row = 0; !active.empty(); ++row) {
        std::vector<Active> next;
        next.reserve(active.size());

        for (std::size_t i = 0; i < active.size(); ++i) {
            const auto& node = active[i];
            if (node.tree_row == row) {
                walk.tops.push_back(Root{row, node.index, node.hash});
                continue;
            }

            const uint64_t sibling_index = node.index ^ 1;
            Hash256 parent;
            if ((node.index & 1) == 0 && i + 1 < active.size() &&
                active[i + 1].index == sibling_index) {
                if (active[i + 1].tree_row != node.tree_row) {
                    return std::unexpected(ProofError{ProofFailure::Malformed, node.origin});
                }
                parent = parent_hash(node.hash, active[i + 1].hash);
                ++i;
            } else {
                auto sibling = source(row, sibling_index);
                if (!sibling) {
                    return std::unexpected(sibling.error());
                }
                walk.siblings.push_back(Root{row, sibling_index, *sibling});
                parent = (node.index & 1) == 0
                    ? parent_hash(node.hash, *sibling)
                    : parent_hash(*sibling, node.hash);
            }
            next.push_back({node.index >> 1, parent, node.tree_row, node.origin});
        }

        active = std::move(next);
    }

    return walk;
}

// =============================================================================
// Проверка
// =============================================================================

/**
 * @brief Проверить batch доказательство против текущих корней леса
 *
 * @param forest Текущий лес
 * @param proof Доказательство
 * @param leaf_hashes Хеши листьев в порядке proof.targets
 * @return Обход (вершины и использованные братья) или причина отказа
 */
[[nodiscard]] ProofResult<BatchWalk> verify_detailed(
    const Forest& forest,
    const BatchProof& proof,
    std::span<const Hash256> leaf_hashes
);

/**
 * @brief Проверить доказательство (accept/reject)
 *
 * @return Причина отказа или пустой успех
 */
[[nodiscard]] ProofResult<void> verify(
    const Forest& forest,
    const BatchProof& proof,
    std::span<const Hash256> leaf_hashes
);

} // namespace arbor::accumulator
