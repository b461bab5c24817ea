/**
 * @file mem_forest.hpp
 * @brief Полный лес в памяти
 *
 * Хранит все узлы (арена по строкам) и умеет строить batch
 * доказательства для любых живых позиций. Используется как локальный
 * источник доказательств и как эталон для пересчёта корней с нуля.
 */

#pragma once

#include "forest.hpp"
#include "proof.hpp"

#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace arbor::accumulator {

/**
 * @brief Лес со всеми узлами
 *
 * Узел (row, index) присутствует, если все листья его поддерева живы.
 * Корни - присутствующие узлы без присутствующего родителя.
 */
class MemForest {
public:
    MemForest() = default;

    /**
     * @brief Добавить лист
     *
     * @return Позиция нового листа
     */
    uint64_t add(const Hash256& leaf);

    /**
     * @brief Добавить листья по порядку
     */
    void add(std::span<const Hash256> leaves);

    /**
     * @brief Удалить живой лист
     *
     * @return MalformedForest, если позиция вне леса или уже удалена
     */
    [[nodiscard]] Result<void> remove(uint64_t position);

    /**
     * @brief Удалить несколько листьев
     */
    [[nodiscard]] Result<void> remove(std::span<const uint64_t> positions);

    /**
     * @brief Построить batch доказательство
     *
     * @param positions Живые позиции (порядок сохраняется в targets)
     */
    [[nodiscard]] Result<BatchProof> prove(std::span<const uint64_t> positions) const;

    /**
     * @brief Путь включения одного листа
     */
    [[nodiscard]] Result<InclusionPath> prove_path(uint64_t position) const;

    /**
     * @brief Текущее состояние в виде корней
     */
    [[nodiscard]] Forest forest() const;

    [[nodiscard]] uint64_t num_leaves() const noexcept {
        return rows_.empty() ? 0 : rows_[0].size();
    }

    /**
     * @brief Хеш живого листа
     */
    [[nodiscard]] std::optional<Hash256> leaf(uint64_t position) const;

    /**
     * @brief Позиция живого листа по его хешу
     */
    [[nodiscard]] std::optional<uint64_t> position_of(const Hash256& leaf) const;

    /**
     * @brief Живые листья (позиция, хеш)
     */
    [[nodiscard]] std::vector<std::pair<uint64_t, Hash256>> live_leaves() const;

private:
    struct Node {
        Hash256 hash{};
        bool present{false};
    };

    [[nodiscard]] bool present(uint8_t row, uint64_t index) const noexcept;

    /// @brief Высота дерева, содержащего живую позицию
    [[nodiscard]] uint8_t tree_row(uint64_t position) const noexcept;

    std::vector<std::vector<Node>> rows_;
    std::unordered_map<Hash256, uint64_t> positions_;
};

} // namespace arbor::accumulator
