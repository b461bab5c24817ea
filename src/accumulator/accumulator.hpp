/**
 * @file accumulator.hpp
 * @brief Операции Utreexo аккумулятора
 *
 * Чистые функции над значением Forest: добавление листьев, удаление
 * по доказательству и точный откат блока по undo данным.
 *
 * Блок применяется в порядке "удалить, затем добавить": траты
 * доказываются против леса до блока.
 */

#pragma once

#include "forest.hpp"
#include "proof.hpp"

#include <span>
#include <vector>

namespace arbor::accumulator {

/**
 * @brief Undo данные одного блока
 *
 * Достаточны, чтобы восстановить лес до блока точно.
 */
struct UndoData {
    /// @brief Удалённые позиции (порядок proof.targets)
    std::vector<uint64_t> targets;

    /// @brief Высота дерева каждой удалённой позиции в лесу до блока
    std::vector<uint8_t> target_rows;

    /// @brief Хеши удалённых листьев
    std::vector<Hash256> leaf_hashes;

    /// @brief Хеши братьев из доказательства
    std::vector<Hash256> proof_hashes;

    /// @brief Корни, поглощённые при добавлении новых листьев
    std::vector<Root> absorbed_roots;

    /// @brief Количество добавленных листьев
    uint64_t num_added{0};

    void serialize(core::serialization::WriteStream& out) const;

    [[nodiscard]] static UndoData deserialize(core::serialization::ReadStream& in);

    [[nodiscard]] Bytes serialize() const;

    [[nodiscard]] static Result<UndoData> deserialize(ByteSpan data);

    [[nodiscard]] bool operator==(const UndoData&) const noexcept = default;
};

/**
 * @brief Добавить листья в конец леса
 *
 * Новый лист - узел (0, num_leaves). Пока последний корень является его
 * левым братом, они объединяются и перенос идёт строкой выше.
 *
 * @param forest Исходный лес
 * @param leaves Хеши новых листьев
 * @param absorbed Если не nullptr - сюда пишутся поглощённые корни исходного леса
 * @return MalformedForest при переполнении позиций
 */
[[nodiscard]] Result<Forest> add_leaves(
    const Forest& forest,
    std::span<const Hash256> leaves,
    std::vector<Root>* absorbed = nullptr
);

/**
 * @brief Удалить листья по доказательству
 *
 * Корень каждого затронутого дерева заменяется нетронутыми поддеревьями
 * из доказательства, оставшийся брат удалённого узла становится корнем
 * меньшего дерева.
 *
 * @return Новый лес или причина отказа доказательства
 */
[[nodiscard]] ProofResult<Forest> delete_leaves(
    const Forest& forest,
    const BatchProof& proof,
    std::span<const Hash256> leaf_hashes
);

/**
 * @brief Результат применения блока
 */
struct BlockModification {
    Forest forest;
    UndoData undo;
};

/**
 * @brief Применить блок: удалить потраченные, затем добавить новые
 *
 * @return ProofInvalid (причина в сообщении) или MalformedForest
 */
[[nodiscard]] Result<BlockModification> apply_block(
    const Forest& forest,
    const BatchProof& proof,
    std::span<const Hash256> spent_leaf_hashes,
    std::span<const Hash256> new_leaves
);

/**
 * @brief Откатить блок
 *
 * @param forest Лес после блока
 * @param undo Undo данные блока
 * @return Лес до блока или MalformedForest, если undo не подходит к лесу
 */
[[nodiscard]] Result<Forest> undo_block(const Forest& forest, const UndoData& undo);

} // namespace arbor::accumulator
