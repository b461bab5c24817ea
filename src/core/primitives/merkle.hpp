/**
 * @file merkle.hpp
 * @brief Merkle дерево транзакций блока
 *
 * Корень используется для проверки, что тело блока соответствует
 * заголовку (merkle_root) и witness commitment в coinbase.
 */

#pragma once

#include "../types.hpp"

#include <vector>

namespace arbor::core {

/**
 * @brief Результат вычисления Merkle root
 */
struct MerkleRoot {
    /// @brief Корень дерева
    Hash256 root{};

    /// @brief На каком-то уровне совпали два соседних хеша
    ///
    /// Такое дерево допускает второй список транзакций с тем же корнем
    /// (дублирование хвоста), поэтому блок с mutated=true отклоняется.
    bool mutated{false};
};

/**
 * @brief Вычислить Merkle root из списка хешей
 *
 * При нечётном количестве элементов на уровне последний дублируется.
 *
 * @param leaves Листья дерева
 */
[[nodiscard]] MerkleRoot compute_merkle_root(std::vector<Hash256> leaves);

/**
 * @brief Объединить два хеша для Merkle дерева
 *
 * @return SHA256d(left || right)
 */
[[nodiscard]] Hash256 merkle_hash(
    const Hash256& left,
    const Hash256& right
) noexcept;

/**
 * @brief Вычислить witness Merkle root
 *
 * wtxid coinbase заменяется нулевым хешем.
 *
 * @param wtxids Witness transaction IDs (первый - coinbase)
 */
[[nodiscard]] Hash256 compute_witness_merkle_root(
    const std::vector<Hash256>& wtxids
);

} // namespace arbor::core
