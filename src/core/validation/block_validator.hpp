/**
 * @file block_validator.hpp
 * @brief Контекстно-независимые проверки блока
 *
 * Проверки, не требующие леса: структура транзакций, merkle root,
 * вес, суммы, созревание coinbase, соответствие входов листам
 * доказательства. Результат - хеши потраченных и новых листьев,
 * готовые для apply_block.
 *
 * Проверки без состояния: несколько блоков можно проверять параллельно.
 */

#pragma once

#include "../chain/chain_params.hpp"
#include "../../accumulator/utreexo_block.hpp"

#include <cstdint>
#include <vector>

namespace arbor::core::validation {

/**
 * @brief Результат проверки блока
 */
struct BlockCheck {
    /// @brief Высота, для которой выполнялась проверка
    uint32_t height{0};

    /// @brief Хеши потраченных листьев (порядок proof.targets)
    std::vector<Hash256> spent_hashes;

    /// @brief Хеши новых листьев в порядке добавления
    std::vector<Hash256> new_leaves;

    /// @brief Сумма комиссий блока (сатоши)
    int64_t fees{0};
};

/**
 * @brief Валидатор блоков
 */
class BlockValidator {
public:
    explicit BlockValidator(const ChainParams& params);

    /**
     * @brief Проверить блок на заданной высоте
     *
     * merkle root проверяется отдельно (check_merkle_root).
     *
     * @return InvalidBlock с описанием причины при нарушении
     */
    [[nodiscard]] Result<BlockCheck> check_block(
        const accumulator::UtreexoBlock& block,
        uint32_t height
    ) const;

    /**
     * @brief Проверить, что транзакции соответствуют merkle root заголовка
     */
    [[nodiscard]] Result<void> check_merkle_root(const Block& block) const;

    /**
     * @brief Проверить структуру блока (coinbase, вес)
     */
    [[nodiscard]] Result<void> check_structure(const Block& block) const;

    /**
     * @brief Проверить witness commitment coinbase (BIP141)
     *
     * Обязателен, если в блоке есть транзакции с witness.
     */
    [[nodiscard]] Result<void> check_witness_commitment(
        const Block& block,
        uint32_t height
    ) const;

private:
    const ChainParams& params_;
};

} // namespace arbor::core::validation
