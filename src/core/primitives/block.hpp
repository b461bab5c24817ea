/**
 * @file block.hpp
 * @brief Полный блок: заголовок и транзакции
 */

#pragma once

#include "block_header.hpp"
#include "merkle.hpp"
#include "transaction.hpp"

#include <vector>

namespace arbor::core {

/**
 * @brief Блок Bitcoin
 */
struct Block {
    BlockHeader header;
    std::vector<Transaction> transactions;

    [[nodiscard]] Hash256 hash() const noexcept {
        return header.hash();
    }

    /**
     * @brief Сериализовать блок (транзакции с witness)
     */
    [[nodiscard]] Bytes serialize() const;

    /**
     * @brief Десериализовать блок
     */
    [[nodiscard]] static Result<Block> deserialize(ByteSpan data);

    /**
     * @brief Merkle root по txid транзакций
     */
    [[nodiscard]] MerkleRoot compute_merkle_root() const;

    /// @brief Вес блока
    [[nodiscard]] std::size_t weight() const;

    [[nodiscard]] bool operator==(const Block&) const = default;
};

} // namespace arbor::core
