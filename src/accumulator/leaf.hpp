/**
 * @file leaf.hpp
 * @brief Листья аккумулятора: коммитменты к UTXO
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/block.hpp"
#include "../core/serialization/stream.hpp"

#include <cstdint>
#include <vector>

namespace arbor::accumulator {

/**
 * @brief Данные одного UTXO, к которым привязан лист
 *
 * Хеш листа: SHA512/256(tag || tag || block_hash || txid || vout ||
 * header_code || txout), где tag = SHA512("UtreexoV1") (64 байта),
 * header_code = height << 1 | is_coinbase.
 */
struct LeafData {
    /// @brief Хеш блока, создавшего выход
    Hash256 block_hash{};

    core::OutPoint prevout;

    /// @brief Высота блока, создавшего выход
    uint32_t height{0};

    bool is_coinbase{false};

    core::TxOut output;

    [[nodiscard]] constexpr uint32_t header_code() const noexcept {
        return (height << 1) | (is_coinbase ? 1u : 0u);
    }

    /**
     * @brief Хеш листа (коммитмент)
     */
    [[nodiscard]] Hash256 hash() const;

    void serialize(core::serialization::WriteStream& out) const;

    [[nodiscard]] static LeafData deserialize(core::serialization::ReadStream& in);

    [[nodiscard]] bool operator==(const LeafData&) const = default;
};

/**
 * @brief Новые листья блока
 *
 * Выходы всех транзакций по порядку, кроме нерасходуемых
 * и потраченных в этом же блоке.
 *
 * @param block Блок
 * @param height Высота блока
 */
[[nodiscard]] std::vector<LeafData> block_leaves(const core::Block& block, uint32_t height);

/**
 * @brief Хеши набора листьев
 */
[[nodiscard]] std::vector<Hash256> leaf_hashes(const std::vector<LeafData>& leaves);

} // namespace arbor::accumulator
