/**
 * @file utreexo_block.hpp
 * @brief Блок вместе с доказательством для потраченных выходов
 */

#pragma once

#include "leaf.hpp"
#include "proof.hpp"
#include "../core/primitives/block.hpp"

#include <vector>

namespace arbor::accumulator {

/**
 * @brief Блок, как его присылает сеть
 *
 * spent_leaves[i] - данные листа на позиции proof.targets[i].
 */
struct UtreexoBlock {
    core::Block block;
    BatchProof proof;
    std::vector<LeafData> spent_leaves;

    [[nodiscard]] Hash256 hash() const noexcept {
        return block.hash();
    }

    [[nodiscard]] Bytes serialize() const;

    /**
     * @return StoreCorruption для некорректных данных
     */
    [[nodiscard]] static Result<UtreexoBlock> deserialize(ByteSpan data);

    [[nodiscard]] bool operator==(const UtreexoBlock&) const = default;
};

} // namespace arbor::accumulator
