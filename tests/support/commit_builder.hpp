/**
 * @file commit_builder.hpp
 * @brief Синтетические коммиты блоков для тестов хранилища
 */

#pragma once

#include "accumulator/mem_forest.hpp"
#include "storage/chain_store.hpp"

#include <cstdint>
#include <vector>

namespace arbor::test {

/**
 * @brief Строит цепочку BlockCommit без майнинга
 *
 * Каждый блок добавляет два листа и тратит самый старый живой лист.
 * Копия построителя продолжает независимую ветку.
 */
class CommitBuilder {
public:
    /**
     * @brief Следующий коммит ветки
     *
     * @param tag Отличает блоки разных веток на одной высоте
     */
    [[nodiscard]] storage::BlockCommit next(uint8_t tag = 0);

    /**
     * @brief count коммитов подряд
     */
    [[nodiscard]] std::vector<storage::BlockCommit> chain(uint32_t count, uint8_t tag = 0);

    [[nodiscard]] uint32_t next_height() const noexcept {
        return height_;
    }

private:
    accumulator::MemForest forest_;
    accumulator::Forest roots_;
    Hash256 prev_{};
    core::uint256 work_;
    uint32_t height_{0};
    uint64_t leaf_counter_{0};
};

} // namespace arbor::test
