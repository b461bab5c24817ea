/**
 * @file block_index.hpp
 * @brief Дерево известных заголовков и активная цепь
 *
 * Хранит все принятые заголовки (всех веток) с высотой, накопленной
 * работой и статусом, а также хеши активной цепи по высоте.
 *
 * @note Не потокобезопасен: принадлежит ChainState и используется
 *       под его мьютексом.
 */

#pragma once

#include "../core/types.hpp"
#include "../storage/chain_store.hpp"

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace arbor::chain {

/**
 * @brief Индекс заголовков
 */
class BlockIndex {
public:
    /**
     * @brief Запись индекса
     */
    struct Entry {
        storage::StoredHeader record;

        Hash256 hash{};

        /// @brief Порядковый номер появления (разрешение ничьих по работе)
        uint64_t sequence{0};
    };

    /**
     * @brief Добавить заголовок
     *
     * Родитель должен быть в индексе (кроме genesis на высоте 0).
     * Повторное добавление обновляет запись, сохраняя порядок появления.
     */
    [[nodiscard]] Result<void> insert(const storage::StoredHeader& record);

    [[nodiscard]] const Entry* find(const Hash256& hash) const;

    [[nodiscard]] bool contains(const Hash256& hash) const {
        return entries_.contains(hash);
    }

    void set_status(const Hash256& hash, storage::HeaderStatus status);

    /**
     * @brief Предок заголовка на высоте
     */
    [[nodiscard]] const Entry* ancestor(const Hash256& hash, uint32_t height) const;

    /**
     * @brief Последний общий предок двух заголовков
     */
    [[nodiscard]] const Entry* find_fork(const Hash256& a, const Hash256& b) const;

    /**
     * @brief Является ли ancestor предком hash (или им самим)
     */
    [[nodiscard]] bool is_ancestor(const Hash256& ancestor, const Hash256& hash) const;

    /**
     * @brief Все потомки заголовка (без него самого)
     */
    [[nodiscard]] std::vector<Hash256> descendants(const Hash256& hash) const;

    // =========================================================================
    // Активная цепь
    // =========================================================================

    /**
     * @brief Сделать заголовок вершиной активной цепи
     */
    void set_active_tip(const Hash256& hash);

    [[nodiscard]] std::optional<Hash256> active_at(uint32_t height) const;

    [[nodiscard]] bool is_active(const Hash256& hash) const;

    [[nodiscard]] const Entry* active_tip() const;

    [[nodiscard]] uint32_t active_height() const noexcept {
        return active_.empty() ? 0 : static_cast<uint32_t>(active_.size() - 1);
    }

    // =========================================================================
    // Лучший заголовок
    // =========================================================================

    /**
     * @brief Заголовок с наибольшей работой среди неотклонённых
     *
     * При равной работе выигрывает появившийся раньше.
     */
    [[nodiscard]] const Entry* best_header() const;

    [[nodiscard]] std::size_t size() const noexcept {
        return entries_.size();
    }

    void clear();

    /**
     * @brief Предпочтительнее ли candidate: больше работы, при равенстве - раньше появился
     */
    [[nodiscard]] static bool better(const Entry& candidate, const Entry& current) noexcept;

private:
    void recompute_best();

    std::unordered_map<Hash256, Entry> entries_;

    // Хеши активной цепи по высоте
    std::vector<Hash256> active_;

    std::optional<Hash256> best_;
    uint64_t next_sequence_{0};
};

} // namespace arbor::chain
