/**
 * @file forest.hpp
 * @brief Состояние Utreexo аккумулятора (лес корней)
 *
 * Лес описывается количеством когда-либо добавленных позиций и набором
 * корней. Узел (row, index) покрывает позиции листьев
 * [index << row, (index + 1) << row). Корни - максимальные полные
 * выровненные поддеревья над живыми листьями: удалённая позиция
 * становится дырой, листья никогда не переставляются, позиция 2k
 * всегда в паре с 2k+1.
 *
 * Пока удалений не было, корни соответствуют битам num_leaves
 * (классический лес двоичного счётчика).
 */

#pragma once

#include "../core/types.hpp"
#include "../core/serialization/stream.hpp"

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace arbor::accumulator {

/**
 * @brief Хеш родителя: SHA512/256(left || right)
 */
[[nodiscard]] Hash256 parent_hash(const Hash256& left, const Hash256& right) noexcept;

/**
 * @brief Корень дерева леса
 */
struct Root {
    /// @brief Высота дерева (0 - одиночный лист)
    uint8_t row{0};

    /// @brief Индекс узла внутри строки
    uint64_t index{0};

    Hash256 hash{};

    /// @brief Первая покрываемая позиция
    [[nodiscard]] constexpr uint64_t start() const noexcept {
        return index << row;
    }

    /// @brief Позиция за последней покрываемой
    [[nodiscard]] constexpr uint64_t end() const noexcept {
        return (index + 1) << row;
    }

    [[nodiscard]] constexpr bool covers(uint64_t position) const noexcept {
        return position >= start() && position < end();
    }

    [[nodiscard]] bool operator==(const Root&) const noexcept = default;
};

/**
 * @brief Лес: всё состояние аккумулятора, нужное pruned-ноде
 *
 * Значение без скрытого состояния: операции add/delete принимают
 * лес и возвращают новый.
 */
struct Forest {
    /// @brief Количество позиций, когда-либо добавленных
    uint64_t num_leaves{0};

    /// @brief Корни, отсортированные по первой покрываемой позиции
    std::vector<Root> roots;

    /**
     * @brief Количество живых (неудалённых) листьев
     */
    [[nodiscard]] uint64_t live_leaves() const noexcept;

    /**
     * @brief Найти корень, покрывающий позицию
     *
     * @return Индекс в roots или std::nullopt (позиция удалена или вне леса)
     */
    [[nodiscard]] std::optional<std::size_t> find_root(uint64_t position) const noexcept;

    void serialize(core::serialization::WriteStream& out) const;

    [[nodiscard]] static Forest deserialize(core::serialization::ReadStream& in);

    [[nodiscard]] Bytes serialize() const;

    [[nodiscard]] static Result<Forest> deserialize(ByteSpan data);

    [[nodiscard]] bool operator==(const Forest&) const noexcept = default;
};

/**
 * @brief Проверить внутреннюю согласованность леса
 *
 * Корни отсортированы, не пересекаются, лежат внутри [0, num_leaves),
 * высоты не превышают MAX_FOREST_ROWS.
 *
 * @return MalformedForest при нарушении
 */
[[nodiscard]] Result<void> validate_forest(const Forest& forest);

/**
 * @brief Упорядочить корни по первой покрываемой позиции
 */
void sort_roots(std::vector<Root>& roots);

/**
 * @brief Вычислить лес с нуля по множеству живых листьев
 *
 * @param num_leaves Количество когда-либо добавленных позиций
 * @param leaves Пары (позиция, хеш листа) в любом порядке
 * @return MalformedForest при позиции вне диапазона или повторе
 */
[[nodiscard]] Result<Forest> recompute_forest(
    uint64_t num_leaves,
    std::vector<std::pair<uint64_t, Hash256>> leaves
);

} // namespace arbor::accumulator
