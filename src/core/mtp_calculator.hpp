/**
 * @file mtp_calculator.hpp
 * @brief Вычисление Median Time Past (MTP)
 *
 * Вычисляет MTP по последним 11 блокам для определения
 * минимально допустимого timestamp нового блока (MTP + 1).
 */

#pragma once

#include "constants.hpp"
#include "types.hpp"
#include "primitives/block_header.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace arbor::core {

/**
 * @brief Количество блоков для вычисления MTP
 */
constexpr std::size_t MTP_BLOCK_COUNT = constants::MEDIAN_TIME_SPAN;

/**
 * @brief Калькулятор Median Time Past
 *
 * Кольцевой буфер timestamps последних 11 блоков. Заполняется
 * от старых блоков к новым. Около genesis блоков меньше 11,
 * тогда берётся медиана имеющихся.
 */
class MtpCalculator {
public:
    MtpCalculator() = default;

    /**
     * @brief Добавить timestamp следующего блока
     */
    void push_timestamp(uint32_t timestamp) noexcept;

    /**
     * @brief Добавить заголовок следующего блока
     */
    void push_header(const BlockHeader& header) noexcept;

    void reset() noexcept;

    /**
     * @brief Вычислить MTP
     *
     * @return Медиана сохранённых timestamps или 0, если их нет
     */
    [[nodiscard]] uint32_t get_mtp() const noexcept;

    /**
     * @brief Минимально допустимый timestamp следующего блока (MTP + 1)
     */
    [[nodiscard]] uint32_t get_min_timestamp() const noexcept;

    /**
     * @brief Есть ли полные 11 timestamps
     */
    [[nodiscard]] bool has_sufficient_data() const noexcept;

    [[nodiscard]] std::size_t count() const noexcept;

private:
    std::array<uint32_t, MTP_BLOCK_COUNT> timestamps_{};
    std::size_t count_{0};
    std::size_t head_{0};  // Позиция для следующей записи
};

/**
 * @brief Медиана произвольного набора timestamps
 */
[[nodiscard]] uint32_t median_time_past(std::span<const uint32_t> timestamps);

} // namespace arbor::core
