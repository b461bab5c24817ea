/**
 * @file pow_validator.hpp
 * @brief Валидатор Proof-of-Work
 *
 * Проверяет корректность proof-of-work и вычисляет требуемую
 * сложность следующего блока (пересчёт каждые 2016 блоков).
 */

#pragma once

#include "../chain/chain_params.hpp"
#include "../primitives/block_header.hpp"

#include <cstdint>
#include <functional>
#include <optional>

namespace arbor::core::validation {

/**
 * @brief Заголовок с высотой (для обхода предков)
 */
struct HeaderAtHeight {
    BlockHeader header;
    uint32_t height{0};
};

/**
 * @brief Получить предка текущего заголовка на заданной высоте
 *
 * Возвращает std::nullopt, если такого предка нет.
 */
using AncestorLookup = std::function<std::optional<HeaderAtHeight>(uint32_t height)>;

/**
 * @brief Валидатор Proof-of-Work
 *
 * Проверяет:
 * - Корректность nBits (не отрицательный, без переполнения, не выше pow_limit)
 * - hash(header) <= target
 * - Правила пересчёта сложности
 */
class PowValidator {
public:
    /**
     * @brief Создать валидатор для сети
     */
    explicit PowValidator(const ChainParams& params);

    /**
     * @brief Проверить proof-of-work заголовка
     *
     * @return true если bits корректны и hash <= target
     */
    [[nodiscard]] bool validate_pow(const BlockHeader& header) const noexcept;

    /**
     * @brief Проверить валидность nBits
     */
    [[nodiscard]] bool validate_bits(uint32_t bits) const noexcept;

    /**
     * @brief Требуемый nBits для блока, следующего за prev
     *
     * @param prev Предыдущий заголовок и его высота
     * @param new_timestamp Timestamp нового блока (для min-difficulty правила)
     * @param ancestor Доступ к предкам prev по высоте
     */
    [[nodiscard]] uint32_t next_work_required(
        const HeaderAtHeight& prev,
        uint32_t new_timestamp,
        const AncestorLookup& ancestor
    ) const;

    /**
     * @brief Вычислить следующий target по результатам периода
     *
     * @param last_bits Текущий compact target
     * @param actual_timespan Фактическое время периода (секунды)
     * @return Новый compact target
     */
    [[nodiscard]] uint32_t calculate_next_target(
        uint32_t last_bits,
        int64_t actual_timespan
    ) const noexcept;

    /**
     * @brief Ожидаемая длительность периода пересчёта (секунды)
     */
    [[nodiscard]] int64_t get_expected_timespan() const noexcept;

private:
    const ChainParams& params_;
};

} // namespace arbor::core::validation
