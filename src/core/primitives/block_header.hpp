/**
 * @file block_header.hpp
 * @brief 80-байтный заголовок блока Bitcoin
 *
 * Заголовок, compact-представление target и работа (chain work),
 * которую заголовок добавляет к цепи.
 */

#pragma once

#include "../constants.hpp"
#include "../types.hpp"
#include "uint256.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace arbor::core {

/// @brief Размер заголовка блока в байтах
inline constexpr std::size_t BLOCK_HEADER_SIZE = constants::BLOCK_HEADER_SIZE;

/**
 * @brief Заголовок блока Bitcoin (80 байт)
 *
 * Структура:
 * - version:     4 байта (int32_t, little-endian)
 * - prev_hash:   32 байта (uint256, little-endian)
 * - merkle_root: 32 байта (uint256, little-endian)
 * - timestamp:   4 байта (uint32_t, little-endian)
 * - bits:        4 байта (uint32_t, little-endian) - compact target
 * - nonce:       4 байта (uint32_t, little-endian)
 */
struct BlockHeader {
    /// @brief Версия блока
    int32_t version{0};

    /// @brief Хеш предыдущего блока
    Hash256 prev_hash{};

    /// @brief Корень Merkle дерева транзакций
    Hash256 merkle_root{};

    /// @brief Временная метка (Unix timestamp)
    uint32_t timestamp{0};

    /// @brief Compact target (nBits)
    uint32_t bits{0};

    /// @brief Nonce для proof-of-work
    uint32_t nonce{0};

    // =========================================================================
    // Сериализация
    // =========================================================================

    /**
     * @brief Сериализовать заголовок в 80 байт
     */
    [[nodiscard]] std::array<uint8_t, BLOCK_HEADER_SIZE> serialize() const noexcept;

    /**
     * @brief Десериализовать заголовок из 80 байт
     *
     * @param data Указатель на данные (минимум 80 байт)
     */
    [[nodiscard]] static BlockHeader deserialize(const uint8_t* data) noexcept;

    /**
     * @brief Десериализовать заголовок из span с проверкой длины
     */
    [[nodiscard]] static Result<BlockHeader> deserialize(ByteSpan data);

    // =========================================================================
    // Хеширование
    // =========================================================================

    /**
     * @brief Вычислить хеш заголовка (double SHA256)
     */
    [[nodiscard]] Hash256 hash() const noexcept;

    /**
     * @brief Вычислить хеш как uint256
     */
    [[nodiscard]] uint256 hash_uint256() const noexcept;

    // =========================================================================
    // Target и работа
    // =========================================================================

    /**
     * @brief Получить target из compact bits
     */
    [[nodiscard]] uint256 get_target() const noexcept;

    /**
     * @brief Проверить, что хеш не превышает target
     */
    [[nodiscard]] bool check_pow() const noexcept;

    /**
     * @brief Работа, которую блок добавляет к цепи
     *
     * Для некорректного bits (отрицательный, переполнение, ноль) работа равна нулю.
     */
    [[nodiscard]] uint256 get_block_proof() const noexcept;

    /**
     * @brief Вычислить сложность (относительно Bitcoin genesis)
     */
    [[nodiscard]] double get_difficulty() const noexcept;

    [[nodiscard]] bool operator==(const BlockHeader&) const noexcept = default;
};

/**
 * @brief Результат декодирования compact bits
 */
struct CompactTarget {
    uint256 target;
    bool negative{false};
    bool overflow{false};
};

/**
 * @brief Декодировать compact bits с флагами знака и переполнения
 */
[[nodiscard]] CompactTarget decode_compact(uint32_t bits) noexcept;

/**
 * @brief Преобразовать compact bits в 256-битный target
 *
 * @return Нулевой target для отрицательных или переполненных значений
 */
[[nodiscard]] uint256 bits_to_target(uint32_t bits) noexcept;

/**
 * @brief Преобразовать 256-битный target в compact bits
 */
[[nodiscard]] uint32_t target_to_bits(const uint256& target) noexcept;

/**
 * @brief Вычислить сложность из compact bits
 */
[[nodiscard]] double bits_to_difficulty(uint32_t bits) noexcept;

} // namespace arbor::core
