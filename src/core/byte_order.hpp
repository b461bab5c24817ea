/**
 * @file byte_order.hpp
 * @brief Функции для работы с порядком байт (endianness)
 *
 * Bitcoin использует little-endian для числовых полей сериализации.
 * Ключи хранилища пишутся в big-endian, чтобы лексикографический
 * порядок ключей совпадал с порядком высот.
 */

#pragma once

#include <array>
#include <bit>
#include <cstdint>
#include <cstring>
#include <span>

namespace arbor {

/**
 * @brief Преобразовать значение хоста в little-endian (и обратно)
 */
template<typename T>
[[nodiscard]] constexpr T to_little_endian(T value) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        return value;
    } else {
        return std::byteswap(value);
    }
}

/**
 * @brief Преобразовать значение хоста в big-endian (и обратно)
 */
template<typename T>
[[nodiscard]] constexpr T to_big_endian(T value) noexcept {
    if constexpr (std::endian::native == std::endian::big) {
        return value;
    } else {
        return std::byteswap(value);
    }
}

// =============================================================================
// Little-endian
// =============================================================================

inline void write_le16(uint8_t* dest, uint16_t value) noexcept {
    value = to_little_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

inline void write_le32(uint8_t* dest, uint32_t value) noexcept {
    value = to_little_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

inline void write_le64(uint8_t* dest, uint64_t value) noexcept {
    value = to_little_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

[[nodiscard]] inline uint16_t read_le16(const uint8_t* src) noexcept {
    uint16_t value;
    std::memcpy(&value, src, sizeof(value));
    return to_little_endian(value);
}

[[nodiscard]] inline uint32_t read_le32(const uint8_t* src) noexcept {
    uint32_t value;
    std::memcpy(&value, src, sizeof(value));
    return to_little_endian(value);
}

[[nodiscard]] inline uint64_t read_le64(const uint8_t* src) noexcept {
    uint64_t value;
    std::memcpy(&value, src, sizeof(value));
    return to_little_endian(value);
}

// =============================================================================
// Big-endian
// =============================================================================

inline void write_be32(uint8_t* dest, uint32_t value) noexcept {
    value = to_big_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

[[nodiscard]] inline uint32_t read_be32(const uint8_t* src) noexcept {
    uint32_t value;
    std::memcpy(&value, src, sizeof(value));
    return to_big_endian(value);
}

inline void write_be64(uint8_t* dest, uint64_t value) noexcept {
    value = to_big_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

[[nodiscard]] inline uint64_t read_be64(const uint8_t* src) noexcept {
    uint64_t value;
    std::memcpy(&value, src, sizeof(value));
    return to_big_endian(value);
}

// =============================================================================
// Реверс массива байт (для хешей)
// =============================================================================

/**
 * @brief Создать реверсированную копию массива байт
 *
 * Block hash в Bitcoin отображается в обратном порядке байт.
 */
template<std::size_t N>
[[nodiscard]] constexpr std::array<uint8_t, N> reverse_copy(
    const std::array<uint8_t, N>& input
) noexcept {
    std::array<uint8_t, N> result{};
    for (std::size_t i = 0; i < N; ++i) {
        result[i] = input[N - 1 - i];
    }
    return result;
}

} // namespace arbor
