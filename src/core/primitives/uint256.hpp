/**
 * @file uint256.hpp
 * @brief 256-битное беззнаковое целое число
 *
 * Используется для targets (порогов сложности), сравнения proof-of-work
 * и накопленной работы цепи (chain work).
 */

#pragma once

#include "../types.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace arbor::core {

/**
 * @brief 256-битное беззнаковое целое число
 *
 * Хранится в little-endian формате (как в Bitcoin). Арифметика
 * выполняется по модулю 2^256.
 */
class uint256 {
public:
    /// @brief Размер в байтах
    static constexpr std::size_t SIZE = 32;

    /// @brief Конструктор по умолчанию (нулевое значение)
    constexpr uint256() noexcept : data_{} {}

    /// @brief Конструктор из массива байт
    constexpr explicit uint256(const Hash256& hash) noexcept : data_(hash) {}

    /// @brief Конструктор из 64-битного числа
    constexpr explicit uint256(uint64_t value) noexcept : data_{} {
        for (std::size_t i = 0; i < 8; ++i) {
            data_[i] = static_cast<uint8_t>(value >> (8 * i));
        }
    }

    // =========================================================================
    // Доступ к данным
    // =========================================================================

    [[nodiscard]] constexpr const uint8_t* data() const noexcept {
        return data_.data();
    }

    [[nodiscard]] constexpr uint8_t* data() noexcept {
        return data_.data();
    }

    [[nodiscard]] static constexpr std::size_t size() noexcept {
        return SIZE;
    }

    [[nodiscard]] constexpr uint8_t operator[](std::size_t i) const noexcept {
        return data_[i];
    }

    [[nodiscard]] constexpr uint8_t& operator[](std::size_t i) noexcept {
        return data_[i];
    }

    [[nodiscard]] constexpr const Hash256& to_hash256() const noexcept {
        return data_;
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /**
     * @brief Номер старшего установленного бита + 1 (0 для нуля)
     */
    [[nodiscard]] unsigned bits() const noexcept;

    /**
     * @brief Младшие 64 бита
     */
    [[nodiscard]] uint64_t low64() const noexcept;

    // =========================================================================
    // Арифметика
    // =========================================================================

    uint256& operator+=(const uint256& other) noexcept;
    uint256& operator-=(const uint256& other) noexcept;
    uint256& operator*=(uint32_t factor) noexcept;

    /**
     * @brief Деление (деление на ноль даёт ноль)
     */
    uint256& operator/=(const uint256& divisor) noexcept;

    uint256& operator<<=(unsigned shift) noexcept;
    uint256& operator>>=(unsigned shift) noexcept;

    [[nodiscard]] uint256 operator~() const noexcept;

    [[nodiscard]] friend uint256 operator+(uint256 a, const uint256& b) noexcept { return a += b; }
    [[nodiscard]] friend uint256 operator-(uint256 a, const uint256& b) noexcept { return a -= b; }
    [[nodiscard]] friend uint256 operator*(uint256 a, uint32_t b) noexcept { return a *= b; }
    [[nodiscard]] friend uint256 operator/(uint256 a, const uint256& b) noexcept { return a /= b; }
    [[nodiscard]] friend uint256 operator<<(uint256 a, unsigned s) noexcept { return a <<= s; }
    [[nodiscard]] friend uint256 operator>>(uint256 a, unsigned s) noexcept { return a >>= s; }

    // =========================================================================
    // Сравнение
    // =========================================================================

    /**
     * @brief Трёхстороннее сравнение как чисел (старшие байты сначала)
     */
    [[nodiscard]] constexpr std::strong_ordering operator<=>(
        const uint256& other
    ) const noexcept {
        for (std::size_t i = SIZE; i-- > 0;) {
            if (data_[i] < other.data_[i]) return std::strong_ordering::less;
            if (data_[i] > other.data_[i]) return std::strong_ordering::greater;
        }
        return std::strong_ordering::equal;
    }

    [[nodiscard]] constexpr bool operator==(const uint256& other) const noexcept {
        return data_ == other.data_;
    }

    // =========================================================================
    // Строковое представление
    // =========================================================================

    /**
     * @brief Преобразовать в hex строку (big-endian, как в explorer)
     */
    [[nodiscard]] std::string to_hex() const;

    /**
     * @brief Создать из hex строки (big-endian)
     *
     * @throws std::invalid_argument при некорректной строке
     */
    [[nodiscard]] static uint256 from_hex(std::string_view hex);

    [[nodiscard]] static constexpr uint256 zero() noexcept {
        return uint256{};
    }

    [[nodiscard]] static constexpr uint256 one() noexcept {
        return uint256{1ULL};
    }

private:
    using Limbs = std::array<uint64_t, 4>;

    [[nodiscard]] Limbs to_limbs() const noexcept;
    void from_limbs(const Limbs& limbs) noexcept;

    Hash256 data_;
};

/**
 * @brief Работа, ожидаемая для нахождения хеша не выше target
 *
 * work = 2^256 / (target + 1), вычисляется как ~target / (target + 1) + 1.
 */
[[nodiscard]] uint256 work_from_target(const uint256& target) noexcept;

/**
 * @brief Hex строка хеша в отображаемом (reversed) виде
 */
[[nodiscard]] std::string hash_to_hex(const Hash256& hash);

/**
 * @brief Разобрать hex строку хеша в отображаемом (reversed) виде
 *
 * @throws std::invalid_argument при некорректной строке
 */
[[nodiscard]] Hash256 hash_from_hex(std::string_view hex);

} // namespace arbor::core
