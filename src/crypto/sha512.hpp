/**
 * @file sha512.hpp
 * @brief SHA512 и SHA512/256 интерфейс
 *
 * SHA512/256 - хеш аккумулятора Utreexo: leaf hash и родительские узлы
 * леса. SHA512 нужен только для тега leaf hash.
 */

#pragma once

#include "../core/types.hpp"

#include <array>
#include <cstdint>

namespace arbor::crypto {

/**
 * @brief Полный SHA512 хеш (64 байта)
 */
using Hash512 = std::array<uint8_t, 64>;

/**
 * @brief SHA512 состояние (8 x 64-bit слов)
 */
using Sha512State = std::array<uint64_t, 8>;

/**
 * @brief Функция сжатия SHA512 для одного 128-байтного блока
 */
void sha512_transform(Sha512State& state, const uint8_t* block) noexcept;

namespace detail {

/**
 * @brief Общее ядро SHA512 и его усечённых вариантов
 *
 * Варианты отличаются только начальным состоянием и длиной вывода.
 */
class Sha512Engine {
public:
    explicit Sha512Engine(const Sha512State& init) noexcept;

    void write(ByteSpan data) noexcept;

    /**
     * @brief Дописать padding и длину сообщения
     *
     * После вызова state() содержит итоговый хеш.
     */
    void pad() noexcept;

    [[nodiscard]] const Sha512State& state() const noexcept {
        return state_;
    }

    void reset() noexcept;

private:
    Sha512State init_;
    Sha512State state_;
    std::array<uint8_t, 128> buffer_{};
    std::size_t buffered_{0};
    uint64_t total_bytes_{0};
};

} // namespace detail

/**
 * @brief Потоковый SHA512
 */
class Sha512 {
public:
    Sha512() noexcept;

    Sha512& write(ByteSpan data) noexcept;

    /**
     * @brief Завершить вычисление; хешер сбрасывается
     */
    [[nodiscard]] Hash512 finalize() noexcept;

    void reset() noexcept;

private:
    detail::Sha512Engine engine_;
};

/**
 * @brief Потоковый SHA512/256 (FIPS 180-4, 5.3.6)
 *
 * @code
 * Sha512_256 hasher;
 * hasher.write(left).write(right);
 * Hash256 parent = hasher.finalize();
 * @endcode
 */
class Sha512_256 {
public:
    Sha512_256() noexcept;

    Sha512_256& write(ByteSpan data) noexcept;

    /**
     * @brief Завершить вычисление; хешер сбрасывается
     */
    [[nodiscard]] Hash256 finalize() noexcept;

    void reset() noexcept;

private:
    detail::Sha512Engine engine_;
};

[[nodiscard]] Hash512 sha512(ByteSpan data) noexcept;

[[nodiscard]] Hash256 sha512_256(ByteSpan data) noexcept;

} // namespace arbor::crypto
