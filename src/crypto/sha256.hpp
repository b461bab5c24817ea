/**
 * @file sha256.hpp
 * @brief SHA256 интерфейс
 *
 * Предоставляет:
 * - Потоковый хешер Sha256 (write/finalize) для хеширования составных
 *   сообщений без промежуточной конкатенации
 * - Однократные функции sha256 и sha256d (block hash, txid, checksum)
 */

#pragma once

#include "../core/types.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace arbor::crypto {

/**
 * @brief SHA256 состояние (8 x 32-bit слов)
 */
using Sha256State = std::array<uint32_t, 8>;

/**
 * @brief Функция сжатия SHA256 для одного 64-байтного блока
 *
 * @param state Состояние хеша (будет модифицировано)
 * @param block Указатель на 64 байта данных
 */
void sha256_transform(Sha256State& state, const uint8_t* block) noexcept;

/**
 * @brief Потоковый SHA256
 *
 * Пример:
 * @code
 * Sha256 hasher;
 * hasher.write(left).write(right);
 * Hash256 parent = hasher.finalize();
 * @endcode
 */
class Sha256 {
public:
    Sha256() noexcept;

    /**
     * @brief Добавить данные к сообщению
     */
    Sha256& write(ByteSpan data) noexcept;

    /**
     * @brief Завершить вычисление и получить хеш
     *
     * После вызова хешер сбрасывается в начальное состояние.
     */
    [[nodiscard]] Hash256 finalize() noexcept;

    /**
     * @brief Сбросить состояние
     */
    void reset() noexcept;

private:
    Sha256State state_;
    std::array<uint8_t, 64> buffer_{};
    std::size_t buffered_{0};
    uint64_t total_bytes_{0};
};

/**
 * @brief Вычислить SHA256 хеш данных произвольной длины
 */
[[nodiscard]] Hash256 sha256(ByteSpan data) noexcept;

/**
 * @brief Вычислить SHA256d = SHA256(SHA256(data))
 *
 * Используется в Bitcoin для block hash, txid и Merkle tree.
 */
[[nodiscard]] Hash256 sha256d(ByteSpan data) noexcept;

} // namespace arbor::crypto
