/**
 * @file stream.hpp
 * @brief Потоки чтения/записи для сериализации
 *
 * Бинарный формат Bitcoin (little-endian, CompactSize) для транзакций,
 * блоков и записей хранилища.
 */

#pragma once

#include "../types.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace arbor::core::serialization {

/**
 * @brief Исключение при ошибке чтения
 *
 * Внутри кодеков ошибки выбрасываются, на границе модуля
 * преобразуются в Result через decode().
 */
class StreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Поток для чтения бинарных данных
 */
class ReadStream {
public:
    explicit ReadStream(ByteSpan data) noexcept
        : data_(data), pos_(0) {}

    explicit ReadStream(const Bytes& data) noexcept
        : data_(data), pos_(0) {}

    // =========================================================================
    // Чтение примитивов
    // =========================================================================

    [[nodiscard]] uint8_t read_u8();
    [[nodiscard]] uint16_t read_u16_le();
    [[nodiscard]] uint32_t read_u32_le();
    [[nodiscard]] uint64_t read_u64_le();
    [[nodiscard]] int32_t read_i32_le();
    [[nodiscard]] int64_t read_i64_le();

    /**
     * @brief Прочитать 8 байт (big-endian)
     */
    [[nodiscard]] uint64_t read_u64_be();

    /**
     * @brief Прочитать VarInt (CompactSize)
     *
     * @throws StreamError для неканонической кодировки
     */
    [[nodiscard]] uint64_t read_varint();

    /**
     * @brief Прочитать массив байт фиксированной длины
     */
    [[nodiscard]] Bytes read_bytes(std::size_t count);

    /**
     * @brief Прочитать массив байт с префиксом длины (VarInt)
     */
    [[nodiscard]] Bytes read_var_bytes(std::size_t max_size = 32 * 1024 * 1024);

    [[nodiscard]] Hash256 read_hash256();

    /**
     * @brief Прочитать VarInt-счётчик элементов с ограничением сверху
     */
    [[nodiscard]] std::size_t read_count(std::size_t max_count);

    // =========================================================================
    // Состояние
    // =========================================================================

    [[nodiscard]] std::size_t remaining() const noexcept;
    [[nodiscard]] std::size_t position() const noexcept;
    [[nodiscard]] bool eof() const noexcept;
    void skip(std::size_t count);

private:
    void ensure_available(std::size_t count);

    ByteSpan data_;
    std::size_t pos_;
};

/**
 * @brief Поток для записи бинарных данных
 */
class WriteStream {
public:
    WriteStream() = default;

    /**
     * @brief Создать поток с предварительно выделенной памятью
     */
    explicit WriteStream(std::size_t reserve_size);

    // =========================================================================
    // Запись примитивов
    // =========================================================================

    void write_u8(uint8_t value);
    void write_u16_le(uint16_t value);
    void write_u32_le(uint32_t value);
    void write_u64_le(uint64_t value);
    void write_i32_le(int32_t value);
    void write_i64_le(int64_t value);
    void write_u64_be(uint64_t value);
    void write_varint(uint64_t value);
    void write_bytes(ByteSpan data);

    /**
     * @brief Записать массив байт с префиксом длины (VarInt)
     */
    void write_var_bytes(ByteSpan data);

    void write_hash256(const Hash256& hash);

    // =========================================================================
    // Результат
    // =========================================================================

    [[nodiscard]] const Bytes& data() const noexcept;
    [[nodiscard]] Bytes take_data() noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    void clear();

private:
    Bytes data_;
};

// =============================================================================
// Утилиты
// =============================================================================

/**
 * @brief Размер VarInt для данного значения
 */
[[nodiscard]] inline std::size_t varint_size(uint64_t value) noexcept {
    if (value < 0xFD) return 1;
    if (value <= 0xFFFF) return 3;
    if (value <= 0xFFFFFFFF) return 5;
    return 9;
}

/**
 * @brief Выполнить декодер, преобразовав StreamError в Result
 *
 * Декодер обязан прочитать данные полностью: остаток считается ошибкой.
 *
 * @param data Входные данные
 * @param code Код ошибки для некорректных данных
 * @param fn Функция (ReadStream&) -> T
 */
template<typename Fn>
[[nodiscard]] auto decode(ByteSpan data, ErrorCode code, Fn&& fn)
    -> Result<decltype(fn(std::declval<ReadStream&>()))>
{
    using T = decltype(fn(std::declval<ReadStream&>()));
    ReadStream stream(data);
    try {
        T value = std::forward<Fn>(fn)(stream);
        if (!stream.eof()) {
            return Err<T>(code, "Лишние байты после данных: " +
                                std::to_string(stream.remaining()));
        }
        return value;
    } catch (const StreamError& e) {
        return Err<T>(code, e.what());
    }
}

} // namespace arbor::core::serialization
