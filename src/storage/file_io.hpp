/**
 * @file file_io.hpp
 * @brief Обёртка над POSIX файлом для flat-file backend
 *
 * Запись только в конец (append), чтение через pread, явный fsync.
 * errno EINTR/EAGAIN/EBUSY считаются временными (StoreIoTransient).
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <filesystem>

namespace arbor::storage {

/**
 * @brief Файл, открытый на чтение и дозапись
 */
class File {
public:
    File() = default;
    ~File();

    File(File&& other) noexcept;
    File& operator=(File&& other) noexcept;

    File(const File&) = delete;
    File& operator=(const File&) = delete;

    /**
     * @brief Открыть файл, создав при отсутствии
     */
    [[nodiscard]] static Result<File> open(const std::filesystem::path& path);

    /**
     * @brief Дописать данные в конец файла
     *
     * @return Смещение начала записанных данных
     */
    [[nodiscard]] Result<uint64_t> append(ByteSpan data);

    /**
     * @brief Прочитать ровно data.size() байт со смещения
     */
    [[nodiscard]] Result<void> read_at(uint64_t offset, std::span<uint8_t> data) const;

    [[nodiscard]] Result<void> sync();

    /**
     * @brief Обрезать файл до размера
     */
    [[nodiscard]] Result<void> truncate(uint64_t size);

    [[nodiscard]] uint64_t size() const noexcept { return size_; }

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    void close() noexcept;

private:
    int fd_{-1};
    uint64_t size_{0};
    std::filesystem::path path_;
};

/**
 * @brief Ошибка по errno с классификацией временных ошибок
 */
[[nodiscard]] Error errno_error(int error, std::string_view what, const std::filesystem::path& path);

/**
 * @brief Атомарно заменить файл содержимым (tmp + fsync + rename)
 */
[[nodiscard]] Result<void> write_file_atomic(const std::filesystem::path& path, ByteSpan data);

/**
 * @brief Прочитать файл целиком
 *
 * @return StoreNotFound, если файла нет
 */
[[nodiscard]] Result<Bytes> read_file(const std::filesystem::path& path);

} // namespace arbor::storage
