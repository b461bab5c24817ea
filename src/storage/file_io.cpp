/**
 * @file file_io.cpp
 * @brief Реализация POSIX файловых операций
 */

#include "file_io.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/stat.h>
#include <unistd.h>

namespace arbor::storage {

Error errno_error(int error, std::string_view what, const std::filesystem::path& path) {
    const bool transient = error == EINTR || error == EAGAIN || error == EBUSY;
    return Error{
        transient ? ErrorCode::StoreIoTransient : ErrorCode::StoreIoError,
        std::format("{} {}: {}", what, path.string(), std::strerror(error))
    };
}

namespace {

/// @brief fsync каталога, чтобы rename и создание файлов пережили сбой
[[nodiscard]] Result<void> sync_directory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return std::unexpected(errno_error(errno, "open dir", dir));
    }
    const int rc = ::fsync(fd);
    const int error = errno;
    ::close(fd);
    if (rc != 0) {
        return std::unexpected(errno_error(error, "fsync dir", dir));
    }
    return {};
}

} // namespace

// =============================================================================
// File
// =============================================================================

File::~File() {
    close();
}

File::File(File&& other) noexcept
    : fd_(other.fd_)
    , size_(other.size_)
    , path_(std::move(other.path_))
{
    other.fd_ = -1;
    other.size_ = 0;
}

File& File::operator=(File&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        size_ = other.size_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
        other.size_ = 0;
    }
    return *this;
}

void File::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<File> File::open(const std::filesystem::path& path) {
    File file;
    file.path_ = path;
    file.fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (file.fd_ < 0) {
        return std::unexpected(errno_error(errno, "open", path));
    }

    struct stat st{};
    if (::fstat(file.fd_, &st) != 0) {
        return std::unexpected(errno_error(errno, "fstat", path));
    }
    file.size_ = static_cast<uint64_t>(st.st_size);
    return file;
}

Result<uint64_t> File::append(ByteSpan data) {
    const uint64_t start = size_;
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::pwrite(fd_, data.data() + written, data.size() - written,
                             static_cast<off_t>(start + written));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(errno_error(errno, "write", path_));
        }
        written += static_cast<std::size_t>(n);
    }
    size_ = start + data.size();
    return start;
}

Result<void> File::read_at(uint64_t offset, std::span<uint8_t> data) const {
    if (offset + data.size() > size_) {
        return Err<void>(ErrorCode::StoreCorruption,
                         std::format("Чтение за концом файла {} (смещение {}, {} байт)",
                                     path_.string(), offset, data.size()));
    }
    std::size_t done = 0;
    while (done < data.size()) {
        ssize_t n = ::pread(fd_, data.data() + done, data.size() - done,
                            static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(errno_error(errno, "read", path_));
        }
        if (n == 0) {
            return Err<void>(ErrorCode::StoreCorruption,
                             std::format("Неожиданный конец файла {}", path_.string()));
        }
        done += static_cast<std::size_t>(n);
    }
    return {};
}

Result<void> File::sync() {
    if (::fsync(fd_) != 0) {
        return std::unexpected(errno_error(errno, "fsync", path_));
    }
    return {};
}

Result<void> File::truncate(uint64_t size) {
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        return std::unexpected(errno_error(errno, "truncate", path_));
    }
    size_ = size;
    return sync();
}

// =============================================================================
// Целые файлы
// =============================================================================

Result<void> write_file_atomic(const std::filesystem::path& path, ByteSpan data) {
    auto tmp_path = path;
    tmp_path += ".tmp";

    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);

    {
        auto tmp = File::open(tmp_path);
        if (!tmp) {
            return std::unexpected(tmp.error());
        }
        if (auto written = tmp->append(data); !written) {
            return std::unexpected(written.error());
        }
        if (auto synced = tmp->sync(); !synced) {
            return synced;
        }
    }

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        return std::unexpected(errno_error(errno, "rename", tmp_path));
    }
    return sync_directory(path.parent_path().empty() ? std::filesystem::path(".") : path.parent_path());
}

Result<Bytes> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Err<Bytes>(ErrorCode::StoreNotFound,
                          std::format("Файл не найден: {}", path.string()));
    }
    auto file = File::open(path);
    if (!file) {
        return std::unexpected(file.error());
    }
    Bytes data(file->size());
    if (auto result = file->read_at(0, data); !result) {
        return std::unexpected(result.error());
    }
    return data;
}

} // namespace arbor::storage
