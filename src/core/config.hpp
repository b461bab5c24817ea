/**
 * @file config.hpp
 * @brief Конфигурация arbor
 *
 * Загрузка и парсинг конфигурации из TOML файла.
 *
 * Пример конфигурации (arbor.toml):
 * @code
 * [chain]
 * network = "mainnet"
 *
 * [storage]
 * backend = "leveldb"          # или "flatfile"
 * data_dir = "./arbor-data"
 * sync_writes = true
 * checkpoint_interval = 64
 * io_retry_attempts = 3
 * io_retry_backoff_ms = 50
 * leveldb_cache_mb = 32
 *
 * [pruning]
 * enabled = true
 * retention_window = 288
 * max_reorg_depth = 100
 * prune_interval = 10
 *
 * [validation]
 * script_checks = true
 * max_future_block_time = 7200
 * verify_workers = 2
 *
 * [logging]
 * level = "info"
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace arbor {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Выбор сети
 */
struct ChainConfig {
    /// @brief "mainnet", "testnet", "signet" или "regtest"
    std::string network = "mainnet";
};

/**
 * @brief Тип backend хранилища
 */
enum class StorageBackend {
    LevelDb,
    FlatFile
};

[[nodiscard]] constexpr std::string_view to_string(StorageBackend backend) noexcept {
    switch (backend) {
        case StorageBackend::LevelDb: return "leveldb";
        case StorageBackend::FlatFile: return "flatfile";
        default: return "unknown";
    }
}

/**
 * @brief Настройки хранилища
 */
struct StorageConfig {
    StorageBackend backend = StorageBackend::LevelDb;

    /// @brief Каталог данных
    std::filesystem::path data_dir = "./arbor-data";

    /// @brief fsync при каждом коммите блока
    bool sync_writes = true;

    /// @brief Через сколько коммитов flat-file backend пишет checkpoint индекса
    uint32_t checkpoint_interval = constants::DEFAULT_CHECKPOINT_INTERVAL;

    /// @brief Количество повторов при StoreIoTransient
    uint32_t io_retry_attempts = constants::DEFAULT_IO_RETRY_ATTEMPTS;

    /// @brief Базовая задержка повтора (мс), удваивается с каждой попыткой
    uint32_t io_retry_backoff_ms = constants::DEFAULT_IO_RETRY_BACKOFF_MS;

    /// @brief Размер block cache LevelDB (МБ)
    uint32_t leveldb_cache_mb = constants::DEFAULT_LEVELDB_CACHE_MB;
};

/**
 * @brief Настройки pruning
 */
struct PruningConfig {
    bool enabled = true;

    /// @brief Сколько последних блоков хранят undo данные и тела
    uint32_t retention_window = constants::DEFAULT_RETENTION_WINDOW;

    /// @brief Максимальная поддерживаемая глубина реорганизации
    uint32_t max_reorg_depth = constants::DEFAULT_MAX_REORG_DEPTH;

    /// @brief Запуск pruning каждые N подключённых блоков
    uint32_t prune_interval = constants::DEFAULT_PRUNE_INTERVAL;
};

/**
 * @brief Настройки валидации
 */
struct ValidationConfig {
    /// @brief Вызывать ScriptValidator (false - доверять скриптам)
    bool script_checks = true;

    /// @brief Допустимое опережение timestamp блока (секунды)
    int64_t max_future_block_time = constants::MAX_FUTURE_BLOCK_TIME;

    /// @brief Потоки предварительной проверки блоков
    uint32_t verify_workers = 2;
};

/**
 * @brief Настройки логирования
 */
struct LoggingConfig {
    /// @brief Уровень логирования: "error", "warn", "info", "debug"
    std::string level = "info";
};

/**
 * @brief Полная конфигурация arbor
 */
struct Config {
    ChainConfig chain;
    StorageConfig storage;
    PruningConfig pruning;
    ValidationConfig validation;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из строки TOML
     */
    [[nodiscard]] static Result<Config> parse(std::string_view toml_text);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./arbor.toml
     * 3. /etc/arbor/arbor.toml
     * 4. ~/.config/arbor/arbor.toml
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * Проверяет:
     * - Известную сеть и уровень логирования
     * - retention_window >= max_reorg_depth
     * - Диапазоны числовых значений
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace arbor
