/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"
#include "chain/chain_registry.hpp"
#include "../log/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <vector>

namespace arbor {

namespace {

/**
 * @brief Прочитать неотрицательное целое, проверив диапазон uint32
 */
[[nodiscard]] Result<void> read_u32(
    const toml::table& section,
    std::string_view key,
    std::string_view section_name,
    uint32_t& out
) {
    if (auto val = section[key].value<int64_t>()) {
        if (*val < 0 || *val > static_cast<int64_t>(UINT32_MAX)) {
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                std::format("{}.{} вне допустимого диапазона: {}", section_name, key, *val)
            );
        }
        out = static_cast<uint32_t>(*val);
    }
    return {};
}

[[nodiscard]] Result<Config> from_table(const toml::table& table) {
    Config config;

    // === Секция [chain] ===
    if (auto chain = table["chain"].as_table()) {
        if (auto val = (*chain)["network"].value<std::string>()) {
            config.chain.network = *val;
        }
    }

    // === Секция [storage] ===
    if (auto storage = table["storage"].as_table()) {
        if (auto val = (*storage)["backend"].value<std::string>()) {
            if (*val == "leveldb") {
                config.storage.backend = StorageBackend::LevelDb;
            } else if (*val == "flatfile") {
                config.storage.backend = StorageBackend::FlatFile;
            } else {
                return Err<Config>(
                    ErrorCode::ConfigInvalidValue,
                    std::format("storage.backend должен быть 'leveldb' или 'flatfile', получено '{}'", *val)
                );
            }
        }
        if (auto val = (*storage)["data_dir"].value<std::string>()) {
            config.storage.data_dir = *val;
        }
        if (auto val = (*storage)["sync_writes"].value<bool>()) {
            config.storage.sync_writes = *val;
        }

        for (auto [key, field] : {
                 std::pair{"checkpoint_interval", &config.storage.checkpoint_interval},
                 std::pair{"io_retry_attempts", &config.storage.io_retry_attempts},
                 std::pair{"io_retry_backoff_ms", &config.storage.io_retry_backoff_ms},
                 std::pair{"leveldb_cache_mb", &config.storage.leveldb_cache_mb}}) {
            if (auto result = read_u32(*storage, key, "storage", *field); !result) {
                return std::unexpected(result.error());
            }
        }
    }

    // === Секция [pruning] ===
    if (auto pruning = table["pruning"].as_table()) {
        if (auto val = (*pruning)["enabled"].value<bool>()) {
            config.pruning.enabled = *val;
        }
        for (auto [key, field] : {
                 std::pair{"retention_window", &config.pruning.retention_window},
                 std::pair{"max_reorg_depth", &config.pruning.max_reorg_depth},
                 std::pair{"prune_interval", &config.pruning.prune_interval}}) {
            if (auto result = read_u32(*pruning, key, "pruning", *field); !result) {
                return std::unexpected(result.error());
            }
        }
    }

    // === Секция [validation] ===
    if (auto validation = table["validation"].as_table()) {
        if (auto val = (*validation)["script_checks"].value<bool>()) {
            config.validation.script_checks = *val;
        }
        if (auto val = (*validation)["max_future_block_time"].value<int64_t>()) {
            config.validation.max_future_block_time = *val;
        }
        if (auto result = read_u32(*validation, "verify_workers", "validation",
                                   config.validation.verify_workers); !result) {
            return std::unexpected(result.error());
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
    }

    return config;
}

} // namespace

// =============================================================================
// Config - Загрузка
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view toml_text) {
    try {
        auto table = toml::parse(toml_text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный путь обязан существовать
    if (path.has_value()) {
        return load(path.value());
    }

    std::vector<std::filesystem::path> search_paths;
    search_paths.push_back("arbor.toml");
    search_paths.push_back("/etc/arbor/arbor.toml");

    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "arbor" / "arbor.toml"
        );
    }

    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            log::debug("Найден файл конфигурации: {}", search_path.string());
            return load(search_path);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    if (!core::ChainRegistry::instance().has_chain(chain.network)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Неизвестная сеть '{}' (mainnet, testnet, signet, regtest)", chain.network)
        );
    }

    if (storage.data_dir.empty()) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Не указан каталог данных (storage.data_dir)"
        );
    }

    if (storage.checkpoint_interval == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "storage.checkpoint_interval должен быть больше 0"
        );
    }

    // Undo данные нужны на всю глубину поддерживаемой реорганизации
    if (pruning.retention_window < pruning.max_reorg_depth) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("pruning.retention_window ({}) меньше pruning.max_reorg_depth ({})",
                        pruning.retention_window, pruning.max_reorg_depth)
        );
    }

    if (pruning.prune_interval == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "pruning.prune_interval должен быть больше 0"
        );
    }

    if (validation.max_future_block_time < 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "validation.max_future_block_time не может быть отрицательным"
        );
    }

    if (validation.verify_workers == 0 || validation.verify_workers > 64) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "validation.verify_workers должен быть от 1 до 64"
        );
    }

    if (!log::parse_level(logging.level)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Неизвестный уровень логирования '{}'", logging.level)
        );
    }

    return {};
}

} // namespace arbor
