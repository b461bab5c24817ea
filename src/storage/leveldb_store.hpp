/**
 * @file leveldb_store.hpp
 * @brief Backend хранилища на LevelDB
 *
 * Схема ключей:
 * - 'h' + hash       -> StoredHeader
 * - 'H' + height(BE) -> hash активной цепи
 * - 'r' + height(BE) -> лес после блока
 * - 'u' + height(BE) -> undo данные
 * - 'b' + height(BE) -> тело блока
 * - 'T'              -> tip
 * - 'P'              -> высота pruning
 *
 * Коммит блока - один leveldb::WriteBatch.
 */

#pragma once

#include "chain_store.hpp"

#include <leveldb/cache.h>
#include <leveldb/db.h>

#include <filesystem>
#include <memory>
#include <atomic>
#include <mutex>
#include <optional>

namespace arbor::storage {

/**
 * @brief Настройки LevelDB backend
 */
struct LevelDbOptions {
    std::filesystem::path path;

    /// @brief Синхронная запись (fsync) каждого коммита
    bool sync_writes{true};

    /// @brief Размер block cache (байт)
    std::size_t cache_bytes{32 * 1024 * 1024};
};

/**
 * @brief ChainStore поверх LevelDB
 */
class LevelDbStore final : public ChainStore {
public:
    /**
     * @brief Открыть (или создать) базу
     */
    [[nodiscard]] static Result<std::unique_ptr<LevelDbStore>> open(const LevelDbOptions& options);

    ~LevelDbStore() override;

    LevelDbStore(const LevelDbStore&) = delete;
    LevelDbStore& operator=(const LevelDbStore&) = delete;

    [[nodiscard]] Result<StoredHeader> get_header(const Hash256& hash) const override;
    [[nodiscard]] Result<StoredHeader> get_header_by_height(uint32_t height) const override;
    [[nodiscard]] Result<void> put_header(const StoredHeader& header) override;
    [[nodiscard]] Result<std::vector<StoredHeader>> load_headers() const override;

    [[nodiscard]] Result<void> put_block(const BlockCommit& commit) override;
    [[nodiscard]] Result<std::optional<ChainTip>> get_tip() const override;
    [[nodiscard]] Result<accumulator::Forest> get_roots(uint32_t height) const override;
    [[nodiscard]] Result<accumulator::UndoData> get_undo(uint32_t height) const override;
    [[nodiscard]] Result<Bytes> get_block_body(uint32_t height) const override;
    [[nodiscard]] Result<accumulator::Forest> rewind_to(uint32_t height) override;

    [[nodiscard]] Result<void> prune_before(uint32_t height) override;
    [[nodiscard]] uint32_t prune_height() const override;

    [[nodiscard]] std::string_view name() const noexcept override {
        return "leveldb";
    }

private:
    LevelDbStore(std::unique_ptr<leveldb::DB> db,
                 std::unique_ptr<leveldb::Cache> cache,
                 const LevelDbOptions& options);

    /**
     * @brief Прочитать значение ключа
     *
     * @return std::nullopt для отсутствующего ключа
     */
    [[nodiscard]] Result<std::optional<std::string>> read(const std::string& key) const;

    [[nodiscard]] Result<void> write(leveldb::WriteBatch& batch);

    [[nodiscard]] Result<std::optional<ChainTip>> read_tip() const;

    // cache_ должен пережить db_
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<leveldb::DB> db_;
    leveldb::ReadOptions read_options_;
    leveldb::WriteOptions write_options_;

    /// @brief Сериализует изменяющие операции (чтение-модификация-запись tip)
    mutable std::mutex write_mutex_;

    /// @brief Кэш высоты pruning (читается без write_mutex_)
    std::atomic<uint32_t> prune_height_{0};
};

} // namespace arbor::storage
