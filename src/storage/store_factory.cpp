/**
 * @file store_factory.cpp
 * @brief Реализация выбора backend
 */

#include "store_factory.hpp"
#include "flat_file_store.hpp"
#include "leveldb_store.hpp"

namespace arbor::storage {

Result<std::unique_ptr<ChainStore>> open_chain_store(const StorageConfig& config) {
    switch (config.backend) {
        case StorageBackend::LevelDb: {
            LevelDbOptions options;
            options.path = config.data_dir / "chainstate";
            options.sync_writes = config.sync_writes;
            options.cache_bytes = std::size_t{config.leveldb_cache_mb} * 1024 * 1024;
            auto store = LevelDbStore::open(options);
            if (!store) {
                return std::unexpected(store.error());
            }
            return std::unique_ptr<ChainStore>(std::move(*store));
        }
        case StorageBackend::FlatFile: {
            FlatFileOptions options;
            options.path = config.data_dir / "blocks";
            options.sync_writes = config.sync_writes;
            options.checkpoint_interval = config.checkpoint_interval;
            auto store = FlatFileStore::open(options);
            if (!store) {
                return std::unexpected(store.error());
            }
            return std::unique_ptr<ChainStore>(std::move(*store));
        }
    }
    return Err<std::unique_ptr<ChainStore>>(ErrorCode::ConfigInvalidValue,
                                            "Неизвестный backend хранилища");
}

RetryPolicy retry_policy(const StorageConfig& config) noexcept {
    return RetryPolicy{
        config.io_retry_attempts,
        std::chrono::milliseconds{config.io_retry_backoff_ms}
    };
}

} // namespace arbor::storage
