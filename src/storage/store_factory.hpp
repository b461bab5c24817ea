/**
 * @file store_factory.hpp
 * @brief Выбор backend хранилища по конфигурации
 */

#pragma once

#include "chain_store.hpp"
#include "retry.hpp"
#include "../core/config.hpp"

#include <memory>

namespace arbor::storage {

/**
 * @brief Открыть хранилище, указанное в [storage]
 *
 * LevelDB размещается в data_dir/chainstate, flat-file - в data_dir/blocks.
 */
[[nodiscard]] Result<std::unique_ptr<ChainStore>> open_chain_store(const StorageConfig& config);

/**
 * @brief Политика повторов из [storage]
 */
[[nodiscard]] RetryPolicy retry_policy(const StorageConfig& config) noexcept;

} // namespace arbor::storage
