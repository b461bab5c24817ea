/**
 * @file test_config.cpp
 * @brief Тесты загрузки и валидации конфигурации
 */

#include <gtest/gtest.h>

#include "core/config.hpp"
#include "support/chain_builder.hpp"

#include <fstream>

namespace arbor::test {

TEST(ConfigTest, DefaultsAreValid) {
    Config config;

    EXPECT_EQ(config.chain.network, "mainnet");
    EXPECT_EQ(config.storage.backend, StorageBackend::LevelDb);
    EXPECT_GE(config.pruning.retention_window, config.pruning.max_reorg_depth);
    EXPECT_TRUE(config.validate().has_value());
}

TEST(ConfigTest, ParsesAllSections) {
    auto config = Config::parse(R"(
[chain]
network = "regtest"

[storage]
backend = "flatfile"
data_dir = "/tmp/arbor-regtest"
sync_writes = false
checkpoint_interval = 16
io_retry_attempts = 5
io_retry_backoff_ms = 10
leveldb_cache_mb = 8

[pruning]
enabled = false
retention_window = 500
max_reorg_depth = 200
prune_interval = 25

[validation]
script_checks = false
max_future_block_time = 600
verify_workers = 4

[logging]
level = "debug"
)");
    ASSERT_TRUE(config.has_value()) << config.error().message;

    EXPECT_EQ(config->chain.network, "regtest");
    EXPECT_EQ(config->storage.backend, StorageBackend::FlatFile);
    EXPECT_EQ(config->storage.data_dir, "/tmp/arbor-regtest");
    EXPECT_FALSE(config->storage.sync_writes);
    EXPECT_EQ(config->storage.checkpoint_interval, 16u);
    EXPECT_EQ(config->storage.io_retry_attempts, 5u);
    EXPECT_EQ(config->storage.io_retry_backoff_ms, 10u);
    EXPECT_EQ(config->storage.leveldb_cache_mb, 8u);
    EXPECT_FALSE(config->pruning.enabled);
    EXPECT_EQ(config->pruning.retention_window, 500u);
    EXPECT_EQ(config->pruning.max_reorg_depth, 200u);
    EXPECT_EQ(config->pruning.prune_interval, 25u);
    EXPECT_FALSE(config->validation.script_checks);
    EXPECT_EQ(config->validation.max_future_block_time, 600);
    EXPECT_EQ(config->validation.verify_workers, 4u);
    EXPECT_EQ(config->logging.level, "debug");
    EXPECT_TRUE(config->validate().has_value());
}

TEST(ConfigTest, RejectsUnknownBackend) {
    auto config = Config::parse("[storage]\nbackend = \"rocksdb\"\n");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigInvalidValue);
}

TEST(ConfigTest, RejectsNegativeInterval) {
    auto config = Config::parse("[pruning]\nprune_interval = -1\n");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigInvalidValue);
}

TEST(ConfigTest, ReportsTomlSyntaxError) {
    auto config = Config::parse("[chain\nnetwork = ");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigParseError);
}

TEST(ConfigTest, RetentionMustCoverReorgDepth) {
    Config config;
    config.pruning.retention_window = 50;
    config.pruning.max_reorg_depth = 100;

    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalidValue);
    EXPECT_NE(result.error().message.find("retention_window"), std::string::npos);
}

TEST(ConfigTest, RejectsUnknownNetworkAndLevel) {
    Config config;
    config.chain.network = "litecoin";
    EXPECT_FALSE(config.validate().has_value());

    config.chain.network = "signet";
    config.logging.level = "trace";
    EXPECT_FALSE(config.validate().has_value());
}

TEST(ConfigTest, RejectsZeroWorkers) {
    Config config;
    config.validation.verify_workers = 0;
    EXPECT_FALSE(config.validate().has_value());
}

TEST(ConfigTest, LoadMissingFile) {
    auto config = Config::load("/nonexistent/arbor.toml");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigNotFound);
}

TEST(ConfigTest, LoadFromFile) {
    TempDir dir("arbor-config");
    const auto path = dir.path() / "arbor.toml";
    {
        std::ofstream out(path);
        out << "[chain]\nnetwork = \"testnet\"\n[storage]\nbackend = \"leveldb\"\n";
    }

    auto config = Config::load(path);
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->chain.network, "testnet");

    auto searched = Config::load_with_search(path);
    ASSERT_TRUE(searched.has_value());
    EXPECT_EQ(searched->chain.network, "testnet");
}

} // namespace arbor::test
