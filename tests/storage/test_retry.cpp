/**
 * @file test_retry.cpp
 * @brief Тесты повторов операций хранилища и выбора backend
 */

#include <gtest/gtest.h>

#include "storage/retry.hpp"
#include "storage/store_factory.hpp"
#include "support/chain_builder.hpp"

namespace arbor::storage::test {

namespace {

const RetryPolicy FAST{3, std::chrono::milliseconds{1}};

} // namespace

TEST(RetryTest, SucceedsFirstTime) {
    int calls = 0;
    auto result = with_retry(FAST, "read", [&]() -> Result<int> {
        ++calls;
        return 42;
    });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, RetriesTransientErrors) {
    int calls = 0;
    auto result = with_retry(FAST, "write", [&]() -> Result<void> {
        if (++calls < 3) {
            return Err<void>(ErrorCode::StoreIoTransient, "EAGAIN");
        }
        return {};
    });

    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, GivesUpAfterAttempts) {
    int calls = 0;
    auto result = with_retry(FAST, "write", [&]() -> Result<void> {
        ++calls;
        return Err<void>(ErrorCode::StoreIoTransient, "EINTR");
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::StoreIoTransient);
    EXPECT_EQ(calls, 4);
}

TEST(RetryTest, OtherErrorsAreNotRetried) {
    int calls = 0;
    auto result = with_retry(FAST, "read", [&]() -> Result<void> {
        ++calls;
        return Err<void>(ErrorCode::StoreCorruption, "checksum");
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::StoreCorruption);
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, ZeroAttemptsMeansSingleCall) {
    int calls = 0;
    auto result = with_retry(RetryPolicy{0, std::chrono::milliseconds{1}}, "read",
                             [&]() -> Result<void> {
                                 ++calls;
                                 return Err<void>(ErrorCode::StoreIoTransient, "EAGAIN");
                             });

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(calls, 1);
}

// =============================================================================
// Выбор backend
// =============================================================================

TEST(StoreFactoryTest, OpensConfiguredBackend) {
    arbor::test::TempDir dir("arbor-factory");

    StorageConfig config;
    config.data_dir = dir.path();
    config.sync_writes = false;

    config.backend = StorageBackend::FlatFile;
    {
        auto store = open_chain_store(config);
        ASSERT_TRUE(store.has_value()) << store.error().message;
        EXPECT_EQ((*store)->name(), "flatfile");
    }
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "blocks"));

    config.backend = StorageBackend::LevelDb;
    {
        auto store = open_chain_store(config);
        ASSERT_TRUE(store.has_value()) << store.error().message;
        EXPECT_EQ((*store)->name(), "leveldb");
    }
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "chainstate"));
}

TEST(StoreFactoryTest, RetryPolicyFromConfig) {
    StorageConfig config;
    config.io_retry_attempts = 7;
    config.io_retry_backoff_ms = 25;

    const auto policy = retry_policy(config);
    EXPECT_EQ(policy.attempts, 7u);
    EXPECT_EQ(policy.backoff, std::chrono::milliseconds{25});
}

} // namespace arbor::storage::test
