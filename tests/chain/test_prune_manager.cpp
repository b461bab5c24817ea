/**
 * @file test_prune_manager.cpp
 * @brief Тесты окна хранения и периодического удаления
 */

#include <gtest/gtest.h>

#include "chain/prune_manager.hpp"
#include "storage/flat_file_store.hpp"
#include "support/chain_builder.hpp"
#include "support/commit_builder.hpp"

namespace arbor::chain::test {

using arbor::test::CommitBuilder;
using arbor::test::TempDir;

class PruneManagerTest : public ::testing::Test {
protected:
    PruneManagerTest() : dir_("arbor-prune") {
        config_.enabled = true;
        config_.retention_window = 5;
        config_.max_reorg_depth = 3;
        config_.prune_interval = 4;
    }

    void SetUp() override {
        storage::FlatFileOptions options;
        options.path = dir_.path() / "blocks";
        options.sync_writes = false;
        auto store = storage::FlatFileStore::open(options);
        ASSERT_TRUE(store.has_value()) << store.error().message;
        store_ = std::move(*store);
    }

    void commit(uint32_t count) {
        for (auto& c : builder_.chain(count)) {
            auto put = store_->put_block(c);
            ASSERT_TRUE(put.has_value()) << put.error().message;
        }
    }

    [[nodiscard]] static storage::ChainTip tip_at(uint32_t height) {
        return storage::ChainTip{Hash256{}, height};
    }

    TempDir dir_;
    PruningConfig config_;
    CommitBuilder builder_;
    std::unique_ptr<storage::FlatFileStore> store_;
};

TEST_F(PruneManagerTest, KeepsLargerOfWindowAndReorgDepth) {
    PruneManager manager(*store_, config_);
    EXPECT_EQ(manager.keep_blocks(), 5u);

    config_.max_reorg_depth = 8;
    PruneManager deep(*store_, config_);
    EXPECT_EQ(deep.keep_blocks(), 8u);
}

TEST_F(PruneManagerTest, PruneTarget) {
    PruneManager manager(*store_, config_);
    EXPECT_FALSE(manager.prune_target(0).has_value());
    EXPECT_FALSE(manager.prune_target(5).has_value());
    ASSERT_TRUE(manager.prune_target(6).has_value());
    EXPECT_EQ(*manager.prune_target(6), 1u);
    EXPECT_EQ(*manager.prune_target(100), 95u);
}

TEST_F(PruneManagerTest, RunOnceShortChainDoesNothing) {
    commit(4);
    PruneManager manager(*store_, config_);

    auto result = manager.run_once(3);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(*result, 0u);
    EXPECT_EQ(store_->prune_height(), 0u);
}

TEST_F(PruneManagerTest, RunOnceIgnoresEnabledFlag) {
    commit(12);
    config_.enabled = false;
    PruneManager manager(*store_, config_);

    auto result = manager.run_once(11);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(*result, 6u);
    EXPECT_EQ(store_->prune_height(), 6u);

    // Последние keep_blocks блоков сохраняют undo
    for (uint32_t h = 6; h <= 11; ++h) {
        EXPECT_TRUE(store_->get_undo(h).has_value()) << "height " << h;
    }
    auto pruned = store_->get_undo(5);
    ASSERT_FALSE(pruned.has_value());
    EXPECT_EQ(pruned.error().code, ErrorCode::UndoUnavailable);
}

TEST_F(PruneManagerTest, RunOnceNeverMovesBackwards) {
    commit(12);
    PruneManager manager(*store_, config_);

    ASSERT_TRUE(manager.run_once(11).has_value());
    auto result = manager.run_once(8);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 6u);
}

TEST_F(PruneManagerTest, OnTipRunsEveryInterval) {
    commit(14);
    PruneManager manager(*store_, config_);

    // Проходы на tip 1, 5 и 9
    for (uint32_t h = 1; h <= 8; ++h) {
        manager.on_tip(tip_at(h));
        EXPECT_EQ(store_->prune_height(), 0u) << "tip " << h;
    }
    manager.on_tip(tip_at(9));
    EXPECT_EQ(store_->prune_height(), 4u);

    for (uint32_t h = 10; h <= 12; ++h) {
        manager.on_tip(tip_at(h));
        EXPECT_EQ(store_->prune_height(), 4u) << "tip " << h;
    }
    manager.on_tip(tip_at(13));
    EXPECT_EQ(store_->prune_height(), 8u);
}

TEST_F(PruneManagerTest, OnTipDisabledDoesNothing) {
    commit(14);
    config_.enabled = false;
    PruneManager manager(*store_, config_);

    for (uint32_t h = 1; h <= 13; ++h) {
        manager.on_tip(tip_at(h));
    }
    EXPECT_EQ(store_->prune_height(), 0u);
}

TEST_F(PruneManagerTest, OnTipAfterRewindWaitsFullInterval) {
    commit(14);
    PruneManager manager(*store_, config_);

    manager.on_tip(tip_at(9));
    EXPECT_EQ(store_->prune_height(), 4u);

    // Откат ниже последнего прохода сдвигает отсчёт интервала
    manager.on_tip(tip_at(7));
    manager.on_tip(tip_at(10));
    EXPECT_EQ(store_->prune_height(), 4u);

    manager.on_tip(tip_at(11));
    EXPECT_EQ(store_->prune_height(), 6u);
}

} // namespace arbor::chain::test
