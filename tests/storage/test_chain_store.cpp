/**
 * @file test_chain_store.cpp
 * @brief Общий контракт ChainStore для обоих backend
 */

#include <gtest/gtest.h>

#include "storage/flat_file_store.hpp"
#include "storage/leveldb_store.hpp"
#include "support/chain_builder.hpp"
#include "support/commit_builder.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <type_traits>

namespace arbor::storage::test {

using arbor::test::CommitBuilder;
using arbor::test::TempDir;

// Набор backend закрыт
static_assert(std::is_final_v<LevelDbStore>);
static_assert(std::is_final_v<FlatFileStore>);

// =============================================================================
// Backend
// =============================================================================

struct LevelDbBackend {
    static constexpr const char* NAME = "leveldb";

    static Result<std::unique_ptr<ChainStore>> open(const std::filesystem::path& path) {
        LevelDbOptions options;
        options.path = path;
        options.sync_writes = false;
        auto store = LevelDbStore::open(options);
        if (!store) {
            return std::unexpected(store.error());
        }
        return std::unique_ptr<ChainStore>(std::move(*store));
    }
};

struct FlatFileBackend {
    static constexpr const char* NAME = "flat-file";

    static Result<std::unique_ptr<ChainStore>> open(const std::filesystem::path& path) {
        FlatFileOptions options;
        options.path = path;
        options.sync_writes = false;
        // Маленькие сегменты: pruning удаляет файлы уже на коротких цепях
        options.segment_size = 512;
        auto store = FlatFileStore::open(options);
        if (!store) {
            return std::unexpected(store.error());
        }
        return std::unique_ptr<ChainStore>(std::move(*store));
    }
};

template<typename Backend>
class ChainStoreTest : public ::testing::Test {
protected:
    ChainStoreTest() : dir_(std::string("arbor-store-") + Backend::NAME) {}

    void SetUp() override {
        reopen();
    }

    void reopen() {
        store_.reset();
        auto store = Backend::open(dir_.path() / "db");
        ASSERT_TRUE(store.has_value()) << store.error().message;
        store_ = std::move(*store);
    }

    /// @brief Закоммитить count блоков основной ветки
    std::vector<BlockCommit> commit_chain(uint32_t count) {
        auto commits = builder_.chain(count);
        for (const auto& commit : commits) {
            auto put = store_->put_block(commit);
            EXPECT_TRUE(put.has_value()) << put.error().message;
        }
        return commits;
    }

    TempDir dir_;
    std::unique_ptr<ChainStore> store_;
    CommitBuilder builder_;
};

using Backends = ::testing::Types<LevelDbBackend, FlatFileBackend>;
TYPED_TEST_SUITE(ChainStoreTest, Backends);

// =============================================================================
// Заголовки
// =============================================================================

TYPED_TEST(ChainStoreTest, EmptyStore) {
    auto tip = this->store_->get_tip();
    ASSERT_TRUE(tip.has_value());
    EXPECT_FALSE(tip->has_value());
    EXPECT_EQ(this->store_->prune_height(), 0u);

    auto headers = this->store_->load_headers();
    ASSERT_TRUE(headers.has_value());
    EXPECT_TRUE(headers->empty());

    auto missing = this->store_->get_header(Hash256{});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::StoreNotFound);

    auto roots = this->store_->get_roots(0);
    ASSERT_FALSE(roots.has_value());
    EXPECT_EQ(roots.error().code, ErrorCode::StoreNotFound);
}

TYPED_TEST(ChainStoreTest, PutHeaderDoesNotMoveTip) {
    auto commit = this->builder_.next();
    StoredHeader header = commit.header;
    header.status = HeaderStatus::HeaderValid;

    ASSERT_TRUE(this->store_->put_header(header).has_value());

    auto loaded = this->store_->get_header(header.hash());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, header);

    auto tip = this->store_->get_tip();
    ASSERT_TRUE(tip.has_value());
    EXPECT_FALSE(tip->has_value());
    EXPECT_FALSE(this->store_->get_header_by_height(0).has_value());
}

TYPED_TEST(ChainStoreTest, PutHeaderUpdatesStatus) {
    StoredHeader header = this->builder_.next().header;
    header.status = HeaderStatus::HeaderValid;
    ASSERT_TRUE(this->store_->put_header(header).has_value());

    header.status = HeaderStatus::Rejected;
    ASSERT_TRUE(this->store_->put_header(header).has_value());

    auto loaded = this->store_->get_header(header.hash());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->status, HeaderStatus::Rejected);

    auto headers = this->store_->load_headers();
    ASSERT_TRUE(headers.has_value());
    EXPECT_EQ(headers->size(), 1u);
}

// =============================================================================
// Блоки
// =============================================================================

TYPED_TEST(ChainStoreTest, PutBlockCommitsEverything) {
    const auto commits = this->commit_chain(5);

    auto tip = this->store_->get_tip();
    ASSERT_TRUE(tip.has_value());
    ASSERT_TRUE(tip->has_value());
    EXPECT_EQ((*tip)->height, 4u);
    EXPECT_EQ((*tip)->hash, commits.back().header.hash());

    for (uint32_t h = 0; h < commits.size(); ++h) {
        auto header = this->store_->get_header_by_height(h);
        ASSERT_TRUE(header.has_value());
        EXPECT_EQ(*header, commits[h].header);

        auto roots = this->store_->get_roots(h);
        ASSERT_TRUE(roots.has_value());
        EXPECT_EQ(*roots, commits[h].forest);

        auto undo = this->store_->get_undo(h);
        ASSERT_TRUE(undo.has_value());
        EXPECT_EQ(*undo, commits[h].undo);

        auto body = this->store_->get_block_body(h);
        ASSERT_TRUE(body.has_value());
        EXPECT_EQ(*body, commits[h].body);
    }

    EXPECT_FALSE(this->store_->get_header_by_height(5).has_value());
}

TYPED_TEST(ChainStoreTest, PutBlockRejectsWrongHeight) {
    this->commit_chain(2);

    CommitBuilder other;
    auto stray = other.next();
    auto put = this->store_->put_block(stray);

    ASSERT_FALSE(put.has_value());
    EXPECT_EQ(put.error().code, ErrorCode::StoreCorruption);

    auto tip = this->store_->get_tip();
    ASSERT_TRUE(tip.has_value());
    EXPECT_EQ((*tip)->height, 1u);
}

TYPED_TEST(ChainStoreTest, PutBlockRejectsWrongParent) {
    this->commit_chain(3);

    CommitBuilder other;
    auto foreign = other.chain(4, 7);
    auto put = this->store_->put_block(foreign.back());

    ASSERT_FALSE(put.has_value());
    EXPECT_EQ(put.error().code, ErrorCode::StoreCorruption);
}

TYPED_TEST(ChainStoreTest, SurvivesReopen) {
    const auto commits = this->commit_chain(6);
    ASSERT_TRUE(this->store_->prune_before(2).has_value());

    this->reopen();

    auto tip = this->store_->get_tip();
    ASSERT_TRUE(tip.has_value());
    ASSERT_TRUE(tip->has_value());
    EXPECT_EQ((*tip)->hash, commits.back().header.hash());
    EXPECT_EQ(this->store_->prune_height(), 2u);

    auto roots = this->store_->get_roots(5);
    ASSERT_TRUE(roots.has_value());
    EXPECT_EQ(*roots, commits[5].forest);

    auto headers = this->store_->load_headers();
    ASSERT_TRUE(headers.has_value());
    EXPECT_EQ(headers->size(), commits.size());
}

// =============================================================================
// Откат
// =============================================================================

TYPED_TEST(ChainStoreTest, RewindRestoresForest) {
    const auto commits = this->commit_chain(6);

    auto forest = this->store_->rewind_to(2);
    ASSERT_TRUE(forest.has_value()) << forest.error().message;
    EXPECT_EQ(*forest, commits[2].forest);

    auto tip = this->store_->get_tip();
    ASSERT_TRUE(tip.has_value());
    EXPECT_EQ((*tip)->height, 2u);
    EXPECT_EQ((*tip)->hash, commits[2].header.hash());

    // Заголовки отключённых блоков остаются доступны по хешу
    EXPECT_TRUE(this->store_->get_header(commits[4].header.hash()).has_value());
    EXPECT_FALSE(this->store_->get_header_by_height(3).has_value());
    EXPECT_FALSE(this->store_->get_roots(3).has_value());
}

TYPED_TEST(ChainStoreTest, RewindToTipIsNoop) {
    const auto commits = this->commit_chain(3);

    auto forest = this->store_->rewind_to(2);
    ASSERT_TRUE(forest.has_value());
    EXPECT_EQ(*forest, commits[2].forest);

    auto tip = this->store_->get_tip();
    ASSERT_TRUE(tip.has_value());
    EXPECT_EQ((*tip)->height, 2u);
}

TYPED_TEST(ChainStoreTest, RewindAboveTipFails) {
    this->commit_chain(3);

    auto forest = this->store_->rewind_to(5);
    ASSERT_FALSE(forest.has_value());
    EXPECT_EQ(forest.error().code, ErrorCode::StoreNotFound);
}

TYPED_TEST(ChainStoreTest, RewindThenExtendWithFork) {
    const auto commits = this->commit_chain(5);

    // Ветка от высоты 2: строим заново тем же построителем до развилки
    CommitBuilder fork;
    auto prefix = fork.chain(3);
    ASSERT_EQ(prefix.back().header.hash(), commits[2].header.hash());

    ASSERT_TRUE(this->store_->rewind_to(2).has_value());
    const auto side = fork.chain(3, 9);
    for (const auto& commit : side) {
        auto put = this->store_->put_block(commit);
        ASSERT_TRUE(put.has_value()) << put.error().message;
    }

    auto tip = this->store_->get_tip();
    ASSERT_TRUE(tip.has_value());
    EXPECT_EQ((*tip)->height, 5u);
    EXPECT_EQ((*tip)->hash, side.back().header.hash());

    auto body = this->store_->get_block_body(4);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(*body, side[1].body);

    this->reopen();
    auto reopened = this->store_->get_header_by_height(3);
    ASSERT_TRUE(reopened.has_value());
    EXPECT_EQ(reopened->hash(), side[0].header.hash());
}

// =============================================================================
// Pruning
// =============================================================================

TYPED_TEST(ChainStoreTest, PruneDropsUndoAndBodiesOnly) {
    const auto commits = this->commit_chain(8);
    ASSERT_TRUE(this->store_->prune_before(5).has_value());
    EXPECT_EQ(this->store_->prune_height(), 5u);

    for (uint32_t h = 0; h < 5; ++h) {
        auto undo = this->store_->get_undo(h);
        ASSERT_FALSE(undo.has_value());
        EXPECT_EQ(undo.error().code, ErrorCode::UndoUnavailable);

        auto body = this->store_->get_block_body(h);
        ASSERT_FALSE(body.has_value());
        EXPECT_EQ(body.error().code, ErrorCode::UndoUnavailable);

        // Заголовки и корни не удаляются
        EXPECT_TRUE(this->store_->get_header_by_height(h).has_value());
        auto roots = this->store_->get_roots(h);
        ASSERT_TRUE(roots.has_value());
        EXPECT_EQ(*roots, commits[h].forest);
    }
    for (uint32_t h = 5; h < 8; ++h) {
        auto undo = this->store_->get_undo(h);
        ASSERT_TRUE(undo.has_value()) << "height " << h;
        EXPECT_EQ(*undo, commits[h].undo);
    }
}

TYPED_TEST(ChainStoreTest, PruneIsMonotonic) {
    this->commit_chain(6);
    ASSERT_TRUE(this->store_->prune_before(4).has_value());
    ASSERT_TRUE(this->store_->prune_before(2).has_value());
    EXPECT_EQ(this->store_->prune_height(), 4u);
}

TYPED_TEST(ChainStoreTest, ConcurrentReadsDuringPrune) {
    constexpr uint32_t COUNT = 40;
    this->commit_chain(COUNT);

    std::atomic<bool> done{false};
    std::atomic<uint32_t> unexpected_errors{0};
    std::atomic<uint32_t> reads{0};

    // Читатель видит либо данные, либо UndoUnavailable
    std::thread reader([&] {
        while (!done.load()) {
            for (uint32_t height = 0; height < COUNT; ++height) {
                auto undo = this->store_->get_undo(height);
                if (!undo && undo.error().code != ErrorCode::UndoUnavailable) {
                    unexpected_errors.fetch_add(1);
                }
                auto body = this->store_->get_block_body(height);
                if (!body && body.error().code != ErrorCode::UndoUnavailable) {
                    unexpected_errors.fetch_add(1);
                }
                reads.fetch_add(1);
            }
        }
    });

    for (uint32_t height = 1; height < COUNT; ++height) {
        auto pruned = this->store_->prune_before(height);
        EXPECT_TRUE(pruned.has_value()) << pruned.error().message;
        EXPECT_EQ(this->store_->prune_height(), height);
    }
    done.store(true);
    reader.join();

    EXPECT_GT(reads.load(), 0u);
    EXPECT_EQ(unexpected_errors.load(), 0u);

    auto last = this->store_->get_undo(COUNT - 1);
    EXPECT_TRUE(last.has_value());
    auto gone = this->store_->get_undo(COUNT - 2);
    ASSERT_FALSE(gone.has_value());
    EXPECT_EQ(gone.error().code, ErrorCode::UndoUnavailable);
}

TYPED_TEST(ChainStoreTest, RewindBelowPruneHeightFails) {
    this->commit_chain(8);
    ASSERT_TRUE(this->store_->prune_before(5).has_value());

    // До высоты 4 нужны undo высот 8..5: доступны
    auto allowed = this->store_->rewind_to(4);
    ASSERT_TRUE(allowed.has_value()) << allowed.error().message;

    auto refused = this->store_->rewind_to(2);
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, ErrorCode::UndoUnavailable);

    auto tip = this->store_->get_tip();
    ASSERT_TRUE(tip.has_value());
    EXPECT_EQ((*tip)->height, 4u);
}

TYPED_TEST(ChainStoreTest, ReplayUndoMatchesStoredRoots) {
    const auto commits = this->commit_chain(7);

    auto forest = replay_undo(*this->store_, 6, 1);
    ASSERT_TRUE(forest.has_value()) << forest.error().message;
    EXPECT_EQ(*forest, commits[1].forest);

    // replay_undo только читает
    auto tip = this->store_->get_tip();
    ASSERT_TRUE(tip.has_value());
    EXPECT_EQ((*tip)->height, 6u);
}

} // namespace arbor::storage::test
