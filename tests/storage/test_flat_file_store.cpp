/**
 * @file test_flat_file_store.cpp
 * @brief Восстановление журнала, checkpoint и сегменты flat-file backend
 */

#include <gtest/gtest.h>

#include "core/byte_order.hpp"
#include "storage/file_io.hpp"
#include "storage/flat_file_store.hpp"
#include "support/chain_builder.hpp"
#include "support/commit_builder.hpp"

#include <filesystem>
#include <fstream>

namespace arbor::storage::test {

using arbor::test::CommitBuilder;
using arbor::test::TempDir;

class FlatFileStoreTest : public ::testing::Test {
protected:
    FlatFileStoreTest() : dir_("arbor-flatfile") {
        options_.path = dir_.path() / "blocks";
        options_.sync_writes = false;
        options_.checkpoint_interval = 1000;
    }

    [[nodiscard]] std::unique_ptr<FlatFileStore> open() {
        auto store = FlatFileStore::open(options_);
        EXPECT_TRUE(store.has_value()) << store.error().message;
        return store ? std::move(*store) : nullptr;
    }

    [[nodiscard]] std::filesystem::path log_path() const {
        return options_.path / "chain.log";
    }

    [[nodiscard]] std::filesystem::path index_path() const {
        return options_.path / "chain.idx";
    }

    void commit(FlatFileStore& store, const std::vector<BlockCommit>& commits) {
        for (const auto& c : commits) {
            auto put = store.put_block(c);
            ASSERT_TRUE(put.has_value()) << put.error().message;
        }
    }

    [[nodiscard]] static uint32_t tip_height(const FlatFileStore& store) {
        auto tip = store.get_tip();
        EXPECT_TRUE(tip.has_value());
        EXPECT_TRUE(tip && tip->has_value());
        return (tip && tip->has_value()) ? (*tip)->height : 0;
    }

    TempDir dir_;
    FlatFileOptions options_;
    CommitBuilder builder_;
};

TEST_F(FlatFileStoreTest, CreatesLayout) {
    auto store = open();
    ASSERT_NE(store, nullptr);
    EXPECT_EQ(store->name(), "flatfile");
    EXPECT_TRUE(std::filesystem::exists(log_path()));
    EXPECT_TRUE(std::filesystem::exists(options_.path / "undo_00000.dat"));
}

TEST_F(FlatFileStoreTest, GarbageTailIsTruncated) {
    std::uintmax_t clean_size = 0;
    {
        auto store = open();
        ASSERT_NE(store, nullptr);
        commit(*store, builder_.chain(4));
        clean_size = std::filesystem::file_size(log_path());
    }

    {
        std::ofstream out(log_path(), std::ios::binary | std::ios::app);
        const char junk[] = {0x41, 0x52, 0x42, 0x4C, 0x02, 0x7F};
        out.write(junk, sizeof(junk));
    }
    ASSERT_GT(std::filesystem::file_size(log_path()), clean_size);

    auto store = open();
    ASSERT_NE(store, nullptr);
    EXPECT_EQ(tip_height(*store), 3u);
    EXPECT_EQ(std::filesystem::file_size(log_path()), clean_size);
}

TEST_F(FlatFileStoreTest, TornLastCommitIsDropped) {
    std::vector<BlockCommit> commits = builder_.chain(5);
    {
        auto store = open();
        ASSERT_NE(store, nullptr);
        commit(*store, commits);
    }

    // Обрываем последнюю запись посередине
    std::filesystem::resize_file(log_path(), std::filesystem::file_size(log_path()) - 10);

    auto store = open();
    ASSERT_NE(store, nullptr);
    EXPECT_EQ(tip_height(*store), 3u);

    auto tip = store->get_tip();
    ASSERT_TRUE(tip.has_value());
    EXPECT_EQ((*tip)->hash, commits[3].header.hash());

    // Оборванный блок можно закоммитить заново
    auto put = store->put_block(commits[4]);
    ASSERT_TRUE(put.has_value()) << put.error().message;
    EXPECT_EQ(tip_height(*store), 4u);
}

TEST_F(FlatFileStoreTest, CorruptedChecksumStopsReplay) {
    std::vector<BlockCommit> commits = builder_.chain(3);
    {
        auto store = open();
        ASSERT_NE(store, nullptr);
        commit(*store, commits);
    }

    // Последний байт журнала - checksum последней записи
    auto data = read_file(log_path());
    ASSERT_TRUE(data.has_value());
    data->back() ^= 0xFF;
    ASSERT_TRUE(write_file_atomic(log_path(), *data).has_value());
    // Checkpoint при закрытии покрывает весь журнал: имитируем сбой до него
    std::filesystem::remove(index_path());

    auto store = open();
    ASSERT_NE(store, nullptr);
    EXPECT_EQ(tip_height(*store), 1u);
}

TEST_F(FlatFileStoreTest, CorruptedMiddleRecordIsFatal) {
    std::vector<BlockCommit> commits = builder_.chain(3);
    {
        auto store = open();
        ASSERT_NE(store, nullptr);
        commit(*store, commits);
    }
    std::filesystem::remove(index_path());

    // Запись: magic(4) type(1) length(4) payload checksum(4)
    auto data = read_file(log_path());
    ASSERT_TRUE(data.has_value());
    const uint32_t first_length = read_le32(data->data() + 5);
    ASSERT_LT(9u + first_length + 4u, data->size());
    (*data)[9 + first_length] ^= 0xFF;
    ASSERT_TRUE(write_file_atomic(log_path(), *data).has_value());

    auto store = FlatFileStore::open(options_);
    ASSERT_FALSE(store.has_value());
    EXPECT_EQ(store.error().code, ErrorCode::StoreCorruption);

    // Журнал не обрезан
    EXPECT_EQ(std::filesystem::file_size(log_path()), data->size());
}

TEST_F(FlatFileStoreTest, CorruptedRecordHeaderIsFatal) {
    std::vector<BlockCommit> commits = builder_.chain(3);
    {
        auto store = open();
        ASSERT_NE(store, nullptr);
        commit(*store, commits);
    }
    std::filesystem::remove(index_path());

    auto data = read_file(log_path());
    ASSERT_TRUE(data.has_value());
    (*data)[0] ^= 0x5A;
    ASSERT_TRUE(write_file_atomic(log_path(), *data).has_value());

    auto store = FlatFileStore::open(options_);
    ASSERT_FALSE(store.has_value());
    EXPECT_EQ(store.error().code, ErrorCode::StoreCorruption);
}

TEST_F(FlatFileStoreTest, ZeroFilledTailIsTruncated) {
    std::uintmax_t clean_size = 0;
    {
        auto store = open();
        ASSERT_NE(store, nullptr);
        commit(*store, builder_.chain(3));
        clean_size = std::filesystem::file_size(log_path());
    }

    std::filesystem::resize_file(log_path(), clean_size + 200);

    auto store = open();
    ASSERT_NE(store, nullptr);
    EXPECT_EQ(tip_height(*store), 2u);
    EXPECT_EQ(std::filesystem::file_size(log_path()), clean_size);
}

TEST_F(FlatFileStoreTest, CheckpointShortensReplay) {
    options_.checkpoint_interval = 2;
    std::vector<BlockCommit> commits = builder_.chain(5);
    {
        auto store = open();
        ASSERT_NE(store, nullptr);
        commit(*store, commits);
        ASSERT_TRUE(store->prune_before(1).has_value());
    }
    ASSERT_TRUE(std::filesystem::exists(index_path()));

    auto store = open();
    ASSERT_NE(store, nullptr);
    EXPECT_EQ(tip_height(*store), 4u);
    EXPECT_EQ(store->prune_height(), 1u);

    for (uint32_t h = 0; h < commits.size(); ++h) {
        auto roots = store->get_roots(h);
        ASSERT_TRUE(roots.has_value());
        EXPECT_EQ(*roots, commits[h].forest);
    }
    auto undo = store->get_undo(4);
    ASSERT_TRUE(undo.has_value());
    EXPECT_EQ(*undo, commits[4].undo);
}

TEST_F(FlatFileStoreTest, ExplicitCheckpointThenMoreCommits) {
    std::vector<BlockCommit> commits = builder_.chain(6);
    {
        auto store = open();
        ASSERT_NE(store, nullptr);
        commit(*store, std::vector<BlockCommit>(commits.begin(), commits.begin() + 3));
        ASSERT_TRUE(store->checkpoint().has_value());
        commit(*store, std::vector<BlockCommit>(commits.begin() + 3, commits.end()));
    }

    auto store = open();
    ASSERT_NE(store, nullptr);
    EXPECT_EQ(tip_height(*store), 5u);

    auto header = store->get_header_by_height(4);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(*header, commits[4].header);
}

TEST_F(FlatFileStoreTest, CorruptedCheckpointFallsBackToLog) {
    std::vector<BlockCommit> commits = builder_.chain(4);
    {
        auto store = open();
        ASSERT_NE(store, nullptr);
        commit(*store, commits);
        ASSERT_TRUE(store->checkpoint().has_value());
    }

    auto index = read_file(index_path());
    ASSERT_TRUE(index.has_value());
    (*index)[index->size() / 2] ^= 0x5A;
    ASSERT_TRUE(write_file_atomic(index_path(), *index).has_value());

    auto store = open();
    ASSERT_NE(store, nullptr);
    EXPECT_EQ(tip_height(*store), 3u);

    auto roots = store->get_roots(3);
    ASSERT_TRUE(roots.has_value());
    EXPECT_EQ(*roots, commits[3].forest);
}

TEST_F(FlatFileStoreTest, RewindIsJournaled) {
    std::vector<BlockCommit> commits = builder_.chain(5);
    {
        auto store = open();
        ASSERT_NE(store, nullptr);
        commit(*store, commits);
        ASSERT_TRUE(store->rewind_to(1).has_value());
    }

    auto store = open();
    ASSERT_NE(store, nullptr);
    EXPECT_EQ(tip_height(*store), 1u);
    EXPECT_FALSE(store->get_roots(2).has_value());
}

TEST_F(FlatFileStoreTest, PruneRemovesOldSegments) {
    options_.segment_size = 256;
    std::vector<BlockCommit> commits = builder_.chain(12);

    auto store = open();
    ASSERT_NE(store, nullptr);
    commit(*store, commits);
    ASSERT_TRUE(std::filesystem::exists(options_.path / "undo_00000.dat"));
    ASSERT_TRUE(std::filesystem::exists(options_.path / "undo_00001.dat"));

    ASSERT_TRUE(store->prune_before(11).has_value());
    EXPECT_FALSE(std::filesystem::exists(options_.path / "undo_00000.dat"));

    auto undo = store->get_undo(11);
    ASSERT_TRUE(undo.has_value()) << undo.error().message;
    EXPECT_EQ(*undo, commits[11].undo);
}

TEST_F(FlatFileStoreTest, FileIoAppendAndRead) {
    std::filesystem::create_directories(options_.path);
    auto file = File::open(options_.path / "scratch.bin");
    ASSERT_TRUE(file.has_value()) << file.error().message;

    const Bytes first = {1, 2, 3};
    const Bytes second = {4, 5};
    auto off1 = file->append(first);
    auto off2 = file->append(second);
    ASSERT_TRUE(off1.has_value());
    ASSERT_TRUE(off2.has_value());
    EXPECT_EQ(*off1, 0u);
    EXPECT_EQ(*off2, 3u);
    EXPECT_EQ(file->size(), 5u);

    Bytes back(2);
    ASSERT_TRUE(file->read_at(3, back).has_value());
    EXPECT_EQ(back, second);

    Bytes too_far(4);
    EXPECT_FALSE(file->read_at(3, too_far).has_value());

    ASSERT_TRUE(file->truncate(3).has_value());
    EXPECT_EQ(file->size(), 3u);
}

TEST_F(FlatFileStoreTest, ReadMissingFile) {
    auto data = read_file(dir_.path() / "missing.bin");
    ASSERT_FALSE(data.has_value());
    EXPECT_EQ(data.error().code, ErrorCode::StoreNotFound);
}

} // namespace arbor::storage::test
