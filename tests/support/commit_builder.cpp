/**
 * @file commit_builder.cpp
 * @brief Реализация CommitBuilder
 */

#include "commit_builder.hpp"
#include "crypto/sha256.hpp"

#include <gtest/gtest.h>

namespace arbor::test {

storage::BlockCommit CommitBuilder::next(uint8_t tag) {
    storage::BlockCommit commit;

    auto& header = commit.header.header;
    header.version = 1;
    header.prev_hash = prev_;
    header.merkle_root.fill(tag);
    header.timestamp = 1'000'000 + height_;
    header.bits = 0x207fffff;
    header.nonce = height_;

    work_ += core::uint256(2);
    commit.header.height = height_;
    commit.header.chain_work = work_;
    commit.header.status = storage::HeaderStatus::Connected;

    // Тратим самый старый живой лист
    std::vector<uint64_t> targets;
    std::vector<Hash256> spent;
    const auto live = forest_.live_leaves();
    if (!live.empty()) {
        targets.push_back(live.front().first);
        spent.push_back(live.front().second);
    }

    std::vector<Hash256> created;
    for (int i = 0; i < 2; ++i) {
        const std::array<uint8_t, 10> raw = {
            tag, static_cast<uint8_t>(i),
            static_cast<uint8_t>(leaf_counter_), static_cast<uint8_t>(leaf_counter_ >> 8),
            static_cast<uint8_t>(leaf_counter_ >> 16), static_cast<uint8_t>(leaf_counter_ >> 24),
            static_cast<uint8_t>(height_), static_cast<uint8_t>(height_ >> 8),
            static_cast<uint8_t>(height_ >> 16), static_cast<uint8_t>(height_ >> 24)
        };
        created.push_back(crypto::sha256(raw));
        ++leaf_counter_;
    }

    auto proof = forest_.prove(targets);
    EXPECT_TRUE(proof.has_value());
    auto mod = accumulator::apply_block(roots_, proof.value_or(accumulator::BatchProof{}),
                                        spent, created);
    EXPECT_TRUE(mod.has_value());
    if (mod) {
        roots_ = mod->forest;
        commit.forest = mod->forest;
        commit.undo = mod->undo;
    }
    EXPECT_TRUE(forest_.remove(targets).has_value());
    forest_.add(created);

    commit.body = {tag, static_cast<uint8_t>(height_), 0xB0, 0xD1};

    prev_ = header.hash();
    ++height_;
    return commit;
}

std::vector<storage::BlockCommit> CommitBuilder::chain(uint32_t count, uint8_t tag) {
    std::vector<storage::BlockCommit> commits;
    commits.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        commits.push_back(next(tag));
    }
    return commits;
}

} // namespace arbor::test
