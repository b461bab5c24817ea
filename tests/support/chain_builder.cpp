/**
 * @file chain_builder.cpp
 * @brief Реализация ChainBuilder
 */

#include "chain_builder.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <format>

namespace arbor::test {

namespace {

/// @brief OP_TRUE: выход без условий
const Bytes ANYONE_CAN_SPEND = {0x51};

} // namespace

ChainBuilder::ChainBuilder(const core::ChainParams& params)
    : params_(params)
{
}

BranchState ChainBuilder::genesis() const {
    BranchState state;
    state.tip = params_.genesis;
    state.hash = params_.genesis_hash;
    state.height = 0;
    return state;
}

core::BlockHeader ChainBuilder::grind(core::BlockHeader header) {
    while (!header.check_pow()) {
        ++header.nonce;
    }
    return header;
}

accumulator::UtreexoBlock ChainBuilder::mine(
    BranchState& state,
    std::span<const std::size_t> spend,
    uint8_t tag
) {
    const uint32_t height = state.height + 1;

    accumulator::UtreexoBlock result;
    core::Block& block = result.block;

    // Coinbase с высотой и тегом ветки в scriptSig
    core::Transaction coinbase;
    core::TxIn coinbase_in;
    coinbase_in.prevout = core::OutPoint{Hash256{}, 0xFFFFFFFF};
    coinbase_in.script_sig = {
        0x04,
        static_cast<uint8_t>(height), static_cast<uint8_t>(height >> 8),
        static_cast<uint8_t>(height >> 16), static_cast<uint8_t>(height >> 24),
        0x01, tag
    };
    coinbase.inputs.push_back(std::move(coinbase_in));
    block.transactions.push_back(std::move(coinbase));

    int64_t fees = 0;
    std::vector<uint64_t> positions;
    for (auto index : spend) {
        const auto& leaf = state.utxos.at(index);

        core::Transaction tx;
        core::TxIn input;
        input.prevout = leaf.prevout;
        tx.inputs.push_back(std::move(input));
        tx.outputs.push_back(core::TxOut{leaf.output.value - FEE, ANYONE_CAN_SPEND});
        block.transactions.push_back(std::move(tx));
        fees += FEE;

        const auto position = state.forest.position_of(leaf.hash());
        EXPECT_TRUE(position.has_value()) << "Лист не найден в лесу ветки";
        positions.push_back(position.value_or(0));
        result.spent_leaves.push_back(leaf);
    }

    block.transactions.front().outputs.push_back(
        core::TxOut{params_.block_subsidy(height) + fees, ANYONE_CAN_SPEND});

    block.header.version = 0x20000000;
    block.header.prev_hash = state.hash;
    block.header.merkle_root = block.compute_merkle_root().root;
    block.header.timestamp = state.tip.timestamp + 600;
    block.header.bits = state.tip.bits;
    block.header = grind(block.header);

    if (!positions.empty()) {
        auto proof = state.forest.prove(positions);
        EXPECT_TRUE(proof.has_value()) << (proof ? "" : proof.error().message);
        if (proof) {
            result.proof = std::move(*proof);
        }
        auto removed = state.forest.remove(positions);
        EXPECT_TRUE(removed.has_value());
    }

    const auto created = accumulator::block_leaves(block, height);
    state.forest.add(accumulator::leaf_hashes(created));

    // Потраченные удаляются с конца, чтобы индексы не сдвигались
    std::vector<std::size_t> doomed(spend.begin(), spend.end());
    std::sort(doomed.rbegin(), doomed.rend());
    for (auto index : doomed) {
        state.utxos.erase(state.utxos.begin() + static_cast<std::ptrdiff_t>(index));
    }
    state.utxos.insert(state.utxos.end(), created.begin(), created.end());

    state.tip = block.header;
    state.hash = block.header.hash();
    state.height = height;
    return result;
}

std::vector<accumulator::UtreexoBlock> ChainBuilder::mine_chain(
    BranchState& state,
    std::size_t count,
    uint8_t tag
) {
    std::vector<accumulator::UtreexoBlock> blocks;
    blocks.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        blocks.push_back(mine(state, {}, tag));
    }
    return blocks;
}

// =============================================================================
// TempDir
// =============================================================================

TempDir::TempDir(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            std::format("{}-{}-{}", prefix, stamp, counter.fetch_add(1));
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

} // namespace arbor::test
