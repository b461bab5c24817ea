/**
 * @file test_leaf.cpp
 * @brief Тесты коммитментов листьев и блоков с доказательствами
 */

#include <gtest/gtest.h>

#include "accumulator/leaf.hpp"
#include "accumulator/utreexo_block.hpp"
#include "core/chain/chain_registry.hpp"
#include "core/constants.hpp"
#include "crypto/sha512.hpp"
#include "support/chain_builder.hpp"

namespace arbor::accumulator::test {

namespace {

[[nodiscard]] LeafData sample_leaf() {
    LeafData leaf;
    leaf.block_hash.fill(0x11);
    leaf.prevout.txid.fill(0x22);
    leaf.prevout.vout = 3;
    leaf.height = 500;
    leaf.is_coinbase = true;
    leaf.output = core::TxOut{5'000, Bytes{0x51}};
    return leaf;
}

[[nodiscard]] core::Transaction coinbase_tx() {
    core::Transaction tx;
    core::TxIn input;
    input.prevout = core::OutPoint{Hash256{}, 0xFFFFFFFF};
    input.script_sig = {0x01, 0x07};
    tx.inputs.push_back(input);
    tx.outputs.push_back(core::TxOut{50'000, Bytes{0x51}});
    tx.outputs.push_back(core::TxOut{0, Bytes{0x6a, 0x01, 0x00}});
    tx.outputs.push_back(core::TxOut{1'000, Bytes{0x52}});
    return tx;
}

} // namespace

TEST(LeafTest, HeaderCodePacksHeightAndCoinbase) {
    LeafData leaf = sample_leaf();
    EXPECT_EQ(leaf.header_code(), 1001u);

    leaf.is_coinbase = false;
    EXPECT_EQ(leaf.header_code(), 1000u);
}

TEST(LeafTest, HashIsTaggedSha512_256) {
    const LeafData leaf = sample_leaf();

    core::serialization::WriteStream body;
    leaf.serialize(body);

    const crypto::Hash512 tag = crypto::sha512(constants::UTREEXO_TAG_STRING);
    crypto::Sha512_256 hasher;
    hasher.write(tag).write(tag).write(body.data());

    EXPECT_EQ(leaf.hash(), hasher.finalize());
    EXPECT_NE(leaf.hash(), crypto::sha512_256(body.data()));
}

TEST(LeafTest, HashKnownAnswer) {
    // block_hash = 11.., txid = 22.., vout 3, height 500, coinbase, 5000 sat, OP_TRUE
    constexpr Hash256 expected = {{
        0x5f, 0xb5, 0xff, 0x12, 0x0c, 0x39, 0x0f, 0x9b,
        0xfb, 0x24, 0x3b, 0x29, 0x80, 0x5d, 0x84, 0xb2,
        0x4b, 0xf4, 0x4d, 0x43, 0x33, 0xe3, 0xfe, 0x70,
        0x6c, 0x93, 0xb0, 0x21, 0x92, 0xa0, 0x31, 0x23
    }};
    EXPECT_EQ(sample_leaf().hash(), expected);
}

TEST(LeafTest, EveryFieldChangesHash) {
    const Hash256 base = sample_leaf().hash();

    LeafData leaf = sample_leaf();
    leaf.block_hash[0] ^= 1;
    EXPECT_NE(leaf.hash(), base);

    leaf = sample_leaf();
    leaf.prevout.vout = 4;
    EXPECT_NE(leaf.hash(), base);

    leaf = sample_leaf();
    leaf.height = 501;
    EXPECT_NE(leaf.hash(), base);

    leaf = sample_leaf();
    leaf.is_coinbase = false;
    EXPECT_NE(leaf.hash(), base);

    leaf = sample_leaf();
    leaf.output.value += 1;
    EXPECT_NE(leaf.hash(), base);

    leaf = sample_leaf();
    leaf.output.script_pubkey.push_back(0x87);
    EXPECT_NE(leaf.hash(), base);
}

TEST(LeafTest, SerializeRoundTrip) {
    const LeafData leaf = sample_leaf();
    core::serialization::WriteStream out;
    leaf.serialize(out);

    core::serialization::ReadStream in(out.data());
    EXPECT_EQ(LeafData::deserialize(in), leaf);
    EXPECT_TRUE(in.eof());
}

TEST(BlockLeavesTest, SkipsUnspendableAndSpentInBlock) {
    core::Block block;
    block.header.bits = 0x207fffff;
    block.transactions.push_back(coinbase_tx());

    // Вторая транзакция тратит выход 0 coinbase этого же блока
    core::Transaction spend;
    core::TxIn input;
    input.prevout = core::OutPoint{block.transactions[0].txid(), 0};
    spend.inputs.push_back(input);
    spend.outputs.push_back(core::TxOut{49'000, Bytes{0x53}});
    block.transactions.push_back(spend);

    const auto leaves = block_leaves(block, 12);
    ASSERT_EQ(leaves.size(), 2u);

    EXPECT_EQ(leaves[0].prevout, (core::OutPoint{block.transactions[0].txid(), 2}));
    EXPECT_TRUE(leaves[0].is_coinbase);
    EXPECT_EQ(leaves[0].height, 12u);
    EXPECT_EQ(leaves[0].block_hash, block.hash());

    EXPECT_EQ(leaves[1].prevout, (core::OutPoint{block.transactions[1].txid(), 0}));
    EXPECT_FALSE(leaves[1].is_coinbase);
    EXPECT_EQ(leaves[1].output.value, 49'000);

    const auto hashes = leaf_hashes(leaves);
    ASSERT_EQ(hashes.size(), 2u);
    EXPECT_EQ(hashes[1], leaves[1].hash());
}

TEST(UtreexoBlockTest, SerializeRoundTrip) {
    const auto* params = core::ChainRegistry::instance().get_by_name("regtest");
    ASSERT_NE(params, nullptr);

    arbor::test::ChainBuilder builder(*params);
    auto state = builder.genesis();
    (void)builder.mine(state);
    const std::size_t spend[] = {0};
    const auto block = builder.mine(state, spend);
    ASSERT_EQ(block.spent_leaves.size(), 1u);

    auto parsed = UtreexoBlock::deserialize(block.serialize());
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(*parsed, block);
    EXPECT_EQ(parsed->hash(), block.hash());
}

TEST(UtreexoBlockTest, TruncatedIsCorruption) {
    const auto* params = core::ChainRegistry::instance().get_by_name("regtest");
    ASSERT_NE(params, nullptr);

    arbor::test::ChainBuilder builder(*params);
    auto state = builder.genesis();
    Bytes raw = builder.mine(state).serialize();
    raw.resize(raw.size() - 5);

    auto parsed = UtreexoBlock::deserialize(raw);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, ErrorCode::StoreCorruption);
}

} // namespace arbor::accumulator::test
