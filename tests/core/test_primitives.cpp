/**
 * @file test_primitives.cpp
 * @brief Тесты заголовка, транзакций, блока и merkle дерева
 */

#include <gtest/gtest.h>

#include "core/chain/chain_registry.hpp"
#include "core/primitives/block.hpp"
#include "core/serialization/stream.hpp"

#include <string_view>

namespace arbor::core::test {

namespace {

/// @brief Coinbase транзакция genesis блока mainnet
constexpr std::string_view GENESIS_COINBASE_HEX =
    "01000000010000000000000000000000000000000000000000000000000000000000000000ffffffff"
    "4d04ffff001d0104455468652054696d65732030332f4a616e2f32303039204368616e63656c6c6f72"
    "206f6e206272696e6b206f66207365636f6e64206261696c6f757420666f722062616e6b73ffffffff"
    "0100f2052a01000000434104678afdb0fe5548271967f1a67130b7105cd6a828e03909a67962e0ea1f"
    "61deb649f6bc3f4cef38c4f35504e51ec112de5c384df7ba0b8d578a4c702b6bf11d5fac00000000";

[[nodiscard]] Bytes bytes_from_hex(std::string_view hex) {
    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::stoi(std::string(hex.substr(i, 2)), nullptr, 16)));
    }
    return out;
}

[[nodiscard]] Transaction genesis_coinbase() {
    const Bytes raw = bytes_from_hex(GENESIS_COINBASE_HEX);
    serialization::ReadStream in(raw);
    return Transaction::deserialize(in);
}

[[nodiscard]] Transaction spend(const Hash256& txid, uint32_t vout, int64_t value) {
    Transaction tx;
    TxIn input;
    input.prevout = OutPoint{txid, vout};
    tx.inputs.push_back(input);
    tx.outputs.push_back(TxOut{value, Bytes{0x51}});
    return tx;
}

} // namespace

// =============================================================================
// Заголовок
// =============================================================================

TEST(BlockHeaderTest, SerializeRoundTrip) {
    const auto& genesis = mainnet_params().genesis;
    const auto raw = genesis.serialize();

    ASSERT_EQ(raw.size(), BLOCK_HEADER_SIZE);
    EXPECT_EQ(BlockHeader::deserialize(raw.data()), genesis);

    auto parsed = BlockHeader::deserialize(ByteSpan{raw});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, genesis);
}

TEST(BlockHeaderTest, RejectsShortInput) {
    const std::array<uint8_t, 79> raw{};
    EXPECT_FALSE(BlockHeader::deserialize(ByteSpan{raw}).has_value());
}

TEST(BlockHeaderTest, GenesisFieldsLittleEndian) {
    const auto raw = mainnet_params().genesis.serialize();

    // version = 1
    EXPECT_EQ(raw[0], 0x01);
    // timestamp 1231006505 = 0x495fab29
    EXPECT_EQ(raw[68], 0x29);
    EXPECT_EQ(raw[71], 0x49);
    // bits 0x1d00ffff
    EXPECT_EQ(raw[72], 0xff);
    EXPECT_EQ(raw[75], 0x1d);
}

// =============================================================================
// Транзакции
// =============================================================================

TEST(TransactionTest, GenesisCoinbaseTxid) {
    const auto tx = genesis_coinbase();

    EXPECT_TRUE(tx.is_coinbase());
    ASSERT_EQ(tx.outputs.size(), 1u);
    EXPECT_EQ(tx.outputs[0].value, 50 * constants::COIN);
    EXPECT_EQ(hash_to_hex(tx.txid()),
              "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b");
    // Без witness txid и wtxid совпадают
    EXPECT_EQ(tx.txid(), tx.wtxid());
    EXPECT_EQ(tx.serialize(), bytes_from_hex(GENESIS_COINBASE_HEX));
}

TEST(TransactionTest, SegwitSerialization) {
    Transaction tx = spend(Hash256{0x11}, 1, 1000);
    tx.inputs[0].witness = {Bytes(72, 0x30), Bytes(33, 0x02)};

    ASSERT_TRUE(tx.has_witness());
    const Bytes full = tx.serialize(true);
    const Bytes stripped = tx.serialize(false);

    // marker 0x00, flag 0x01 после версии
    EXPECT_EQ(full[4], 0x00);
    EXPECT_EQ(full[5], 0x01);
    EXPECT_GT(full.size(), stripped.size());

    serialization::ReadStream in(full);
    const auto parsed = Transaction::deserialize(in);
    EXPECT_EQ(parsed, tx);
    EXPECT_TRUE(in.eof());

    EXPECT_NE(tx.txid(), tx.wtxid());
    EXPECT_EQ(tx.weight(), stripped.size() * 3 + full.size());
}

TEST(TransactionTest, UnspendableOutputs) {
    EXPECT_TRUE((TxOut{0, Bytes{constants::OP_RETURN, 0x01, 0x02}}).is_unspendable());
    EXPECT_TRUE((TxOut{0, Bytes(constants::MAX_SCRIPT_SIZE + 1, 0x51)}).is_unspendable());
    EXPECT_FALSE((TxOut{0, Bytes{0x51}}).is_unspendable());
    EXPECT_FALSE((TxOut{0, Bytes{}}).is_unspendable());
}

TEST(TransactionTest, TruncatedInputThrows) {
    Bytes raw = bytes_from_hex(GENESIS_COINBASE_HEX);
    raw.resize(raw.size() - 10);

    serialization::ReadStream in(raw);
    EXPECT_THROW((void)Transaction::deserialize(in), serialization::StreamError);
}

// =============================================================================
// Merkle и блок
// =============================================================================

TEST(MerkleTest, SingleTransactionRootIsTxid) {
    Block block;
    block.transactions.push_back(genesis_coinbase());

    const auto merkle = block.compute_merkle_root();
    EXPECT_EQ(merkle.root, block.transactions[0].txid());
    EXPECT_EQ(merkle.root, mainnet_params().genesis.merkle_root);
    EXPECT_FALSE(merkle.mutated);
}

TEST(MerkleTest, OddCountDuplicatesLast) {
    const Hash256 a{0x01};
    const Hash256 b{0x02};
    const Hash256 c{0x03};

    const auto root = compute_merkle_root({a, b, c});
    const Hash256 expected = merkle_hash(merkle_hash(a, b), merkle_hash(c, c));

    EXPECT_EQ(root.root, expected);
    EXPECT_FALSE(root.mutated);
}

TEST(MerkleTest, DuplicatedPairIsMutated) {
    const Hash256 a{0x01};
    const Hash256 b{0x02};

    // [a, b, b, b] даёт тот же корень, что и [a, b, b]
    const auto mutated = compute_merkle_root({a, b, b, b});
    const auto honest = compute_merkle_root({a, b, b});

    EXPECT_TRUE(mutated.mutated);
    EXPECT_EQ(mutated.root, honest.root);
}

TEST(BlockTest, SerializeRoundTrip) {
    Block block;
    block.header = mainnet_params().genesis;
    block.transactions.push_back(genesis_coinbase());
    block.transactions.push_back(spend(block.transactions[0].txid(), 0, 49 * constants::COIN));

    auto parsed = Block::deserialize(block.serialize());
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(*parsed, block);
    EXPECT_EQ(parsed->hash(), block.hash());
}

TEST(BlockTest, DeserializeRejectsTrailingBytes) {
    Block block;
    block.header = mainnet_params().genesis;
    block.transactions.push_back(genesis_coinbase());

    Bytes raw = block.serialize();
    raw.push_back(0x00);
    EXPECT_FALSE(Block::deserialize(raw).has_value());
}

} // namespace arbor::core::test
