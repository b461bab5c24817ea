/**
 * @file block.cpp
 * @brief Реализация сериализации блока
 */

#include "block.hpp"

namespace arbor::core {

using serialization::ReadStream;
using serialization::WriteStream;

Bytes Block::serialize() const {
    WriteStream out(BLOCK_HEADER_SIZE + transactions.size() * 256);
    out.write_bytes(header.serialize());
    out.write_varint(transactions.size());
    for (const auto& tx : transactions) {
        tx.serialize(out, true);
    }
    return out.take_data();
}

Result<Block> Block::deserialize(ByteSpan data) {
    return serialization::decode(data, ErrorCode::InvalidBlock, [](ReadStream& in) {
        Block block;
        auto raw_header = in.read_bytes(BLOCK_HEADER_SIZE);
        block.header = BlockHeader::deserialize(raw_header.data());

        const std::size_t tx_count = in.read_count(1'000'000);
        block.transactions.reserve(tx_count);
        for (std::size_t i = 0; i < tx_count; ++i) {
            block.transactions.push_back(Transaction::deserialize(in));
        }
        return block;
    });
}

MerkleRoot Block::compute_merkle_root() const {
    std::vector<Hash256> txids;
    txids.reserve(transactions.size());
    for (const auto& tx : transactions) {
        txids.push_back(tx.txid());
    }
    return core::compute_merkle_root(std::move(txids));
}

std::size_t Block::weight() const {
    // Заголовок и счётчик транзакций не содержат witness данных
    std::size_t weight = (BLOCK_HEADER_SIZE +
        serialization::varint_size(transactions.size())) * constants::WITNESS_SCALE_FACTOR;
    for (const auto& tx : transactions) {
        weight += tx.weight();
    }
    return weight;
}

} // namespace arbor::core
