/**
 * @file utreexo_block.cpp
 * @brief Сериализация UtreexoBlock
 */

#include "utreexo_block.hpp"

namespace arbor::accumulator {

using core::serialization::ReadStream;
using core::serialization::WriteStream;

Bytes UtreexoBlock::serialize() const {
    WriteStream out(1024);
    out.write_var_bytes(block.serialize());
    proof.serialize(out);
    out.write_varint(spent_leaves.size());
    for (const auto& leaf : spent_leaves) {
        leaf.serialize(out);
    }
    return out.take_data();
}

Result<UtreexoBlock> UtreexoBlock::deserialize(ByteSpan data) {
    struct Parts {
        Bytes block;
        BatchProof proof;
        std::vector<LeafData> leaves;
    };

    auto parts = core::serialization::decode(data, ErrorCode::StoreCorruption, [](ReadStream& in) {
        Parts result;
        result.block = in.read_var_bytes();
        result.proof = BatchProof::deserialize(in);
        const std::size_t count = in.read_count(in.remaining());
        result.leaves.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            result.leaves.push_back(LeafData::deserialize(in));
        }
        return result;
    });
    if (!parts) {
        return std::unexpected(parts.error());
    }

    auto block = core::Block::deserialize(parts->block);
    if (!block) {
        return Err<UtreexoBlock>(ErrorCode::StoreCorruption, block.error().message);
    }
    return UtreexoBlock{std::move(*block), std::move(parts->proof), std::move(parts->leaves)};
}

} // namespace arbor::accumulator
