/**
 * @file leaf.cpp
 * @brief Реализация коммитментов листьев
 */

#include "leaf.hpp"
#include "../core/constants.hpp"
#include "../crypto/sha512.hpp"

#include <set>

namespace arbor::accumulator {

using core::serialization::ReadStream;
using core::serialization::WriteStream;

namespace {

/// @brief SHA512("UtreexoV1")
[[nodiscard]] const crypto::Hash512& utreexo_tag() {
    static const crypto::Hash512 tag = crypto::sha512(constants::UTREEXO_TAG_STRING);
    return tag;
}

} // namespace

Hash256 LeafData::hash() const {
    WriteStream body(128 + output.script_pubkey.size());
    body.write_hash256(block_hash);
    body.write_hash256(prevout.txid);
    body.write_u32_le(prevout.vout);
    body.write_u32_le(header_code());
    output.serialize(body);

    crypto::Sha512_256 hasher;
    hasher.write(utreexo_tag()).write(utreexo_tag()).write(body.data());
    return hasher.finalize();
}

void LeafData::serialize(WriteStream& out) const {
    out.write_hash256(block_hash);
    out.write_hash256(prevout.txid);
    out.write_u32_le(prevout.vout);
    out.write_u32_le(header_code());
    output.serialize(out);
}

LeafData LeafData::deserialize(ReadStream& in) {
    LeafData leaf;
    leaf.block_hash = in.read_hash256();
    leaf.prevout.txid = in.read_hash256();
    leaf.prevout.vout = in.read_u32_le();
    const uint32_t code = in.read_u32_le();
    leaf.height = code >> 1;
    leaf.is_coinbase = (code & 1) != 0;
    leaf.output = core::TxOut::deserialize(in);
    return leaf;
}

std::vector<LeafData> block_leaves(const core::Block& block, uint32_t height) {
    const Hash256 block_hash = block.hash();

    // Выходы, потраченные внутри блока, в аккумулятор не попадают
    std::set<core::OutPoint> spent_in_block;
    for (const auto& tx : block.transactions) {
        if (tx.is_coinbase()) {
            continue;
        }
        for (const auto& input : tx.inputs) {
            spent_in_block.insert(input.prevout);
        }
    }

    std::vector<LeafData> leaves;
    for (const auto& tx : block.transactions) {
        const Hash256 txid = tx.txid();
        const bool coinbase = tx.is_coinbase();
        for (uint32_t vout = 0; vout < tx.outputs.size(); ++vout) {
            const auto& output = tx.outputs[vout];
            core::OutPoint outpoint{txid, vout};
            if (output.is_unspendable() || spent_in_block.contains(outpoint)) {
                continue;
            }
            leaves.push_back(LeafData{block_hash, outpoint, height, coinbase, output});
        }
    }
    return leaves;
}

std::vector<Hash256> leaf_hashes(const std::vector<LeafData>& leaves) {
    std::vector<Hash256> hashes;
    hashes.reserve(leaves.size());
    for (const auto& leaf : leaves) {
        hashes.push_back(leaf.hash());
    }
    return hashes;
}

} // namespace arbor::accumulator
