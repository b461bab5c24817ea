/**
 * @file transaction.cpp
 * @brief Реализация транзакции
 */

#include "transaction.hpp"
#include "../constants.hpp"
#include "../../crypto/sha256.hpp"

namespace arbor::core {

using serialization::ReadStream;
using serialization::StreamError;
using serialization::WriteStream;

namespace {

/// @brief Верхняя граница количества элементов (вход/выход/witness)
constexpr std::size_t MAX_ELEMENTS = 1'000'000;

} // namespace

// =============================================================================
// TxOut
// =============================================================================

bool TxOut::is_unspendable() const noexcept {
    return (!script_pubkey.empty() && script_pubkey[0] == constants::OP_RETURN) ||
           script_pubkey.size() > constants::MAX_SCRIPT_SIZE;
}

void TxOut::serialize(WriteStream& out) const {
    out.write_i64_le(value);
    out.write_var_bytes(script_pubkey);
}

TxOut TxOut::deserialize(ReadStream& in) {
    TxOut txout;
    txout.value = in.read_i64_le();
    txout.script_pubkey = in.read_var_bytes();
    return txout;
}

// =============================================================================
// Transaction
// =============================================================================

bool Transaction::has_witness() const noexcept {
    for (const auto& input : inputs) {
        if (!input.witness.empty()) {
            return true;
        }
    }
    return false;
}

bool Transaction::is_coinbase() const noexcept {
    return inputs.size() == 1 && inputs[0].prevout.is_null();
}

void Transaction::serialize(WriteStream& out, bool with_witness) const {
    const bool segwit = with_witness && has_witness();

    out.write_i32_le(version);
    if (segwit) {
        // marker + flag
        out.write_u8(0x00);
        out.write_u8(0x01);
    }

    out.write_varint(inputs.size());
    for (const auto& input : inputs) {
        out.write_hash256(input.prevout.txid);
        out.write_u32_le(input.prevout.vout);
        out.write_var_bytes(input.script_sig);
        out.write_u32_le(input.sequence);
    }

    out.write_varint(outputs.size());
    for (const auto& output : outputs) {
        output.serialize(out);
    }

    if (segwit) {
        for (const auto& input : inputs) {
            out.write_varint(input.witness.size());
            for (const auto& item : input.witness) {
                out.write_var_bytes(item);
            }
        }
    }

    out.write_u32_le(lock_time);
}

Bytes Transaction::serialize(bool with_witness) const {
    WriteStream out;
    serialize(out, with_witness);
    return out.take_data();
}

Transaction Transaction::deserialize(ReadStream& in) {
    Transaction tx;
    tx.version = in.read_i32_le();

    auto read_inputs = [&](std::size_t count) {
        tx.inputs.resize(count);
        for (auto& input : tx.inputs) {
            input.prevout.txid = in.read_hash256();
            input.prevout.vout = in.read_u32_le();
            input.script_sig = in.read_var_bytes();
            input.sequence = in.read_u32_le();
        }
    };

    bool segwit = false;
    std::size_t input_count = in.read_count(MAX_ELEMENTS);
    if (input_count == 0) {
        // Либо segwit marker, либо транзакция без входов
        uint8_t flag = in.read_u8();
        if (flag != 0x01) {
            throw StreamError("Unknown transaction flag");
        }
        segwit = true;
        input_count = in.read_count(MAX_ELEMENTS);
    }
    read_inputs(input_count);

    const std::size_t output_count = in.read_count(MAX_ELEMENTS);
    tx.outputs.reserve(output_count);
    for (std::size_t i = 0; i < output_count; ++i) {
        tx.outputs.push_back(TxOut::deserialize(in));
    }

    if (segwit) {
        for (auto& input : tx.inputs) {
            const std::size_t items = in.read_count(MAX_ELEMENTS);
            input.witness.reserve(items);
            for (std::size_t i = 0; i < items; ++i) {
                input.witness.push_back(in.read_var_bytes());
            }
        }
        if (!tx.has_witness()) {
            throw StreamError("Superfluous witness record");
        }
    }

    tx.lock_time = in.read_u32_le();
    return tx;
}

Hash256 Transaction::txid() const {
    return crypto::sha256d(serialize(false));
}

Hash256 Transaction::wtxid() const {
    return crypto::sha256d(serialize(true));
}

std::size_t Transaction::weight() const {
    const std::size_t base = serialize(false).size();
    const std::size_t total = serialize(true).size();
    return base * (constants::WITNESS_SCALE_FACTOR - 1) + total;
}

int64_t Transaction::total_output_value() const noexcept {
    int64_t total = 0;
    for (const auto& output : outputs) {
        total += output.value;
    }
    return total;
}

} // namespace arbor::core
