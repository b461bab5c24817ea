/**
 * @file chain_store.cpp
 * @brief Записи хранилища и общая логика backend
 */

#include "chain_store.hpp"
#include "../core/serialization/stream.hpp"

#include <format>

namespace arbor::storage {

using core::serialization::ReadStream;
using core::serialization::WriteStream;

// =============================================================================
// StoredHeader
// =============================================================================

Bytes StoredHeader::serialize() const {
    WriteStream out(core::BLOCK_HEADER_SIZE + 4 + 32 + 1);
    out.write_bytes(header.serialize());
    out.write_u32_le(height);
    out.write_bytes(ByteSpan(chain_work.data(), core::uint256::size()));
    out.write_u8(static_cast<uint8_t>(status));
    return out.take_data();
}

Result<StoredHeader> StoredHeader::deserialize(ByteSpan data) {
    return core::serialization::decode(data, ErrorCode::StoreCorruption, [](ReadStream& in) {
        StoredHeader stored;
        auto raw = in.read_bytes(core::BLOCK_HEADER_SIZE);
        stored.header = core::BlockHeader::deserialize(raw.data());
        stored.height = in.read_u32_le();
        stored.chain_work = core::uint256{in.read_hash256()};
        const uint8_t status = in.read_u8();
        if (status > static_cast<uint8_t>(HeaderStatus::Rejected)) {
            throw core::serialization::StreamError("Unknown header status");
        }
        stored.status = static_cast<HeaderStatus>(status);
        return stored;
    });
}

// =============================================================================
// ChainTip
// =============================================================================

Bytes ChainTip::serialize() const {
    WriteStream out(36);
    out.write_hash256(hash);
    out.write_u32_le(height);
    return out.take_data();
}

Result<ChainTip> ChainTip::deserialize(ByteSpan data) {
    return core::serialization::decode(data, ErrorCode::StoreCorruption, [](ReadStream& in) {
        ChainTip tip;
        tip.hash = in.read_hash256();
        tip.height = in.read_u32_le();
        return tip;
    });
}

// =============================================================================
// Откат по undo данным
// =============================================================================

Result<accumulator::Forest> replay_undo(const ChainStore& store, uint32_t from, uint32_t to) {
    if (to > from) {
        return Err<accumulator::Forest>(
            ErrorCode::StoreNotFound,
            std::format("Высота {} выше tip {}", to, from));
    }
    if (to + 1 < store.prune_height() && to < from) {
        return Err<accumulator::Forest>(
            ErrorCode::UndoUnavailable,
            std::format("Откат до {} невозможен: undo данные ниже {} удалены",
                        to, store.prune_height()));
    }

    auto forest = store.get_roots(from);
    if (!forest) {
        return forest;
    }

    for (uint32_t height = from; height > to; --height) {
        auto undo = store.get_undo(height);
        if (!undo) {
            return std::unexpected(undo.error());
        }
        auto prev = accumulator::undo_block(*forest, *undo);
        if (!prev) {
            return Err<accumulator::Forest>(
                ErrorCode::StoreCorruption,
                std::format("Undo данные высоты {} не применимы: {}", height, prev.error().message));
        }
        forest = std::move(prev);
    }

    // Корни хранятся для каждой высоты: результат отката обязан совпасть
    auto stored = store.get_roots(to);
    if (!stored) {
        return stored;
    }
    if (*stored != *forest) {
        return Err<accumulator::Forest>(
            ErrorCode::StoreCorruption,
            std::format("Лес после отката до {} не совпадает с сохранёнными корнями", to));
    }
    return forest;
}

} // namespace arbor::storage
