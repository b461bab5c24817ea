/**
 * @file block_header.cpp
 * @brief Реализация заголовка блока
 */

#include "block_header.hpp"
#include "../byte_order.hpp"
#include "../../crypto/sha256.hpp"

#include <cmath>
#include <cstring>

namespace arbor::core {

std::array<uint8_t, BLOCK_HEADER_SIZE> BlockHeader::serialize() const noexcept {
    std::array<uint8_t, BLOCK_HEADER_SIZE> result{};

    write_le32(result.data(), static_cast<uint32_t>(version));
    std::memcpy(result.data() + 4, prev_hash.data(), 32);
    std::memcpy(result.data() + 36, merkle_root.data(), 32);
    write_le32(result.data() + 68, timestamp);
    write_le32(result.data() + 72, bits);
    write_le32(result.data() + 76, nonce);

    return result;
}

BlockHeader BlockHeader::deserialize(const uint8_t* data) noexcept {
    BlockHeader header;

    header.version = static_cast<int32_t>(read_le32(data));
    std::memcpy(header.prev_hash.data(), data + 4, 32);
    std::memcpy(header.merkle_root.data(), data + 36, 32);
    header.timestamp = read_le32(data + 68);
    header.bits = read_le32(data + 72);
    header.nonce = read_le32(data + 76);

    return header;
}

Result<BlockHeader> BlockHeader::deserialize(ByteSpan data) {
    if (data.size() < BLOCK_HEADER_SIZE) {
        return Err<BlockHeader>(
            ErrorCode::InvalidHeader,
            "Заголовок короче 80 байт: " + std::to_string(data.size()));
    }
    return deserialize(data.data());
}

Hash256 BlockHeader::hash() const noexcept {
    auto serialized = serialize();
    return crypto::sha256d(serialized);
}

uint256 BlockHeader::hash_uint256() const noexcept {
    return uint256{hash()};
}

uint256 BlockHeader::get_target() const noexcept {
    return bits_to_target(bits);
}

bool BlockHeader::check_pow() const noexcept {
    auto target = get_target();
    if (target.is_zero()) {
        return false;
    }
    return hash_uint256() <= target;
}

uint256 BlockHeader::get_block_proof() const noexcept {
    auto target = get_target();
    if (target.is_zero()) {
        return uint256::zero();
    }
    return work_from_target(target);
}

double BlockHeader::get_difficulty() const noexcept {
    return bits_to_difficulty(bits);
}

CompactTarget decode_compact(uint32_t bits) noexcept {
    CompactTarget result;

    const uint32_t exponent = bits >> 24;
    uint32_t mantissa = bits & 0x007FFFFF;

    if (exponent <= 3) {
        mantissa >>= 8 * (3 - exponent);
        result.target = uint256{static_cast<uint64_t>(mantissa)};
    } else {
        result.target = uint256{static_cast<uint64_t>(mantissa)};
        result.target <<= 8 * (exponent - 3);
    }

    result.negative = mantissa != 0 && (bits & 0x00800000) != 0;
    result.overflow = mantissa != 0 &&
        ((exponent > 34) ||
         (mantissa > 0xff && exponent > 33) ||
         (mantissa > 0xffff && exponent > 32));

    return result;
}

uint256 bits_to_target(uint32_t bits) noexcept {
    auto decoded = decode_compact(bits);
    if (decoded.negative || decoded.overflow) {
        return uint256::zero();
    }
    return decoded.target;
}

uint32_t target_to_bits(const uint256& target) noexcept {
    uint32_t size = (target.bits() + 7) / 8;
    uint32_t mantissa;

    if (size <= 3) {
        mantissa = static_cast<uint32_t>(target.low64() << (8 * (3 - size)));
    } else {
        mantissa = static_cast<uint32_t>((target >> (8 * (size - 3))).low64());
    }

    // Старший бит мантиссы означает знак: сдвигаем в следующий байт
    if (mantissa & 0x00800000) {
        mantissa >>= 8;
        ++size;
    }

    return (size << 24) | (mantissa & 0x007FFFFF);
}

double bits_to_difficulty(uint32_t bits) noexcept {
    int shift = static_cast<int>((bits >> 24) & 0xff);
    const uint32_t mantissa = bits & 0x00ffffff;
    if (mantissa == 0) {
        return 0.0;
    }

    double difficulty = static_cast<double>(0x0000ffff) / static_cast<double>(mantissa);
    while (shift < 29) {
        difficulty *= 256.0;
        ++shift;
    }
    while (shift > 29) {
        difficulty /= 256.0;
        --shift;
    }
    return difficulty;
}

} // namespace arbor::core
