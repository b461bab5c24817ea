/**
 * @file stream.cpp
 * @brief Реализация потоков сериализации
 */

#include "stream.hpp"
#include "../byte_order.hpp"

#include <cstring>

namespace arbor::core::serialization {

// =============================================================================
// ReadStream
// =============================================================================

void ReadStream::ensure_available(std::size_t count) {
    if (count > data_.size() - pos_) {
        throw StreamError("Unexpected end of stream");
    }
}

uint8_t ReadStream::read_u8() {
    ensure_available(1);
    return data_[pos_++];
}

uint16_t ReadStream::read_u16_le() {
    ensure_available(2);
    auto result = read_le16(data_.data() + pos_);
    pos_ += 2;
    return result;
}

uint32_t ReadStream::read_u32_le() {
    ensure_available(4);
    auto result = read_le32(data_.data() + pos_);
    pos_ += 4;
    return result;
}

uint64_t ReadStream::read_u64_le() {
    ensure_available(8);
    auto result = read_le64(data_.data() + pos_);
    pos_ += 8;
    return result;
}

int32_t ReadStream::read_i32_le() {
    return static_cast<int32_t>(read_u32_le());
}

int64_t ReadStream::read_i64_le() {
    return static_cast<int64_t>(read_u64_le());
}

uint64_t ReadStream::read_u64_be() {
    ensure_available(8);
    auto result = read_be64(data_.data() + pos_);
    pos_ += 8;
    return result;
}

uint64_t ReadStream::read_varint() {
    uint8_t first = read_u8();
    uint64_t value;
    uint64_t min_value;
    if (first < 0xFD) {
        return first;
    } else if (first == 0xFD) {
        value = read_u16_le();
        min_value = 0xFD;
    } else if (first == 0xFE) {
        value = read_u32_le();
        min_value = 0x10000;
    } else {
        value = read_u64_le();
        min_value = 0x100000000ULL;
    }
    if (value < min_value) {
        throw StreamError("Non-canonical CompactSize");
    }
    return value;
}

Bytes ReadStream::read_bytes(std::size_t count) {
    ensure_available(count);
    Bytes result(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                 data_.begin() + static_cast<std::ptrdiff_t>(pos_ + count));
    pos_ += count;
    return result;
}

Bytes ReadStream::read_var_bytes(std::size_t max_size) {
    uint64_t len = read_varint();
    if (len > max_size) {
        throw StreamError("Byte array too long");
    }
    return read_bytes(static_cast<std::size_t>(len));
}

Hash256 ReadStream::read_hash256() {
    ensure_available(32);
    Hash256 result;
    std::memcpy(result.data(), data_.data() + pos_, 32);
    pos_ += 32;
    return result;
}

std::size_t ReadStream::read_count(std::size_t max_count) {
    uint64_t count = read_varint();
    // Каждый элемент занимает хотя бы байт: защищаемся от огромных reserve()
    if (count > max_count || count > remaining()) {
        throw StreamError("Element count out of range");
    }
    return static_cast<std::size_t>(count);
}

std::size_t ReadStream::remaining() const noexcept {
    return data_.size() - pos_;
}

std::size_t ReadStream::position() const noexcept {
    return pos_;
}

bool ReadStream::eof() const noexcept {
    return pos_ >= data_.size();
}

void ReadStream::skip(std::size_t count) {
    ensure_available(count);
    pos_ += count;
}

// =============================================================================
// WriteStream
// =============================================================================

WriteStream::WriteStream(std::size_t reserve_size) {
    data_.reserve(reserve_size);
}

void WriteStream::write_u8(uint8_t value) {
    data_.push_back(value);
}

void WriteStream::write_u16_le(uint16_t value) {
    uint8_t buf[2];
    write_le16(buf, value);
    data_.insert(data_.end(), buf, buf + 2);
}

void WriteStream::write_u32_le(uint32_t value) {
    uint8_t buf[4];
    write_le32(buf, value);
    data_.insert(data_.end(), buf, buf + 4);
}

void WriteStream::write_u64_le(uint64_t value) {
    uint8_t buf[8];
    write_le64(buf, value);
    data_.insert(data_.end(), buf, buf + 8);
}

void WriteStream::write_i32_le(int32_t value) {
    write_u32_le(static_cast<uint32_t>(value));
}

void WriteStream::write_i64_le(int64_t value) {
    write_u64_le(static_cast<uint64_t>(value));
}

void WriteStream::write_u64_be(uint64_t value) {
    uint8_t buf[8];
    write_be64(buf, value);
    data_.insert(data_.end(), buf, buf + 8);
}

void WriteStream::write_varint(uint64_t value) {
    if (value < 0xFD) {
        write_u8(static_cast<uint8_t>(value));
    } else if (value <= 0xFFFF) {
        write_u8(0xFD);
        write_u16_le(static_cast<uint16_t>(value));
    } else if (value <= 0xFFFFFFFF) {
        write_u8(0xFE);
        write_u32_le(static_cast<uint32_t>(value));
    } else {
        write_u8(0xFF);
        write_u64_le(value);
    }
}

void WriteStream::write_bytes(ByteSpan data) {
    data_.insert(data_.end(), data.begin(), data.end());
}

void WriteStream::write_var_bytes(ByteSpan data) {
    write_varint(data.size());
    write_bytes(data);
}

void WriteStream::write_hash256(const Hash256& hash) {
    data_.insert(data_.end(), hash.begin(), hash.end());
}

const Bytes& WriteStream::data() const noexcept {
    return data_;
}

Bytes WriteStream::take_data() noexcept {
    return std::move(data_);
}

std::size_t WriteStream::size() const noexcept {
    return data_.size();
}

void WriteStream::clear() {
    data_.clear();
}

} // namespace arbor::core::serialization
