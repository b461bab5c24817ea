/**
 * @file sha256.cpp
 * @brief Программная реализация SHA256 (FIPS 180-4)
 */

#include "sha256.hpp"
#include "../core/byte_order.hpp"
#include "../core/constants.hpp"

#include <algorithm>
#include <bit>
#include <cstring>

namespace arbor::crypto {

namespace {

// Функции SHA256 (FIPS 180-4, секция 4.1.2)
[[nodiscard]] inline uint32_t ch(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (~x & z);
}

[[nodiscard]] inline uint32_t maj(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (x & z) ^ (y & z);
}

[[nodiscard]] inline uint32_t big_sigma0(uint32_t x) noexcept {
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

[[nodiscard]] inline uint32_t big_sigma1(uint32_t x) noexcept {
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

[[nodiscard]] inline uint32_t small_sigma0(uint32_t x) noexcept {
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3);
}

[[nodiscard]] inline uint32_t small_sigma1(uint32_t x) noexcept {
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10);
}

} // anonymous namespace

void sha256_transform(Sha256State& state, const uint8_t* block) noexcept {
    // Расписание сообщения
    std::array<uint32_t, 64> w;
    for (std::size_t i = 0; i < 16; ++i) {
        w[i] = read_be32(block + i * 4);
    }
    for (std::size_t i = 16; i < 64; ++i) {
        w[i] = small_sigma1(w[i - 2]) + w[i - 7] + small_sigma0(w[i - 15]) + w[i - 16];
    }

    uint32_t a = state[0];
    uint32_t b = state[1];
    uint32_t c = state[2];
    uint32_t d = state[3];
    uint32_t e = state[4];
    uint32_t f = state[5];
    uint32_t g = state[6];
    uint32_t h = state[7];

    for (std::size_t i = 0; i < 64; ++i) {
        uint32_t t1 = h + big_sigma1(e) + ch(e, f, g) + constants::SHA256_K[i] + w[i];
        uint32_t t2 = big_sigma0(a) + maj(a, b, c);
        h = g;
        g = f;
        f = e;
        e = d + t1;
        d = c;
        c = b;
        b = a;
        a = t1 + t2;
    }

    state[0] += a;
    state[1] += b;
    state[2] += c;
    state[3] += d;
    state[4] += e;
    state[5] += f;
    state[6] += g;
    state[7] += h;
}

// =============================================================================
// Sha256
// =============================================================================

Sha256::Sha256() noexcept
    : state_(constants::SHA256_INIT) {}

void Sha256::reset() noexcept {
    state_ = constants::SHA256_INIT;
    buffered_ = 0;
    total_bytes_ = 0;
}

Sha256& Sha256::write(ByteSpan data) noexcept {
    const uint8_t* ptr = data.data();
    std::size_t len = data.size();
    total_bytes_ += len;

    // Дополняем частично заполненный буфер
    if (buffered_ > 0) {
        std::size_t take = std::min(len, buffer_.size() - buffered_);
        std::memcpy(buffer_.data() + buffered_, ptr, take);
        buffered_ += take;
        ptr += take;
        len -= take;
        if (buffered_ < buffer_.size()) {
            return *this;
        }
        sha256_transform(state_, buffer_.data());
        buffered_ = 0;
    }

    // Полные блоки без копирования
    while (len >= constants::SHA256_BLOCK_SIZE) {
        sha256_transform(state_, ptr);
        ptr += constants::SHA256_BLOCK_SIZE;
        len -= constants::SHA256_BLOCK_SIZE;
    }

    if (len > 0) {
        std::memcpy(buffer_.data(), ptr, len);
        buffered_ = len;
    }
    return *this;
}

Hash256 Sha256::finalize() noexcept {
    const uint64_t bit_len = total_bytes_ * 8;

    // 0x80 + нули до 56 байт по модулю 64 + длина в битах (big-endian)
    std::array<uint8_t, 72> padding{};
    padding[0] = 0x80;
    std::size_t pad_len = (buffered_ < 56) ? (56 - buffered_) : (120 - buffered_);
    write_be32(padding.data() + pad_len, static_cast<uint32_t>(bit_len >> 32));
    write_be32(padding.data() + pad_len + 4, static_cast<uint32_t>(bit_len));

    // total_bytes_ не должен учитывать padding, поэтому сохраняем его
    const uint64_t saved_total = total_bytes_;
    write(ByteSpan(padding.data(), pad_len + 8));
    total_bytes_ = saved_total;

    Hash256 result;
    for (std::size_t i = 0; i < 8; ++i) {
        write_be32(result.data() + i * 4, state_[i]);
    }

    reset();
    return result;
}

// =============================================================================
// Однократные функции
// =============================================================================

Hash256 sha256(ByteSpan data) noexcept {
    Sha256 hasher;
    hasher.write(data);
    return hasher.finalize();
}

Hash256 sha256d(ByteSpan data) noexcept {
    Hash256 first = sha256(data);
    return sha256(ByteSpan(first.data(), first.size()));
}

} // namespace arbor::crypto
