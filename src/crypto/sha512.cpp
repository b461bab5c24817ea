/**
 * @file sha512.cpp
 * @brief Программная реализация SHA512 и SHA512/256 (FIPS 180-4)
 */

#include "sha512.hpp"
#include "../core/byte_order.hpp"
#include "../core/constants.hpp"

#include <algorithm>
#include <bit>
#include <cstring>

namespace arbor::crypto {

namespace {

// Функции SHA512 (FIPS 180-4, секция 4.1.3)
[[nodiscard]] inline uint64_t ch(uint64_t x, uint64_t y, uint64_t z) noexcept {
    return (x & y) ^ (~x & z);
}

[[nodiscard]] inline uint64_t maj(uint64_t x, uint64_t y, uint64_t z) noexcept {
    return (x & y) ^ (x & z) ^ (y & z);
}

[[nodiscard]] inline uint64_t big_sigma0(uint64_t x) noexcept {
    return std::rotr(x, 28) ^ std::rotr(x, 34) ^ std::rotr(x, 39);
}

[[nodiscard]] inline uint64_t big_sigma1(uint64_t x) noexcept {
    return std::rotr(x, 14) ^ std::rotr(x, 18) ^ std::rotr(x, 41);
}

[[nodiscard]] inline uint64_t small_sigma0(uint64_t x) noexcept {
    return std::rotr(x, 1) ^ std::rotr(x, 8) ^ (x >> 7);
}

[[nodiscard]] inline uint64_t small_sigma1(uint64_t x) noexcept {
    return std::rotr(x, 19) ^ std::rotr(x, 61) ^ (x >> 6);
}

} // anonymous namespace

void sha512_transform(Sha512State& state, const uint8_t* block) noexcept {
    std::array<uint64_t, 80> w;
    for (std::size_t i = 0; i < 16; ++i) {
        w[i] = read_be64(block + i * 8);
    }
    for (std::size_t i = 16; i < 80; ++i) {
        w[i] = small_sigma1(w[i - 2]) + w[i - 7] + small_sigma0(w[i - 15]) + w[i - 16];
    }

    uint64_t a = state[0];
    uint64_t b = state[1];
    uint64_t c = state[2];
    uint64_t d = state[3];
    uint64_t e = state[4];
    uint64_t f = state[5];
    uint64_t g = state[6];
    uint64_t h = state[7];

    for (std::size_t i = 0; i < 80; ++i) {
        uint64_t t1 = h + big_sigma1(e) + ch(e, f, g) + constants::SHA512_K[i] + w[i];
        uint64_t t2 = big_sigma0(a) + maj(a, b, c);
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
// Sha512Engine
// =============================================================================

namespace detail {

Sha512Engine::Sha512Engine(const Sha512State& init) noexcept
    : init_(init)
    , state_(init) {}

void Sha512Engine::reset() noexcept {
    state_ = init_;
    buffered_ = 0;
    total_bytes_ = 0;
}

void Sha512Engine::write(ByteSpan data) noexcept {
    const uint8_t* ptr = data.data();
    std::size_t len = data.size();
    total_bytes_ += len;

    if (buffered_ > 0) {
        std::size_t take = std::min(len, buffer_.size() - buffered_);
        std::memcpy(buffer_.data() + buffered_, ptr, take);
        buffered_ += take;
        ptr += take;
        len -= take;
        if (buffered_ < buffer_.size()) {
            return;
        }
        sha512_transform(state_, buffer_.data());
        buffered_ = 0;
    }

    while (len >= constants::SHA512_BLOCK_SIZE) {
        sha512_transform(state_, ptr);
        ptr += constants::SHA512_BLOCK_SIZE;
        len -= constants::SHA512_BLOCK_SIZE;
    }

    if (len > 0) {
        std::memcpy(buffer_.data(), ptr, len);
        buffered_ = len;
    }
}

void Sha512Engine::pad() noexcept {
    const uint64_t total = total_bytes_;

    // 0x80 + нули до 112 байт по модулю 128 + 128-битная длина в битах
    std::array<uint8_t, 144> padding{};
    padding[0] = 0x80;
    const std::size_t pad_len = (buffered_ < 112) ? (112 - buffered_) : (240 - buffered_);
    write_be64(padding.data() + pad_len, total >> 61);
    write_be64(padding.data() + pad_len + 8, total << 3);

    write(ByteSpan(padding.data(), pad_len + 16));
    total_bytes_ = total;
}

} // namespace detail

// =============================================================================
// Sha512 / Sha512_256
// =============================================================================

Sha512::Sha512() noexcept
    : engine_(constants::SHA512_INIT) {}

Sha512& Sha512::write(ByteSpan data) noexcept {
    engine_.write(data);
    return *this;
}

Hash512 Sha512::finalize() noexcept {
    engine_.pad();
    Hash512 result;
    for (std::size_t i = 0; i < 8; ++i) {
        write_be64(result.data() + i * 8, engine_.state()[i]);
    }
    engine_.reset();
    return result;
}

void Sha512::reset() noexcept {
    engine_.reset();
}

Sha512_256::Sha512_256() noexcept
    : engine_(constants::SHA512_256_INIT) {}

Sha512_256& Sha512_256::write(ByteSpan data) noexcept {
    engine_.write(data);
    return *this;
}

Hash256 Sha512_256::finalize() noexcept {
    engine_.pad();
    Hash256 result;
    for (std::size_t i = 0; i < 4; ++i) {
        write_be64(result.data() + i * 8, engine_.state()[i]);
    }
    engine_.reset();
    return result;
}

void Sha512_256::reset() noexcept {
    engine_.reset();
}

// =============================================================================
// Однократные функции
// =============================================================================

Hash512 sha512(ByteSpan data) noexcept {
    Sha512 hasher;
    hasher.write(data);
    return hasher.finalize();
}

Hash256 sha512_256(ByteSpan data) noexcept {
    Sha512_256 hasher;
    hasher.write(data);
    return hasher.finalize();
}

} // namespace arbor::crypto
