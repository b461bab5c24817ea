/**
 * @file uint256.cpp
 * @brief Реализация 256-битного целого числа
 */

#include "uint256.hpp"
#include "../byte_order.hpp"

#include <bit>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace arbor::core {

namespace {

[[nodiscard]] inline uint8_t hex_char_to_int(char c) {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    throw std::invalid_argument("Invalid hex character");
}

} // namespace

uint256::Limbs uint256::to_limbs() const noexcept {
    Limbs limbs{};
    for (std::size_t i = 0; i < 4; ++i) {
        limbs[i] = read_le64(data_.data() + i * 8);
    }
    return limbs;
}

void uint256::from_limbs(const Limbs& limbs) noexcept {
    for (std::size_t i = 0; i < 4; ++i) {
        write_le64(data_.data() + i * 8, limbs[i]);
    }
}

unsigned uint256::bits() const noexcept {
    auto limbs = to_limbs();
    for (std::size_t i = 4; i-- > 0;) {
        if (limbs[i] != 0) {
            return static_cast<unsigned>(i * 64 + 64 - std::countl_zero(limbs[i]));
        }
    }
    return 0;
}

uint64_t uint256::low64() const noexcept {
    return read_le64(data_.data());
}

uint256& uint256::operator+=(const uint256& other) noexcept {
    auto a = to_limbs();
    auto b = other.to_limbs();
    unsigned __int128 carry = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        unsigned __int128 sum = static_cast<unsigned __int128>(a[i]) + b[i] + carry;
        a[i] = static_cast<uint64_t>(sum);
        carry = sum >> 64;
    }
    from_limbs(a);
    return *this;
}

uint256& uint256::operator-=(const uint256& other) noexcept {
    // a - b = a + (~b + 1)
    *this += ~other + one();
    return *this;
}

uint256& uint256::operator*=(uint32_t factor) noexcept {
    auto a = to_limbs();
    unsigned __int128 carry = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        unsigned __int128 product = static_cast<unsigned __int128>(a[i]) * factor + carry;
        a[i] = static_cast<uint64_t>(product);
        carry = product >> 64;
    }
    from_limbs(a);
    return *this;
}

uint256& uint256::operator/=(const uint256& divisor) noexcept {
    if (divisor.is_zero()) {
        *this = zero();
        return *this;
    }

    // Деление сдвигом и вычитанием
    uint256 dividend = *this;
    uint256 div = divisor;
    uint256 quotient;

    const int dividend_bits = static_cast<int>(dividend.bits());
    const int divisor_bits = static_cast<int>(div.bits());
    if (divisor_bits > dividend_bits) {
        *this = zero();
        return *this;
    }

    int shift = dividend_bits - divisor_bits;
    div <<= static_cast<unsigned>(shift);
    while (shift >= 0) {
        if (dividend >= div) {
            dividend -= div;
            quotient[static_cast<std::size_t>(shift / 8)] |=
                static_cast<uint8_t>(1u << (shift % 8));
        }
        div >>= 1;
        --shift;
    }

    *this = quotient;
    return *this;
}

uint256& uint256::operator<<=(unsigned shift) noexcept {
    auto a = to_limbs();
    Limbs r{};
    const unsigned limb_shift = shift / 64;
    const unsigned bit_shift = shift % 64;
    for (unsigned i = 0; i < 4; ++i) {
        if (i + limb_shift >= 4) break;
        r[i + limb_shift] |= a[i] << bit_shift;
        if (bit_shift != 0 && i + limb_shift + 1 < 4) {
            r[i + limb_shift + 1] |= a[i] >> (64 - bit_shift);
        }
    }
    from_limbs(r);
    return *this;
}

uint256& uint256::operator>>=(unsigned shift) noexcept {
    auto a = to_limbs();
    Limbs r{};
    const unsigned limb_shift = shift / 64;
    const unsigned bit_shift = shift % 64;
    for (unsigned i = limb_shift; i < 4; ++i) {
        r[i - limb_shift] |= a[i] >> bit_shift;
        if (bit_shift != 0 && i - limb_shift >= 1) {
            r[i - limb_shift - 1] |= a[i] << (64 - bit_shift);
        }
    }
    from_limbs(r);
    return *this;
}

uint256 uint256::operator~() const noexcept {
    uint256 result;
    for (std::size_t i = 0; i < SIZE; ++i) {
        result.data_[i] = static_cast<uint8_t>(~data_[i]);
    }
    return result;
}

std::string uint256::to_hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = SIZE; i-- > 0;) {
        oss << std::setw(2) << static_cast<unsigned>(data_[i]);
    }
    return oss.str();
}

uint256 uint256::from_hex(std::string_view hex) {
    if (hex.size() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length");
    }

    uint256 result;
    for (std::size_t i = 0; i < SIZE; ++i) {
        std::size_t hex_idx = (SIZE - 1 - i) * 2;
        result.data_[i] = static_cast<uint8_t>(
            (hex_char_to_int(hex[hex_idx]) << 4) | hex_char_to_int(hex[hex_idx + 1]));
    }
    return result;
}

uint256 work_from_target(const uint256& target) noexcept {
    // 2^256 не помещается в uint256, поэтому (2^256 - target - 1) / (target + 1) + 1
    return (~target / (target + uint256::one())) + uint256::one();
}

std::string hash_to_hex(const Hash256& hash) {
    return uint256{hash}.to_hex();
}

Hash256 hash_from_hex(std::string_view hex) {
    return uint256::from_hex(hex).to_hash256();
}

} // namespace arbor::core
