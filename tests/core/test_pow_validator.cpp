/**
 * @file test_pow_validator.cpp
 * @brief Тесты compact target, работы и пересчёта сложности
 *
 * Векторы пересчёта взяты из истории mainnet.
 */

#include <gtest/gtest.h>

#include "core/chain/chain_registry.hpp"
#include "core/primitives/block_header.hpp"
#include "core/validation/pow_validator.hpp"

#include <map>

namespace arbor::core::test {

using validation::HeaderAtHeight;
using validation::PowValidator;

// =============================================================================
// Compact target
// =============================================================================

TEST(CompactTargetTest, GenesisBits) {
    const auto target = bits_to_target(0x1d00ffff);

    EXPECT_EQ(target, uint256::from_hex(
        "00000000ffff0000000000000000000000000000000000000000000000000000"));
    EXPECT_EQ(target_to_bits(target), 0x1d00ffffu);
}

TEST(CompactTargetTest, NegativeAndOverflow) {
    // Знаковый бит мантиссы
    const auto negative = decode_compact(0x04923456);
    EXPECT_TRUE(negative.negative);

    // Экспонента слишком велика для 256 бит
    const auto overflow = decode_compact(0xff123456);
    EXPECT_TRUE(overflow.overflow);

    // Нулевая мантисса - нулевой target
    EXPECT_TRUE(bits_to_target(0x01003456).is_zero());
}

TEST(CompactTargetTest, NormalizesMantissaSignBit) {
    // 0x80 в старшем байте мантиссы уходит в экспоненту
    const auto target = uint256{0x80ULL};
    EXPECT_EQ(target_to_bits(target), 0x02008000u);
}

// =============================================================================
// Работа
// =============================================================================

TEST(ChainWorkTest, MainnetGenesisWork) {
    const auto& params = mainnet_params();

    // 2^256 / (0xffff * 2^208 + 1)
    EXPECT_EQ(params.genesis.get_block_proof(), uint256{0x0100010001ULL});
}

TEST(ChainWorkTest, RegtestWorkIsTwo) {
    const auto& params = regtest_params();
    EXPECT_EQ(params.genesis.get_block_proof(), uint256{2ULL});
}

TEST(ChainWorkTest, HarderTargetMeansMoreWork) {
    BlockHeader easy;
    easy.bits = 0x1d00ffff;
    BlockHeader hard;
    hard.bits = 0x1c7fff80;

    EXPECT_GT(hard.get_block_proof(), easy.get_block_proof());
}

// =============================================================================
// PoW
// =============================================================================

TEST(PowValidatorTest, AcceptsMainnetGenesis) {
    const auto& params = mainnet_params();
    PowValidator validator(params);

    EXPECT_TRUE(validator.validate_pow(params.genesis));
}

TEST(PowValidatorTest, RejectsWrongNonce) {
    const auto& params = mainnet_params();
    PowValidator validator(params);

    auto header = params.genesis;
    header.nonce += 1;
    EXPECT_FALSE(validator.validate_pow(header));
}

TEST(PowValidatorTest, RejectsBitsAbovePowLimit) {
    const auto& params = mainnet_params();
    PowValidator validator(params);

    EXPECT_TRUE(validator.validate_bits(0x1d00ffff));
    EXPECT_FALSE(validator.validate_bits(0x1d01ffff));
    EXPECT_FALSE(validator.validate_bits(0x207fffff));
    EXPECT_FALSE(validator.validate_bits(0x04923456));
}

// =============================================================================
// Пересчёт сложности
// =============================================================================

TEST(RetargetTest, KeepsBitsForExpectedTimespan) {
    PowValidator validator(mainnet_params());
    EXPECT_EQ(validator.calculate_next_target(0x1d00ffff, validator.get_expected_timespan()),
              0x1d00ffffu);
}

TEST(RetargetTest, HalfTimespanDoublesDifficulty) {
    PowValidator validator(mainnet_params());
    EXPECT_EQ(validator.calculate_next_target(0x1d00ffff, validator.get_expected_timespan() / 2),
              0x1c7fff80u);
}

TEST(RetargetTest, MainnetBlock32256) {
    PowValidator validator(mainnet_params());
    EXPECT_EQ(validator.calculate_next_target(0x1d00ffff, 1262152739 - 1261130161), 0x1d00d86au);
}

TEST(RetargetTest, ClampsToQuarterTimespan) {
    PowValidator validator(mainnet_params());
    EXPECT_EQ(validator.calculate_next_target(0x1c05a3f4, 1279297671 - 1279008237), 0x1c0168fdu);
}

TEST(RetargetTest, ClampsToFourTimesTimespan) {
    PowValidator validator(mainnet_params());
    EXPECT_EQ(validator.calculate_next_target(0x1c387f6f, 1269211443 - 1263163443), 0x1d00e1fdu);
}

TEST(RetargetTest, CapsAtPowLimit) {
    PowValidator validator(mainnet_params());
    EXPECT_EQ(validator.calculate_next_target(0x1d00ffff, validator.get_expected_timespan() * 4),
              0x1d00ffffu);
}

TEST(RetargetTest, UsesFirstBlockOfPeriod) {
    const auto& params = mainnet_params();
    PowValidator validator(params);

    std::map<uint32_t, HeaderAtHeight> chain;
    BlockHeader first;
    first.bits = 0x1d00ffff;
    first.timestamp = 1261130161;
    chain[30240] = {first, 30240};

    BlockHeader last;
    last.bits = 0x1d00ffff;
    last.timestamp = 1262152739;
    chain[32255] = {last, 32255};

    auto lookup = [&](uint32_t height) -> std::optional<HeaderAtHeight> {
        auto it = chain.find(height);
        if (it == chain.end()) {
            return std::nullopt;
        }
        return it->second;
    };

    EXPECT_EQ(validator.next_work_required(chain[32255], last.timestamp + 600, lookup), 0x1d00d86au);

    // Вне границы периода bits не меняются
    HeaderAtHeight middle{last, 32000};
    EXPECT_EQ(validator.next_work_required(middle, last.timestamp + 600, lookup), 0x1d00ffffu);
}

TEST(RetargetTest, TestnetMinDifficultyAfterTwentyMinutes) {
    const auto& params = testnet_params();
    PowValidator validator(params);

    BlockHeader prev;
    prev.bits = 0x1c00ffff;
    prev.timestamp = 1'400'000'000;
    const HeaderAtHeight at{prev, 1000};
    auto no_ancestors = [](uint32_t) -> std::optional<HeaderAtHeight> { return std::nullopt; };

    EXPECT_EQ(validator.next_work_required(at, prev.timestamp + 1201, no_ancestors),
              params.pow_limit_bits());
    EXPECT_EQ(validator.next_work_required(at, prev.timestamp + 600, no_ancestors), 0x1c00ffffu);
}

TEST(RetargetTest, TestnetSkipsMinDifficultyBlocks) {
    const auto& params = testnet_params();
    PowValidator validator(params);
    const uint32_t limit = params.pow_limit_bits();

    std::map<uint32_t, HeaderAtHeight> chain;
    BlockHeader real;
    real.bits = 0x1c00ffff;
    real.timestamp = 1'400'000'000;
    chain[2020] = {real, 2020};
    for (uint32_t h = 2021; h <= 2023; ++h) {
        BlockHeader easy;
        easy.bits = limit;
        easy.timestamp = real.timestamp + (h - 2020) * 1300;
        chain[h] = {easy, h};
    }
    auto lookup = [&](uint32_t height) -> std::optional<HeaderAtHeight> {
        auto it = chain.find(height);
        if (it == chain.end()) {
            return std::nullopt;
        }
        return it->second;
    };

    // Быстрый блок после серии блоков минимальной сложности
    const auto& prev = chain[2023];
    EXPECT_EQ(validator.next_work_required(prev, prev.header.timestamp + 60, lookup), 0x1c00ffffu);
}

TEST(RetargetTest, RegtestNeverRetargets) {
    const auto& params = regtest_params();
    PowValidator validator(params);

    BlockHeader prev = params.genesis;
    const HeaderAtHeight at{prev, params.difficulty.adjustment_interval() - 1};
    auto no_ancestors = [](uint32_t) -> std::optional<HeaderAtHeight> { return std::nullopt; };

    EXPECT_EQ(validator.next_work_required(at, prev.timestamp + 600, no_ancestors), prev.bits);
}

} // namespace arbor::core::test
