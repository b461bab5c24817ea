/**
 * @file test_chain_params.cpp
 * @brief Тесты для ChainParams и ChainRegistry
 */

#include <gtest/gtest.h>

#include "core/chain/chain_params.hpp"
#include "core/chain/chain_registry.hpp"

#include <algorithm>

namespace arbor::core::test {

// =============================================================================
// Тесты ChainRegistry
// =============================================================================

TEST(ChainRegistryTest, InstanceIsSingleton) {
    auto& registry1 = ChainRegistry::instance();
    auto& registry2 = ChainRegistry::instance();

    EXPECT_EQ(&registry1, &registry2);
}

TEST(ChainRegistryTest, HasBuiltinChains) {
    auto& registry = ChainRegistry::instance();

    EXPECT_TRUE(registry.has_chain("mainnet"));
    EXPECT_TRUE(registry.has_chain("testnet"));
    EXPECT_TRUE(registry.has_chain("signet"));
    EXPECT_TRUE(registry.has_chain("regtest"));
    EXPECT_FALSE(registry.has_chain("namecoin"));
}

TEST(ChainRegistryTest, GetByName) {
    auto& registry = ChainRegistry::instance();

    auto* main = registry.get_by_name("mainnet");
    ASSERT_NE(main, nullptr);
    EXPECT_EQ(main->name, "mainnet");
    EXPECT_EQ(&mainnet_params(), main);

    EXPECT_EQ(registry.get_by_name("unknown"), nullptr);
}

TEST(ChainRegistryTest, GetAllNames) {
    auto names = ChainRegistry::instance().get_all_names();

    EXPECT_GE(names.size(), 4u);
    EXPECT_NE(std::find(names.begin(), names.end(), "regtest"), names.end());
}

TEST(ChainRegistryTest, RegisterRejectsDuplicateName) {
    ChainParams params = regtest_params();
    EXPECT_FALSE(ChainRegistry::instance().register_chain(params));
}

TEST(ChainRegistryTest, PointersStableAfterRegistration) {
    const ChainParams* before = &regtest_params();

    ChainParams custom = regtest_params();
    custom.name = "regtest-stable-pointer";
    ASSERT_TRUE(ChainRegistry::instance().register_chain(custom));

    EXPECT_EQ(&regtest_params(), before);
    EXPECT_NE(ChainRegistry::instance().get_by_name("regtest-stable-pointer"), nullptr);
}

// =============================================================================
// Тесты ChainParams
// =============================================================================

TEST(ChainParamsTest, GenesisHashes) {
    EXPECT_EQ(hash_to_hex(mainnet_params().genesis_hash),
              "000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f");
    EXPECT_EQ(hash_to_hex(testnet_params().genesis_hash),
              "000000000933ea01ad0ee984209779baaec3ced90fa3f408719526f8d77f4943");
    EXPECT_EQ(hash_to_hex(signet_params().genesis_hash),
              "00000008819873e925422c1ff0f99f7cc9bbb232af63a077a480a3633bee1ef6");
    EXPECT_EQ(hash_to_hex(regtest_params().genesis_hash),
              "0f9188f13cb7b2c71f2a335e3a4fc328bf5beb436012afca590b1a11466e2206");
}

TEST(ChainParamsTest, GenesisHashMatchesHeader) {
    ChainRegistry::instance().for_each([](const ChainParams& params) {
        EXPECT_EQ(params.genesis.hash(), params.genesis_hash) << params.name;
    });
}

TEST(ChainParamsTest, MainnetDifficulty) {
    const auto& params = mainnet_params();

    EXPECT_EQ(params.difficulty.adjustment_interval(), 2016u);
    EXPECT_EQ(params.pow_limit_bits(), 0x1d00ffffu);
    EXPECT_FALSE(params.difficulty.allow_min_difficulty);
    EXPECT_FALSE(params.difficulty.no_retargeting);
    EXPECT_EQ(params.rewards.coinbase_maturity, 100u);
}

TEST(ChainParamsTest, RegtestDifficulty) {
    const auto& params = regtest_params();

    EXPECT_EQ(params.pow_limit_bits(), 0x207fffffu);
    EXPECT_TRUE(params.difficulty.no_retargeting);
    EXPECT_EQ(params.rewards.halving_interval, 150u);
}

TEST(ChainParamsTest, BlockSubsidyHalvings) {
    const auto& params = mainnet_params();

    EXPECT_EQ(params.block_subsidy(0), 50 * constants::COIN);
    EXPECT_EQ(params.block_subsidy(209'999), 50 * constants::COIN);
    EXPECT_EQ(params.block_subsidy(210'000), 25 * constants::COIN);
    EXPECT_EQ(params.block_subsidy(840'000), 3 * constants::COIN + constants::COIN / 8);
    EXPECT_EQ(params.block_subsidy(64 * 210'000), 0);
}

} // namespace arbor::core::test
