/**
 * @file chain_registry.cpp
 * @brief Реализация реестра сетей
 */

#include "chain_registry.hpp"

#include <stdexcept>

namespace arbor::core {

namespace {

/// @brief Merkle root genesis блока (одинаков для всех сетей)
constexpr std::string_view GENESIS_MERKLE_ROOT =
    "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";

[[nodiscard]] BlockHeader make_genesis(uint32_t timestamp, uint32_t bits, uint32_t nonce) {
    BlockHeader header;
    header.version = 1;
    header.prev_hash = Hash256{};
    header.merkle_root = hash_from_hex(GENESIS_MERKLE_ROOT);
    header.timestamp = timestamp;
    header.bits = bits;
    header.nonce = nonce;
    return header;
}

[[nodiscard]] const ChainParams& require(std::string_view name) {
    const auto* params = ChainRegistry::instance().get_by_name(name);
    if (params == nullptr) {
        throw std::logic_error("Встроенная сеть не зарегистрирована: " + std::string(name));
    }
    return *params;
}

} // namespace

ChainRegistry& ChainRegistry::instance() {
    static ChainRegistry instance;
    return instance;
}

ChainRegistry::ChainRegistry() {
    init_builtin_chains();
}

void ChainRegistry::init_builtin_chains() {
    const auto main_limit = uint256::from_hex(
        "00000000ffffffffffffffffffffffffffffffffffffffffffffffffffffffff");

    // Mainnet
    {
        ChainParams params;
        params.name = "mainnet";
        params.magic = {0xf9, 0xbe, 0xb4, 0xd9};
        params.genesis = make_genesis(1231006505, 0x1d00ffff, 2083236893);
        params.difficulty.pow_limit = main_limit;
        params.segwit_height = 481824;
        register_chain(std::move(params));
    }

    // Testnet3
    {
        ChainParams params;
        params.name = "testnet";
        params.magic = {0x0b, 0x11, 0x09, 0x07};
        params.genesis = make_genesis(1296688602, 0x1d00ffff, 414098458);
        params.difficulty.pow_limit = main_limit;
        params.difficulty.allow_min_difficulty = true;
        params.segwit_height = 834624;
        register_chain(std::move(params));
    }

    // Signet (default signet, без проверки подписи блока)
    {
        ChainParams params;
        params.name = "signet";
        params.magic = {0x0a, 0x03, 0xcf, 0x40};
        params.genesis = make_genesis(1598918400, 0x1e0377ae, 52613770);
        params.difficulty.pow_limit = uint256::from_hex(
            "00000377ae000000000000000000000000000000000000000000000000000000");
        params.segwit_height = 1;
        register_chain(std::move(params));
    }

    // Regtest
    {
        ChainParams params;
        params.name = "regtest";
        params.magic = {0xfa, 0xbf, 0xb5, 0xda};
        params.genesis = make_genesis(1296688602, 0x207fffff, 2);
        params.difficulty.pow_limit = uint256::from_hex(
            "7fffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff");
        params.difficulty.allow_min_difficulty = true;
        params.difficulty.no_retargeting = true;
        params.rewards.halving_interval = 150;
        params.segwit_height = 0;
        register_chain(std::move(params));
    }
}

const ChainParams* ChainRegistry::get_by_name(std::string_view name) const {
    auto it = name_index_.find(std::string(name));
    if (it == name_index_.end()) {
        return nullptr;
    }
    return &chains_[it->second];
}

bool ChainRegistry::has_chain(std::string_view name) const {
    return name_index_.contains(std::string(name));
}

std::vector<std::string_view> ChainRegistry::get_all_names() const {
    std::vector<std::string_view> names;
    names.reserve(chains_.size());
    for (const auto& chain : chains_) {
        names.push_back(chain.name);
    }
    return names;
}

void ChainRegistry::for_each(const std::function<void(const ChainParams&)>& callback) const {
    for (const auto& chain : chains_) {
        callback(chain);
    }
}

bool ChainRegistry::register_chain(ChainParams params) {
    if (name_index_.contains(params.name)) {
        return false;
    }
    params.genesis_hash = params.genesis.hash();
    name_index_.emplace(params.name, chains_.size());
    chains_.push_back(std::move(params));
    return true;
}

const ChainParams& mainnet_params() {
    return require("mainnet");
}

const ChainParams& testnet_params() {
    return require("testnet");
}

const ChainParams& signet_params() {
    return require("signet");
}

const ChainParams& regtest_params() {
    return require("regtest");
}

} // namespace arbor::core
