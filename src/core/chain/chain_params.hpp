/**
 * @file chain_params.hpp
 * @brief Параметры сети Bitcoin
 *
 * Содержит всё, что отличает mainnet, testnet, signet и regtest
 * для валидации заголовков и блоков.
 */

#pragma once

#include "../types.hpp"
#include "../primitives/block_header.hpp"
#include "../primitives/uint256.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace arbor::core {

/**
 * @brief Параметры сложности
 *
 * Определяет алгоритм пересчёта сложности.
 */
struct DifficultyParams {
    /// @brief Максимальный (самый лёгкий) target
    uint256 pow_limit;

    /// @brief Целевое время блока (секунды)
    uint32_t target_spacing{600};

    /// @brief Целевая длительность периода пересчёта (секунды)
    uint32_t target_timespan{14 * 24 * 60 * 60};

    /// @brief Разрешить блоки минимальной сложности после 2 * target_spacing
    bool allow_min_difficulty{false};

    /// @brief Сложность никогда не пересчитывается (regtest)
    bool no_retargeting{false};

    /**
     * @brief Интервал пересчёта сложности (в блоках)
     */
    [[nodiscard]] constexpr uint32_t adjustment_interval() const noexcept {
        return target_timespan / target_spacing;
    }
};

/**
 * @brief Параметры наград
 */
struct RewardParams {
    /// @brief Начальная награда за блок (сатоши)
    int64_t initial_subsidy{50 * 100'000'000LL};

    /// @brief Интервал halving (в блоках)
    uint32_t halving_interval{210'000};

    /// @brief Время созревания coinbase (в блоках)
    uint32_t coinbase_maturity{100};
};

/**
 * @brief Параметры сети
 */
struct ChainParams {
    // =========================================================================
    // Идентификация
    // =========================================================================

    /// @brief Имя сети ("mainnet", "testnet", "signet", "regtest")
    std::string name;

    /// @brief Магические байты сети (префикс сообщений P2P)
    std::array<uint8_t, 4> magic{};

    /// @brief Заголовок genesis блока
    BlockHeader genesis;

    /// @brief Хеш genesis блока
    Hash256 genesis_hash{};

    // =========================================================================
    // Консенсус
    // =========================================================================

    DifficultyParams difficulty;

    RewardParams rewards;

    /// @brief Высота активации segwit (witness commitment обязателен)
    uint32_t segwit_height{0};

    // =========================================================================
    // Вспомогательные методы
    // =========================================================================

    /**
     * @brief Награда за блок на высоте height
     *
     * Ноль после 64 halving (сдвиг на 64 не определён).
     */
    [[nodiscard]] constexpr int64_t block_subsidy(uint32_t height) const noexcept {
        const uint32_t halvings = height / rewards.halving_interval;
        if (halvings >= 64) {
            return 0;
        }
        return rewards.initial_subsidy >> halvings;
    }

    /**
     * @brief compact bits минимальной сложности
     */
    [[nodiscard]] uint32_t pow_limit_bits() const noexcept {
        return target_to_bits(difficulty.pow_limit);
    }
};

} // namespace arbor::core
