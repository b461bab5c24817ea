/**
 * @file chain_registry.hpp
 * @brief Реестр поддерживаемых сетей Bitcoin
 *
 * Централизованное хранилище параметров сетей.
 * Позволяет получить параметры по имени из конфигурации.
 */

#pragma once

#include "chain_params.hpp"

#include <deque>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace arbor::core {

/**
 * @brief Реестр параметров сетей
 *
 * Синглтон со встроенными сетями mainnet, testnet, signet и regtest.
 */
class ChainRegistry {
public:
    /**
     * @brief Получить единственный экземпляр реестра
     */
    [[nodiscard]] static ChainRegistry& instance();

    ChainRegistry(const ChainRegistry&) = delete;
    ChainRegistry& operator=(const ChainRegistry&) = delete;
    ChainRegistry(ChainRegistry&&) = delete;
    ChainRegistry& operator=(ChainRegistry&&) = delete;

    /**
     * @brief Получить параметры сети по имени
     *
     * @return Указатель на параметры или nullptr
     */
    [[nodiscard]] const ChainParams* get_by_name(std::string_view name) const;

    [[nodiscard]] bool has_chain(std::string_view name) const;

    /**
     * @brief Список имён всех зарегистрированных сетей
     */
    [[nodiscard]] std::vector<std::string_view> get_all_names() const;

    void for_each(const std::function<void(const ChainParams&)>& callback) const;

    /**
     * @brief Зарегистрировать сеть
     *
     * @return false если сеть с таким именем уже есть
     */
    bool register_chain(ChainParams params);

private:
    ChainRegistry();
    ~ChainRegistry() = default;

    void init_builtin_chains();

    /// @brief deque: указатели на элементы стабильны при регистрации новых сетей
    std::deque<ChainParams> chains_;
    std::unordered_map<std::string, std::size_t> name_index_;
};

// =============================================================================
// Удобные функции доступа
// =============================================================================

[[nodiscard]] const ChainParams& mainnet_params();
[[nodiscard]] const ChainParams& testnet_params();
[[nodiscard]] const ChainParams& signet_params();
[[nodiscard]] const ChainParams& regtest_params();

} // namespace arbor::core
