/**
 * @file prune_manager.hpp
 * @brief Удаление старых undo данных и тел блоков
 *
 * Оставляет undo данные для последних max(retention_window, max_reorg_depth)
 * блоков, чтобы любая допустимая реорганизация оставалась возможной.
 * Заголовки и корни леса на всех высотах не удаляются.
 *
 * Ошибка удаления не фатальна: пишется в лог, следующая попытка будет
 * через prune_interval блоков.
 */

#pragma once

#include "../core/config.hpp"
#include "../storage/chain_store.hpp"
#include "../storage/retry.hpp"

#include <cstdint>
#include <optional>

namespace arbor::chain {

/**
 * @brief Менеджер удаления старых данных
 */
class PruneManager {
public:
    /**
     * @param store Хранилище (должно пережить PruneManager)
     * @param config Политика удаления
     * @param retry Политика повторов для ошибок ввода-вывода
     */
    PruneManager(storage::ChainStore& store, const PruningConfig& config, storage::RetryPolicy retry = {});

    /**
     * @brief Высота, ниже которой можно удалять при данном tip
     *
     * @return std::nullopt, если цепь короче окна хранения
     */
    [[nodiscard]] std::optional<uint32_t> prune_target(uint32_t tip_height) const noexcept;

    /**
     * @brief Один проход удаления
     *
     * Выполняется независимо от pruning.enabled (явный запрос).
     *
     * @return Высота удаления после прохода
     */
    [[nodiscard]] Result<uint32_t> run_once(uint32_t tip_height);

    /**
     * @brief Обработчик смены tip для ChainState
     *
     * Запускает проход раз в prune_interval блоков, если удаление включено.
     */
    void on_tip(const storage::ChainTip& tip);

    /**
     * @brief Сколько блоков гарантированно сохраняет undo данные
     */
    [[nodiscard]] uint32_t keep_blocks() const noexcept;

    [[nodiscard]] const PruningConfig& config() const noexcept {
        return config_;
    }

private:
    storage::ChainStore& store_;
    PruningConfig config_;
    storage::RetryPolicy retry_;

    /// @brief Высота tip при последнем проходе
    std::optional<uint32_t> last_run_;
};

} // namespace arbor::chain
