/**
 * @file prune_manager.cpp
 * @brief Реализация PruneManager
 */

#include "prune_manager.hpp"
#include "../log/logger.hpp"

#include <algorithm>

namespace arbor::chain {

PruneManager::PruneManager(storage::ChainStore& store, const PruningConfig& config, storage::RetryPolicy retry)
    : store_(store)
    , config_(config)
    , retry_(retry)
{
}

uint32_t PruneManager::keep_blocks() const noexcept {
    return std::max(config_.retention_window, config_.max_reorg_depth);
}

std::optional<uint32_t> PruneManager::prune_target(uint32_t tip_height) const noexcept {
    const uint32_t keep = keep_blocks();
    if (tip_height <= keep) {
        return std::nullopt;
    }
    return tip_height - keep;
}

Result<uint32_t> PruneManager::run_once(uint32_t tip_height) {
    last_run_ = tip_height;

    const uint32_t current = store_.prune_height();
    const auto target = prune_target(tip_height);
    if (!target || *target <= current) {
        log::debug("Удаление не требуется: tip {}, удалено до {}", tip_height, current);
        return current;
    }

    auto pruned = storage::with_retry(retry_, "prune_before", [&] { return store_.prune_before(*target); });
    if (!pruned) {
        return std::unexpected(pruned.error());
    }

    log::info("Удалены undo данные и тела блоков на высотах [{}, {}), хранится {} блоков",
              current, *target, tip_height - *target + 1);
    return store_.prune_height();
}

void PruneManager::on_tip(const storage::ChainTip& tip) {
    if (!config_.enabled) {
        return;
    }
    // После отката tip ниже последнего прохода: ждём нового интервала
    if (last_run_ && tip.height < *last_run_ + config_.prune_interval) {
        if (tip.height < *last_run_) {
            last_run_ = tip.height;
        }
        return;
    }

    auto result = run_once(tip.height);
    if (!result) {
        log::warn("Удаление старых данных не выполнено: {}", result.error().message);
    }
}

} // namespace arbor::chain
