/**
 * @file chain_state.hpp
 * @brief Оркестратор цепи: заголовки, блоки, реорганизации
 *
 * Единственный писатель состояния цепи. Все изменения (приём заголовка,
 * подключение блока, реорганизация) выполняются под одним мьютексом.
 * Читатели получают неизменяемый снимок {tip, лес} без блокировки
 * пути изменения.
 *
 * Блок подключается так:
 * 1. Заголовок принят (PoW, сложность, MTP, время).
 * 2. Проверки без состояния (BlockValidator), можно параллельно.
 * 3. Удаление потраченных листьев по доказательству, затем добавление новых.
 * 4. Проверка скриптов внешним ScriptValidator.
 * 5. Атомарный коммит {заголовок, лес, undo, тело} в ChainStore.
 *
 * Ошибка на любом шаге до 5 не меняет ни память, ни хранилище.
 */

#pragma once

#include "block_index.hpp"
#include "../accumulator/utreexo_block.hpp"
#include "../core/chain/chain_params.hpp"
#include "../core/config.hpp"
#include "../core/validation/block_validator.hpp"
#include "../core/validation/pow_validator.hpp"
#include "../core/validation/script_validator.hpp"
#include "../storage/chain_store.hpp"
#include "../storage/retry.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace arbor::chain {

// =============================================================================
// Настройки и результаты
// =============================================================================

/**
 * @brief Параметры ChainState
 */
struct ChainStateOptions {
    /// @brief Максимальная глубина реорганизации (блоков)
    uint32_t max_reorg_depth{constants::DEFAULT_MAX_REORG_DEPTH};

    /// @brief Допустимое опережение timestamp (секунды)
    int64_t max_future_block_time{constants::MAX_FUTURE_BLOCK_TIME};

    /// @brief Сколько блоков проверяется заранее при подключении пачки
    uint32_t verify_workers{2};

    /// @brief Вызывать ScriptValidator при подключении
    bool script_checks{true};

    storage::RetryPolicy retry;

    [[nodiscard]] static ChainStateOptions from_config(const Config& config);
};

/**
 * @brief Неизменяемый снимок состояния цепи
 */
struct ChainSnapshot {
    storage::ChainTip tip;
    core::uint256 chain_work;
    accumulator::Forest forest;
};

/**
 * @brief Итог подключения блока
 */
enum class ConnectStatus {
    /// @brief Блок стал новым tip
    Connected,

    /// @brief Блок сохранён на боковой ветке с меньшей работой
    SideBranch,

    /// @brief Блок привёл к реорганизации
    Reorganized
};

[[nodiscard]] constexpr std::string_view to_string(ConnectStatus status) noexcept {
    switch (status) {
        case ConnectStatus::Connected: return "connected";
        case ConnectStatus::SideBranch: return "side-branch";
        case ConnectStatus::Reorganized: return "reorganized";
        default: return "unknown";
    }
}

/**
 * @brief Итог приёма пачки заголовков
 */
struct HeaderBatchResult {
    /// @brief Сколько заголовков принято (с начала пачки)
    std::size_t accepted{0};

    /// @brief Первая ошибка (приём останавливается на ней)
    std::optional<Error> error;
};

/// @brief Текущее время (unix секунды)
using Clock = std::function<int64_t()>;

/// @brief Вызывается после каждой смены tip
using TipCallback = std::function<void(const storage::ChainTip& tip)>;

// =============================================================================
// ChainState
// =============================================================================

/**
 * @brief Состояние цепи
 */
class ChainState {
public:
    /**
     * @param params Параметры сети
     * @param store Хранилище (должно пережить ChainState)
     * @param scripts Проверка скриптов (должна пережить ChainState)
     * @param options Параметры
     * @param clock Источник времени (для проверки timestamp)
     */
    ChainState(
        const core::ChainParams& params,
        storage::ChainStore& store,
        core::validation::ScriptValidator& scripts,
        ChainStateOptions options,
        Clock clock = {}
    );

    ChainState(const ChainState&) = delete;
    ChainState& operator=(const ChainState&) = delete;

    /**
     * @brief Загрузить состояние из хранилища
     *
     * Пустое хранилище инициализируется genesis блоком.
     */
    [[nodiscard]] Result<void> init();

    // =========================================================================
    // Изменение состояния
    // =========================================================================

    /**
     * @brief Принять заголовок
     *
     * Повторный приём известного заголовка возвращает сохранённую запись.
     *
     * @return InvalidHeader, OrphanHeader или ошибка хранилища
     */
    [[nodiscard]] Result<storage::StoredHeader> accept_header(const core::BlockHeader& header);

    /**
     * @brief Принять упорядоченную пачку заголовков
     */
    [[nodiscard]] HeaderBatchResult accept_headers(std::span<const core::BlockHeader> headers);

    /**
     * @brief Подключить блок
     *
     * Заголовок принимается, если ещё не известен. Блок боковой ветки
     * сохраняется до момента, когда его ветка наберёт больше работы.
     *
     * @return ProofInvalid (причина в сообщении), InvalidBlock, ScriptInvalid,
     *         DuplicateBlock, ReorgDepthExceeded, Cancelled или ошибка хранилища
     */
    [[nodiscard]] Result<ConnectStatus> connect_block(const accumulator::UtreexoBlock& block);

    /**
     * @brief Подключить последовательность блоков
     *
     * Проверки без состояния блока k+1 выполняются в рабочем потоке, пока
     * применяется блок k. Коммиты идут строго по порядку цепи.
     *
     * @return Количество обработанных блоков или первая ошибка
     */
    [[nodiscard]] Result<std::size_t> connect_blocks(std::span<const accumulator::UtreexoBlock> blocks);

    /**
     * @brief Отключить tip активной цепи по undo данным
     */
    [[nodiscard]] Result<void> disconnect_tip();

    /**
     * @brief Пометить блок и его потомков отклонёнными
     *
     * Если блок на активной цепи, она откатывается до его родителя,
     * после чего выбирается лучшая доступная ветка.
     */
    [[nodiscard]] Result<void> invalidate_block(const Hash256& hash);

    /**
     * @brief Запросить остановку: текущее подключение отменяется без коммита
     */
    void request_shutdown() noexcept;

    [[nodiscard]] bool shutdown_requested() const noexcept {
        return shutdown_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Подписка на смену tip (вызывается под мьютексом изменения)
     */
    void set_tip_callback(TipCallback callback);

    // =========================================================================
    // Чтение
    // =========================================================================

    /**
     * @brief Текущий снимок {tip, работа, лес}
     */
    [[nodiscard]] std::shared_ptr<const ChainSnapshot> snapshot() const;

    [[nodiscard]] storage::ChainTip tip() const;

    [[nodiscard]] Result<storage::StoredHeader> get_header(const Hash256& hash) const;

    [[nodiscard]] Result<storage::StoredHeader> get_header_by_height(uint32_t height) const;

    [[nodiscard]] Result<accumulator::Forest> get_roots(uint32_t height) const;

    /**
     * @brief Block locator активной цепи
     *
     * 10 последних хешей подряд, далее с удваивающимся шагом, последним
     * всегда идёт genesis.
     */
    [[nodiscard]] std::vector<Hash256> get_block_locator() const;

    /**
     * @brief Заголовок с наибольшей накопленной работой
     */
    [[nodiscard]] std::optional<storage::StoredHeader> best_header() const;

    /**
     * @brief Причина отклонения блока, если он отклонён в этом процессе
     */
    [[nodiscard]] std::optional<Error> rejection_reason(const Hash256& hash) const;

    [[nodiscard]] const core::ChainParams& params() const noexcept {
        return params_;
    }

    [[nodiscard]] storage::ChainStore& store() noexcept {
        return store_;
    }

    [[nodiscard]] const ChainStateOptions& options() const noexcept {
        return options_;
    }

private:
    /// @brief Блок, прошедший проверки без состояния
    struct PendingBlock {
        accumulator::UtreexoBlock block;
        core::validation::BlockCheck check;
    };

    /// @brief Итог проверок без состояния
    struct Precheck {
        std::optional<PendingBlock> block;
        std::optional<Error> error;

        /// @brief Ошибка - свойство блока (блок отклоняется навсегда)
        bool permanent{false};
    };

    /// @brief Итог выбора лучшей цепи
    struct Activation {
        bool reorganized{false};

        /// @brief Ошибки отдельных блоков
        std::unordered_map<Hash256, Error> failures;

        /// @brief Отказ в реорганизации (глубина)
        std::optional<Error> refusal;
    };

    [[nodiscard]] Precheck precheck(const accumulator::UtreexoBlock& block, uint32_t height) const;

    [[nodiscard]] Result<const BlockIndex::Entry*> accept_header_locked(const core::BlockHeader& header);

    [[nodiscard]] Result<void> check_header_locked(
        const core::BlockHeader& header,
        const BlockIndex::Entry& parent
    ) const;

    [[nodiscard]] Result<ConnectStatus> submit_locked(
        const accumulator::UtreexoBlock& block,
        Precheck precheck
    );

    [[nodiscard]] Result<Activation> activate_best_chain_locked();

    [[nodiscard]] std::optional<Hash256> find_candidate_locked() const;

    /**
     * @brief Перейти на ветку с вершиной target
     *
     * Вся ветка проверяется в памяти до первой записи в хранилище.
     */
    [[nodiscard]] Result<void> switch_to_locked(const Hash256& target, Activation& activation);

    /**
     * @brief Откатить активную цепь до высоты, сохранив тела в pending
     */
    [[nodiscard]] Result<void> rewind_locked(uint32_t height);

    void reject_locked(const Hash256& hash, const Error& reason);

    void persist_status_locked(const Hash256& hash);

    void publish_snapshot_locked();

    [[nodiscard]] int64_t now() const;

    const core::ChainParams& params_;
    storage::ChainStore& store_;
    core::validation::ScriptValidator& scripts_;
    ChainStateOptions options_;
    Clock clock_;

    core::validation::PowValidator pow_validator_;
    core::validation::BlockValidator block_validator_;

    /// @brief Мьютекс пути изменения
    mutable std::mutex mutex_;

    BlockIndex index_;
    accumulator::Forest forest_;
    std::unordered_map<Hash256, PendingBlock> pending_;
    std::unordered_map<Hash256, Error> rejections_;

    /// @brief Вершины веток, реорганизация на которые отклонена по глубине
    std::unordered_set<Hash256> refused_;

    TipCallback tip_callback_;

    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const ChainSnapshot> snapshot_;

    std::atomic<bool> shutdown_{false};
};

} // namespace arbor::chain
