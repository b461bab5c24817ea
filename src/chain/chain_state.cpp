/**
 * @file chain_state.cpp
 * @brief Реализация ChainState
 */

#include "chain_state.hpp"
#include "../core/mtp_calculator.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <format>
#include <future>

namespace arbor::chain {

using storage::ChainTip;
using storage::HeaderStatus;
using storage::StoredHeader;
using storage::with_retry;

namespace {

[[nodiscard]] std::string short_hash(const Hash256& hash) {
    return core::hash_to_hex(hash).substr(0, 16);
}

/// @brief Ошибка в присланном доказательстве, а не в самом блоке
[[nodiscard]] bool is_proof_error(ErrorCode code) noexcept {
    return code == ErrorCode::ProofInvalid || code == ErrorCode::MalformedForest;
}

[[nodiscard]] int64_t system_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

ChainStateOptions ChainStateOptions::from_config(const Config& config) {
    ChainStateOptions options;
    options.max_reorg_depth = config.pruning.max_reorg_depth;
    options.max_future_block_time = config.validation.max_future_block_time;
    options.verify_workers = config.validation.verify_workers;
    options.script_checks = config.validation.script_checks;
    options.retry = storage::RetryPolicy{
        config.storage.io_retry_attempts,
        std::chrono::milliseconds{config.storage.io_retry_backoff_ms}
    };
    return options;
}

// =============================================================================
// Инициализация
// =============================================================================

ChainState::ChainState(
    const core::ChainParams& params,
    storage::ChainStore& store,
    core::validation::ScriptValidator& scripts,
    ChainStateOptions options,
    Clock clock
)
    : params_(params)
    , store_(store)
    , scripts_(scripts)
    , options_(std::move(options))
    , clock_(clock ? std::move(clock) : Clock(system_now))
    , pow_validator_(params)
    , block_validator_(params)
    , snapshot_(std::make_shared<const ChainSnapshot>())
{
}

Result<void> ChainState::init() {
    std::lock_guard<std::mutex> lock(mutex_);

    index_.clear();
    pending_.clear();
    rejections_.clear();
    refused_.clear();

    auto headers = with_retry(options_.retry, "load_headers", [&] { return store_.load_headers(); });
    if (!headers) {
        return std::unexpected(headers.error());
    }
    std::sort(headers->begin(), headers->end(),
              [](const StoredHeader& a, const StoredHeader& b) { return a.height < b.height; });
    for (const auto& header : *headers) {
        if (auto inserted = index_.insert(header); !inserted) {
            return Err<void>(ErrorCode::StoreCorruption,
                             std::format("Заголовок {} на высоте {}: {}", short_hash(header.hash()),
                                         header.height, inserted.error().message));
        }
    }

    auto tip = with_retry(options_.retry, "get_tip", [&] { return store_.get_tip(); });
    if (!tip) {
        return std::unexpected(tip.error());
    }

    if (!tip->has_value()) {
        const StoredHeader genesis{
            params_.genesis, 0, params_.genesis.get_block_proof(), HeaderStatus::Connected
        };
        const storage::BlockCommit commit{genesis, accumulator::Forest{}, accumulator::UndoData{}, {}};
        auto stored = with_retry(options_.retry, "put_block", [&] { return store_.put_block(commit); });
        if (!stored) {
            return stored;
        }
        if (auto inserted = index_.insert(genesis); !inserted) {
            return inserted;
        }
        index_.set_active_tip(params_.genesis_hash);
        forest_ = accumulator::Forest{};
        log::info("Хранилище пусто: записан genesis {}", core::hash_to_hex(params_.genesis_hash));
    } else {
        const ChainTip& stored_tip = **tip;
        const auto genesis = index_.find(params_.genesis_hash);
        if (genesis == nullptr || genesis->record.height != 0) {
            return Err<void>(ErrorCode::ConfigInvalidValue,
                             std::format("Каталог данных не принадлежит сети {}", params_.name));
        }
        if (!index_.contains(stored_tip.hash)) {
            return Err<void>(ErrorCode::StoreCorruption,
                             "Нет заголовка для tip " + core::hash_to_hex(stored_tip.hash));
        }

        auto roots = with_retry(options_.retry, "get_roots",
                                [&] { return store_.get_roots(stored_tip.height); });
        if (!roots) {
            return std::unexpected(roots.error());
        }
        forest_ = std::move(*roots);
        index_.set_active_tip(stored_tip.hash);

        // Connected вне активной цепи остаётся после прерванной реорганизации
        for (const auto& header : *headers) {
            const Hash256 hash = header.hash();
            if (header.status == HeaderStatus::Connected && !index_.is_active(hash)) {
                index_.set_status(hash, HeaderStatus::HeaderValid);
            }
        }
    }

    publish_snapshot_locked();

    const auto* tip_entry = index_.active_tip();
    const auto* best = index_.best_header();
    log::info("Цепь {}: tip {} на высоте {}, заголовков {}, лучший заголовок на высоте {}, backend {}",
              params_.name, short_hash(tip_entry->hash), tip_entry->record.height, index_.size(),
              best != nullptr ? best->record.height : 0, store_.name());
    return {};
}

// =============================================================================
// Заголовки
// =============================================================================

Result<StoredHeader> ChainState::accept_header(const core::BlockHeader& header) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entry = accept_header_locked(header);
    if (!entry) {
        return std::unexpected(entry.error());
    }
    return (*entry)->record;
}

HeaderBatchResult ChainState::accept_headers(std::span<const core::BlockHeader> headers) {
    std::lock_guard<std::mutex> lock(mutex_);
    HeaderBatchResult result;
    for (const auto& header : headers) {
        if (shutdown_requested()) {
            result.error = Error{ErrorCode::Cancelled};
            break;
        }
        auto entry = accept_header_locked(header);
        if (!entry) {
            result.error = entry.error();
            break;
        }
        ++result.accepted;
    }
    if (result.accepted > 0) {
        const auto* best = index_.best_header();
        log::debug("Принято заголовков: {}, лучший на высоте {}", result.accepted,
                   best != nullptr ? best->record.height : 0);
    }
    return result;
}

Result<const BlockIndex::Entry*> ChainState::accept_header_locked(const core::BlockHeader& header) {
    const Hash256 hash = header.hash();

    if (const auto* known = index_.find(hash)) {
        if (known->record.status == HeaderStatus::Rejected) {
            return Err<const BlockIndex::Entry*>(ErrorCode::InvalidHeader,
                                                 "Заголовок ранее отклонён: " + short_hash(hash));
        }
        return known;
    }

    const auto* parent = index_.find(header.prev_hash);
    if (parent == nullptr) {
        return Err<const BlockIndex::Entry*>(ErrorCode::OrphanHeader,
                                             "Неизвестен предыдущий блок " + short_hash(header.prev_hash));
    }
    if (parent->record.status == HeaderStatus::Rejected) {
        return Err<const BlockIndex::Entry*>(ErrorCode::InvalidHeader,
                                             "Предыдущий блок отклонён: " + short_hash(header.prev_hash));
    }

    if (auto checked = check_header_locked(header, *parent); !checked) {
        log::warn("Заголовок {} отклонён: {}", short_hash(hash), checked.error().message);
        return std::unexpected(checked.error());
    }

    const StoredHeader record{
        header,
        parent->record.height + 1,
        parent->record.chain_work + header.get_block_proof(),
        HeaderStatus::HeaderValid
    };
    auto stored = with_retry(options_.retry, "put_header", [&] { return store_.put_header(record); });
    if (!stored) {
        return std::unexpected(stored.error());
    }
    if (auto inserted = index_.insert(record); !inserted) {
        return std::unexpected(inserted.error());
    }
    return index_.find(hash);
}

Result<void> ChainState::check_header_locked(
    const core::BlockHeader& header,
    const BlockIndex::Entry& parent
) const {
    if (!pow_validator_.validate_pow(header)) {
        return Err<void>(ErrorCode::InvalidHeader, "Хеш не удовлетворяет target (PoW)");
    }

    const core::validation::AncestorLookup lookup =
        [&](uint32_t height) -> std::optional<core::validation::HeaderAtHeight> {
            const auto* entry = index_.ancestor(parent.hash, height);
            if (entry == nullptr) {
                return std::nullopt;
            }
            return core::validation::HeaderAtHeight{entry->record.header, entry->record.height};
        };
    const uint32_t expected_bits = pow_validator_.next_work_required(
        {parent.record.header, parent.record.height}, header.timestamp, lookup);
    if (header.bits != expected_bits) {
        return Err<void>(ErrorCode::InvalidHeader,
                         std::format("bits {:08x} вместо ожидаемых {:08x}", header.bits, expected_bits));
    }

    core::MtpCalculator mtp;
    for (const auto* cursor = &parent; cursor != nullptr; ) {
        mtp.push_header(cursor->record.header);
        if (mtp.has_sufficient_data() || cursor->record.height == 0) {
            break;
        }
        cursor = index_.find(cursor->record.header.prev_hash);
    }
    if (header.timestamp <= mtp.get_mtp()) {
        return Err<void>(ErrorCode::InvalidHeader,
                         std::format("timestamp {} не больше median time past {}",
                                     header.timestamp, mtp.get_mtp()));
    }

    const int64_t limit = now() + options_.max_future_block_time;
    if (static_cast<int64_t>(header.timestamp) > limit) {
        return Err<void>(ErrorCode::InvalidHeader,
                         std::format("timestamp {} дальше в будущем, чем {}", header.timestamp, limit));
    }
    return {};
}

// =============================================================================
// Блоки
// =============================================================================

ChainState::Precheck ChainState::precheck(
    const accumulator::UtreexoBlock& block,
    uint32_t height
) const {
    Precheck result;
    if (auto merkle = block_validator_.check_merkle_root(block.block); !merkle) {
        result.error = merkle.error();
        return result;
    }
    auto check = block_validator_.check_block(block, height);
    if (!check) {
        result.error = check.error();
        result.permanent = true;
        return result;
    }
    result.block = PendingBlock{block, std::move(*check)};
    return result;
}

Result<ConnectStatus> ChainState::connect_block(const accumulator::UtreexoBlock& block) {
    uint32_t height = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const Hash256 hash = block.hash();
        if (index_.is_active(hash)) {
            return Err<ConnectStatus>(ErrorCode::DuplicateBlock, "Блок уже подключён: " + short_hash(hash));
        }
        const auto* parent = index_.find(block.block.header.prev_hash);
        if (parent == nullptr) {
            return Err<ConnectStatus>(ErrorCode::OrphanHeader,
                                      "Неизвестен предыдущий блок " +
                                      short_hash(block.block.header.prev_hash));
        }
        height = parent->record.height + 1;
    }

    Precheck checked = precheck(block, height);

    std::lock_guard<std::mutex> lock(mutex_);
    return submit_locked(block, std::move(checked));
}

Result<std::size_t> ChainState::connect_blocks(std::span<const accumulator::UtreexoBlock> blocks) {
    if (blocks.empty()) {
        return std::size_t{0};
    }

    uint32_t base_height = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto* parent = index_.find(blocks.front().block.header.prev_hash);
        if (parent == nullptr) {
            return Err<std::size_t>(ErrorCode::OrphanHeader, "Неизвестен родитель первого блока");
        }
        base_height = parent->record.height + 1;
    }
    for (std::size_t i = 1; i < blocks.size(); ++i) {
        if (blocks[i].block.header.prev_hash != blocks[i - 1].hash()) {
            return Err<std::size_t>(ErrorCode::InvalidBlock,
                                    std::format("Блок #{} не продолжает предыдущий", i));
        }
    }

    // Окно предварительных проверок впереди текущего блока
    const std::size_t window = std::max<std::size_t>(1, options_.verify_workers);
    std::deque<std::future<Precheck>> inflight;
    std::size_t next = 0;
    auto launch = [&] {
        while (next < blocks.size() && inflight.size() < window) {
            const accumulator::UtreexoBlock* block = &blocks[next];
            const uint32_t height = base_height + static_cast<uint32_t>(next);
            inflight.push_back(std::async(std::launch::async, [this, block, height] {
                return precheck(*block, height);
            }));
            ++next;
        }
    };

    launch();
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        Precheck checked = inflight.front().get();
        inflight.pop_front();
        launch();

        Result<ConnectStatus> status = [&] {
            std::lock_guard<std::mutex> lock(mutex_);
            return submit_locked(blocks[i], std::move(checked));
        }();
        if (!status && status.error().code != ErrorCode::DuplicateBlock) {
            return std::unexpected(status.error());
        }
    }
    return blocks.size();
}

Result<ConnectStatus> ChainState::submit_locked(
    const accumulator::UtreexoBlock& block,
    Precheck checked
) {
    if (shutdown_requested()) {
        return Err<ConnectStatus>(ErrorCode::Cancelled, "Подключение отменено");
    }

    auto entry = accept_header_locked(block.block.header);
    if (!entry) {
        return std::unexpected(entry.error());
    }
    const Hash256 hash = (*entry)->hash;
    const uint32_t height = (*entry)->record.height;

    if (index_.is_active(hash)) {
        return Err<ConnectStatus>(ErrorCode::DuplicateBlock, "Блок уже подключён: " + short_hash(hash));
    }
    if (checked.error) {
        if (checked.permanent) {
            reject_locked(hash, *checked.error);
        } else {
            log::warn("Блок {} не принят: {}", short_hash(hash), checked.error->message);
        }
        return std::unexpected(*checked.error);
    }
    if (checked.block->check.height != height) {
        return Err<ConnectStatus>(ErrorCode::InvalidBlock,
                                  std::format("Блок проверен для высоты {}, а находится на {}",
                                              checked.block->check.height, height));
    }

    pending_.insert_or_assign(hash, std::move(*checked.block));

    auto activation = activate_best_chain_locked();
    if (!activation) {
        return std::unexpected(activation.error());
    }
    if (index_.is_active(hash)) {
        return activation->reorganized ? ConnectStatus::Reorganized : ConnectStatus::Connected;
    }
    if (auto failure = activation->failures.find(hash); failure != activation->failures.end()) {
        return std::unexpected(failure->second);
    }
    if (activation->refusal) {
        return std::unexpected(*activation->refusal);
    }
    return ConnectStatus::SideBranch;
}

// =============================================================================
// Выбор лучшей цепи
// =============================================================================

std::optional<Hash256> ChainState::find_candidate_locked() const {
    const auto* tip = index_.active_tip();
    const BlockIndex::Entry* best = nullptr;

    for (const auto& [hash, pending] : pending_) {
        if (refused_.contains(hash)) {
            continue;
        }
        const auto* entry = index_.find(hash);
        if (entry == nullptr || entry->record.status == HeaderStatus::Rejected) {
            continue;
        }
        if (best != nullptr && !BlockIndex::better(*entry, *best)) {
            continue;
        }

        // Тела всех блоков ветки до активной цепи должны быть на руках
        bool available = true;
        for (const auto* cursor = entry; !index_.is_active(cursor->hash); ) {
            if (cursor->record.status == HeaderStatus::Rejected || !pending_.contains(cursor->hash)) {
                available = false;
                break;
            }
            cursor = index_.find(cursor->record.header.prev_hash);
            if (cursor == nullptr) {
                available = false;
                break;
            }
        }
        if (available) {
            best = entry;
        }
    }

    // При равной работе остаётся текущий tip
    if (best == nullptr || !(best->record.chain_work > tip->record.chain_work)) {
        return std::nullopt;
    }
    return best->hash;
}

Result<ChainState::Activation> ChainState::activate_best_chain_locked() {
    Activation activation;
    const Hash256 tip_before = index_.active_tip()->hash;

    while (auto candidate = find_candidate_locked()) {
        auto switched = switch_to_locked(*candidate, activation);
        if (switched) {
            continue;
        }
        const Error& error = switched.error();
        if (error.code == ErrorCode::ReorgDepthExceeded) {
            refused_.insert(*candidate);
            activation.refusal = error;
            continue;
        }
        if (is_consensus_error(error.code)) {
            // Блок уже отклонён или удалён из pending: выбираем заново
            continue;
        }
        return std::unexpected(error);
    }

    const auto* tip = index_.active_tip();
    if (tip->hash != tip_before && tip_callback_) {
        tip_callback_(ChainTip{tip->hash, tip->record.height});
    }
    return activation;
}

Result<void> ChainState::switch_to_locked(const Hash256& target, Activation& activation) {
    const auto* tip = index_.active_tip();
    const auto* fork = index_.find_fork(tip->hash, target);
    if (fork == nullptr) {
        return Err<void>(ErrorCode::StoreCorruption, "Нет общего предка с веткой " + short_hash(target));
    }

    const uint32_t tip_height = tip->record.height;
    const uint32_t fork_height = fork->record.height;
    const uint32_t depth = tip_height - fork_height;

    if (depth > 0) {
        if (depth > options_.max_reorg_depth || fork_height + 1 < store_.prune_height()) {
            log::warn("Реорганизация на {} отклонена: глубина {} (максимум {}, undo данные с высоты {})",
                      short_hash(target), depth, options_.max_reorg_depth, store_.prune_height());
            return Err<void>(ErrorCode::ReorgDepthExceeded,
                             std::format("Глубина реорганизации {} вне окна хранения", depth));
        }
        log::info("Реорганизация: откат {} блоков до высоты {}, новая вершина {}",
                  depth, fork_height, short_hash(target));
    }

    std::vector<Hash256> path;
    for (const auto* cursor = index_.find(target); cursor != nullptr && cursor->hash != fork->hash;
         cursor = index_.find(cursor->record.header.prev_hash)) {
        path.push_back(cursor->hash);
    }
    std::reverse(path.begin(), path.end());

    // 1. Вся ветка проверяется в памяти
    accumulator::Forest forest = forest_;
    if (depth > 0) {
        auto replayed = with_retry(options_.retry, "replay_undo",
                                   [&] { return storage::replay_undo(store_, tip_height, fork_height); });
        if (!replayed) {
            if (replayed.error().code == ErrorCode::UndoUnavailable) {
                return Err<void>(ErrorCode::ReorgDepthExceeded, replayed.error().message);
            }
            return std::unexpected(replayed.error());
        }
        forest = std::move(*replayed);
    }

    std::vector<storage::BlockCommit> commits;
    commits.reserve(path.size());
    for (const auto& hash : path) {
        if (shutdown_requested()) {
            return Err<void>(ErrorCode::Cancelled, "Подключение отменено");
        }

        const PendingBlock& pending = pending_.at(hash);
        auto modification = accumulator::apply_block(
            forest, pending.block.proof, pending.check.spent_hashes, pending.check.new_leaves);
        if (!modification) {
            const Error error = modification.error();
            activation.failures.insert_or_assign(hash, error);
            if (is_proof_error(error.code)) {
                log::warn("Доказательство блока {} не принято: {}", short_hash(hash), error.message);
                pending_.erase(hash);
            } else {
                reject_locked(hash, error);
            }
            return std::unexpected(error);
        }

        auto scripts = options_.script_checks
            ? scripts_.validate(pending.block.block, pending.block.spent_leaves, shutdown_)
            : Result<void>{};
        if (!scripts) {
            if (scripts.error().code == ErrorCode::Cancelled) {
                return std::unexpected(scripts.error());
            }
            const Error error{ErrorCode::ScriptInvalid, scripts.error().message};
            activation.failures.insert_or_assign(hash, error);
            reject_locked(hash, error);
            return std::unexpected(error);
        }

        StoredHeader record = index_.find(hash)->record;
        record.status = HeaderStatus::Connected;
        forest = modification->forest;
        commits.push_back(storage::BlockCommit{
            std::move(record), forest, std::move(modification->undo), pending.block.serialize()
        });
    }

    if (shutdown_requested()) {
        return Err<void>(ErrorCode::Cancelled, "Подключение отменено");
    }

    // 2. Коммит: откат, затем блоки по порядку
    if (depth > 0) {
        if (auto rewound = rewind_locked(fork_height); !rewound) {
            publish_snapshot_locked();
            return rewound;
        }
        activation.reorganized = true;
    }

    for (auto& commit : commits) {
        const Hash256 hash = commit.header.hash();
        auto stored = with_retry(options_.retry, "put_block", [&] { return store_.put_block(commit); });
        if (!stored) {
            log::error("Не удалось записать блок {}: {}", short_hash(hash), stored.error().message);
            publish_snapshot_locked();
            return stored;
        }

        if (auto inserted = index_.insert(commit.header); !inserted) {
            return inserted;
        }
        index_.set_active_tip(hash);
        pending_.erase(hash);
        log::info("Блок {} подключён на высоте {} (листьев: -{} +{}, корней: {})",
                  short_hash(hash), commit.header.height, commit.undo.targets.size(),
                  commit.undo.num_added, commit.forest.roots.size());
        forest_ = std::move(commit.forest);
    }

    publish_snapshot_locked();
    if (depth > 0) {
        log::info("Реорганизация завершена: tip {} на высоте {}",
                  short_hash(index_.active_tip()->hash), index_.active_height());
    }
    return {};
}

Result<void> ChainState::rewind_locked(uint32_t height) {
    const uint32_t tip_height = index_.active_height();
    if (height >= tip_height) {
        return {};
    }
    if (height + 1 < store_.prune_height()) {
        return Err<void>(ErrorCode::ReorgDepthExceeded,
                         std::format("Undo данные ниже высоты {} удалены", store_.prune_height()));
    }

    // Тела отключаемых блоков сохраняются в pending до удаления из хранилища
    std::vector<Hash256> disconnected;
    for (uint32_t h = height + 1; h <= tip_height; ++h) {
        const Hash256 hash = *index_.active_at(h);
        disconnected.push_back(hash);
        if (index_.find(hash)->record.status == HeaderStatus::Rejected) {
            continue;
        }

        auto body = with_retry(options_.retry, "get_block_body", [&] { return store_.get_block_body(h); });
        if (!body || body->empty()) {
            log::warn("Тело блока {} недоступно: после отката его нужно получить заново", short_hash(hash));
            continue;
        }
        auto block = accumulator::UtreexoBlock::deserialize(*body);
        if (!block) {
            log::warn("Тело блока {} повреждено: {}", short_hash(hash), block.error().message);
            continue;
        }
        Precheck checked = precheck(*block, h);
        if (checked.block) {
            pending_.insert_or_assign(hash, std::move(*checked.block));
        }
    }

    auto forest = with_retry(options_.retry, "rewind_to", [&] { return store_.rewind_to(height); });
    if (!forest) {
        if (forest.error().code == ErrorCode::UndoUnavailable) {
            return Err<void>(ErrorCode::ReorgDepthExceeded, forest.error().message);
        }
        return std::unexpected(forest.error());
    }

    forest_ = std::move(*forest);
    index_.set_active_tip(*index_.active_at(height));

    for (const auto& hash : disconnected) {
        if (index_.find(hash)->record.status != HeaderStatus::Rejected) {
            index_.set_status(hash, HeaderStatus::HeaderValid);
            persist_status_locked(hash);
        }
    }
    log::debug("Откат активной цепи с высоты {} до {}", tip_height, height);
    return {};
}

Result<void> ChainState::disconnect_tip() {
    std::lock_guard<std::mutex> lock(mutex_);

    const uint32_t height = index_.active_height();
    if (height == 0) {
        return Err<void>(ErrorCode::ReorgDepthExceeded, "genesis нельзя отключить");
    }
    if (auto rewound = rewind_locked(height - 1); !rewound) {
        return rewound;
    }

    publish_snapshot_locked();
    const auto* tip = index_.active_tip();
    log::info("Блок на высоте {} отключён, tip {}", height, short_hash(tip->hash));
    if (tip_callback_) {
        tip_callback_(ChainTip{tip->hash, tip->record.height});
    }
    return {};
}

Result<void> ChainState::invalidate_block(const Hash256& hash) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto* entry = index_.find(hash);
    if (entry == nullptr) {
        return Err<void>(ErrorCode::StoreNotFound, "Неизвестный блок " + short_hash(hash));
    }
    const uint32_t height = entry->record.height;
    if (height == 0) {
        return Err<void>(ErrorCode::InvalidBlock, "genesis нельзя пометить недействительным");
    }
    const bool active = index_.is_active(hash);

    reject_locked(hash, Error{ErrorCode::InvalidBlock, "Блок помечен недействительным вручную"});

    if (active) {
        if (auto rewound = rewind_locked(height - 1); !rewound) {
            return rewound;
        }
        publish_snapshot_locked();
        const auto* tip = index_.active_tip();
        if (tip_callback_) {
            tip_callback_(ChainTip{tip->hash, tip->record.height});
        }
    }

    auto activation = activate_best_chain_locked();
    if (!activation) {
        return std::unexpected(activation.error());
    }
    return {};
}

void ChainState::reject_locked(const Hash256& hash, const Error& reason) {
    std::vector<Hash256> doomed = index_.descendants(hash);
    const std::size_t descendants = doomed.size();
    doomed.insert(doomed.begin(), hash);

    for (const auto& victim : doomed) {
        index_.set_status(victim, HeaderStatus::Rejected);
        pending_.erase(victim);
        rejections_.insert_or_assign(
            victim,
            victim == hash ? reason
                           : Error{reason.code, "Отклонён предок " + short_hash(hash) + ": " + reason.message});
        persist_status_locked(victim);
    }
    log::warn("Блок {} отклонён: {} (потомков: {})", short_hash(hash), reason.message, descendants);
}

void ChainState::persist_status_locked(const Hash256& hash) {
    const auto* entry = index_.find(hash);
    if (entry == nullptr) {
        return;
    }
    auto stored = with_retry(options_.retry, "put_header",
                             [&] { return store_.put_header(entry->record); });
    if (!stored) {
        log::error("Не удалось сохранить статус блока {}: {}", short_hash(hash), stored.error().message);
    }
}

void ChainState::request_shutdown() noexcept {
    shutdown_.store(true, std::memory_order_relaxed);
}

void ChainState::set_tip_callback(TipCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    tip_callback_ = std::move(callback);
}

// =============================================================================
// Чтение
// =============================================================================

void ChainState::publish_snapshot_locked() {
    const auto* tip = index_.active_tip();
    auto snapshot = std::make_shared<const ChainSnapshot>(ChainSnapshot{
        ChainTip{tip->hash, tip->record.height}, tip->record.chain_work, forest_
    });
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_ = std::move(snapshot);
}

std::shared_ptr<const ChainSnapshot> ChainState::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

ChainTip ChainState::tip() const {
    return snapshot()->tip;
}

Result<StoredHeader> ChainState::get_header(const Hash256& hash) const {
    return with_retry(options_.retry, "get_header", [&] { return store_.get_header(hash); });
}

Result<StoredHeader> ChainState::get_header_by_height(uint32_t height) const {
    return with_retry(options_.retry, "get_header_by_height",
                      [&] { return store_.get_header_by_height(height); });
}

Result<accumulator::Forest> ChainState::get_roots(uint32_t height) const {
    return with_retry(options_.retry, "get_roots", [&] { return store_.get_roots(height); });
}

std::vector<Hash256> ChainState::get_block_locator() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Hash256> locator;
    int64_t height = index_.active_height();
    int64_t step = 1;
    while (true) {
        locator.push_back(*index_.active_at(static_cast<uint32_t>(height)));
        if (height == 0) {
            break;
        }
        if (locator.size() >= 10) {
            step *= 2;
        }
        height = std::max<int64_t>(height - step, 0);
    }
    return locator;
}

std::optional<StoredHeader> ChainState::best_header() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* best = index_.best_header();
    if (best == nullptr) {
        return std::nullopt;
    }
    return best->record;
}

std::optional<Error> ChainState::rejection_reason(const Hash256& hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rejections_.find(hash);
    if (it == rejections_.end()) {
        return std::nullopt;
    }
    return it->second;
}

int64_t ChainState::now() const {
    return clock_();
}

} // namespace arbor::chain
