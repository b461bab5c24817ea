/**
 * @file chain_store.hpp
 * @brief Контракт хранилища цепи
 *
 * Единый интерфейс для двух backend: LevelDB и flat-file.
 * ChainState работает только через него и не зависит от backend.
 *
 * Логически хранятся:
 * - hash -> заголовок (с высотой, накопленной работой и статусом)
 * - height -> hash активной цепи
 * - height -> корни леса (не удаляются pruning)
 * - height -> undo данные и тело блока (удаляются pruning)
 * - tip и высота pruning
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/block_header.hpp"
#include "../core/primitives/uint256.hpp"
#include "../accumulator/accumulator.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace arbor::storage {

/**
 * @brief Статус заголовка/блока
 *
 * Unknown -> HeaderValid -> Connected, либо Rejected на любом шаге.
 */
enum class HeaderStatus : uint8_t {
    Unknown = 0,
    HeaderValid = 1,
    Connected = 2,
    Rejected = 3
};

[[nodiscard]] constexpr std::string_view to_string(HeaderStatus status) noexcept {
    switch (status) {
        case HeaderStatus::Unknown: return "unknown";
        case HeaderStatus::HeaderValid: return "header-valid";
        case HeaderStatus::Connected: return "connected";
        case HeaderStatus::Rejected: return "rejected";
        default: return "invalid";
    }
}

/**
 * @brief Заголовок с метаданными цепи
 */
struct StoredHeader {
    core::BlockHeader header;
    uint32_t height{0};

    /// @brief Накопленная работа от genesis включительно
    core::uint256 chain_work;

    HeaderStatus status{HeaderStatus::Unknown};

    [[nodiscard]] Hash256 hash() const noexcept {
        return header.hash();
    }

    [[nodiscard]] Bytes serialize() const;

    [[nodiscard]] static Result<StoredHeader> deserialize(ByteSpan data);

    [[nodiscard]] bool operator==(const StoredHeader&) const noexcept = default;
};

/**
 * @brief Текущая вершина активной цепи
 */
struct ChainTip {
    Hash256 hash{};
    uint32_t height{0};

    [[nodiscard]] Bytes serialize() const;

    [[nodiscard]] static Result<ChainTip> deserialize(ByteSpan data);

    [[nodiscard]] bool operator==(const ChainTip&) const noexcept = default;
};

/**
 * @brief Всё, что коммитится при подключении блока
 */
struct BlockCommit {
    /// @brief Заголовок блока (status = Connected)
    StoredHeader header;

    /// @brief Лес после блока
    accumulator::Forest forest;

    /// @brief Undo данные блока
    accumulator::UndoData undo;

    /// @brief Сериализованное тело блока (может быть пустым)
    Bytes body;
};

/**
 * @brief Хранилище цепи
 *
 * Все операции синхронны: возврат из put_block означает, что данные
 * долговечны. Реализации потокобезопасны.
 *
 * Реализации только две (LevelDbStore и FlatFileStore, обе final); других наследников не будет.
 */
class ChainStore {
public:
    virtual ~ChainStore() = default;

    // =========================================================================
    // Заголовки
    // =========================================================================

    /**
     * @brief Заголовок по хешу (любая ветка)
     *
     * @return StoreNotFound, если заголовок неизвестен
     */
    [[nodiscard]] virtual Result<StoredHeader> get_header(const Hash256& hash) const = 0;

    /**
     * @brief Заголовок активной цепи на высоте
     *
     * @return StoreNotFound, если высота выше tip
     */
    [[nodiscard]] virtual Result<StoredHeader> get_header_by_height(uint32_t height) const = 0;

    /**
     * @brief Сохранить (или обновить статус) заголовка без изменения tip
     */
    [[nodiscard]] virtual Result<void> put_header(const StoredHeader& header) = 0;

    /**
     * @brief Все сохранённые заголовки (для восстановления дерева при старте)
     */
    [[nodiscard]] virtual Result<std::vector<StoredHeader>> load_headers() const = 0;

    // =========================================================================
    // Блоки
    // =========================================================================

    /**
     * @brief Атомарно закоммитить блок и сделать его tip
     *
     * Заголовок, корни, undo данные, тело и tip сохраняются целиком
     * или не сохраняются вовсе. Высота блока - tip + 1 (или 0 для пустого
     * хранилища).
     */
    [[nodiscard]] virtual Result<void> put_block(const BlockCommit& commit) = 0;

    /**
     * @brief Текущий tip (std::nullopt для пустого хранилища)
     */
    [[nodiscard]] virtual Result<std::optional<ChainTip>> get_tip() const = 0;

    /**
     * @brief Лес после блока на высоте
     */
    [[nodiscard]] virtual Result<accumulator::Forest> get_roots(uint32_t height) const = 0;

    /**
     * @brief Undo данные блока на высоте
     *
     * @return UndoUnavailable для удалённых pruning высот
     */
    [[nodiscard]] virtual Result<accumulator::UndoData> get_undo(uint32_t height) const = 0;

    /**
     * @brief Тело блока на высоте
     *
     * @return UndoUnavailable для удалённых pruning высот
     */
    [[nodiscard]] virtual Result<Bytes> get_block_body(uint32_t height) const = 0;

    /**
     * @brief Откатить активную цепь до высоты по undo данным
     *
     * Данные высот выше height (индекс, корни, undo, тела) удаляются,
     * заголовки по хешу остаются.
     *
     * @return Лес на высоте height; UndoUnavailable, если нужные undo удалены
     */
    [[nodiscard]] virtual Result<accumulator::Forest> rewind_to(uint32_t height) = 0;

    // =========================================================================
    // Pruning
    // =========================================================================

    /**
     * @brief Удалить undo данные и тела блоков ниже высоты
     *
     * Заголовки и корни всех высот остаются.
     */
    [[nodiscard]] virtual Result<void> prune_before(uint32_t height) = 0;

    /**
     * @brief Наименьшая высота, для которой ещё есть undo данные
     */
    [[nodiscard]] virtual uint32_t prune_height() const = 0;

    /**
     * @brief Имя backend для логов
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Откатить лес с высоты from до высоты to по undo данным
 *
 * Общая часть rewind_to обоих backend.
 *
 * @param store Хранилище (get_roots/get_undo)
 * @param from Текущая высота tip
 * @param to Целевая высота
 */
[[nodiscard]] Result<accumulator::Forest> replay_undo(
    const ChainStore& store,
    uint32_t from,
    uint32_t to
);

} // namespace arbor::storage
