/**
 * @file flat_file_store.hpp
 * @brief Flat-file backend хранилища
 *
 * Файлы в каталоге данных:
 * - chain.log       - журнал записей (заголовки, коммиты, откаты, pruning)
 * - undo_NNNNN.dat  - сегменты undo данных и тел блоков
 * - chain.idx       - checkpoint индекса в памяти
 *
 * Запись журнала: [magic u32][type u8][len u32][payload][checksum 4 байта],
 * checksum - первые 4 байта SHA256d(payload).
 *
 * Порядок коммита блока: undo в сегмент, fsync, запись Commit в журнал,
 * fsync, обновление индекса. Оборванный хвост журнала при открытии
 * обрезается по последней целой записи.
 */

#pragma once

#include "chain_store.hpp"
#include "file_io.hpp"
#include "../core/constants.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace arbor::storage {

/**
 * @brief Настройки flat-file backend
 */
struct FlatFileOptions {
    std::filesystem::path path;

    /// @brief fsync после каждой записи
    bool sync_writes{true};

    /// @brief Запись checkpoint индекса каждые N коммитов
    uint32_t checkpoint_interval{constants::DEFAULT_CHECKPOINT_INTERVAL};

    /// @brief Максимальный размер сегмента undo
    std::size_t segment_size{constants::UNDO_SEGMENT_SIZE};
};

/**
 * @brief Положение undo данных и тела блока в сегменте
 */
struct UndoLocation {
    uint32_t segment{0};
    uint64_t offset{0};
    uint32_t undo_size{0};
    uint32_t body_size{0};

    [[nodiscard]] bool operator==(const UndoLocation&) const noexcept = default;
};

/**
 * @brief ChainStore поверх журнала и сегментов
 */
class FlatFileStore final : public ChainStore {
public:
    /**
     * @brief Открыть хранилище с восстановлением после сбоя
     */
    [[nodiscard]] static Result<std::unique_ptr<FlatFileStore>> open(const FlatFileOptions& options);

    ~FlatFileStore() override;

    FlatFileStore(const FlatFileStore&) = delete;
    FlatFileStore& operator=(const FlatFileStore&) = delete;

    [[nodiscard]] Result<StoredHeader> get_header(const Hash256& hash) const override;
    [[nodiscard]] Result<StoredHeader> get_header_by_height(uint32_t height) const override;
    [[nodiscard]] Result<void> put_header(const StoredHeader& header) override;
    [[nodiscard]] Result<std::vector<StoredHeader>> load_headers() const override;

    [[nodiscard]] Result<void> put_block(const BlockCommit& commit) override;
    [[nodiscard]] Result<std::optional<ChainTip>> get_tip() const override;
    [[nodiscard]] Result<accumulator::Forest> get_roots(uint32_t height) const override;
    [[nodiscard]] Result<accumulator::UndoData> get_undo(uint32_t height) const override;
    [[nodiscard]] Result<Bytes> get_block_body(uint32_t height) const override;
    [[nodiscard]] Result<accumulator::Forest> rewind_to(uint32_t height) override;

    [[nodiscard]] Result<void> prune_before(uint32_t height) override;
    [[nodiscard]] uint32_t prune_height() const override;

    [[nodiscard]] std::string_view name() const noexcept override {
        return "flatfile";
    }

    /**
     * @brief Записать checkpoint индекса немедленно
     */
    [[nodiscard]] Result<void> checkpoint();

private:
    /// @brief Тип записи журнала
    enum class RecordType : uint8_t {
        Header = 1,
        Commit = 2,
        Rewind = 3,
        Prune = 4
    };

    /// @brief Блок активной цепи
    struct ActiveEntry {
        Hash256 hash{};
        accumulator::Forest forest;
        UndoLocation location;
    };

    explicit FlatFileStore(const FlatFileOptions& options);

    /**
     * @brief Загрузить checkpoint и прочитать журнал после него
     */
    [[nodiscard]] Result<void> recover();

    [[nodiscard]] Result<void> load_checkpoint();

    /// @brief Записать checkpoint (write_mutex_ уже захвачен)
    [[nodiscard]] Result<void> write_checkpoint();

    /**
     * @brief Применить запись журнала к индексу в памяти
     */
    [[nodiscard]] Result<void> apply_record(RecordType type, ByteSpan payload);

    /**
     * @brief Дописать запись в журнал (с fsync)
     */
    [[nodiscard]] Result<void> append_record(RecordType type, ByteSpan payload);

    /**
     * @brief Дописать undo данные и тело в текущий сегмент (с fsync)
     */
    [[nodiscard]] Result<UndoLocation> append_undo(ByteSpan undo, ByteSpan body);

    /**
     * @brief Прочитать и проверить содержимое записи сегмента
     */
    [[nodiscard]] Result<Bytes> read_segment_record(const UndoLocation& location) const;

    [[nodiscard]] Result<void> open_segment(uint32_t id);

    [[nodiscard]] std::filesystem::path segment_path(uint32_t id) const;

    void remove_segments_below(uint32_t id);

    void maybe_checkpoint();

    FlatFileOptions options_;

    File log_;
    File segment_;
    uint32_t segment_id_{0};

    /// @brief Смещение журнала, до которого индекс покрыт checkpoint
    uint64_t checkpoint_offset_{0};
    uint32_t commits_since_checkpoint_{0};

    // Индекс в памяти
    std::unordered_map<Hash256, StoredHeader> headers_;
    std::vector<ActiveEntry> active_;
    uint32_t prune_height_{0};

    /// @brief Сериализует писателей (файлы и изменения индекса)
    std::mutex write_mutex_;

    /// @brief Защищает индекс в памяти от одновременного чтения и изменения
    mutable std::shared_mutex state_mutex_;
};

} // namespace arbor::storage
