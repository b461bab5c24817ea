/**
 * @file flat_file_store.cpp
 * @brief Реализация flat-file backend
 */

#include "flat_file_store.hpp"
#include "../core/byte_order.hpp"
#include "../core/serialization/stream.hpp"
#include "../crypto/sha256.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <format>

namespace arbor::storage {

using core::serialization::ReadStream;
using core::serialization::WriteStream;

namespace {

/// @brief "ARBL" - начало каждой записи журнала
constexpr uint32_t LOG_MAGIC = 0x4C425241;

/// @brief "ARBI" - начало checkpoint
constexpr uint32_t INDEX_MAGIC = 0x49425241;
constexpr uint8_t INDEX_VERSION = 1;

constexpr std::size_t RECORD_HEADER_SIZE = 4 + 1 + 4;
constexpr std::size_t CHECKSUM_SIZE = 4;
constexpr uint32_t MAX_RECORD_SIZE = 64 * 1024 * 1024;

const char* const LOG_FILE = "chain.log";
const char* const INDEX_FILE = "chain.idx";

[[nodiscard]] std::array<uint8_t, CHECKSUM_SIZE> checksum(ByteSpan data) noexcept {
    const Hash256 digest = crypto::sha256d(data);
    std::array<uint8_t, CHECKSUM_SIZE> result{};
    std::copy_n(digest.begin(), CHECKSUM_SIZE, result.begin());
    return result;
}

[[nodiscard]] bool checksum_matches(ByteSpan data, ByteSpan expected) noexcept {
    const auto actual = checksum(data);
    return std::equal(actual.begin(), actual.end(), expected.begin(), expected.end());
}

/**
 * @brief Остаток журнала с offset состоит из нулей
 *
 * Так выглядит хвост, длина которого дошла до диска раньше данных.
 */
[[nodiscard]] Result<bool> zero_tail(const File& log, uint64_t offset) {
    std::array<uint8_t, 4096> chunk{};
    while (offset < log.size()) {
        const auto take = static_cast<std::size_t>(std::min<uint64_t>(chunk.size(), log.size() - offset));
        if (auto read = log.read_at(offset, std::span<uint8_t>(chunk.data(), take)); !read) {
            return std::unexpected(read.error());
        }
        if (std::any_of(chunk.begin(), chunk.begin() + take, [](uint8_t b) { return b != 0; })) {
            return false;
        }
        offset += take;
    }
    return true;
}

void write_location(WriteStream& out, const UndoLocation& location) {
    out.write_u32_le(location.segment);
    out.write_u64_le(location.offset);
    out.write_u32_le(location.undo_size);
    out.write_u32_le(location.body_size);
}

[[nodiscard]] UndoLocation read_location(ReadStream& in) {
    UndoLocation location;
    location.segment = in.read_u32_le();
    location.offset = in.read_u64_le();
    location.undo_size = in.read_u32_le();
    location.body_size = in.read_u32_le();
    return location;
}

/// @brief Разобранная запись Commit
struct CommitRecord {
    Bytes header;
    accumulator::Forest forest;
    UndoLocation location;
};

[[nodiscard]] bool parse_segment_id(const std::filesystem::path& path, uint32_t& id) {
    const std::string name = path.filename().string();
    if (!name.starts_with("undo_") || !name.ends_with(".dat")) {
        return false;
    }
    const std::string digits = name.substr(5, name.size() - 5 - 4);
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    id = static_cast<uint32_t>(std::stoul(digits));
    return true;
}

} // namespace

// =============================================================================
// Открытие и восстановление
// =============================================================================

FlatFileStore::FlatFileStore(const FlatFileOptions& options)
    : options_(options)
{
}

FlatFileStore::~FlatFileStore() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (commits_since_checkpoint_ > 0) {
        if (auto result = write_checkpoint(); !result) {
            log::warn("flat-file: не удалось записать checkpoint при закрытии: {}",
                      result.error().message);
        }
    }
}

Result<std::unique_ptr<FlatFileStore>> FlatFileStore::open(const FlatFileOptions& options) {
    std::error_code ec;
    std::filesystem::create_directories(options.path, ec);
    if (ec) {
        return Err<std::unique_ptr<FlatFileStore>>(
            ErrorCode::StoreIoError,
            std::format("Не удалось создать каталог {}: {}", options.path.string(), ec.message()));
    }

    std::unique_ptr<FlatFileStore> store(new FlatFileStore(options));

    auto log_file = File::open(options.path / LOG_FILE);
    if (!log_file) {
        return std::unexpected(log_file.error());
    }
    store->log_ = std::move(*log_file);

    if (auto result = store->recover(); !result) {
        return std::unexpected(result.error());
    }

    log::info("Flat-file хранилище открыто: {} ({} блоков, {} заголовков, pruned до {})",
              options.path.string(), store->active_.size(), store->headers_.size(),
              store->prune_height_);
    return store;
}

Result<void> FlatFileStore::recover() {
    if (auto loaded = load_checkpoint(); !loaded) {
        if (loaded.error().code != ErrorCode::StoreNotFound) {
            log::warn("flat-file: checkpoint проигнорирован ({}), чтение журнала с начала",
                      loaded.error().message);
        }
        headers_.clear();
        active_.clear();
        prune_height_ = 0;
        checkpoint_offset_ = 0;
    }

    uint64_t offset = checkpoint_offset_;
    uint32_t replayed = 0;
    std::array<uint8_t, RECORD_HEADER_SIZE> head{};

    while (offset < log_.size()) {
        const uint64_t available = log_.size() - offset;
        if (available < RECORD_HEADER_SIZE + CHECKSUM_SIZE) {
            break;
        }
        if (auto read = log_.read_at(offset, head); !read) {
            return read;
        }
        const uint32_t magic = read_le32(head.data());
        const auto type = static_cast<RecordType>(head[4]);
        const uint32_t length = read_le32(head.data() + 5);
        // Оборванная дозапись начинается с целого magic либо не дошла до диска вовсе
        if (magic != LOG_MAGIC || length > MAX_RECORD_SIZE) {
            auto zeros = zero_tail(log_, offset);
            if (!zeros) {
                return std::unexpected(zeros.error());
            }
            if (*zeros) {
                break;
            }
            return Err<void>(ErrorCode::StoreCorruption,
                             std::format("Повреждён заголовок записи журнала на смещении {}", offset));
        }
        const uint64_t record_size = RECORD_HEADER_SIZE + uint64_t{length} + CHECKSUM_SIZE;
        if (available < record_size) {
            break;
        }

        Bytes body(length + CHECKSUM_SIZE);
        if (auto read = log_.read_at(offset + RECORD_HEADER_SIZE, body); !read) {
            return read;
        }
        const ByteSpan payload(body.data(), length);
        if (!checksum_matches(payload, ByteSpan(body.data() + length, CHECKSUM_SIZE))) {
            // Неполной может быть только последняя запись
            if (available == record_size) {
                break;
            }
            return Err<void>(ErrorCode::StoreCorruption,
                             std::format("Неверная контрольная сумма записи журнала на смещении {} "
                                         "({} байт журнала после неё)",
                                         offset, available - record_size));
        }

        if (auto applied = apply_record(type, payload); !applied) {
            return Err<void>(ErrorCode::StoreCorruption,
                             std::format("Запись журнала на смещении {}: {}",
                                         offset, applied.error().message));
        }
        if (type == RecordType::Commit) {
            ++replayed;
        }
        offset += record_size;
    }

    if (offset < log_.size()) {
        log::warn("flat-file: оборванный хвост журнала ({} байт) обрезан на смещении {}",
                  log_.size() - offset, offset);
        if (auto truncated = log_.truncate(offset); !truncated) {
            return truncated;
        }
    }
    commits_since_checkpoint_ = replayed;

    // Последний существующий сегмент становится текущим
    uint32_t last_segment = 0;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(options_.path, ec)) {
        uint32_t id = 0;
        if (parse_segment_id(entry.path(), id)) {
            last_segment = std::max(last_segment, id);
        }
    }
    if (ec) {
        return Err<void>(ErrorCode::StoreIoError,
                         std::format("Не удалось прочитать каталог {}: {}",
                                     options_.path.string(), ec.message()));
    }
    if (!active_.empty()) {
        last_segment = std::max(last_segment, active_.back().location.segment);
    }
    return open_segment(last_segment);
}

Result<void> FlatFileStore::load_checkpoint() {
    auto data = read_file(options_.path / INDEX_FILE);
    if (!data) {
        return std::unexpected(data.error());
    }
    if (data->size() < CHECKSUM_SIZE) {
        return Err<void>(ErrorCode::StoreCorruption, "checkpoint слишком короткий");
    }
    const ByteSpan content(data->data(), data->size() - CHECKSUM_SIZE);
    if (!checksum_matches(content, ByteSpan(data->data() + content.size(), CHECKSUM_SIZE))) {
        return Err<void>(ErrorCode::StoreCorruption, "checksum checkpoint не совпадает");
    }

    struct Snapshot {
        uint64_t log_offset{0};
        uint32_t prune_height{0};
        std::vector<StoredHeader> headers;
        std::vector<ActiveEntry> active;
    };

    auto snapshot = core::serialization::decode(content, ErrorCode::StoreCorruption, [](ReadStream& in) {
        Snapshot result;
        if (in.read_u32_le() != INDEX_MAGIC || in.read_u8() != INDEX_VERSION) {
            throw core::serialization::StreamError("Unknown checkpoint format");
        }
        result.log_offset = in.read_u64_le();
        result.prune_height = in.read_u32_le();

        const std::size_t header_count = in.read_count(in.remaining());
        result.headers.reserve(header_count);
        for (std::size_t i = 0; i < header_count; ++i) {
            auto header = StoredHeader::deserialize(in.read_var_bytes());
            if (!header) {
                throw core::serialization::StreamError(header.error().message);
            }
            result.headers.push_back(std::move(*header));
        }

        const std::size_t active_count = in.read_count(in.remaining());
        result.active.reserve(active_count);
        for (std::size_t i = 0; i < active_count; ++i) {
            ActiveEntry entry;
            entry.hash = in.read_hash256();
            entry.forest = accumulator::Forest::deserialize(in);
            entry.location = read_location(in);
            result.active.push_back(std::move(entry));
        }
        return result;
    });
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    if (snapshot->log_offset > log_.size()) {
        return Err<void>(ErrorCode::StoreCorruption,
                         std::format("checkpoint покрывает {} байт журнала, в журнале {}",
                                     snapshot->log_offset, log_.size()));
    }

    headers_.clear();
    for (auto& header : snapshot->headers) {
        headers_.emplace(header.hash(), std::move(header));
    }
    for (const auto& entry : snapshot->active) {
        if (!headers_.contains(entry.hash)) {
            return Err<void>(ErrorCode::StoreCorruption,
                             "checkpoint ссылается на неизвестный заголовок");
        }
    }
    active_ = std::move(snapshot->active);
    prune_height_ = snapshot->prune_height;
    checkpoint_offset_ = snapshot->log_offset;
    return {};
}

Result<void> FlatFileStore::checkpoint() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return write_checkpoint();
}

Result<void> FlatFileStore::write_checkpoint() {
    WriteStream out(1024);
    {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        out.write_u32_le(INDEX_MAGIC);
        out.write_u8(INDEX_VERSION);
        out.write_u64_le(log_.size());
        out.write_u32_le(prune_height_);
        out.write_varint(headers_.size());
        for (const auto& [hash, header] : headers_) {
            out.write_var_bytes(header.serialize());
        }
        out.write_varint(active_.size());
        for (const auto& entry : active_) {
            out.write_hash256(entry.hash);
            entry.forest.serialize(out);
            write_location(out, entry.location);
        }
    }
    const auto sum = checksum(out.data());
    out.write_bytes(sum);

    if (auto written = write_file_atomic(options_.path / INDEX_FILE, out.data()); !written) {
        return written;
    }
    checkpoint_offset_ = log_.size();
    commits_since_checkpoint_ = 0;
    return {};
}

void FlatFileStore::maybe_checkpoint() {
    if (commits_since_checkpoint_ < options_.checkpoint_interval) {
        return;
    }
    // Журнал - источник истины, checkpoint лишь сокращает восстановление
    if (auto result = write_checkpoint(); !result) {
        log::warn("flat-file: не удалось записать checkpoint: {}", result.error().message);
    }
}

// =============================================================================
// Журнал и сегменты
// =============================================================================

Result<void> FlatFileStore::apply_record(RecordType type, ByteSpan payload) {
    switch (type) {
        case RecordType::Header: {
            auto header = StoredHeader::deserialize(payload);
            if (!header) {
                return std::unexpected(header.error());
            }
            headers_[header->hash()] = std::move(*header);
            return {};
        }
        case RecordType::Commit: {
            auto record = core::serialization::decode(payload, ErrorCode::StoreCorruption, [](ReadStream& in) {
                CommitRecord result;
                result.header = in.read_var_bytes();
                result.forest = accumulator::Forest::deserialize(in);
                result.location = read_location(in);
                return result;
            });
            if (!record) {
                return std::unexpected(record.error());
            }
            auto header = StoredHeader::deserialize(record->header);
            if (!header) {
                return std::unexpected(header.error());
            }
            if (header->height != active_.size()) {
                return Err<void>(ErrorCode::StoreCorruption,
                                 std::format("Коммит высоты {} при tip {}",
                                             header->height, active_.size()));
            }
            const Hash256 hash = header->hash();
            headers_[hash] = std::move(*header);
            active_.push_back(ActiveEntry{hash, std::move(record->forest), record->location});
            return {};
        }
        case RecordType::Rewind: {
            if (payload.size() != 4) {
                return Err<void>(ErrorCode::StoreCorruption, "Некорректная запись отката");
            }
            const uint32_t height = read_le32(payload.data());
            if (height >= active_.size()) {
                return Err<void>(ErrorCode::StoreCorruption,
                                 std::format("Откат до {} при tip {}", height, active_.size()));
            }
            active_.resize(height + 1);
            return {};
        }
        case RecordType::Prune: {
            if (payload.size() != 4) {
                return Err<void>(ErrorCode::StoreCorruption, "Некорректная запись pruning");
            }
            prune_height_ = std::max(prune_height_, read_le32(payload.data()));
            return {};
        }
    }
    return Err<void>(ErrorCode::StoreCorruption,
                     std::format("Неизвестный тип записи {}", static_cast<int>(type)));
}

Result<void> FlatFileStore::append_record(RecordType type, ByteSpan payload) {
    Bytes record(RECORD_HEADER_SIZE);
    write_le32(record.data(), LOG_MAGIC);
    record[4] = static_cast<uint8_t>(type);
    write_le32(record.data() + 5, static_cast<uint32_t>(payload.size()));
    record.insert(record.end(), payload.begin(), payload.end());
    const auto sum = checksum(payload);
    record.insert(record.end(), sum.begin(), sum.end());

    const uint64_t start = log_.size();
    if (auto written = log_.append(record); !written) {
        // Частично записанная запись не должна остаться перед следующей
        if (auto truncated = log_.truncate(start); !truncated) {
            log::error("flat-file: не удалось обрезать журнал после ошибки: {}",
                       truncated.error().message);
        }
        return std::unexpected(written.error());
    }
    if (options_.sync_writes) {
        return log_.sync();
    }
    return {};
}

std::filesystem::path FlatFileStore::segment_path(uint32_t id) const {
    return options_.path / std::format("undo_{:05}.dat", id);
}

Result<void> FlatFileStore::open_segment(uint32_t id) {
    auto file = File::open(segment_path(id));
    if (!file) {
        return std::unexpected(file.error());
    }
    segment_ = std::move(*file);
    segment_id_ = id;
    return {};
}

Result<UndoLocation> FlatFileStore::append_undo(ByteSpan undo, ByteSpan body) {
    const std::size_t record_size = undo.size() + body.size() + CHECKSUM_SIZE;
    if (segment_.size() > 0 && segment_.size() + record_size > options_.segment_size) {
        if (auto opened = open_segment(segment_id_ + 1); !opened) {
            return std::unexpected(opened.error());
        }
    }

    Bytes record;
    record.reserve(record_size);
    record.insert(record.end(), undo.begin(), undo.end());
    record.insert(record.end(), body.begin(), body.end());
    const auto sum = checksum(record);
    record.insert(record.end(), sum.begin(), sum.end());

    auto offset = segment_.append(record);
    if (!offset) {
        return std::unexpected(offset.error());
    }
    if (options_.sync_writes) {
        if (auto synced = segment_.sync(); !synced) {
            return std::unexpected(synced.error());
        }
    }
    return UndoLocation{
        segment_id_, *offset,
        static_cast<uint32_t>(undo.size()), static_cast<uint32_t>(body.size())
    };
}

Result<Bytes> FlatFileStore::read_segment_record(const UndoLocation& location) const {
    const auto path = segment_path(location.segment);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Err<Bytes>(ErrorCode::StoreCorruption,
                          std::format("Сегмент {} отсутствует", path.string()));
    }
    auto file = File::open(path);
    if (!file) {
        return std::unexpected(file.error());
    }
    const std::size_t size = std::size_t{location.undo_size} + location.body_size;
    Bytes data(size + CHECKSUM_SIZE);
    if (auto read = file->read_at(location.offset, data); !read) {
        return std::unexpected(read.error());
    }
    if (!checksum_matches(ByteSpan(data.data(), size), ByteSpan(data.data() + size, CHECKSUM_SIZE))) {
        return Err<Bytes>(ErrorCode::StoreCorruption,
                          std::format("checksum записи в {} на смещении {} не совпадает",
                                      path.string(), location.offset));
    }
    data.resize(size);
    return data;
}

void FlatFileStore::remove_segments_below(uint32_t id) {
    std::error_code ec;
    std::vector<std::filesystem::path> doomed;
    for (const auto& entry : std::filesystem::directory_iterator(options_.path, ec)) {
        uint32_t segment = 0;
        if (parse_segment_id(entry.path(), segment) && segment < id && segment != segment_id_) {
            doomed.push_back(entry.path());
        }
    }
    for (const auto& path : doomed) {
        if (!std::filesystem::remove(path, ec) && ec) {
            log::warn("flat-file: не удалось удалить сегмент {}: {}", path.string(), ec.message());
        } else {
            log::debug("flat-file: удалён сегмент {}", path.string());
        }
    }
}

// =============================================================================
// Заголовки
// =============================================================================

Result<StoredHeader> FlatFileStore::get_header(const Hash256& hash) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    auto it = headers_.find(hash);
    if (it == headers_.end()) {
        return Err<StoredHeader>(ErrorCode::StoreNotFound,
                                 "Заголовок не найден: " + core::hash_to_hex(hash));
    }
    return it->second;
}

Result<StoredHeader> FlatFileStore::get_header_by_height(uint32_t height) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    if (height >= active_.size()) {
        return Err<StoredHeader>(ErrorCode::StoreNotFound,
                                 std::format("Нет блока активной цепи на высоте {}", height));
    }
    auto it = headers_.find(active_[height].hash);
    if (it == headers_.end()) {
        return Err<StoredHeader>(ErrorCode::StoreCorruption,
                                 std::format("Нет заголовка для высоты {}", height));
    }
    return it->second;
}

Result<void> FlatFileStore::put_header(const StoredHeader& header) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    const Bytes payload = header.serialize();
    if (auto written = append_record(RecordType::Header, payload); !written) {
        return written;
    }
    std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
    return apply_record(RecordType::Header, payload);
}

Result<std::vector<StoredHeader>> FlatFileStore::load_headers() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    std::vector<StoredHeader> headers;
    headers.reserve(headers_.size());
    for (const auto& [hash, header] : headers_) {
        headers.push_back(header);
    }
    return headers;
}

// =============================================================================
// Блоки
// =============================================================================

Result<void> FlatFileStore::put_block(const BlockCommit& commit) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    const uint32_t expected_height = static_cast<uint32_t>(active_.size());
    if (commit.header.height != expected_height) {
        return Err<void>(ErrorCode::StoreCorruption,
                         std::format("put_block: высота {} вместо ожидаемой {}",
                                     commit.header.height, expected_height));
    }
    if (!active_.empty() && commit.header.header.prev_hash != active_.back().hash) {
        return Err<void>(ErrorCode::StoreCorruption,
                         "put_block: блок не продолжает tip хранилища");
    }

    auto location = append_undo(commit.undo.serialize(), commit.body);
    if (!location) {
        return std::unexpected(location.error());
    }

    WriteStream payload(256);
    payload.write_var_bytes(commit.header.serialize());
    commit.forest.serialize(payload);
    write_location(payload, *location);

    if (auto written = append_record(RecordType::Commit, payload.data()); !written) {
        return written;
    }
    {
        std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
        if (auto applied = apply_record(RecordType::Commit, payload.data()); !applied) {
            return applied;
        }
    }
    ++commits_since_checkpoint_;
    maybe_checkpoint();
    return {};
}

Result<std::optional<ChainTip>> FlatFileStore::get_tip() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    if (active_.empty()) {
        return std::optional<ChainTip>{};
    }
    return std::optional<ChainTip>{
        ChainTip{active_.back().hash, static_cast<uint32_t>(active_.size() - 1)}
    };
}

Result<accumulator::Forest> FlatFileStore::get_roots(uint32_t height) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    if (height >= active_.size()) {
        return Err<accumulator::Forest>(ErrorCode::StoreNotFound,
                                        std::format("Нет корней для высоты {}", height));
    }
    return active_[height].forest;
}

Result<accumulator::UndoData> FlatFileStore::get_undo(uint32_t height) const {
    UndoLocation location;
    {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        if (height < prune_height_) {
            return Err<accumulator::UndoData>(ErrorCode::UndoUnavailable,
                                              std::format("Undo данные высоты {} удалены", height));
        }
        if (height >= active_.size()) {
            return Err<accumulator::UndoData>(ErrorCode::StoreNotFound,
                                              std::format("Нет undo данных для высоты {}", height));
        }
        location = active_[height].location;
    }

    auto data = read_segment_record(location);
    if (!data) {
        // Сегмент мог быть удалён prune_before после снятия блокировки
        if (height < prune_height()) {
            return Err<accumulator::UndoData>(ErrorCode::UndoUnavailable,
                                              std::format("Undo данные высоты {} удалены", height));
        }
        return std::unexpected(data.error());
    }
    return accumulator::UndoData::deserialize(ByteSpan(data->data(), location.undo_size));
}

Result<Bytes> FlatFileStore::get_block_body(uint32_t height) const {
    UndoLocation location;
    {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        if (height < prune_height_) {
            return Err<Bytes>(ErrorCode::UndoUnavailable,
                              std::format("Тело блока высоты {} удалено", height));
        }
        if (height >= active_.size()) {
            return Err<Bytes>(ErrorCode::StoreNotFound,
                              std::format("Нет тела блока для высоты {}", height));
        }
        location = active_[height].location;
    }

    auto data = read_segment_record(location);
    if (!data) {
        if (height < prune_height()) {
            return Err<Bytes>(ErrorCode::UndoUnavailable,
                              std::format("Тело блока высоты {} удалено", height));
        }
        return std::unexpected(data.error());
    }
    return Bytes(data->begin() + location.undo_size, data->end());
}

Result<accumulator::Forest> FlatFileStore::rewind_to(uint32_t height) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (active_.empty()) {
        return Err<accumulator::Forest>(ErrorCode::StoreNotFound, "Хранилище пусто");
    }
    const auto tip_height = static_cast<uint32_t>(active_.size() - 1);

    auto forest = replay_undo(*this, tip_height, height);
    if (!forest || height == tip_height) {
        return forest;
    }

    uint8_t payload[4];
    write_le32(payload, height);
    if (auto written = append_record(RecordType::Rewind, payload); !written) {
        return std::unexpected(written.error());
    }
    {
        std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
        if (auto applied = apply_record(RecordType::Rewind, payload); !applied) {
            return std::unexpected(applied.error());
        }
    }
    ++commits_since_checkpoint_;
    maybe_checkpoint();

    log::debug("flat-file: откат с высоты {} до {}", tip_height, height);
    return forest;
}

// =============================================================================
// Pruning
// =============================================================================

Result<void> FlatFileStore::prune_before(uint32_t height) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (height <= prune_height_) {
        return {};
    }

    uint8_t payload[4];
    write_le32(payload, height);
    if (auto written = append_record(RecordType::Prune, payload); !written) {
        return written;
    }
    {
        std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
        if (auto applied = apply_record(RecordType::Prune, payload); !applied) {
            return applied;
        }
    }

    // Сегменты заполняются по возрастанию высот: всё ниже сегмента высоты height не нужно
    const uint32_t keep_from = height < active_.size()
        ? active_[height].location.segment
        : segment_id_;
    remove_segments_below(keep_from);
    return {};
}

uint32_t FlatFileStore::prune_height() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return prune_height_;
}

} // namespace arbor::storage
