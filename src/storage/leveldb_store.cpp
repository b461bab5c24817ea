/**
 * @file leveldb_store.cpp
 * @brief Реализация LevelDB backend
 */

#include "leveldb_store.hpp"
#include "../core/byte_order.hpp"
#include "../log/logger.hpp"

#include <leveldb/iterator.h>
#include <leveldb/write_batch.h>

#include <format>

namespace arbor::storage {

namespace {

constexpr char HEADER_PREFIX = 'h';
constexpr char HEIGHT_PREFIX = 'H';
constexpr char ROOTS_PREFIX = 'r';
constexpr char UNDO_PREFIX = 'u';
constexpr char BODY_PREFIX = 'b';
const std::string TIP_KEY = "T";
const std::string PRUNE_KEY = "P";

[[nodiscard]] std::string hash_key(const Hash256& hash) {
    std::string key(1 + hash.size(), '\0');
    key[0] = HEADER_PREFIX;
    std::memcpy(key.data() + 1, hash.data(), hash.size());
    return key;
}

/// @brief Высота в big-endian: итерация по ключам идёт по возрастанию высот
[[nodiscard]] std::string height_key(char prefix, uint32_t height) {
    std::string key(5, '\0');
    key[0] = prefix;
    write_be32(reinterpret_cast<uint8_t*>(key.data() + 1), height);
    return key;
}

[[nodiscard]] ByteSpan as_bytes(const std::string& value) noexcept {
    return ByteSpan(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

[[nodiscard]] leveldb::Slice as_slice(const Bytes& value) noexcept {
    return leveldb::Slice(reinterpret_cast<const char*>(value.data()), value.size());
}

/**
 * @brief Преобразовать leveldb::Status в Error
 */
[[nodiscard]] Error status_error(const leveldb::Status& status, std::string_view what) {
    ErrorCode code = ErrorCode::StoreIoError;
    if (status.IsCorruption()) {
        code = ErrorCode::StoreCorruption;
    } else if (status.IsIOError()) {
        // Ошибки ввода/вывода LevelDB (занятый файл, нехватка дескрипторов) повторяемы
        code = ErrorCode::StoreIoTransient;
    } else if (status.IsNotFound()) {
        code = ErrorCode::StoreNotFound;
    }
    return Error{code, std::format("LevelDB {}: {}", what, status.ToString())};
}

} // namespace

// =============================================================================
// Открытие
// =============================================================================

LevelDbStore::LevelDbStore(
    std::unique_ptr<leveldb::DB> db,
    std::unique_ptr<leveldb::Cache> cache,
    const LevelDbOptions& options
)
    : cache_(std::move(cache))
    , db_(std::move(db))
{
    read_options_.verify_checksums = true;
    write_options_.sync = options.sync_writes;
}

LevelDbStore::~LevelDbStore() {
    db_.reset();
    cache_.reset();
}

Result<std::unique_ptr<LevelDbStore>> LevelDbStore::open(const LevelDbOptions& options) {
    std::error_code ec;
    std::filesystem::create_directories(options.path, ec);
    if (ec) {
        return Err<std::unique_ptr<LevelDbStore>>(
            ErrorCode::StoreIoError,
            std::format("Не удалось создать каталог {}: {}", options.path.string(), ec.message()));
    }

    std::unique_ptr<leveldb::Cache> cache(leveldb::NewLRUCache(options.cache_bytes));

    leveldb::Options db_options;
    db_options.create_if_missing = true;
    db_options.paranoid_checks = true;
    db_options.block_cache = cache.get();

    leveldb::DB* raw_db = nullptr;
    leveldb::Status status = leveldb::DB::Open(db_options, options.path.string(), &raw_db);
    if (!status.ok()) {
        return std::unexpected(status_error(status, "open"));
    }

    std::unique_ptr<LevelDbStore> store(
        new LevelDbStore(std::unique_ptr<leveldb::DB>(raw_db), std::move(cache), options));

    auto prune = store->read(PRUNE_KEY);
    if (!prune) {
        return std::unexpected(prune.error());
    }
    if (prune->has_value()) {
        if ((*prune)->size() != 4) {
            return Err<std::unique_ptr<LevelDbStore>>(
                ErrorCode::StoreCorruption, "Некорректная запись высоты pruning");
        }
        store->prune_height_.store(read_le32(as_bytes(**prune).data()), std::memory_order_release);
    }

    log::info("LevelDB хранилище открыто: {} (pruned до {})",
              options.path.string(), store->prune_height());
    return store;
}

// =============================================================================
// Низкоуровневые операции
// =============================================================================

Result<std::optional<std::string>> LevelDbStore::read(const std::string& key) const {
    std::string value;
    leveldb::Status status = db_->Get(read_options_, key, &value);
    if (status.IsNotFound()) {
        return std::optional<std::string>{};
    }
    if (!status.ok()) {
        return std::unexpected(status_error(status, "get"));
    }
    return std::optional<std::string>{std::move(value)};
}

Result<void> LevelDbStore::write(leveldb::WriteBatch& batch) {
    leveldb::Status status = db_->Write(write_options_, &batch);
    if (!status.ok()) {
        return std::unexpected(status_error(status, "write"));
    }
    return {};
}

Result<std::optional<ChainTip>> LevelDbStore::read_tip() const {
    auto raw = read(TIP_KEY);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    if (!raw->has_value()) {
        return std::optional<ChainTip>{};
    }
    auto tip = ChainTip::deserialize(as_bytes(**raw));
    if (!tip) {
        return std::unexpected(tip.error());
    }
    return std::optional<ChainTip>{*tip};
}

// =============================================================================
// Заголовки
// =============================================================================

Result<StoredHeader> LevelDbStore::get_header(const Hash256& hash) const {
    auto raw = read(hash_key(hash));
    if (!raw) {
        return std::unexpected(raw.error());
    }
    if (!raw->has_value()) {
        return Err<StoredHeader>(ErrorCode::StoreNotFound,
                                 "Заголовок не найден: " + core::hash_to_hex(hash));
    }
    return StoredHeader::deserialize(as_bytes(**raw));
}

Result<StoredHeader> LevelDbStore::get_header_by_height(uint32_t height) const {
    auto raw = read(height_key(HEIGHT_PREFIX, height));
    if (!raw) {
        return std::unexpected(raw.error());
    }
    if (!raw->has_value()) {
        return Err<StoredHeader>(ErrorCode::StoreNotFound,
                                 std::format("Нет блока активной цепи на высоте {}", height));
    }
    if ((*raw)->size() != sizeof(Hash256)) {
        return Err<StoredHeader>(ErrorCode::StoreCorruption,
                                 std::format("Некорректный индекс высоты {}", height));
    }
    Hash256 hash;
    std::memcpy(hash.data(), (*raw)->data(), hash.size());
    return get_header(hash);
}

Result<void> LevelDbStore::put_header(const StoredHeader& header) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    leveldb::WriteBatch batch;
    batch.Put(hash_key(header.hash()), as_slice(header.serialize()));
    return write(batch);
}

Result<std::vector<StoredHeader>> LevelDbStore::load_headers() const {
    std::vector<StoredHeader> headers;
    std::unique_ptr<leveldb::Iterator> it(db_->NewIterator(read_options_));
    const std::string prefix(1, HEADER_PREFIX);
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        auto value = it->value();
        auto header = StoredHeader::deserialize(
            ByteSpan(reinterpret_cast<const uint8_t*>(value.data()), value.size()));
        if (!header) {
            return std::unexpected(header.error());
        }
        headers.push_back(std::move(*header));
    }
    if (!it->status().ok()) {
        return std::unexpected(status_error(it->status(), "iterate"));
    }
    return headers;
}

// =============================================================================
// Блоки
// =============================================================================

Result<void> LevelDbStore::put_block(const BlockCommit& commit) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    auto tip = read_tip();
    if (!tip) {
        return std::unexpected(tip.error());
    }
    const uint32_t expected_height = tip->has_value() ? (*tip)->height + 1 : 0;
    if (commit.header.height != expected_height) {
        return Err<void>(ErrorCode::StoreCorruption,
                         std::format("put_block: высота {} вместо ожидаемой {}",
                                     commit.header.height, expected_height));
    }
    if (tip->has_value() && commit.header.header.prev_hash != (*tip)->hash) {
        return Err<void>(ErrorCode::StoreCorruption,
                         "put_block: блок не продолжает tip хранилища");
    }

    const Hash256 hash = commit.header.hash();
    const uint32_t height = commit.header.height;
    const ChainTip new_tip{hash, height};

    leveldb::WriteBatch batch;
    batch.Put(hash_key(hash), as_slice(commit.header.serialize()));
    batch.Put(height_key(HEIGHT_PREFIX, height),
              leveldb::Slice(reinterpret_cast<const char*>(hash.data()), hash.size()));
    batch.Put(height_key(ROOTS_PREFIX, height), as_slice(commit.forest.serialize()));
    batch.Put(height_key(UNDO_PREFIX, height), as_slice(commit.undo.serialize()));
    batch.Put(height_key(BODY_PREFIX, height), as_slice(commit.body));
    batch.Put(TIP_KEY, as_slice(new_tip.serialize()));
    return write(batch);
}

Result<std::optional<ChainTip>> LevelDbStore::get_tip() const {
    return read_tip();
}

Result<accumulator::Forest> LevelDbStore::get_roots(uint32_t height) const {
    auto raw = read(height_key(ROOTS_PREFIX, height));
    if (!raw) {
        return std::unexpected(raw.error());
    }
    if (!raw->has_value()) {
        return Err<accumulator::Forest>(ErrorCode::StoreNotFound,
                                        std::format("Нет корней для высоты {}", height));
    }
    return accumulator::Forest::deserialize(as_bytes(**raw));
}

Result<accumulator::UndoData> LevelDbStore::get_undo(uint32_t height) const {
    if (height < prune_height()) {
        return Err<accumulator::UndoData>(ErrorCode::UndoUnavailable,
                                          std::format("Undo данные высоты {} удалены", height));
    }
    auto raw = read(height_key(UNDO_PREFIX, height));
    if (!raw) {
        return std::unexpected(raw.error());
    }
    if (!raw->has_value()) {
        // prune_before публикует высоту до удаления ключей
        if (height < prune_height()) {
            return Err<accumulator::UndoData>(ErrorCode::UndoUnavailable,
                                              std::format("Undo данные высоты {} удалены", height));
        }
        return Err<accumulator::UndoData>(ErrorCode::StoreNotFound,
                                          std::format("Нет undo данных для высоты {}", height));
    }
    return accumulator::UndoData::deserialize(as_bytes(**raw));
}

Result<Bytes> LevelDbStore::get_block_body(uint32_t height) const {
    if (height < prune_height()) {
        return Err<Bytes>(ErrorCode::UndoUnavailable,
                          std::format("Тело блока высоты {} удалено", height));
    }
    auto raw = read(height_key(BODY_PREFIX, height));
    if (!raw) {
        return std::unexpected(raw.error());
    }
    if (!raw->has_value()) {
        if (height < prune_height()) {
            return Err<Bytes>(ErrorCode::UndoUnavailable,
                              std::format("Тело блока высоты {} удалено", height));
        }
        return Err<Bytes>(ErrorCode::StoreNotFound,
                          std::format("Нет тела блока для высоты {}", height));
    }
    const auto bytes = as_bytes(**raw);
    return Bytes(bytes.begin(), bytes.end());
}

Result<accumulator::Forest> LevelDbStore::rewind_to(uint32_t height) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    auto tip = read_tip();
    if (!tip) {
        return std::unexpected(tip.error());
    }
    if (!tip->has_value()) {
        return Err<accumulator::Forest>(ErrorCode::StoreNotFound, "Хранилище пусто");
    }
    const uint32_t tip_height = (*tip)->height;

    auto forest = replay_undo(*this, tip_height, height);
    if (!forest) {
        return forest;
    }
    if (height == tip_height) {
        return forest;
    }

    auto target = get_header_by_height(height);
    if (!target) {
        return std::unexpected(target.error());
    }

    leveldb::WriteBatch batch;
    for (uint32_t h = height + 1; h <= tip_height; ++h) {
        batch.Delete(height_key(HEIGHT_PREFIX, h));
        batch.Delete(height_key(ROOTS_PREFIX, h));
        batch.Delete(height_key(UNDO_PREFIX, h));
        batch.Delete(height_key(BODY_PREFIX, h));
    }
    batch.Put(TIP_KEY, as_slice(ChainTip{target->hash(), height}.serialize()));
    if (auto result = write(batch); !result) {
        return std::unexpected(result.error());
    }

    log::debug("LevelDB: откат с высоты {} до {}", tip_height, height);
    return forest;
}

// =============================================================================
// Pruning
// =============================================================================

Result<void> LevelDbStore::prune_before(uint32_t height) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    const uint32_t current = prune_height_.load(std::memory_order_acquire);
    if (height <= current) {
        return {};
    }

    leveldb::WriteBatch batch;
    for (uint32_t h = current; h < height; ++h) {
        batch.Delete(height_key(UNDO_PREFIX, h));
        batch.Delete(height_key(BODY_PREFIX, h));
    }
    uint8_t raw[4];
    write_le32(raw, height);
    batch.Put(PRUNE_KEY, leveldb::Slice(reinterpret_cast<const char*>(raw), sizeof(raw)));

    // Высота публикуется до удаления: читатель не увидит пропавшую запись ниже неё как NotFound
    prune_height_.store(height, std::memory_order_release);
    if (auto result = write(batch); !result) {
        prune_height_.store(current, std::memory_order_release);
        return result;
    }
    return {};
}

uint32_t LevelDbStore::prune_height() const {
    return prune_height_.load(std::memory_order_acquire);
}

} // namespace arbor::storage
