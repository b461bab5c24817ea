/**
 * @file block_index.cpp
 * @brief Реализация индекса заголовков
 */

#include "block_index.hpp"

#include <algorithm>
#include <format>

namespace arbor::chain {

using storage::HeaderStatus;
using storage::StoredHeader;

bool BlockIndex::better(const Entry& candidate, const Entry& current) noexcept {
    if (candidate.record.chain_work != current.record.chain_work) {
        return candidate.record.chain_work > current.record.chain_work;
    }
    return candidate.sequence < current.sequence;
}

Result<void> BlockIndex::insert(const StoredHeader& record) {
    const Hash256 hash = record.hash();

    if (record.height > 0) {
        auto parent = entries_.find(record.header.prev_hash);
        if (parent == entries_.end()) {
            return Err<void>(ErrorCode::OrphanHeader,
                             "Неизвестен родитель " + core::hash_to_hex(record.header.prev_hash));
        }
        if (parent->second.record.height + 1 != record.height) {
            return Err<void>(ErrorCode::StoreCorruption,
                             std::format("Высота {} не следует за родителем {}",
                                         record.height, parent->second.record.height));
        }
    }

    auto [it, inserted] = entries_.try_emplace(hash, Entry{record, hash, next_sequence_});
    if (inserted) {
        ++next_sequence_;
    } else {
        it->second.record = record;
    }

    if (record.status == HeaderStatus::Rejected) {
        if (best_ && *best_ == hash) {
            recompute_best();
        }
        return {};
    }

    const Entry* best = best_header();
    if (best == nullptr || better(it->second, *best)) {
        best_ = hash;
    }
    return {};
}

const BlockIndex::Entry* BlockIndex::find(const Hash256& hash) const {
    auto it = entries_.find(hash);
    return it == entries_.end() ? nullptr : &it->second;
}

void BlockIndex::set_status(const Hash256& hash, HeaderStatus status) {
    auto it = entries_.find(hash);
    if (it == entries_.end()) {
        return;
    }
    it->second.record.status = status;
    if (status == HeaderStatus::Rejected && best_ && *best_ == hash) {
        recompute_best();
    }
}

const BlockIndex::Entry* BlockIndex::ancestor(const Hash256& hash, uint32_t height) const {
    const Entry* entry = find(hash);
    if (entry == nullptr || height > entry->record.height) {
        return nullptr;
    }

    // Быстрый путь: предок на активной цепи
    if (height < active_.size() && is_active(hash)) {
        return find(active_[height]);
    }

    while (entry != nullptr && entry->record.height > height) {
        // Как только ветка сошлась с активной цепью, дальше - по индексу высот
        if (entry->record.height < active_.size() &&
            active_[entry->record.height] == entry->hash) {
            return find(active_[height]);
        }
        entry = find(entry->record.header.prev_hash);
    }
    return entry;
}

const BlockIndex::Entry* BlockIndex::find_fork(const Hash256& a, const Hash256& b) const {
    const Entry* left = find(a);
    const Entry* right = find(b);
    if (left == nullptr || right == nullptr) {
        return nullptr;
    }

    const uint32_t height = std::min(left->record.height, right->record.height);
    left = ancestor(a, height);
    right = ancestor(b, height);

    while (left != nullptr && right != nullptr && left->hash != right->hash) {
        left = find(left->record.header.prev_hash);
        right = find(right->record.header.prev_hash);
    }
    return left != nullptr && right != nullptr ? left : nullptr;
}

bool BlockIndex::is_ancestor(const Hash256& ancestor_hash, const Hash256& hash) const {
    const Entry* candidate = find(ancestor_hash);
    if (candidate == nullptr) {
        return false;
    }
    const Entry* entry = ancestor(hash, candidate->record.height);
    return entry != nullptr && entry->hash == ancestor_hash;
}

std::vector<Hash256> BlockIndex::descendants(const Hash256& hash) const {
    std::vector<Hash256> result;
    const Entry* root = find(hash);
    if (root == nullptr) {
        return result;
    }
    for (const auto& [entry_hash, entry] : entries_) {
        if (entry.record.height > root->record.height && is_ancestor(hash, entry_hash)) {
            result.push_back(entry_hash);
        }
    }
    return result;
}

// =============================================================================
// Активная цепь
// =============================================================================

void BlockIndex::set_active_tip(const Hash256& hash) {
    const Entry* entry = find(hash);
    if (entry == nullptr) {
        return;
    }

    const uint32_t height = entry->record.height;
    active_.resize(height + 1);

    // Переписываем хвост до точки схождения со старой активной цепью
    const Entry* cursor = entry;
    while (cursor != nullptr) {
        const uint32_t h = cursor->record.height;
        const Hash256 cursor_hash = cursor->hash;
        if (active_[h] == cursor_hash) {
            break;
        }
        active_[h] = cursor_hash;
        if (h == 0) {
            break;
        }
        cursor = find(cursor->record.header.prev_hash);
    }
}

std::optional<Hash256> BlockIndex::active_at(uint32_t height) const {
    if (height >= active_.size()) {
        return std::nullopt;
    }
    return active_[height];
}

bool BlockIndex::is_active(const Hash256& hash) const {
    const Entry* entry = find(hash);
    return entry != nullptr && entry->record.height < active_.size() &&
           active_[entry->record.height] == hash;
}

const BlockIndex::Entry* BlockIndex::active_tip() const {
    return active_.empty() ? nullptr : find(active_.back());
}

// =============================================================================
// Лучший заголовок
// =============================================================================

const BlockIndex::Entry* BlockIndex::best_header() const {
    return best_ ? find(*best_) : nullptr;
}

void BlockIndex::recompute_best() {
    best_.reset();
    const Entry* best = nullptr;
    for (const auto& [hash, entry] : entries_) {
        if (entry.record.status == HeaderStatus::Rejected) {
            continue;
        }
        if (best == nullptr || better(entry, *best)) {
            best = &entry;
            best_ = hash;
        }
    }
}

void BlockIndex::clear() {
    entries_.clear();
    active_.clear();
    best_.reset();
    next_sequence_ = 0;
}

} // namespace arbor::chain
