#include "tile_pyramid/storage/tile_cache.hpp"
#include "tile_pyramid/core/errors.hpp"

namespace tile_pyramid::storage {

TileCache::TileCache(TileBackingStore& store, size_t max_size)
    : store_(store), max_size_(max_size) {
    if (max_size_ == 0) {
        throw ValidationError("tile cache size must be at least 1");
    }
}

std::optional<Matrix2Df> TileCache::load(const std::string& key) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        touch(it->second);
        return it->second.data;
    }

    std::optional<Matrix2Df> data = store_.read_tile(key);
    if (!data) return std::nullopt;

    insert(key, *data, true);
    return data;
}

void TileCache::save(const std::string& key, const Matrix2Df& data) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.data = data;
        it->second.saved = false;
        touch(it->second);
        return;
    }
    insert(key, data, false);
}

bool TileCache::exists(const std::string& key) {
    return entries_.count(key) > 0 || store_.contains_tile(key);
}

void TileCache::remove(const std::string& key) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        order_.erase(it->second.pos);
        entries_.erase(it);
    }
    store_.remove_tile(key);
}

void TileCache::flush() {
    for (auto& [key, entry] : entries_) {
        if (!entry.saved) {
            store_.write_tile(key, entry.data);
            entry.saved = true;
        }
    }
}

void TileCache::purge() {
    flush();
    entries_.clear();
    order_.clear();
}

bool TileCache::is_dirty(const std::string& key) const {
    auto it = entries_.find(key);
    return it != entries_.end() && !it->second.saved;
}

void TileCache::touch(Entry& entry) {
    order_.splice(order_.begin(), order_, entry.pos);
}

void TileCache::insert(const std::string& key, Matrix2Df data, bool saved) {
    while (entries_.size() >= max_size_) {
        evict_oldest();
    }
    order_.push_front(key);
    Entry entry;
    entry.data = std::move(data);
    entry.saved = saved;
    entry.pos = order_.begin();
    entries_.emplace(key, std::move(entry));
}

void TileCache::evict_oldest() {
    const std::string key = order_.back();
    auto it = entries_.find(key);
    if (!it->second.saved) {
        store_.write_tile(key, it->second.data);
    }
    entries_.erase(it);
    order_.pop_back();
}

} // namespace tile_pyramid::storage
