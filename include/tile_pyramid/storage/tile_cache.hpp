#pragma once

#include "tile_pyramid/core/types.hpp"

#include <cstddef>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>

namespace tile_pyramid::storage {

// Durable side of a TileCache. Keys are opaque identifiers (file paths for
// the file backends, "layer/x/y" for sqlite).
class TileBackingStore {
public:
    virtual ~TileBackingStore() = default;

    virtual std::optional<Matrix2Df> read_tile(const std::string& key) = 0;
    virtual void write_tile(const std::string& key, const Matrix2Df& tile) = 0;
    // Returns true if a durable copy existed.
    virtual bool remove_tile(const std::string& key) = 0;
    virtual bool contains_tile(const std::string& key) = 0;
};

/**
 * Bounded LRU write-back cache of tile arrays.
 *
 * Saves stay in memory (dirty) until flush(), purge() or eviction. A dirty
 * entry is always written to the backing store before its slot is reused.
 * Every load or save moves the key to the most-recent position.
 */
class TileCache {
public:
    static constexpr size_t kDefaultMaxSize = 1000;

    explicit TileCache(TileBackingStore& store, size_t max_size = kDefaultMaxSize);
    ~TileCache() = default;

    TileCache(const TileCache&) = delete;
    TileCache& operator=(const TileCache&) = delete;

    std::optional<Matrix2Df> load(const std::string& key);
    void save(const std::string& key, const Matrix2Df& data);
    bool exists(const std::string& key);
    void remove(const std::string& key);

    void flush();
    void purge();

    size_t size() const { return entries_.size(); }
    size_t max_size() const { return max_size_; }
    bool contains(const std::string& key) const { return entries_.count(key) > 0; }
    bool is_dirty(const std::string& key) const;

private:
    struct Entry {
        Matrix2Df data;
        bool saved = false;
        std::list<std::string>::iterator pos;
    };

    void touch(Entry& entry);
    void insert(const std::string& key, Matrix2Df data, bool saved);
    void evict_oldest();

    TileBackingStore& store_;
    size_t max_size_;
    std::list<std::string> order_;  // front = most recently touched
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace tile_pyramid::storage
