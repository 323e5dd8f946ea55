#pragma once

#include "tile_pyramid/storage/tile_storage.hpp"

#include <set>

struct sqlite3;

namespace tile_pyramid::storage {

/**
 * One sqlite database per component (<root>/<component>.db) with one table
 * per layer: layer<N>(x INTEGER, y INTEGER, data BLOB), unique on (x, y).
 * Blobs use the tile block codec.
 *
 * Writes happen inside an open transaction; flush() commits it and opens
 * the next one.
 */
class SqliteTileStorage : public CachedTileStorage {
public:
    SqliteTileStorage(const fs::path& root, TileComponent component,
                      size_t cache_size = TileCache::kDefaultMaxSize);
    ~SqliteTileStorage() override;

    SqliteTileStorage(const SqliteTileStorage&) = delete;
    SqliteTileStorage& operator=(const SqliteTileStorage&) = delete;

    StorageBackend backend() const override { return StorageBackend::SQLITE; }

    void flush() override;

    const fs::path& db_path() const { return db_path_; }

protected:
    std::string tile_key(int layer, int x, int y) const override;
    TileCoordSet scan_layer(int layer) override;

    std::optional<Matrix2Df> read_tile(const std::string& key) override;
    void write_tile(const std::string& key, const Matrix2Df& tile) override;
    bool remove_tile(const std::string& key) override;
    bool contains_tile(const std::string& key) override;

private:
    void exec(const std::string& sql);
    void ensure_table(int layer);
    bool has_table(int layer) const { return tables_.count(layer) > 0; }

    fs::path db_path_;
    sqlite3* db_ = nullptr;
    std::set<int> tables_;
};

} // namespace tile_pyramid::storage
