#pragma once

#include "tile_pyramid/core/types.hpp"
#include "tile_pyramid/storage/tile_cache.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace tile_pyramid::storage {

// Persistence for one pyramid component (acc, occ or img) across all layers.
class TileStorage {
public:
    virtual ~TileStorage() = default;

    virtual std::optional<Matrix2Df> get_tile(int layer, int x, int y) = 0;
    virtual void save_tile(int layer, int x, int y, const Matrix2Df& data) = 0;
    virtual void delete_tile(int layer, int x, int y) = 0;
    virtual bool tile_exists(int layer, int x, int y) = 0;
    virtual TileCoordSet get_layer_tile_coords(int layer) = 0;
    virtual void flush() = 0;

    virtual StorageBackend backend() const = 0;
};

/**
 * TileStorage on top of a TileCache. Subclasses provide the backing store,
 * the cache key for a tile and a one-off scan of the tiles of a layer; the
 * coordinate set of each layer is built from that scan the first time it is
 * needed and then kept current on save/delete.
 */
class CachedTileStorage : public TileStorage, protected TileBackingStore {
public:
    explicit CachedTileStorage(size_t cache_size);
    ~CachedTileStorage() override = default;

    std::optional<Matrix2Df> get_tile(int layer, int x, int y) override;
    void save_tile(int layer, int x, int y, const Matrix2Df& data) override;
    void delete_tile(int layer, int x, int y) override;
    bool tile_exists(int layer, int x, int y) override;
    TileCoordSet get_layer_tile_coords(int layer) override;
    void flush() override;

    const TileCache& cache() const { return cache_; }

protected:
    virtual std::string tile_key(int layer, int x, int y) const = 0;
    virtual TileCoordSet scan_layer(int layer) = 0;

    // Flushes without letting exceptions leave a destructor.
    void flush_on_close(const std::string& what) noexcept;

private:
    TileCoordSet& layer_coords(int layer);

    TileCache cache_;
    std::map<int, TileCoordSet> coords_;
};

std::unique_ptr<TileStorage> make_tile_storage(StorageBackend backend,
                                               const fs::path& root,
                                               TileComponent component,
                                               size_t cache_size = TileCache::kDefaultMaxSize);

// Backend of the first tile file found under root (.npy, .tpz or .db).
// Throws StorageNotFoundError when there is none.
StorageBackend infer_backend(const fs::path& root);

} // namespace tile_pyramid::storage
