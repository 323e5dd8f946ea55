#pragma once

#include "tile_pyramid/storage/tile_file_format.hpp"
#include "tile_pyramid/storage/tile_storage.hpp"

#include <memory>

namespace tile_pyramid::storage {

// One file per tile: <root>/<layer>/<xxx>/<xxx>_<yyy>_<component><ext>
class FileTileStorage : public CachedTileStorage {
public:
    FileTileStorage(const fs::path& root, TileComponent component,
                    std::unique_ptr<TileFileFormat> format,
                    size_t cache_size = TileCache::kDefaultMaxSize);
    ~FileTileStorage() override;

    StorageBackend backend() const override { return format_->backend(); }

    fs::path tile_path(int layer, int x, int y) const;

protected:
    std::string tile_key(int layer, int x, int y) const override;
    TileCoordSet scan_layer(int layer) override;

    std::optional<Matrix2Df> read_tile(const std::string& key) override;
    void write_tile(const std::string& key, const Matrix2Df& tile) override;
    bool remove_tile(const std::string& key) override;
    bool contains_tile(const std::string& key) override;

private:
    fs::path root_;
    std::string suffix_;  // "_acc.tpz"
    std::unique_ptr<TileFileFormat> format_;
};

} // namespace tile_pyramid::storage
