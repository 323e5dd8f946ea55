#include "tile_pyramid/storage/tile_storage.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/utils.hpp"
#include "tile_pyramid/storage/file_tile_storage.hpp"
#include "tile_pyramid/storage/sqlite_tile_storage.hpp"

#include <iostream>

namespace tile_pyramid::storage {

CachedTileStorage::CachedTileStorage(size_t cache_size)
    : cache_(*this, cache_size) {}

std::optional<Matrix2Df> CachedTileStorage::get_tile(int layer, int x, int y) {
    return cache_.load(tile_key(layer, x, y));
}

void CachedTileStorage::save_tile(int layer, int x, int y, const Matrix2Df& data) {
    TileCoordSet& coords = layer_coords(layer);
    cache_.save(tile_key(layer, x, y), data);
    coords.insert({x, y});
}

void CachedTileStorage::delete_tile(int layer, int x, int y) {
    TileCoordSet& coords = layer_coords(layer);
    cache_.remove(tile_key(layer, x, y));
    coords.erase({x, y});
}

bool CachedTileStorage::tile_exists(int layer, int x, int y) {
    return cache_.exists(tile_key(layer, x, y));
}

TileCoordSet CachedTileStorage::get_layer_tile_coords(int layer) {
    return layer_coords(layer);
}

void CachedTileStorage::flush() {
    cache_.flush();
}

void CachedTileStorage::flush_on_close(const std::string& what) noexcept {
    try {
        cache_.flush();
    } catch (const std::exception& e) {
        std::cerr << "[STORAGE] Error: unsaved tiles lost while closing " << what
                  << ": " << e.what() << std::endl;
    }
}

TileCoordSet& CachedTileStorage::layer_coords(int layer) {
    auto it = coords_.find(layer);
    if (it == coords_.end()) {
        it = coords_.emplace(layer, scan_layer(layer)).first;
    }
    return it->second;
}

std::unique_ptr<TileStorage> make_tile_storage(StorageBackend backend,
                                               const fs::path& root,
                                               TileComponent component,
                                               size_t cache_size) {
    switch (backend) {
        case StorageBackend::NUMPY:
        case StorageBackend::BLOCK:
            return std::make_unique<FileTileStorage>(root, component, make_file_format(backend),
                                                     cache_size);
        case StorageBackend::SQLITE:
            return std::make_unique<SqliteTileStorage>(root, component, cache_size);
        default:
            throw StorageNotFoundError("unsupported backend");
    }
}

StorageBackend infer_backend(const fs::path& root) {
    if (!fs::is_directory(root)) {
        throw StorageNotFoundError("no pyramid directory at " + root.string());
    }

    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        const std::string ext = core::to_lower(entry.path().extension().string());
        if (ext == backend_extension(StorageBackend::BLOCK)) return StorageBackend::BLOCK;
        if (ext == backend_extension(StorageBackend::NUMPY)) return StorageBackend::NUMPY;
        if (ext == backend_extension(StorageBackend::SQLITE)) return StorageBackend::SQLITE;
    }

    throw StorageNotFoundError("no tile files (.tpz, .npy, .db) under " + root.string());
}

} // namespace tile_pyramid::storage
