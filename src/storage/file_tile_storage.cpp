#include "tile_pyramid/storage/file_tile_storage.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/utils.hpp"

#include <cstdio>

namespace tile_pyramid::storage {

FileTileStorage::FileTileStorage(const fs::path& root, TileComponent component,
                                 std::unique_ptr<TileFileFormat> format, size_t cache_size)
    : CachedTileStorage(cache_size),
      root_(root),
      suffix_("_" + component_to_string(component) + format->extension()),
      format_(std::move(format)) {}

FileTileStorage::~FileTileStorage() {
    flush_on_close(root_.string() + " (" + suffix_ + ")");
}

fs::path FileTileStorage::tile_path(int layer, int x, int y) const {
    char dir[32];
    char name[64];
    std::snprintf(dir, sizeof(dir), "%03d", x);
    std::snprintf(name, sizeof(name), "%03d_%03d", x, y);
    return root_ / std::to_string(layer) / dir / (std::string(name) + suffix_);
}

std::string FileTileStorage::tile_key(int layer, int x, int y) const {
    return tile_path(layer, x, y).string();
}

TileCoordSet FileTileStorage::scan_layer(int layer) {
    TileCoordSet coords;
    const fs::path layer_dir = root_ / std::to_string(layer);
    if (!fs::is_directory(layer_dir)) return coords;

    for (const auto& entry : fs::recursive_directory_iterator(layer_dir)) {
        if (!entry.is_regular_file()) continue;
        const std::string name = entry.path().filename().string();
        if (!core::ends_with(name, suffix_)) continue;

        int x = 0;
        int y = 0;
        char trailing = 0;
        const std::string stem = name.substr(0, name.size() - suffix_.size());
        if (std::sscanf(stem.c_str(), "%d_%d%c", &x, &y, &trailing) == 2) {
            coords.insert({x, y});
        }
    }
    return coords;
}

std::optional<Matrix2Df> FileTileStorage::read_tile(const std::string& key) {
    return format_->read(key);
}

void FileTileStorage::write_tile(const std::string& key, const Matrix2Df& tile) {
    format_->write(key, tile);
}

bool FileTileStorage::remove_tile(const std::string& key) {
    std::error_code ec;
    bool removed = fs::remove(key, ec);
    if (ec) {
        throw IOError("Cannot delete " + key + ": " + ec.message());
    }
    return removed;
}

bool FileTileStorage::contains_tile(const std::string& key) {
    return fs::exists(key);
}

} // namespace tile_pyramid::storage
