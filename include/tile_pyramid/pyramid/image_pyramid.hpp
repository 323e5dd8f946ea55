#pragma once

#include "tile_pyramid/core/types.hpp"
#include "tile_pyramid/io/metadata.hpp"
#include "tile_pyramid/pyramid/tile_math.hpp"
#include "tile_pyramid/storage/tile_storage.hpp"

#include <memory>
#include <optional>

namespace tile_pyramid::pyramid {

struct PyramidOptions {
    int tile_size = 256;
    StorageBackend backend = StorageBackend::BLOCK;
    size_t cache_size = storage::TileCache::kDefaultMaxSize;
    float occupancy_threshold = 0.1f;
    double x0 = 0.0;          // physical origin of pixel (0, 0)
    double y0 = 0.0;
    double pixel_size = 1.0;  // physical units per pixel
    bool transient = false;   // remove the directory on destruction
};

/**
 * Multi-resolution tile pyramid backed by three tile stores.
 *
 * Level 0 keeps a running weighted sum (acc) and a running weight sum (occ)
 * per tile. The materialized image (img) of level 0 and every coarser level
 * is derived from those by update_pyramid(); ingesting a frame deletes the
 * img tiles it makes stale.
 */
class ImagePyramid {
public:
    // New pyramid in `root` (created if missing). An empty root with
    // options.transient makes a fresh temporary directory. Entries of
    // `acquisition` are carried into metadata.json.
    ImagePyramid(const fs::path& root, const PyramidOptions& options,
                 const io::MetadataDocument& acquisition = {});

    // Existing pyramid described by `doc` (the content of its metadata.json).
    // Uses Pyramid.Backend when present, otherwise infers it from the files.
    ImagePyramid(const fs::path& root, const io::MetadataDocument& doc,
                 size_t cache_size = storage::TileCache::kDefaultMaxSize);

    virtual ~ImagePyramid();

    ImagePyramid(const ImagePyramid&) = delete;
    ImagePyramid& operator=(const ImagePyramid&) = delete;

    // Throws MetadataError when metadata.json is missing or incomplete.
    static std::unique_ptr<ImagePyramid> load_existing(
        const fs::path& root, size_t cache_size = storage::TileCache::kDefaultMaxSize);

    // Adds a (pre-weighted) frame and its weights with the frame's top-left
    // pixel at (x, y). x is the column offset, y the row offset.
    void update_base_tiles_from_frame(int x, int y, const Matrix2Df& frame, const Matrix2Df& weights);

    void rebuild_base();
    int make_layer(int input_level);
    // Materializes every layer, flushes the stores and writes metadata.json.
    virtual void update_pyramid();

    std::optional<Matrix2Df> get_tile(int layer, int x, int y);
    TileCoordSet get_layer_tile_coords(int layer);
    Matrix2Df get_oversize_tile(int layer, int x, int y, int span = 2);

    std::optional<Matrix2Df> get_acc_tile(int x, int y) { return acc_->get_tile(0, x, y); }
    std::optional<Matrix2Df> get_occ_tile(int x, int y) { return occ_->get_tile(0, x, y); }
    TileCoordSet get_base_tile_coords() { return occ_->get_layer_tile_coords(0); }

    io::MetadataDocument metadata() const;
    void save_metadata() const;
    void flush();

    const fs::path& root() const { return root_; }
    int tile_size() const { return info_.tile_size; }
    int depth() const { return info_.depth; }
    int n_tiles_x() const { return info_.n_tiles_x; }
    int n_tiles_y() const { return info_.n_tiles_y; }
    double x0() const { return info_.x0; }
    double y0() const { return info_.y0; }
    double pixel_size() const { return info_.pixel_size; }
    float occupancy_threshold() const { return occupancy_threshold_; }
    StorageBackend backend() const { return backend_; }
    bool pyramid_valid() const { return pyramid_valid_; }

protected:
    // Delivers one tile's share of a validated frame. Overridden by the
    // distributed variant to ship the slice to the owning worker.
    virtual void ingest_tile_slice(const TileSlice& slice, const Matrix2Df& frame,
                                   const Matrix2Df& weights);

    // Adds the slice data to the acc/occ tile and drops stale img tiles.
    void apply_tile_update(const TileSlice& slice, const Matrix2Df& frame_part,
                           const Matrix2Df& weight_part);

    void invalidate_ancestors(int x, int y);
    void grow_extent(int last_tile_x, int last_tile_y);
    void mark_invalid() { pyramid_valid_ = false; }
    void mark_finalized(int depth);
    void set_placement(double x0, double y0, double pixel_size);
    void set_metadata_entry(const std::string& key, const io::json& value) { doc_.set(key, value); }

private:
    void open_storage(size_t cache_size);

    fs::path root_;
    io::PyramidMetadata info_;
    io::MetadataDocument doc_;
    StorageBackend backend_ = StorageBackend::BLOCK;
    float occupancy_threshold_ = 0.1f;
    bool pyramid_valid_ = false;
    bool transient_ = false;

    std::unique_ptr<storage::TileStorage> img_;
    std::unique_ptr<storage::TileStorage> acc_;
    std::unique_ptr<storage::TileStorage> occ_;
};

} // namespace tile_pyramid::pyramid
