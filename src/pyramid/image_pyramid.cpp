#include "tile_pyramid/pyramid/image_pyramid.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/utils.hpp"

#include <iostream>
#include <set>

namespace tile_pyramid::pyramid {

ImagePyramid::ImagePyramid(const fs::path& root, const PyramidOptions& options,
                           const io::MetadataDocument& acquisition)
    : root_(root),
      doc_(acquisition),
      backend_(options.backend),
      occupancy_threshold_(options.occupancy_threshold),
      transient_(options.transient) {
    if (options.tile_size < 2 || options.tile_size % 2 != 0) {
        throw ValidationError("tile size must be a positive even number, got " +
                              std::to_string(options.tile_size));
    }

    if (root_.empty()) {
        if (!transient_) {
            throw ValidationError("a pyramid needs a directory unless it is transient");
        }
        root_ = core::make_temp_dir("tile_pyramid");
    }

    info_.tile_size = options.tile_size;
    info_.x0 = options.x0;
    info_.y0 = options.y0;
    info_.pixel_size = options.pixel_size;
    info_.backend = backend_;

    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec && !fs::is_directory(root_)) {
        throw IOError("Cannot create pyramid directory " + root_.string() + ": " + ec.message());
    }

    open_storage(options.cache_size);
}

ImagePyramid::ImagePyramid(const fs::path& root, const io::MetadataDocument& doc,
                           size_t cache_size)
    : root_(root), info_(io::PyramidMetadata::from_document(doc)), doc_(doc) {
    backend_ = info_.backend ? *info_.backend : storage::infer_backend(root_);
    info_.backend = backend_;
    occupancy_threshold_ = doc_.get_or<float>("Pyramid.OccupancyThreshold", 0.1f);
    // A stored pyramid was finalized when its metadata was written.
    pyramid_valid_ = doc_.get_or<bool>("Pyramid.Valid", false);

    open_storage(cache_size);
}

ImagePyramid::~ImagePyramid() {
    if (!transient_) return;

    img_.reset();
    acc_.reset();
    occ_.reset();

    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec) {
        std::cerr << "[PYRAMID] Warning: cannot remove transient pyramid " << root_.string()
                  << ": " << ec.message() << std::endl;
    }
}

std::unique_ptr<ImagePyramid> ImagePyramid::load_existing(const fs::path& root, size_t cache_size) {
    io::MetadataDocument doc = io::MetadataDocument::load(root / io::kMetadataFilename);
    return std::make_unique<ImagePyramid>(root, doc, cache_size);
}

void ImagePyramid::open_storage(size_t cache_size) {
    img_ = storage::make_tile_storage(backend_, root_, TileComponent::IMG, cache_size);
    acc_ = storage::make_tile_storage(backend_, root_, TileComponent::ACC, cache_size);
    occ_ = storage::make_tile_storage(backend_, root_, TileComponent::OCC, cache_size);
}

void ImagePyramid::update_base_tiles_from_frame(int x, int y, const Matrix2Df& frame,
                                                const Matrix2Df& weights) {
    if (x < 0 || y < 0) {
        throw ValidationError("base tile origin positions must be >= 0, got (" +
                              std::to_string(x) + ", " + std::to_string(y) + ")");
    }
    if (frame.rows() != weights.rows() || frame.cols() != weights.cols()) {
        throw ValidationError("frame and weights shapes differ");
    }
    if (frame.size() == 0) {
        throw ValidationError("empty frame");
    }

    const std::vector<TileSlice> slices = compute_tile_slices(
        x, y, static_cast<int>(frame.cols()), static_cast<int>(frame.rows()), info_.tile_size);

    // Slices are ordered by tile x then y, so the last one is the far corner.
    grow_extent(slices.back().tile.x, slices.back().tile.y);

    for (const TileSlice& slice : slices) {
        ingest_tile_slice(slice, frame, weights);
    }

    pyramid_valid_ = false;
}

void ImagePyramid::ingest_tile_slice(const TileSlice& slice, const Matrix2Df& frame,
                                     const Matrix2Df& weights) {
    apply_tile_update(slice,
                      frame.block(slice.frame_row, slice.frame_col, slice.height, slice.width),
                      weights.block(slice.frame_row, slice.frame_col, slice.height, slice.width));
}

void ImagePyramid::apply_tile_update(const TileSlice& slice, const Matrix2Df& frame_part,
                                     const Matrix2Df& weight_part) {
    const int ts = info_.tile_size;
    const int tx = slice.tile.x;
    const int ty = slice.tile.y;

    std::optional<Matrix2Df> acc = acc_->get_tile(0, tx, ty);
    std::optional<Matrix2Df> occ = occ_->get_tile(0, tx, ty);
    if (!acc || !occ) {
        acc = Matrix2Df::Zero(ts, ts);
        occ = Matrix2Df::Zero(ts, ts);
    }

    accumulate_slice(*acc, *occ, slice, frame_part, weight_part);

    acc_->save_tile(0, tx, ty, *acc);
    occ_->save_tile(0, tx, ty, *occ);

    invalidate_ancestors(tx, ty);
}

void ImagePyramid::invalidate_ancestors(int x, int y) {
    // Walk every level up to the current top: a fresh level-0 tile can have
    // a parent that already exists because of its siblings.
    const TileKey base{0, x, y};
    for (int level = 0; level <= info_.depth; ++level) {
        const TileKey k = base.coarsen(level);
        if (img_->tile_exists(k.layer, k.x, k.y)) {
            img_->delete_tile(k.layer, k.x, k.y);
        }
    }
}

void ImagePyramid::mark_finalized(int depth) {
    info_.depth = depth;
    pyramid_valid_ = true;
}

void ImagePyramid::set_placement(double x0, double y0, double pixel_size) {
    if (pixel_size <= 0.0) {
        throw ValidationError("pixel size must be positive");
    }
    info_.x0 = x0;
    info_.y0 = y0;
    info_.pixel_size = pixel_size;
}

void ImagePyramid::grow_extent(int last_tile_x, int last_tile_y) {
    info_.n_tiles_x = std::max(info_.n_tiles_x, last_tile_x + 1);
    info_.n_tiles_y = std::max(info_.n_tiles_y, last_tile_y + 1);
}

void ImagePyramid::rebuild_base() {
    for (const TileXY& c : occ_->get_layer_tile_coords(0)) {
        if (img_->tile_exists(0, c.x, c.y)) continue;

        std::optional<Matrix2Df> occ = occ_->get_tile(0, c.x, c.y);
        std::optional<Matrix2Df> acc = acc_->get_tile(0, c.x, c.y);
        if (!occ || !acc) {
            throw IOError("accumulator missing for occupied tile (" + std::to_string(c.x) +
                          ", " + std::to_string(c.y) + ") in " + root_.string());
        }
        img_->save_tile(0, c.x, c.y, normalize_tile(*acc, *occ, occupancy_threshold_));
    }
}

int ImagePyramid::make_layer(int input_level) {
    const int new_layer = input_level + 1;
    const int ts = info_.tile_size;
    const int q = ts / 2;

    std::set<TileXY> coarse;
    for (const TileXY& c : img_->get_layer_tile_coords(input_level)) {
        coarse.insert({floor_div(c.x, 2), floor_div(c.y, 2)});
    }

    for (const TileXY& c : coarse) {
        if (img_->tile_exists(new_layer, c.x, c.y)) continue;

        Matrix2Df tile = Matrix2Df::Zero(ts, ts);
        // Quadrant (dx, dy) of the coarse tile holds child (2x + dx, 2y + dy).
        for (int dy = 0; dy < 2; ++dy) {
            for (int dx = 0; dx < 2; ++dx) {
                std::optional<Matrix2Df> child =
                    img_->get_tile(input_level, 2 * c.x + dx, 2 * c.y + dy);
                if (child) {
                    tile.block(dy * q, dx * q, q, q) = downsample2x(*child);
                }
            }
        }
        img_->save_tile(new_layer, c.x, c.y, tile);
    }

    return static_cast<int>(coarse.size());
}

void ImagePyramid::update_pyramid() {
    rebuild_base();

    int input_level = 0;
    int produced = make_layer(input_level);
    std::cerr << "[PYRAMID] layer " << input_level + 1 << ": " << produced << " tiles" << std::endl;
    while (produced > 1) {
        ++input_level;
        produced = make_layer(input_level);
        std::cerr << "[PYRAMID] layer " << input_level + 1 << ": " << produced << " tiles"
                  << std::endl;
    }

    mark_finalized(produced > 0 ? input_level + 1 : 0);

    flush();
    save_metadata();
}

std::optional<Matrix2Df> ImagePyramid::get_tile(int layer, int x, int y) {
    return img_->get_tile(layer, x, y);
}

TileCoordSet ImagePyramid::get_layer_tile_coords(int layer) {
    return img_->get_layer_tile_coords(layer);
}

Matrix2Df ImagePyramid::get_oversize_tile(int layer, int x, int y, int span) {
    if (span < 1) {
        throw ValidationError("span must be >= 1");
    }
    const int ts = info_.tile_size;
    Matrix2Df out = Matrix2Df::Zero(ts * span, ts * span);

    for (int i = 0; i < span; ++i) {
        for (int j = 0; j < span; ++j) {
            std::optional<Matrix2Df> sub = get_tile(layer, x + i, y + j);
            if (sub) {
                out.block(j * ts, i * ts, ts, ts) = *sub;
            }
        }
    }
    return out;
}

io::MetadataDocument ImagePyramid::metadata() const {
    io::MetadataDocument doc = doc_;
    info_.write_to(doc);
    doc.set("Pyramid.OccupancyThreshold", occupancy_threshold_);
    doc.set("Pyramid.Valid", pyramid_valid_);
    return doc;
}

void ImagePyramid::save_metadata() const {
    metadata().save(root_ / io::kMetadataFilename);
}

void ImagePyramid::flush() {
    img_->flush();
    acc_->flush();
    occ_->flush();
}

} // namespace tile_pyramid::pyramid
