#pragma once

#include "tile_pyramid/builder/frame_source.hpp"
#include "tile_pyramid/builder/position_mapping.hpp"
#include "tile_pyramid/config/configuration.hpp"
#include "tile_pyramid/io/metadata.hpp"
#include "tile_pyramid/pyramid/image_pyramid.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace tile_pyramid::builder {

// Splits one corrected camera frame into per-channel frames of equal shape.
using Unmixer = std::function<std::vector<Matrix2Df>(const Matrix2Df& frame)>;

// Creates the pyramid a channel is written to. Defaults to a local
// ImagePyramid; the CLI swaps in the distributed client.
using PyramidFactory = std::function<std::unique_ptr<pyramid::ImagePyramid>(
    const fs::path& dir, const pyramid::PyramidOptions& options,
    const io::MetadataDocument& acquisition)>;

struct BuildOptions {
    int tile_size = 256;
    StorageBackend backend = StorageBackend::BLOCK;
    size_t cache_size = storage::TileCache::kDefaultMaxSize;
    float occupancy_threshold = 0.1f;

    bool skip_move_frames = false;
    bool correlate = false;          // pad positions by kCorrelatePadding px
    int edge_ramp_px = 100;
    float edge_ramp_fraction = 0.25f;
    int data_starts_at = -1;         // -1: Protocol.DataStartsAt (default 0)

    // Dark calibration: frame wins over offset; with neither,
    // Camera.ADOffset (default 0) is used.
    std::optional<Matrix2Df> dark_frame;
    std::optional<float> dark_offset;
    std::optional<Matrix2Df> flat;

    Unmixer unmixer;                 // set for splitter data
    PyramidFactory make_pyramid;

    std::ostream* events = nullptr;  // JSON-lines progress, optional
    std::string run_id;
    std::string frame_pattern = "*.fit*";

    static BuildOptions from_config(const config::Config& cfg);
};

constexpr int kCorrelatePadding = 300;

struct BuildResult {
    std::vector<std::unique_ptr<pyramid::ImagePyramid>> pyramids;  // one per channel
    int frames_total = 0;
    int frames_used = 0;
    int frames_skipped = 0;
    double ingest_seconds = 0.0;
    double pyramid_seconds = 0.0;
};

// Linear 0..1 ramps (endpoints included) over
// min(ramp_px, int(ramp_fraction * min(width, height))) pixels on all four
// edges, multiplied where they overlap.
Matrix2Df make_feather_weights(int width, int height, int ramp_px, float ramp_fraction);

// round((pos - min(pos)) / pixel_size) + padding for every frame.
std::vector<int> positions_to_pixels(const std::vector<double>& positions, double pixel_size,
                                     int padding);

// Camera ROI origin in pixels: Camera.ROIOriginX/Y, else Camera.ROIPosX/Y - 1, else 0.
std::pair<int, int> camera_roi_origin(const io::MetadataDocument& metadata);

// Frames to ingest given pixel positions and the skip option. A frame is
// skipped when its position differs from the previous frame's (the stage
// was still moving); the first frame is always kept.
std::vector<bool> frames_to_ingest(const std::vector<int>& xdp, const std::vector<int>& ydp,
                                   int data_starts_at, bool skip_move_frames);

/**
 * Builds a finalized pyramid from frames and per-frame stage positions (in
 * the units of voxelsize.x / voxelsize.y). With an unmixer, one pyramid per
 * channel is written to out_dir/channel<N>.
 */
BuildResult build_pyramid(const fs::path& out_dir, FrameSource& source,
                          const std::vector<double>& xs, const std::vector<double>& ys,
                          const io::MetadataDocument& metadata, const BuildOptions& options);

BuildResult build_pyramid(const fs::path& out_dir, FrameSource& source, const PositionFn& xm,
                          const PositionFn& ym, const io::MetadataDocument& metadata,
                          const BuildOptions& options);

// Stored acquisition: metadata.json, events.json and frames/*.fits. Stage
// positions come from ScannerXPos / ScannerYPos events.
BuildResult create_pyramid_from_dataset(const fs::path& dataset_dir, const fs::path& out_dir,
                                        const BuildOptions& options);

} // namespace tile_pyramid::builder
