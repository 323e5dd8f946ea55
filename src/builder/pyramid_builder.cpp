#include "tile_pyramid/builder/pyramid_builder.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/events.hpp"
#include "tile_pyramid/core/utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>

namespace tile_pyramid::builder {

namespace {

double seconds_since(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

// numpy.linspace(0, 1, n)
std::vector<float> linspace01(int n) {
    std::vector<float> v(static_cast<size_t>(std::max(0, n)), 0.0f);
    for (int i = 0; i < n && n > 1; ++i) {
        v[static_cast<size_t>(i)] = static_cast<float>(i) / static_cast<float>(n - 1);
    }
    return v;
}

std::unique_ptr<pyramid::ImagePyramid> default_pyramid(const fs::path& dir,
                                                       const pyramid::PyramidOptions& options,
                                                       const io::MetadataDocument& acquisition) {
    return std::make_unique<pyramid::ImagePyramid>(dir, options, acquisition);
}

// Event stream that is a no-op without a target.
class Progress {
public:
    Progress(std::ostream* out, std::string run_id) : out_(out), run_id_(std::move(run_id)) {}

    void phase_start(core::Phase p) {
        if (out_) emitter_.phase_start(run_id_, p, *out_);
    }
    void phase_end(core::Phase p, const core::json& extra) {
        if (out_) emitter_.phase_end(run_id_, p, "ok", extra, *out_);
    }
    void frame(int idx, int total, bool skipped) {
        if (out_) emitter_.frame_processed(run_id_, idx, total, skipped, *out_);
    }
    void progress(core::Phase p, int current, int total, const std::string& msg) {
        if (out_) emitter_.phase_progress(run_id_, p, current, total, msg, *out_);
    }

private:
    std::ostream* out_;
    std::string run_id_;
    core::EventEmitter emitter_;
};

} // namespace

BuildOptions BuildOptions::from_config(const config::Config& cfg) {
    BuildOptions opts;
    opts.tile_size = cfg.pyramid.tile_size;
    opts.backend = config::parse_backend(cfg.pyramid.backend);
    opts.cache_size = static_cast<size_t>(cfg.pyramid.cache_size);
    opts.occupancy_threshold = cfg.pyramid.occupancy_threshold;
    opts.skip_move_frames = cfg.build.skip_move_frames;
    opts.correlate = cfg.build.correlate;
    opts.edge_ramp_px = cfg.build.edge_ramp_px;
    opts.edge_ramp_fraction = cfg.build.edge_ramp_fraction;
    opts.data_starts_at = cfg.build.data_starts_at;
    opts.frame_pattern = cfg.build.frame_pattern;
    return opts;
}

Matrix2Df make_feather_weights(int width, int height, int ramp_px, float ramp_fraction) {
    Matrix2Df w = Matrix2Df::Ones(height, width);
    const int n = std::min(ramp_px,
                           static_cast<int>(ramp_fraction * static_cast<float>(std::min(width, height))));
    if (n <= 0) return w;

    const std::vector<float> ramp = linspace01(n);
    for (int i = 0; i < n; ++i) {
        const float r = ramp[static_cast<size_t>(i)];
        w.row(i) *= r;
        w.row(height - 1 - i) *= r;
        w.col(i) *= r;
        w.col(width - 1 - i) *= r;
    }
    return w;
}

std::vector<int> positions_to_pixels(const std::vector<double>& positions, double pixel_size,
                                     int padding) {
    if (!(pixel_size > 0.0)) {
        throw ValidationError("pixel size must be positive");
    }
    std::vector<int> out(positions.size());
    if (positions.empty()) return out;

    const double min_pos = *std::min_element(positions.begin(), positions.end());
    for (size_t i = 0; i < positions.size(); ++i) {
        out[i] = padding + static_cast<int>(std::lround((positions[i] - min_pos) / pixel_size));
    }
    return out;
}

std::pair<int, int> camera_roi_origin(const io::MetadataDocument& metadata) {
    if (metadata.has("Camera.ROIOriginX") || metadata.has("Camera.ROIOriginY")) {
        return {metadata.get_or<int>("Camera.ROIOriginX", 0),
                metadata.get_or<int>("Camera.ROIOriginY", 0)};
    }
    if (metadata.has("Camera.ROIPosX") || metadata.has("Camera.ROIPosY")) {
        return {metadata.get_or<int>("Camera.ROIPosX", 1) - 1,
                metadata.get_or<int>("Camera.ROIPosY", 1) - 1};
    }
    return {0, 0};
}

std::vector<bool> frames_to_ingest(const std::vector<int>& xdp, const std::vector<int>& ydp,
                                   int data_starts_at, bool skip_move_frames) {
    const int n = static_cast<int>(xdp.size());
    std::vector<bool> keep(xdp.size(), false);
    const int start = std::max(0, data_starts_at);

    for (int i = start; i < n; ++i) {
        if (!skip_move_frames || i == start) {
            keep[static_cast<size_t>(i)] = true;
            continue;
        }
        keep[static_cast<size_t>(i)] = xdp[static_cast<size_t>(i - 1)] == xdp[static_cast<size_t>(i)] &&
                                       ydp[static_cast<size_t>(i - 1)] == ydp[static_cast<size_t>(i)];
    }
    return keep;
}

BuildResult build_pyramid(const fs::path& out_dir, FrameSource& source,
                          const std::vector<double>& xs, const std::vector<double>& ys,
                          const io::MetadataDocument& metadata, const BuildOptions& options) {
    const int n_frames = source.frame_count();
    if (n_frames == 0) {
        throw ValidationError("frame source is empty");
    }
    if (static_cast<int>(xs.size()) != n_frames || static_cast<int>(ys.size()) != n_frames) {
        throw ValidationError("need one x and one y position per frame (" +
                              std::to_string(n_frames) + " frames, " +
                              std::to_string(xs.size()) + "/" + std::to_string(ys.size()) +
                              " positions)");
    }

    const double pixel_size_x = metadata.get_as<double>("voxelsize.x");
    const double pixel_size_y = metadata.get_or<double>("voxelsize.y", pixel_size_x);
    const int padding = options.correlate ? kCorrelatePadding : 0;

    const std::vector<int> xdp = positions_to_pixels(xs, pixel_size_x, padding);
    const std::vector<int> ydp = positions_to_pixels(ys, pixel_size_y, padding);

    const auto [roi_x, roi_y] = camera_roi_origin(metadata);
    pyramid::PyramidOptions popts;
    popts.tile_size = options.tile_size;
    popts.backend = options.backend;
    popts.cache_size = options.cache_size;
    popts.occupancy_threshold = options.occupancy_threshold;
    popts.pixel_size = pixel_size_x;
    popts.x0 = *std::min_element(xs.begin(), xs.end()) + pixel_size_x * roi_x;
    popts.y0 = *std::min_element(ys.begin(), ys.end()) + pixel_size_y * roi_y;

    const int data_starts_at = options.data_starts_at >= 0
        ? options.data_starts_at
        : metadata.get_or<int>("Protocol.DataStartsAt", 0);
    const std::vector<bool> keep = frames_to_ingest(xdp, ydp, data_starts_at, options.skip_move_frames);

    const int width = source.width();
    const int height = source.height();
    const float dark_offset = options.dark_offset
        ? *options.dark_offset
        : metadata.get_or<float>("Camera.ADOffset", 0.0f);
    if (options.dark_frame &&
        (options.dark_frame->rows() != height || options.dark_frame->cols() != width)) {
        throw ValidationError("dark frame shape does not match the frames");
    }
    if (options.flat && (options.flat->rows() != height || options.flat->cols() != width)) {
        throw ValidationError("flatfield shape does not match the frames");
    }

    const std::string run_id = options.run_id.empty() ? core::get_run_id() : options.run_id;
    Progress progress(options.events, run_id);
    PyramidFactory make_pyramid = options.make_pyramid;
    if (!make_pyramid) make_pyramid = default_pyramid;

    BuildResult result;
    result.frames_total = n_frames;

    std::cerr << "[INGEST] " << n_frames << " frames of " << width << "x" << height
              << ", tile size " << options.tile_size << ", backend "
              << backend_to_string(options.backend) << std::endl;

    Matrix2Df weights;
    const auto t_ingest = std::chrono::steady_clock::now();
    progress.phase_start(core::Phase::INGEST);

    for (int i = 0; i < n_frames; ++i) {
        if (!keep[static_cast<size_t>(i)]) {
            if (i >= data_starts_at) {
                ++result.frames_skipped;
                progress.frame(i, n_frames, true);
            }
            continue;
        }

        Matrix2Df d = source.frame(i);
        if (options.dark_frame) {
            d -= *options.dark_frame;
        } else {
            d.array() -= dark_offset;
        }
        if (options.flat) {
            d = d.cwiseProduct(*options.flat);
        }

        std::vector<Matrix2Df> channels;
        if (options.unmixer) {
            channels = options.unmixer(d);
            if (channels.empty()) {
                throw ValidationError("unmixer returned no channels");
            }
        } else {
            channels.push_back(std::move(d));
        }

        if (result.pyramids.empty()) {
            const int ch_w = static_cast<int>(channels.front().cols());
            const int ch_h = static_cast<int>(channels.front().rows());
            weights = make_feather_weights(ch_w, ch_h, options.edge_ramp_px, options.edge_ramp_fraction);

            for (size_t c = 0; c < channels.size(); ++c) {
                const fs::path dir = options.unmixer
                    ? out_dir / ("channel" + std::to_string(c))
                    : out_dir;
                result.pyramids.push_back(make_pyramid(dir, popts, metadata));
            }
        }
        if (channels.size() != result.pyramids.size()) {
            throw ValidationError("unmixer returned " + std::to_string(channels.size()) +
                                  " channels, expected " + std::to_string(result.pyramids.size()));
        }

        for (size_t c = 0; c < channels.size(); ++c) {
            if (channels[c].rows() != weights.rows() || channels[c].cols() != weights.cols()) {
                throw ValidationError("channel " + std::to_string(c) + " changed shape");
            }
            const Matrix2Df weighted = channels[c].cwiseProduct(weights);
            result.pyramids[c]->update_base_tiles_from_frame(
                xdp[static_cast<size_t>(i)], ydp[static_cast<size_t>(i)], weighted, weights);
        }

        ++result.frames_used;
        progress.frame(i, n_frames, false);
    }

    result.ingest_seconds = seconds_since(t_ingest);
    std::cerr << "[INGEST] Added " << result.frames_used << " frames (" << result.frames_skipped
              << " skipped) in " << result.ingest_seconds << "s" << std::endl;
    progress.phase_end(core::Phase::INGEST, {{"frames_used", result.frames_used},
                                             {"frames_skipped", result.frames_skipped},
                                             {"seconds", result.ingest_seconds}});

    if (result.pyramids.empty()) {
        throw ValidationError("no frames left to ingest (DataStartsAt " +
                              std::to_string(data_starts_at) + ")");
    }

    const auto t_pyramid = std::chrono::steady_clock::now();
    progress.phase_start(core::Phase::COARSEN);
    for (size_t c = 0; c < result.pyramids.size(); ++c) {
        result.pyramids[c]->update_pyramid();
        progress.progress(core::Phase::COARSEN, static_cast<int>(c) + 1,
                          static_cast<int>(result.pyramids.size()),
                          result.pyramids[c]->root().string());
    }
    result.pyramid_seconds = seconds_since(t_pyramid);
    std::cerr << "[PYRAMID] Built " << result.pyramids.size() << " pyramid(s), depth "
              << result.pyramids.front()->depth() << ", in " << result.pyramid_seconds << "s"
              << std::endl;
    progress.phase_end(core::Phase::COARSEN, {{"depth", result.pyramids.front()->depth()},
                                              {"seconds", result.pyramid_seconds}});

    return result;
}

BuildResult build_pyramid(const fs::path& out_dir, FrameSource& source, const PositionFn& xm,
                          const PositionFn& ym, const io::MetadataDocument& metadata,
                          const BuildOptions& options) {
    const int n = source.frame_count();
    std::vector<double> xs(static_cast<size_t>(n));
    std::vector<double> ys(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        xs[static_cast<size_t>(i)] = xm(i);
        ys[static_cast<size_t>(i)] = ym(i);
    }
    return build_pyramid(out_dir, source, xs, ys, metadata, options);
}

BuildResult create_pyramid_from_dataset(const fs::path& dataset_dir, const fs::path& out_dir,
                                        const BuildOptions& options) {
    const io::MetadataDocument metadata =
        io::MetadataDocument::load(dataset_dir / io::kMetadataFilename);
    const std::vector<AcquisitionEvent> events = load_events(dataset_dir / "events.json");

    FitsFrameSource source(dataset_dir / "frames", options.frame_pattern);

    const PiecewiseMapping xm = PiecewiseMapping::from_events(
        events, metadata, "ScannerXPos", metadata.get_or<double>("Positioning.x", 0.0));
    const PiecewiseMapping ym = PiecewiseMapping::from_events(
        events, metadata, "ScannerYPos", metadata.get_or<double>("Positioning.y", 0.0));

    std::cerr << "[INGEST] Dataset " << dataset_dir.string() << ": " << source.frame_count()
              << " frames, " << events.size() << " events" << std::endl;

    return build_pyramid(out_dir, source, xm.sample(source.frame_count()),
                         ym.sample(source.frame_count()), metadata, options);
}

} // namespace tile_pyramid::builder
