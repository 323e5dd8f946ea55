#include "tile_pyramid/builder/frame_source.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/utils.hpp"
#include "tile_pyramid/io/fits_io.hpp"

namespace tile_pyramid::builder {

InMemoryFrameSource::InMemoryFrameSource(std::vector<Matrix2Df> frames)
    : frames_(std::move(frames)) {
    if (frames_.empty()) return;
    width_ = static_cast<int>(frames_.front().cols());
    height_ = static_cast<int>(frames_.front().rows());
    for (size_t i = 1; i < frames_.size(); ++i) {
        if (frames_[i].cols() != width_ || frames_[i].rows() != height_) {
            throw ValidationError("frame " + std::to_string(i) + " has a different shape");
        }
    }
}

Matrix2Df InMemoryFrameSource::frame(int index) {
    if (index < 0 || index >= frame_count()) {
        throw ValidationError("frame index " + std::to_string(index) + " out of range");
    }
    return frames_[static_cast<size_t>(index)];
}

FitsFrameSource::FitsFrameSource(const fs::path& dir, const std::string& pattern) {
    const std::vector<fs::path> files = core::discover_frames(dir, pattern);
    if (files.empty()) {
        throw ValidationError("no frames matching " + pattern + " in " + dir.string());
    }

    for (const auto& path : files) {
        const io::FitsDimensions dims = io::get_fits_dimensions(path);
        if (index_.empty()) {
            width_ = dims.width;
            height_ = dims.height;
        } else if (dims.width != width_ || dims.height != height_) {
            throw ValidationError(path.string() + " is " + std::to_string(dims.width) + "x" +
                                  std::to_string(dims.height) + ", expected " +
                                  std::to_string(width_) + "x" + std::to_string(height_));
        }
        for (int plane = 0; plane < dims.planes; ++plane) {
            index_.emplace_back(path, plane);
        }
    }
}

Matrix2Df FitsFrameSource::frame(int index) {
    if (index < 0 || index >= frame_count()) {
        throw ValidationError("frame index " + std::to_string(index) + " out of range");
    }
    const auto& [path, plane] = index_[static_cast<size_t>(index)];
    return io::read_fits_float(path, plane).first;
}

} // namespace tile_pyramid::builder
