#pragma once

#include "tile_pyramid/core/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace tile_pyramid::builder {

// Sequence of equally sized camera frames in acquisition order.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual int frame_count() const = 0;
    virtual int width() const = 0;   // columns (x)
    virtual int height() const = 0;  // rows (y)
    virtual Matrix2Df frame(int index) = 0;
};

class InMemoryFrameSource : public FrameSource {
public:
    explicit InMemoryFrameSource(std::vector<Matrix2Df> frames);

    int frame_count() const override { return static_cast<int>(frames_.size()); }
    int width() const override { return width_; }
    int height() const override { return height_; }
    Matrix2Df frame(int index) override;

private:
    std::vector<Matrix2Df> frames_;
    int width_ = 0;
    int height_ = 0;
};

// FITS files in a directory, sorted by name. 3D files contribute one frame
// per plane.
class FitsFrameSource : public FrameSource {
public:
    explicit FitsFrameSource(const fs::path& dir, const std::string& pattern = "*.fit*");

    int frame_count() const override { return static_cast<int>(index_.size()); }
    int width() const override { return width_; }
    int height() const override { return height_; }
    Matrix2Df frame(int index) override;

private:
    std::vector<std::pair<fs::path, int>> index_;  // (file, plane)
    int width_ = 0;
    int height_ = 0;
};

} // namespace tile_pyramid::builder
