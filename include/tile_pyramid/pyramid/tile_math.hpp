#pragma once

#include "tile_pyramid/core/types.hpp"
#include <vector>

namespace tile_pyramid::pyramid {

// Part of a frame that falls into one level-0 tile.
struct TileSlice {
    TileXY tile;
    int frame_col = 0;  // first frame column covered
    int frame_row = 0;  // first frame row covered
    int tile_col = 0;   // where that column lands in the tile
    int tile_row = 0;
    int width = 0;
    int height = 0;
};

// Inclusive range of tile indices a span [origin, origin + length) touches.
inline std::pair<int, int> tile_range(int origin, int length, int tile_size) {
    return {floor_div(origin, tile_size), floor_div(origin + length - 1, tile_size)};
}

// Slices of a width x height frame placed at pixel (x, y), one per touched
// tile, ordered by tile x then y.
std::vector<TileSlice> compute_tile_slices(int x, int y, int width, int height, int tile_size);

// acc += frame part, occ += weight part, at the slice position.
void accumulate_slice(Matrix2Df& acc, Matrix2Df& occ, const TileSlice& slice,
                      const Matrix2Df& frame_part, const Matrix2Df& weight_part);

// Halves both dimensions with area interpolation (2x2 mean).
Matrix2Df downsample2x(const Matrix2Df& tile);

// acc / (occ + 1e-9), zero where occ <= threshold.
Matrix2Df normalize_tile(const Matrix2Df& acc, const Matrix2Df& occ, float threshold);

} // namespace tile_pyramid::pyramid
