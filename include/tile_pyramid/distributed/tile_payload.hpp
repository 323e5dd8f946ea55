#pragma once

#include "tile_pyramid/core/types.hpp"
#include "tile_pyramid/pyramid/tile_math.hpp"

#include <string>

namespace tile_pyramid::distributed {

/**
 * Body of a tile update PUT:
 *
 *   {"frame_shape": [rows, cols], "frame_data": [...],
 *    "weights_shape": [rows, cols], "weights_data": [...],
 *    "coords": [tile_x, tile_y], "offset": [tile_col, tile_row]}
 *
 * Data lists are row-major. "offset" places the slice inside the tile and
 * defaults to [0, 0] when absent.
 */
struct TileUpdatePayload {
    TileXY tile;
    int tile_col = 0;
    int tile_row = 0;
    Matrix2Df frame;
    Matrix2Df weights;

    pyramid::TileSlice slice() const;
};

std::string encode_payload(const TileUpdatePayload& payload);

// Throws ValidationError for malformed JSON or inconsistent shapes.
TileUpdatePayload decode_payload(const std::string& body);

} // namespace tile_pyramid::distributed
