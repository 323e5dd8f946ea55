#pragma once

#include "tile_pyramid/core/types.hpp"

namespace tile_pyramid::io {

// 2D float32 tile as a NumPy .npy file (C order, shape [rows, cols]).
void save_npy_float(const fs::path& path, const Matrix2Df& tile);

// Accepts float32 and float64 arrays; throws IOError for anything else.
Matrix2Df load_npy_float(const fs::path& path);

} // namespace tile_pyramid::io
