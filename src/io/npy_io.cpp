#include "tile_pyramid/io/npy_io.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/utils.hpp"

#include <cnpy.h>
#include <stdexcept>

namespace tile_pyramid::io {

void save_npy_float(const fs::path& path, const Matrix2Df& tile) {
    core::ensure_parent_dir(path);
    const std::vector<size_t> shape{static_cast<size_t>(tile.rows()),
                                    static_cast<size_t>(tile.cols())};
    try {
        cnpy::npy_save<float>(path.string(), tile.data(), shape, "w");
    } catch (const std::runtime_error& e) {
        throw IOError("Cannot write " + path.string() + ": " + e.what());
    }
}

Matrix2Df load_npy_float(const fs::path& path) {
    cnpy::NpyArray arr;
    try {
        arr = cnpy::npy_load(path.string());
    } catch (const std::runtime_error& e) {
        throw IOError("Cannot read " + path.string() + ": " + e.what());
    }

    if (arr.shape.size() != 2) {
        throw IOError("npy is not 2D in " + path.string());
    }
    const auto rows = static_cast<Eigen::Index>(arr.shape[0]);
    const auto cols = static_cast<Eigen::Index>(arr.shape[1]);

    Matrix2Df tile(rows, cols);
    if (arr.word_size == sizeof(float)) {
        tile = Eigen::Map<const Matrix2Df>(arr.data<float>(), rows, cols);
    } else if (arr.word_size == sizeof(double)) {
        tile = Eigen::Map<const Matrix2Dd>(arr.data<double>(), rows, cols).cast<float>();
    } else {
        throw IOError("npy word_size " + std::to_string(arr.word_size) +
                      " is not a float type in " + path.string());
    }

    if (arr.fortran_order) {
        // Column-major on disk: reinterpret and transpose into row-major.
        Matrix2Df fixed = Eigen::Map<const Matrix2Df>(tile.data(), cols, rows).transpose();
        tile = fixed;
    }
    return tile;
}

} // namespace tile_pyramid::io
