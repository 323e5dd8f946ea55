#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tile_pyramid {

namespace fs = std::filesystem;

// Matrix types (NumPy equivalents). Rows are y, columns are x.
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;
using VectorXd = Eigen::VectorXd;

// Tile coordinate within one pyramid layer
struct TileXY {
    int x = 0;
    int y = 0;

    bool operator==(const TileXY& o) const { return x == o.x && y == o.y; }
    bool operator!=(const TileXY& o) const { return !(*this == o); }
    bool operator<(const TileXY& o) const {
        return (x < o.x) || (x == o.x && y < o.y);
    }
};

using TileCoordSet = std::set<TileXY>;

// Tile address across the whole pyramid
struct TileKey {
    int layer = 0;
    int x = 0;
    int y = 0;

    bool operator==(const TileKey& o) const {
        return layer == o.layer && x == o.x && y == o.y;
    }

    // Equivalent key one or more layers up (indices halve per layer).
    TileKey coarsen(int target_layer) const;
};

// Integer division rounding towards negative infinity
inline int floor_div(int a, int b) {
    int q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

inline TileKey TileKey::coarsen(int target_layer) const {
    TileKey out = *this;
    while (out.layer < target_layer) {
        out.x = floor_div(out.x, 2);
        out.y = floor_div(out.y, 2);
        ++out.layer;
    }
    return out;
}

// Pyramid components stored side by side
enum class TileComponent {
    ACC,  // running weighted sum of intensities
    OCC,  // running sum of weights
    IMG   // materialized acc / occ and coarser layers
};

inline std::string component_to_string(TileComponent c) {
    switch (c) {
        case TileComponent::ACC: return "acc";
        case TileComponent::OCC: return "occ";
        case TileComponent::IMG: return "img";
        default: return "img";
    }
}

// Persistence strategy for tiles
enum class StorageBackend {
    NUMPY,   // uncompressed .npy per tile
    BLOCK,   // compressed versioned block per tile
    SQLITE   // one sqlite database per component
};

inline std::string backend_extension(StorageBackend b) {
    switch (b) {
        case StorageBackend::NUMPY: return ".npy";
        case StorageBackend::BLOCK: return ".tpz";
        case StorageBackend::SQLITE: return ".db";
        default: return ".tpz";
    }
}

inline std::string backend_to_string(StorageBackend b) {
    switch (b) {
        case StorageBackend::NUMPY: return "npy";
        case StorageBackend::BLOCK: return "tpz";
        case StorageBackend::SQLITE: return "db";
        default: return "tpz";
    }
}

// Frame -> position lookup used by the construction driver
using PositionFn = std::function<double(int frame_index)>;

} // namespace tile_pyramid
