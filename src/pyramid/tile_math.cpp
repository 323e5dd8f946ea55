#include "tile_pyramid/pyramid/tile_math.hpp"
#include "tile_pyramid/core/errors.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstring>

namespace tile_pyramid::pyramid {

std::vector<TileSlice> compute_tile_slices(int x, int y, int width, int height, int tile_size) {
    std::vector<TileSlice> slices;
    if (width <= 0 || height <= 0) return slices;

    const auto [first_x, last_x] = tile_range(x, width, tile_size);
    const auto [first_y, last_y] = tile_range(y, height, tile_size);

    for (int tx = first_x; tx <= last_x; ++tx) {
        const int tile_x0 = tx * tile_size;
        const int x_start = std::max(x, tile_x0);
        const int x_end = std::min(x + width, tile_x0 + tile_size);

        for (int ty = first_y; ty <= last_y; ++ty) {
            const int tile_y0 = ty * tile_size;
            const int y_start = std::max(y, tile_y0);
            const int y_end = std::min(y + height, tile_y0 + tile_size);

            TileSlice s;
            s.tile = {tx, ty};
            s.frame_col = x_start - x;
            s.frame_row = y_start - y;
            s.tile_col = x_start - tile_x0;
            s.tile_row = y_start - tile_y0;
            s.width = x_end - x_start;
            s.height = y_end - y_start;
            slices.push_back(s);
        }
    }
    return slices;
}

void accumulate_slice(Matrix2Df& acc, Matrix2Df& occ, const TileSlice& slice,
                      const Matrix2Df& frame_part, const Matrix2Df& weight_part) {
    if (frame_part.rows() != slice.height || frame_part.cols() != slice.width ||
        weight_part.rows() != slice.height || weight_part.cols() != slice.width) {
        throw ValidationError("slice data does not match slice extent");
    }
    if (slice.tile_row < 0 || slice.tile_col < 0 ||
        slice.tile_row + slice.height > acc.rows() || slice.tile_col + slice.width > acc.cols()) {
        throw ValidationError("slice does not fit inside the tile");
    }

    acc.block(slice.tile_row, slice.tile_col, slice.height, slice.width) += frame_part;
    occ.block(slice.tile_row, slice.tile_col, slice.height, slice.width) += weight_part;
}

Matrix2Df downsample2x(const Matrix2Df& tile) {
    const int out_h = std::max(1, static_cast<int>(tile.rows()) / 2);
    const int out_w = std::max(1, static_cast<int>(tile.cols()) / 2);

    cv::Mat cv_tile(static_cast<int>(tile.rows()), static_cast<int>(tile.cols()), CV_32F,
                    const_cast<float*>(tile.data()));
    cv::Mat cv_small;
    cv::resize(cv_tile, cv_small, cv::Size(out_w, out_h), 0.0, 0.0, cv::INTER_AREA);

    Matrix2Df down(cv_small.rows, cv_small.cols);
    if (cv_small.isContinuous()) {
        std::memcpy(down.data(), cv_small.data, static_cast<size_t>(down.size()) * sizeof(float));
    } else {
        for (int r = 0; r < cv_small.rows; ++r) {
            const float* src = cv_small.ptr<float>(r);
            float* dst = down.data() + static_cast<size_t>(r) * static_cast<size_t>(cv_small.cols);
            std::memcpy(dst, src, static_cast<size_t>(cv_small.cols) * sizeof(float));
        }
    }
    return down;
}

Matrix2Df normalize_tile(const Matrix2Df& acc, const Matrix2Df& occ, float threshold) {
    Matrix2Df out(acc.rows(), acc.cols());
    for (Eigen::Index i = 0; i < acc.size(); ++i) {
        const float o = occ.data()[i];
        out.data()[i] = o <= threshold ? 0.0f : acc.data()[i] / (o + 1e-9f);
    }
    return out;
}

} // namespace tile_pyramid::pyramid
