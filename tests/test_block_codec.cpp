#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/io/block_codec.hpp"

#include <cstring>

#include <catch2/catch_test_macros.hpp>

using tile_pyramid::IOError;
using tile_pyramid::Matrix2Df;
using namespace tile_pyramid::io;

namespace {

Matrix2Df gradient(int rows, int cols) {
    Matrix2Df m(rows, cols);
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            m(r, c) = static_cast<float>(r * 1000 + c) * 0.5f;
        }
    }
    return m;
}

} // namespace

TEST_CASE("block_codec_preserves_shape_and_values") {
    const Matrix2Df tile = gradient(8, 16);

    for (auto mode : {BlockCompression::NONE, BlockCompression::ZLIB}) {
        const Matrix2Df out = decode_block(encode_block(tile, mode));
        REQUIRE(out.rows() == 8);
        REQUIRE(out.cols() == 16);
        REQUIRE(out == tile);
    }
}

TEST_CASE("block_codec_header_layout") {
    const auto bytes = encode_block(Matrix2Df::Zero(4, 6), BlockCompression::NONE);

    REQUIRE(bytes.size() == kBlockHeaderSize + 4 * 6 * sizeof(float));
    REQUIRE(std::memcmp(bytes.data(), "TPZB", 4) == 0);
    REQUIRE(bytes[4] == kBlockVersion);
    REQUIRE(bytes[5] == 0);
    REQUIRE(bytes[6] == 1);  // float32
    REQUIRE(bytes[7] == 0);  // uncompressed
    REQUIRE(bytes[8] == 4);  // rows
    REQUIRE(bytes[12] == 6); // cols
}

TEST_CASE("block_codec_zlib_shrinks_constant_tile") {
    const Matrix2Df tile = Matrix2Df::Constant(256, 256, 3.0f);
    const auto packed = encode_block(tile, BlockCompression::ZLIB);
    REQUIRE(packed.size() < 256 * 256 * sizeof(float) / 10);
}

TEST_CASE("block_codec_rejects_corruption") {
    auto bytes = encode_block(gradient(4, 4), BlockCompression::NONE);

    SECTION("bad magic") {
        bytes[0] = 'X';
        REQUIRE_THROWS_AS(decode_block(bytes), IOError);
    }
    SECTION("unknown version") {
        bytes[4] = 99;
        REQUIRE_THROWS_AS(decode_block(bytes), IOError);
    }
    SECTION("flipped payload byte fails checksum") {
        bytes[kBlockHeaderSize + 5] ^= 0x40;
        REQUIRE_THROWS_AS(decode_block(bytes), IOError);
    }
    SECTION("truncated payload") {
        bytes.resize(bytes.size() - 3);
        REQUIRE_THROWS_AS(decode_block(bytes), IOError);
    }
    SECTION("truncated header") {
        REQUIRE_THROWS_AS(decode_block(bytes.data(), 10), IOError);
    }
}
