#include "temp_dir.hpp"

#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/pyramid/image_pyramid.hpp"
#include "tile_pyramid/pyramid/tile_math.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

using namespace tile_pyramid;
using tile_pyramid::pyramid::ImagePyramid;
using tile_pyramid::pyramid::PyramidOptions;
using tile_pyramid::testing::TempDir;

namespace {

PyramidOptions options_for(int tile_size, StorageBackend backend = StorageBackend::BLOCK) {
    PyramidOptions o;
    o.tile_size = tile_size;
    o.backend = backend;
    return o;
}

Matrix2Df pattern(int rows, int cols, float scale) {
    Matrix2Df m(rows, cols);
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            m(r, c) = scale * static_cast<float>((r * 7 + c * 3) % 11);
        }
    }
    return m;
}

} // namespace

TEST_CASE("compute_tile_slices_covers_frame_once") {
    const auto slices = pyramid::compute_tile_slices(3, 3, 3, 3, 4);
    REQUIRE(slices.size() == 4);

    REQUIRE(slices[0].tile == TileXY{0, 0});
    REQUIRE(slices[0].frame_col == 0);
    REQUIRE(slices[0].tile_col == 3);
    REQUIRE(slices[0].width == 1);
    REQUIRE(slices[0].height == 1);

    REQUIRE(slices[1].tile == TileXY{0, 1});
    REQUIRE(slices[2].tile == TileXY{1, 0});
    REQUIRE(slices[3].tile == TileXY{1, 1});
    REQUIRE(slices[3].frame_col == 1);
    REQUIRE(slices[3].frame_row == 1);
    REQUIRE(slices[3].tile_col == 0);
    REQUIRE(slices[3].width == 2);
    REQUIRE(slices[3].height == 2);

    int area = 0;
    for (const auto& s : slices) area += s.width * s.height;
    REQUIRE(area == 9);
}

TEST_CASE("tile_range_rounds_towards_negative_infinity") {
    REQUIRE(pyramid::tile_range(0, 256, 256) == std::make_pair(0, 0));
    REQUIRE(pyramid::tile_range(128, 256, 256) == std::make_pair(0, 1));
    REQUIRE(pyramid::tile_range(256, 1, 256) == std::make_pair(1, 1));
    REQUIRE(pyramid::tile_range(-1, 2, 256) == std::make_pair(-1, 0));
}

TEST_CASE("tile_key_coarsen_floors_negative_indices") {
    const TileKey k{0, -3, 5};
    REQUIRE(k.coarsen(0) == k);
    const TileKey parent{1, -2, 2};
    const TileKey top{3, -1, 0};
    REQUIRE(k.coarsen(1) == parent);
    REQUIRE(k.coarsen(3) == top);
}

TEST_CASE("downsample2x_averages_two_by_two_blocks") {
    Matrix2Df tile(4, 4);
    tile << 1, 3, 0, 0,
            5, 7, 0, 4,
            2, 2, 8, 8,
            2, 2, 8, 8;

    const Matrix2Df d = pyramid::downsample2x(tile);
    REQUIRE(d.rows() == 2);
    REQUIRE(d.cols() == 2);
    REQUIRE(d(0, 0) == Catch::Approx(4.0f));
    REQUIRE(d(0, 1) == Catch::Approx(1.0f));
    REQUIRE(d(1, 0) == Catch::Approx(2.0f));
    REQUIRE(d(1, 1) == Catch::Approx(8.0f));
}

TEST_CASE("normalize_tile_zeroes_low_occupancy") {
    Matrix2Df acc(1, 3);
    Matrix2Df occ(1, 3);
    acc << 4.0f, 1.0f, 0.0f;
    occ << 2.0f, 0.05f, 0.0f;

    const Matrix2Df img = pyramid::normalize_tile(acc, occ, 0.1f);
    REQUIRE(img(0, 0) == Catch::Approx(2.0f));
    REQUIRE(img(0, 1) == 0.0f);
    REQUIRE(img(0, 2) == 0.0f);
}

TEST_CASE("two_overlapping_frames_build_a_two_level_pyramid") {
    const StorageBackend backend =
        GENERATE(StorageBackend::NUMPY, StorageBackend::BLOCK, StorageBackend::SQLITE);
    TempDir dir;
    ImagePyramid p(dir.path() / "pyr", options_for(256, backend));

    const Matrix2Df ones = Matrix2Df::Ones(256, 256);
    p.update_base_tiles_from_frame(0, 0, ones, ones);
    p.update_base_tiles_from_frame(128, 0, ones, ones);

    REQUIRE(p.n_tiles_x() == 2);
    REQUIRE(p.n_tiles_y() == 1);
    REQUIRE(p.get_base_tile_coords() == TileCoordSet{{0, 0}, {1, 0}});

    auto acc = p.get_acc_tile(0, 0);
    auto occ = p.get_occ_tile(0, 0);
    REQUIRE(acc);
    REQUIRE(occ);
    REQUIRE((occ->array() > 0.0f).all());
    REQUIRE(*acc == *occ);
    REQUIRE((*occ)(10, 0) == 1.0f);
    REQUIRE((*occ)(10, 127) == 1.0f);
    REQUIRE((*occ)(10, 128) == 2.0f);
    REQUIRE((*occ)(255, 255) == 2.0f);

    auto occ1 = p.get_occ_tile(1, 0);
    REQUIRE(occ1);
    REQUIRE((*occ1)(0, 127) == 1.0f);
    REQUIRE((*occ1)(0, 128) == 0.0f);

    p.update_pyramid();
    REQUIRE(p.pyramid_valid());
    REQUIRE(p.depth() >= 1);

    auto base = p.get_tile(0, 0, 0);
    REQUIRE(base);
    REQUIRE((*base)(5, 200) == Catch::Approx(1.0f));

    auto top = p.get_tile(1, 0, 0);
    REQUIRE(top);
    REQUIRE(top->rows() == 256);
    // Left half of the top row of quadrants comes from tile (0,0) ...
    REQUIRE((*top)(0, 0) == Catch::Approx(1.0f));
    REQUIRE((*top)(127, 127) == Catch::Approx(1.0f));
    // ... the right half from tile (1,0), which is only half covered.
    REQUIRE((*top)(0, 128) == Catch::Approx(1.0f));
    REQUIRE((*top)(0, 191) == Catch::Approx(1.0f));
    REQUIRE((*top)(0, 192) == 0.0f);
    // No child (0,1) or (1,1).
    REQUIRE((*top)(200, 10) == 0.0f);
}

TEST_CASE("ingest_order_does_not_change_accumulators") {
    TempDir dir;
    const Matrix2Df a = pattern(12, 10, 1.0f);
    const Matrix2Df b = pattern(9, 14, 2.0f);
    const Matrix2Df wa = Matrix2Df::Constant(12, 10, 0.5f);
    const Matrix2Df wb = Matrix2Df::Constant(9, 14, 2.0f);

    ImagePyramid p1(dir.path() / "ab", options_for(8));
    p1.update_base_tiles_from_frame(3, 5, a, wa);
    p1.update_base_tiles_from_frame(6, 2, b, wb);

    ImagePyramid p2(dir.path() / "ba", options_for(8));
    p2.update_base_tiles_from_frame(6, 2, b, wb);
    p2.update_base_tiles_from_frame(3, 5, a, wa);

    REQUIRE(p1.get_base_tile_coords() == p2.get_base_tile_coords());
    for (const TileXY& c : p1.get_base_tile_coords()) {
        REQUIRE(p1.get_acc_tile(c.x, c.y)->isApprox(*p2.get_acc_tile(c.x, c.y)));
        REQUIRE(*p1.get_occ_tile(c.x, c.y) == *p2.get_occ_tile(c.x, c.y));
    }
    REQUIRE(p1.n_tiles_x() == p2.n_tiles_x());
    REQUIRE(p1.n_tiles_y() == p2.n_tiles_y());
}

TEST_CASE("negative_origin_is_rejected_without_writes") {
    TempDir dir;
    ImagePyramid p(dir.path(), options_for(8));
    const Matrix2Df f = Matrix2Df::Ones(4, 4);

    REQUIRE_THROWS_AS(p.update_base_tiles_from_frame(-1, 0, f, f), ValidationError);
    REQUIRE_THROWS_AS(p.update_base_tiles_from_frame(0, -3, f, f), ValidationError);
    REQUIRE(p.get_base_tile_coords().empty());
    REQUIRE(p.n_tiles_x() == 0);
}

TEST_CASE("mismatched_weights_are_rejected") {
    TempDir dir;
    ImagePyramid p(dir.path(), options_for(8));
    REQUIRE_THROWS_AS(
        p.update_base_tiles_from_frame(0, 0, Matrix2Df::Ones(4, 4), Matrix2Df::Ones(4, 5)),
        ValidationError);
    REQUIRE(p.get_base_tile_coords().empty());
}

TEST_CASE("odd_tile_size_is_rejected") {
    TempDir dir;
    REQUIRE_THROWS_AS(ImagePyramid(dir.path(), options_for(7)), ValidationError);
}

TEST_CASE("low_occupancy_pixels_render_as_zero") {
    TempDir dir;
    ImagePyramid p(dir.path(), options_for(4));
    const Matrix2Df f = Matrix2Df::Constant(4, 4, 3.0f);
    Matrix2Df w = Matrix2Df::Constant(4, 4, 1.0f);
    w(0, 0) = 0.05f;

    p.update_base_tiles_from_frame(0, 0, f, w);
    p.update_pyramid();

    auto img = p.get_tile(0, 0, 0);
    REQUIRE(img);
    REQUIRE((*img)(0, 0) == 0.0f);
    REQUIRE((*img)(1, 1) == Catch::Approx(3.0f));
}

TEST_CASE("new_data_invalidates_stale_ancestors") {
    TempDir dir;
    ImagePyramid p(dir.path(), options_for(4));
    const Matrix2Df f = Matrix2Df::Ones(4, 4);

    p.update_base_tiles_from_frame(0, 0, f, f);
    p.update_base_tiles_from_frame(4, 0, f, f);
    p.update_pyramid();
    REQUIRE(p.depth() == 1);
    REQUIRE(p.get_tile(1, 0, 0));
    REQUIRE((*p.get_tile(1, 0, 0))(0, 3) == Catch::Approx(1.0f));

    p.update_base_tiles_from_frame(4, 0, Matrix2Df::Constant(4, 4, 5.0f), f);
    REQUIRE_FALSE(p.pyramid_valid());
    REQUIRE_FALSE(p.get_tile(0, 1, 0));
    REQUIRE_FALSE(p.get_tile(1, 0, 0));
    REQUIRE(p.get_tile(0, 0, 0));

    p.update_pyramid();
    // (1 + 5) / 2 on tile (1,0), unchanged on tile (0,0).
    REQUIRE((*p.get_tile(0, 1, 0))(2, 2) == Catch::Approx(3.0f));
    REQUIRE((*p.get_tile(1, 0, 0))(0, 3) == Catch::Approx(3.0f));
    REQUIRE((*p.get_tile(1, 0, 0))(0, 0) == Catch::Approx(1.0f));
}

TEST_CASE("new_sibling_invalidates_existing_parent") {
    TempDir dir;
    ImagePyramid p(dir.path(), options_for(4));
    const Matrix2Df f = Matrix2Df::Ones(4, 4);

    p.update_base_tiles_from_frame(0, 0, f, f);
    p.update_pyramid();
    REQUIRE(p.depth() == 1);
    REQUIRE((*p.get_tile(1, 0, 0))(0, 3) == 0.0f);

    // Tile (1,0) has never existed, but its parent has.
    p.update_base_tiles_from_frame(4, 0, f, f);
    REQUIRE_FALSE(p.get_tile(1, 0, 0));

    p.update_pyramid();
    REQUIRE((*p.get_tile(1, 0, 0))(0, 3) == Catch::Approx(1.0f));
}

TEST_CASE("pyramid_grows_until_a_single_top_tile") {
    TempDir dir;
    ImagePyramid p(dir.path(), options_for(4));
    const Matrix2Df f = Matrix2Df::Ones(4, 20);

    p.update_base_tiles_from_frame(0, 0, f, f);  // tiles x = 0..4
    p.update_pyramid();

    REQUIRE(p.n_tiles_x() == 5);
    REQUIRE(p.get_layer_tile_coords(1).size() == 3);
    REQUIRE(p.get_layer_tile_coords(2).size() == 2);
    REQUIRE(p.get_layer_tile_coords(3).size() == 1);
    REQUIRE(p.depth() == 3);
}

TEST_CASE("oversize_tile_stitches_neighbours") {
    TempDir dir;
    ImagePyramid p(dir.path(), options_for(4));
    p.update_base_tiles_from_frame(0, 0, Matrix2Df::Constant(4, 4, 1.0f), Matrix2Df::Ones(4, 4));
    p.update_base_tiles_from_frame(4, 0, Matrix2Df::Constant(4, 4, 2.0f), Matrix2Df::Ones(4, 4));
    p.update_base_tiles_from_frame(0, 4, Matrix2Df::Constant(4, 4, 3.0f), Matrix2Df::Ones(4, 4));
    p.update_pyramid();

    const Matrix2Df big = p.get_oversize_tile(0, 0, 0, 2);
    REQUIRE(big.rows() == 8);
    REQUIRE(big.cols() == 8);
    REQUIRE(big(0, 0) == Catch::Approx(1.0f));
    REQUIRE(big(0, 5) == Catch::Approx(2.0f));
    REQUIRE(big(5, 0) == Catch::Approx(3.0f));
    REQUIRE(big(5, 5) == 0.0f);

    REQUIRE_THROWS_AS(p.get_oversize_tile(0, 0, 0, 0), ValidationError);
}

TEST_CASE("load_existing_restores_a_finalized_pyramid") {
    const StorageBackend backend =
        GENERATE(StorageBackend::NUMPY, StorageBackend::BLOCK, StorageBackend::SQLITE);
    TempDir dir;
    const fs::path root = dir.path() / "pyr";

    PyramidOptions o = options_for(4, backend);
    o.x0 = 12.5;
    o.y0 = -3.0;
    o.pixel_size = 0.65;
    io::MetadataDocument acquisition;
    acquisition.set("Camera.ADOffset", 100);

    Matrix2Df expected;
    {
        ImagePyramid p(root, o, acquisition);
        p.update_base_tiles_from_frame(2, 1, pattern(6, 9, 1.0f), Matrix2Df::Ones(6, 9));
        p.update_pyramid();
        expected = *p.get_tile(1, 0, 0);
    }

    auto loaded = ImagePyramid::load_existing(root);
    REQUIRE(loaded->backend() == backend);
    REQUIRE(loaded->tile_size() == 4);
    REQUIRE(loaded->depth() == 2);
    REQUIRE(loaded->n_tiles_x() == 3);
    REQUIRE(loaded->n_tiles_y() == 2);
    REQUIRE(loaded->x0() == Catch::Approx(12.5));
    REQUIRE(loaded->y0() == Catch::Approx(-3.0));
    REQUIRE(loaded->pixel_size() == Catch::Approx(0.65));
    REQUIRE(loaded->pyramid_valid());
    REQUIRE(loaded->metadata().get_as<int>("Camera.ADOffset") == 100);
    REQUIRE(*loaded->get_tile(1, 0, 0) == expected);

    // Keeps accumulating on top of the stored sums.
    loaded->update_base_tiles_from_frame(2, 1, Matrix2Df::Ones(2, 2), Matrix2Df::Ones(2, 2));
    REQUIRE((*loaded->get_occ_tile(0, 0))(1, 2) == 2.0f);
}

TEST_CASE("load_existing_requires_metadata") {
    TempDir dir;
    REQUIRE_THROWS_AS(ImagePyramid::load_existing(dir.path()), MetadataError);
}

TEST_CASE("transient_pyramid_removes_its_directory") {
    fs::path root;
    {
        PyramidOptions o = options_for(4);
        o.transient = true;
        ImagePyramid p("", o);
        root = p.root();
        REQUIRE(fs::is_directory(root));
        p.update_base_tiles_from_frame(0, 0, Matrix2Df::Ones(4, 4), Matrix2Df::Ones(4, 4));
        p.update_pyramid();
        REQUIRE(fs::exists(root / io::kMetadataFilename));
    }
    REQUIRE_FALSE(fs::exists(root));
}
