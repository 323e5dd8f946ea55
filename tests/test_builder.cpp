#include "temp_dir.hpp"

#include "tile_pyramid/builder/frame_source.hpp"
#include "tile_pyramid/builder/position_mapping.hpp"
#include "tile_pyramid/builder/pyramid_builder.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/utils.hpp"
#include "tile_pyramid/io/fits_io.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <sstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace tile_pyramid;
using namespace tile_pyramid::builder;
using tile_pyramid::testing::TempDir;

namespace {

io::MetadataDocument acquisition(double ad_offset = 100.0) {
    io::MetadataDocument md;
    md.set("voxelsize.x", 1.0);
    md.set("Camera.ADOffset", ad_offset);
    return md;
}

BuildOptions plain_options() {
    BuildOptions o;
    o.tile_size = 8;
    o.edge_ramp_px = 0;
    o.occupancy_threshold = 0.1f;
    return o;
}

std::vector<Matrix2Df> constant_frames(int n, float value) {
    return std::vector<Matrix2Df>(static_cast<size_t>(n), Matrix2Df::Constant(8, 8, value));
}

} // namespace

TEST_CASE("feather_weights_ramp_all_edges") {
    const Matrix2Df w = make_feather_weights(20, 20, 5, 0.5f);
    REQUIRE(w(0, 10) == 0.0f);
    REQUIRE(w(1, 10) == Catch::Approx(0.25f));
    REQUIRE(w(3, 10) == Catch::Approx(0.75f));
    REQUIRE(w(10, 10) == 1.0f);
    REQUIRE(w(19, 10) == 0.0f);
    REQUIRE(w(10, 18) == Catch::Approx(0.25f));
    REQUIRE(w(1, 1) == Catch::Approx(0.0625f));
}

TEST_CASE("feather_ramp_is_limited_by_frame_fraction") {
    // int(0.25 * 8) = 2 pixels: linspace(0, 1, 2) = {0, 1}.
    const Matrix2Df w = make_feather_weights(12, 8, 100, 0.25f);
    REQUIRE(w.rows() == 8);
    REQUIRE(w.cols() == 12);
    REQUIRE(w(0, 6) == 0.0f);
    REQUIRE(w(1, 6) == 1.0f);
    REQUIRE(w(4, 11) == 0.0f);
    REQUIRE(w(4, 10) == 1.0f);

    REQUIRE(make_feather_weights(6, 6, 0, 0.25f) == Matrix2Df::Ones(6, 6));
}

TEST_CASE("positions_convert_to_pixels_from_the_minimum") {
    const auto px = positions_to_pixels({10.65, 10.0, 11.3}, 0.65, kCorrelatePadding);
    REQUIRE(px == std::vector<int>{301, 300, 302});
    REQUIRE_THROWS_AS(positions_to_pixels({1.0}, 0.0, 0), ValidationError);
}

TEST_CASE("camera_roi_origin_prefers_origin_keys") {
    io::MetadataDocument md;
    REQUIRE(camera_roi_origin(md) == std::make_pair(0, 0));

    md.set("Camera.ROIPosX", 11);
    md.set("Camera.ROIPosY", 21);
    REQUIRE(camera_roi_origin(md) == std::make_pair(10, 20));

    md.set("Camera.ROIOriginX", 4);
    REQUIRE(camera_roi_origin(md) == std::make_pair(4, 0));
}

TEST_CASE("moving_frames_are_skipped_on_request") {
    const std::vector<int> xdp{0, 0, 5, 5, 5, 9, 9};
    const std::vector<int> ydp{0, 0, 0, 0, 3, 3, 3};

    const auto keep = frames_to_ingest(xdp, ydp, 1, true);
    REQUIRE(keep == std::vector<bool>{false, true, false, true, false, false, true});

    const auto all = frames_to_ingest(xdp, ydp, 1, false);
    REQUIRE(all == std::vector<bool>{false, true, true, true, true, true, true});
}

TEST_CASE("piecewise_mapping_holds_values_between_steps") {
    PiecewiseMapping m(2.0);
    m.add_step(5, 10.0);
    m.add_step(2, 7.0);

    REQUIRE(m.step_count() == 2);
    REQUIRE(m(0) == 2.0);
    REQUIRE(m(1) == 2.0);
    REQUIRE(m(2) == 7.0);
    REQUIRE(m(4) == 7.0);
    REQUIRE(m(5) == 10.0);
    REQUIRE(m(500) == 10.0);
}

TEST_CASE("piecewise_mapping_from_events_uses_cycle_time") {
    io::MetadataDocument md;
    md.set("StartTime", 100.0);
    md.set("Camera.CycleTime", 0.5);

    const std::vector<AcquisitionEvent> events{
        {101.2, "ScannerXPos", "3.5"},
        {100.0, "ScannerYPos", "9"},
        {102.0, "ScannerXPos", "4.5"},
    };
    const auto xm = PiecewiseMapping::from_events(events, md, "ScannerXPos", 1.0);
    REQUIRE(xm.sample(6) == std::vector<double>{1.0, 1.0, 1.0, 3.5, 4.5, 4.5});

    io::MetadataDocument no_cycle;
    no_cycle.set("StartTime", 0.0);
    REQUIRE_THROWS_AS(PiecewiseMapping::from_events(events, no_cycle, "ScannerXPos", 0.0),
                      MetadataError);
    // Without matching events the timing keys are not needed.
    REQUIRE(PiecewiseMapping::from_events(events, no_cycle, "Focus", 0.0).step_count() == 0);
}

TEST_CASE("load_events_reads_json_list") {
    TempDir dir;
    REQUIRE(load_events(dir.path() / "events.json").empty());

    core::write_text(dir.path() / "events.json",
                     R"([{"time": 1.5, "name": "ScannerXPos", "value": 12.25},
                         {"time": 2.0, "name": "Shutter", "value": "open"}])");
    const auto events = load_events(dir.path() / "events.json");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].name == "ScannerXPos");
    REQUIRE(std::stod(events[0].value) == 12.25);
    REQUIRE(events[1].value == "open");

    core::write_text(dir.path() / "bad.json", R"({"time": 1})");
    REQUIRE_THROWS_AS(load_events(dir.path() / "bad.json"), ValidationError);
}

TEST_CASE("in_memory_frame_source_rejects_mixed_shapes") {
    std::vector<Matrix2Df> frames{Matrix2Df::Zero(4, 4), Matrix2Df::Zero(4, 5)};
    REQUIRE_THROWS_AS(InMemoryFrameSource(frames), ValidationError);
}

TEST_CASE("build_pyramid_ingests_dark_corrected_frames") {
    TempDir dir;
    InMemoryFrameSource source(constant_frames(4, 110.0f));
    io::MetadataDocument md = acquisition(100.0);
    md.set("Camera.ROIOriginX", 3);

    BuildOptions o = plain_options();
    o.skip_move_frames = true;
    o.data_starts_at = 0;

    std::ostringstream events;
    o.events = &events;
    o.run_id = "test_run";

    // Frame 1 and 3 arrive while the stage moves.
    BuildResult r = build_pyramid(dir.path(), source, std::vector<double>{5.0, 9.0, 9.0, 13.0},
                                  std::vector<double>{0.0, 0.0, 0.0, 0.0}, md, o);

    REQUIRE(r.frames_total == 4);
    REQUIRE(r.frames_used == 2);
    REQUIRE(r.frames_skipped == 2);
    REQUIRE(r.pyramids.size() == 1);

    pyramid::ImagePyramid& p = *r.pyramids.front();
    REQUIRE(p.pyramid_valid());
    REQUIRE(p.depth() == 1);
    REQUIRE(p.n_tiles_x() == 2);
    REQUIRE(p.x0() == Catch::Approx(8.0));
    REQUIRE(p.pixel_size() == Catch::Approx(1.0));

    auto t0 = p.get_tile(0, 0, 0);
    auto t1 = p.get_tile(0, 1, 0);
    REQUIRE(t0);
    REQUIRE(t1);
    REQUIRE((*t0)(4, 4) == Catch::Approx(10.0f));
    REQUIRE((*t1)(4, 3) == Catch::Approx(10.0f));
    REQUIRE((*t1)(4, 4) == 0.0f);
    REQUIRE((*p.get_occ_tile(0, 0))(0, 7) == 2.0f);

    const io::MetadataDocument saved = io::MetadataDocument::load(dir.path() / io::kMetadataFilename);
    REQUIRE(saved.get_as<double>("Camera.ADOffset") == 100.0);
    REQUIRE(saved.get_as<int>("Pyramid.Depth") == 1);

    const std::string log = events.str();
    REQUIRE(log.find("\"phase_start\"") != std::string::npos);
    REQUIRE(log.find("\"frame_processed\"") != std::string::npos);
    REQUIRE(log.find("\"phase_name\":\"INGEST\"") != std::string::npos);
    REQUIRE(log.find("\"phase_name\":\"COARSEN\"") != std::string::npos);
    REQUIRE(log.find("UNKNOWN") == std::string::npos);
    REQUIRE(log.find("test_run") != std::string::npos);
}

TEST_CASE("build_pyramid_applies_dark_frame_and_flat") {
    TempDir dir;
    InMemoryFrameSource source(constant_frames(1, 50.0f));

    BuildOptions o = plain_options();
    o.dark_offset = 1000.0f;                       // overridden by the frame
    o.dark_frame = Matrix2Df::Constant(8, 8, 10.0f);
    o.flat = Matrix2Df::Constant(8, 8, 0.5f);

    PositionFn zero = [](int) { return 0.0; };
    BuildResult r = build_pyramid(dir.path(), source, zero, zero, acquisition(), o);
    REQUIRE((*r.pyramids.front()->get_tile(0, 0, 0))(3, 3) == Catch::Approx(20.0f));
}

TEST_CASE("build_pyramid_feather_weights_leave_zero_edges") {
    TempDir dir;
    InMemoryFrameSource source(constant_frames(1, 105.0f));

    BuildOptions o = plain_options();
    o.edge_ramp_px = 3;
    o.edge_ramp_fraction = 0.5f;

    PositionFn zero = [](int) { return 0.0; };
    BuildResult r = build_pyramid(dir.path(), source, zero, zero, acquisition(), o);
    pyramid::ImagePyramid& p = *r.pyramids.front();

    // Weighted data over weights restores the value where weight > threshold.
    REQUIRE((*p.get_tile(0, 0, 0))(0, 4) == 0.0f);
    REQUIRE((*p.get_tile(0, 0, 0))(4, 4) == Catch::Approx(5.0f));
    REQUIRE((*p.get_acc_tile(0, 0))(1, 4) == Catch::Approx(2.5f));
}

TEST_CASE("build_pyramid_splits_channels") {
    TempDir dir;
    InMemoryFrameSource source(constant_frames(2, 101.0f));

    BuildOptions o = plain_options();
    o.unmixer = [](const Matrix2Df& frame) {
        return std::vector<Matrix2Df>{frame, frame * 2.0f};
    };

    BuildResult r = build_pyramid(dir.path(), source, std::vector<double>{0.0, 0.0},
                                  std::vector<double>{0.0, 0.0}, acquisition(), o);
    REQUIRE(r.pyramids.size() == 2);
    REQUIRE(r.pyramids[0]->root() == dir.path() / "channel0");
    REQUIRE(r.pyramids[1]->root() == dir.path() / "channel1");
    REQUIRE((*r.pyramids[0]->get_tile(0, 0, 0))(1, 1) == Catch::Approx(1.0f));
    REQUIRE((*r.pyramids[1]->get_tile(0, 0, 0))(1, 1) == Catch::Approx(2.0f));
    REQUIRE(fs::exists(dir.path() / "channel1" / io::kMetadataFilename));
}

TEST_CASE("build_pyramid_uses_the_pyramid_factory") {
    TempDir dir;
    InMemoryFrameSource source(constant_frames(1, 100.0f));

    int created = 0;
    BuildOptions o = plain_options();
    o.make_pyramid = [&created](const fs::path& d, const pyramid::PyramidOptions& popts,
                                const io::MetadataDocument& md) {
        ++created;
        REQUIRE(popts.tile_size == 8);
        return std::make_unique<pyramid::ImagePyramid>(d / "custom", popts, md);
    };

    BuildResult r = build_pyramid(dir.path(), source, std::vector<double>{0.0},
                                  std::vector<double>{0.0}, acquisition(), o);
    REQUIRE(created == 1);
    REQUIRE(r.pyramids.front()->root() == dir.path() / "custom");
}

TEST_CASE("build_pyramid_validates_inputs") {
    TempDir dir;
    InMemoryFrameSource source(constant_frames(2, 100.0f));
    BuildOptions o = plain_options();

    io::MetadataDocument no_voxel;
    REQUIRE_THROWS_AS(build_pyramid(dir.path(), source, std::vector<double>{0.0, 1.0},
                                    std::vector<double>{0.0, 0.0}, no_voxel, o),
                      MetadataError);

    REQUIRE_THROWS_AS(build_pyramid(dir.path(), source, std::vector<double>{0.0},
                                    std::vector<double>{0.0}, acquisition(), o),
                      ValidationError);

    o.data_starts_at = 5;
    REQUIRE_THROWS_AS(build_pyramid(dir.path(), source, std::vector<double>{0.0, 1.0},
                                    std::vector<double>{0.0, 0.0}, acquisition(), o),
                      ValidationError);
}

TEST_CASE("create_pyramid_from_dataset_reads_fits_and_events") {
    TempDir dir;
    const fs::path dataset = dir.path() / "acq";

    for (int i = 0; i < 3; ++i) {
        char name[32];
        std::snprintf(name, sizeof(name), "frame_%03d.fits", i);
        io::write_fits_float(dataset / "frames" / name, Matrix2Df::Constant(6, 8, 40.0f),
                             io::FitsHeader{});
    }

    nlohmann::json md = {
        {"voxelsize", {{"x", 2.0}, {"y", 2.0}}},
        {"Camera", {{"ADOffset", 30.0}, {"CycleTime", 1.0}}},
        {"StartTime", 0.0},
        {"Positioning", {{"x", 0.0}, {"y", 0.0}}},
    };
    core::write_text(dataset / io::kMetadataFilename, md.dump());
    // Frame 2 is taken 16 um (8 px) to the right.
    core::write_text(dataset / "events.json",
                     R"([{"time": 1.5, "name": "ScannerXPos", "value": 16.0}])");

    BuildOptions o = plain_options();
    BuildResult r = create_pyramid_from_dataset(dataset, dir.path() / "out", o);

    REQUIRE(r.frames_used == 3);
    pyramid::ImagePyramid& p = *r.pyramids.front();
    REQUIRE(p.n_tiles_x() == 2);
    REQUIRE(p.n_tiles_y() == 1);
    REQUIRE(p.pixel_size() == Catch::Approx(2.0));
    REQUIRE((*p.get_occ_tile(0, 0))(0, 0) == 2.0f);
    REQUIRE((*p.get_occ_tile(1, 0))(0, 0) == 1.0f);
    REQUIRE((*p.get_tile(0, 1, 0))(2, 2) == Catch::Approx(10.0f));

    auto reopened = pyramid::ImagePyramid::load_existing(dir.path() / "out");
    REQUIRE(reopened->depth() == 1);
}

TEST_CASE("fits_header_keys_survive_write_and_read") {
    TempDir dir;
    io::FitsHeader header;
    header.set("PYRLAYER", 2.0);
    header.set("ORIGIN", std::string("tile_pyramid"));
    Matrix2Df data = Matrix2Df::Zero(3, 5);
    data(1, 4) = 7.5f;

    const fs::path path = dir.path() / "tile.fits";
    io::write_fits_float(path, data, header);

    const io::FitsDimensions dims = io::get_fits_dimensions(path);
    REQUIRE(dims.width == 5);
    REQUIRE(dims.height == 3);

    auto [image, read_header] = io::read_fits_float(path, 0);
    REQUIRE(image(1, 4) == Catch::Approx(7.5f));
    REQUIRE(read_header.get_double("PYRLAYER").value_or(-1.0) == Catch::Approx(2.0));
    REQUIRE(read_header.get_string("ORIGIN").value_or("") == "tile_pyramid");
    REQUIRE_FALSE(read_header.get_double("MISSING"));
    REQUIRE_THROWS_AS(io::read_fits_float(path, 1), FitsError);
}
