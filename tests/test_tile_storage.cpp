#include "temp_dir.hpp"

#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/storage/file_tile_storage.hpp"
#include "tile_pyramid/storage/sqlite_tile_storage.hpp"
#include "tile_pyramid/storage/tile_storage.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

using namespace tile_pyramid;
using tile_pyramid::testing::TempDir;

namespace {

Matrix2Df ramp_tile(int ts, float base) {
    Matrix2Df m(ts, ts);
    for (int r = 0; r < ts; ++r) {
        for (int c = 0; c < ts; ++c) {
            m(r, c) = base + static_cast<float>(r * ts + c);
        }
    }
    return m;
}

} // namespace

TEST_CASE("tile_storage_get_after_save_with_and_without_flush") {
    const StorageBackend backend =
        GENERATE(StorageBackend::NUMPY, StorageBackend::BLOCK, StorageBackend::SQLITE);
    TempDir dir;

    {
        auto store = storage::make_tile_storage(backend, dir.path(), TileComponent::ACC, 2);
        REQUIRE(store->backend() == backend);

        const Matrix2Df t = ramp_tile(8, 1.0f);
        store->save_tile(0, 3, 4, t);

        // Served from the cache before anything hit the disk.
        auto cached = store->get_tile(0, 3, 4);
        REQUIRE(cached);
        REQUIRE(*cached == t);

        store->flush();
        auto flushed = store->get_tile(0, 3, 4);
        REQUIRE(flushed);
        REQUIRE(*flushed == t);

        REQUIRE_FALSE(store->get_tile(0, 4, 3));
        REQUIRE_FALSE(store->get_tile(1, 3, 4));
    }

    // A fresh instance reads the durable copy.
    auto reopened = storage::make_tile_storage(backend, dir.path(), TileComponent::ACC, 2);
    auto again = reopened->get_tile(0, 3, 4);
    REQUIRE(again);
    REQUIRE(*again == ramp_tile(8, 1.0f));
}

TEST_CASE("tile_storage_eviction_keeps_tiles_readable") {
    const StorageBackend backend =
        GENERATE(StorageBackend::NUMPY, StorageBackend::BLOCK, StorageBackend::SQLITE);
    TempDir dir;
    auto store = storage::make_tile_storage(backend, dir.path(), TileComponent::OCC, 2);

    for (int i = 0; i < 6; ++i) {
        store->save_tile(0, i, 0, Matrix2Df::Constant(4, 4, static_cast<float>(i)));
    }
    for (int i = 0; i < 6; ++i) {
        auto t = store->get_tile(0, i, 0);
        REQUIRE(t);
        REQUIRE((*t)(2, 2) == static_cast<float>(i));
    }
}

TEST_CASE("tile_storage_coords_follow_save_and_delete") {
    const StorageBackend backend =
        GENERATE(StorageBackend::NUMPY, StorageBackend::BLOCK, StorageBackend::SQLITE);
    TempDir dir;

    {
        auto store = storage::make_tile_storage(backend, dir.path(), TileComponent::IMG);
        store->save_tile(0, 0, 0, Matrix2Df::Ones(4, 4));
        store->save_tile(0, 1, 0, Matrix2Df::Ones(4, 4));
        store->save_tile(1, 0, 0, Matrix2Df::Ones(4, 4));

        REQUIRE(store->get_layer_tile_coords(0) == TileCoordSet{{0, 0}, {1, 0}});
        REQUIRE(store->get_layer_tile_coords(1) == TileCoordSet{{0, 0}});
        REQUIRE(store->get_layer_tile_coords(2).empty());

        REQUIRE(store->tile_exists(0, 1, 0));
        store->delete_tile(0, 1, 0);
        REQUIRE_FALSE(store->tile_exists(0, 1, 0));
        REQUIRE_FALSE(store->get_tile(0, 1, 0));
        REQUIRE(store->get_layer_tile_coords(0) == TileCoordSet{{0, 0}});

        // Deleting an absent tile is harmless.
        store->delete_tile(3, 9, 9);
    }

    // Coordinates are rebuilt from disk by a new instance.
    auto reopened = storage::make_tile_storage(backend, dir.path(), TileComponent::IMG);
    REQUIRE(reopened->get_layer_tile_coords(0) == TileCoordSet{{0, 0}});
    REQUIRE(reopened->get_layer_tile_coords(1) == TileCoordSet{{0, 0}});
}

TEST_CASE("tile_storage_components_do_not_collide") {
    const StorageBackend backend =
        GENERATE(StorageBackend::NUMPY, StorageBackend::BLOCK, StorageBackend::SQLITE);
    TempDir dir;
    auto acc = storage::make_tile_storage(backend, dir.path(), TileComponent::ACC);
    auto occ = storage::make_tile_storage(backend, dir.path(), TileComponent::OCC);

    acc->save_tile(0, 0, 0, Matrix2Df::Constant(4, 4, 2.0f));
    occ->save_tile(0, 0, 0, Matrix2Df::Constant(4, 4, 5.0f));
    acc->flush();
    occ->flush();

    REQUIRE((*acc->get_tile(0, 0, 0))(0, 0) == 2.0f);
    REQUIRE((*occ->get_tile(0, 0, 0))(0, 0) == 5.0f);
}

TEST_CASE("file_tile_storage_path_layout") {
    TempDir dir;
    storage::FileTileStorage store(dir.path(), TileComponent::ACC,
                                   storage::make_file_format(StorageBackend::BLOCK));

    REQUIRE(store.tile_path(2, 7, 12) == dir.path() / "2" / "007" / "007_012_acc.tpz");

    store.save_tile(2, 7, 12, Matrix2Df::Zero(4, 4));
    REQUIRE_FALSE(fs::exists(store.tile_path(2, 7, 12)));
    store.flush();
    REQUIRE(fs::exists(store.tile_path(2, 7, 12)));
}

TEST_CASE("sqlite_tile_storage_uses_one_database_per_component") {
    TempDir dir;
    storage::SqliteTileStorage store(dir.path(), TileComponent::IMG);
    REQUIRE(store.db_path() == dir.path() / "img.db");
    REQUIRE(fs::exists(store.db_path()));
}

TEST_CASE("infer_backend_detects_tile_files") {
    const StorageBackend backend =
        GENERATE(StorageBackend::NUMPY, StorageBackend::BLOCK, StorageBackend::SQLITE);
    TempDir dir;
    {
        auto store = storage::make_tile_storage(backend, dir.path(), TileComponent::ACC);
        store->save_tile(0, 0, 0, Matrix2Df::Ones(4, 4));
    }
    REQUIRE(storage::infer_backend(dir.path()) == backend);
}

TEST_CASE("infer_backend_fails_without_tiles") {
    TempDir dir;
    REQUIRE_THROWS_AS(storage::infer_backend(dir.path()), StorageNotFoundError);
    REQUIRE_THROWS_AS(storage::infer_backend(dir.path() / "missing"), StorageNotFoundError);
}
