#pragma once

#include "tile_pyramid/core/utils.hpp"

#include <filesystem>
#include <system_error>

namespace tile_pyramid::testing {

// Scratch directory removed when the test ends.
class TempDir {
public:
    TempDir() : path_(core::make_temp_dir("tile_pyramid_test")) {}
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace tile_pyramid::testing
