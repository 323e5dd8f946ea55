#pragma once

#include "tile_pyramid/core/types.hpp"
#include <map>
#include <optional>
#include <string>

namespace tile_pyramid::io {

// Subset of a FITS header: strings and numbers, keyed by card name.
struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
};

struct FitsDimensions {
    int width = 0;
    int height = 0;
    int planes = 1;  // NAXIS3 for cubes, 1 for plain images
};

FitsDimensions get_fits_dimensions(const fs::path& path);

// Reads plane `plane` (0-based) of a 2D image or 3D cube as float.
std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path, int plane = 0);

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);

} // namespace tile_pyramid::io
