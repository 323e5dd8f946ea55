#include "tile_pyramid/io/fits_io.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/utils.hpp"

#include <fitsio.h>
#include <cstdlib>
#include <vector>

namespace tile_pyramid::io {

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

namespace {

// Owns an open fitsfile and closes it on scope exit.
class FitsHandle {
public:
    FitsHandle(const fs::path& path, int mode) : path_(path) {
        int status = 0;
        if (fits_open_file(&fptr_, path.string().c_str(), mode, &status)) {
            throw FitsError("Cannot open FITS file: " + path.string());
        }
    }

    ~FitsHandle() {
        int status = 0;
        if (fptr_) fits_close_file(fptr_, &status);
    }

    FitsHandle(const FitsHandle&) = delete;
    FitsHandle& operator=(const FitsHandle&) = delete;

    fitsfile* get() { return fptr_; }
    const fs::path& path() const { return path_; }

private:
    fitsfile* fptr_ = nullptr;
    fs::path path_;
};

FitsDimensions read_dimensions(FitsHandle& fh) {
    int status = 0;
    int naxis = 0;
    int bitpix = 0;
    long naxes[3] = {0, 0, 0};

    fits_get_img_param(fh.get(), 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        throw FitsError("Cannot read FITS image parameters: " + fh.path().string());
    }
    if (naxis < 2) {
        throw FitsError("FITS file has less than 2 dimensions: " + fh.path().string());
    }

    FitsDimensions dims;
    dims.width = static_cast<int>(naxes[0]);
    dims.height = static_cast<int>(naxes[1]);
    dims.planes = naxis >= 3 ? static_cast<int>(naxes[2]) : 1;
    return dims;
}

void read_header(FitsHandle& fh, FitsHeader& header) {
    int status = 0;
    int nkeys = 0;
    fits_get_hdrspace(fh.get(), &nkeys, nullptr, &status);
    if (status) return;

    char card[FLEN_CARD];
    for (int i = 1; i <= nkeys; ++i) {
        status = 0;
        if (fits_read_record(fh.get(), i, card, &status)) continue;

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        if (fits_get_keyname(card, keyname, &keylen, &status)) continue;

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        char dtype = 0;
        if (fits_get_keytype(card, &dtype, &status)) continue;
        if (fits_parse_value(card, value, comment, &status)) continue;

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        if (dtype == 'I' || dtype == 'F') {
            char* end = nullptr;
            double v = std::strtod(val_str.c_str(), &end);
            if (end && *end == '\0' && !val_str.empty()) {
                header.set(key, v);
                continue;
            }
        }
        header.set(key, val_str);
    }
}

} // namespace

FitsDimensions get_fits_dimensions(const fs::path& path) {
    FitsHandle fh(path, READONLY);
    return read_dimensions(fh);
}

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path, int plane) {
    FitsHandle fh(path, READONLY);
    FitsDimensions dims = read_dimensions(fh);

    if (plane < 0 || plane >= dims.planes) {
        throw FitsError("Plane " + std::to_string(plane) + " out of range in " + path.string());
    }

    // FITS is row-major with x fastest, which matches Matrix2Df directly.
    Matrix2Df data(dims.height, dims.width);
    long fpixel[3] = {1, 1, plane + 1};
    int status = 0;
    fits_read_pix(fh.get(), TFLOAT, fpixel, static_cast<long>(data.size()), nullptr,
                  data.data(), nullptr, &status);
    if (status) {
        throw FitsError("Cannot read FITS pixel data: " + path.string());
    }

    FitsHeader header;
    read_header(fh, header);
    return {data, header};
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    fitsfile* fptr = nullptr;
    int status = 0;

    core::ensure_parent_dir(path);
    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};
    fits_create_img(fptr, FLOAT_IMG, 2, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }
    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }

    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TFLOAT, fpixel, static_cast<long>(data.size()),
                   const_cast<float*>(data.data()), &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
}

} // namespace tile_pyramid::io
