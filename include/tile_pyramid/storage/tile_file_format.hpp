#pragma once

#include "tile_pyramid/core/types.hpp"

#include <memory>
#include <optional>
#include <string>

namespace tile_pyramid::storage {

// How one tile is serialized to one file.
class TileFileFormat {
public:
    virtual ~TileFileFormat() = default;

    virtual StorageBackend backend() const = 0;
    std::string extension() const { return backend_extension(backend()); }

    // nullopt when the file does not exist; IOError when it is unreadable.
    virtual std::optional<Matrix2Df> read(const fs::path& path) const = 0;

    // Creates missing parent directories.
    virtual void write(const fs::path& path, const Matrix2Df& tile) const = 0;
};

// Raw .npy arrays.
class NumpyFileFormat : public TileFileFormat {
public:
    StorageBackend backend() const override { return StorageBackend::NUMPY; }
    std::optional<Matrix2Df> read(const fs::path& path) const override;
    void write(const fs::path& path, const Matrix2Df& tile) const override;
};

// zlib-compressed, checksummed blocks (.tpz).
class BlockFileFormat : public TileFileFormat {
public:
    StorageBackend backend() const override { return StorageBackend::BLOCK; }
    std::optional<Matrix2Df> read(const fs::path& path) const override;
    void write(const fs::path& path, const Matrix2Df& tile) const override;
};

std::unique_ptr<TileFileFormat> make_file_format(StorageBackend backend);

} // namespace tile_pyramid::storage
