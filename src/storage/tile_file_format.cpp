#include "tile_pyramid/storage/tile_file_format.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/utils.hpp"
#include "tile_pyramid/io/block_codec.hpp"
#include "tile_pyramid/io/npy_io.hpp"

namespace tile_pyramid::storage {

std::optional<Matrix2Df> NumpyFileFormat::read(const fs::path& path) const {
    if (!fs::exists(path)) return std::nullopt;
    return io::load_npy_float(path);
}

void NumpyFileFormat::write(const fs::path& path, const Matrix2Df& tile) const {
    io::save_npy_float(path, tile);
}

std::optional<Matrix2Df> BlockFileFormat::read(const fs::path& path) const {
    if (!fs::exists(path)) return std::nullopt;
    std::vector<uint8_t> bytes = core::read_bytes(path);
    try {
        return io::decode_block(bytes);
    } catch (const IOError& e) {
        throw IOError(path.string() + ": " + e.what());
    }
}

void BlockFileFormat::write(const fs::path& path, const Matrix2Df& tile) const {
    core::ensure_parent_dir(path);
    core::write_bytes(path, io::encode_block(tile));
}

std::unique_ptr<TileFileFormat> make_file_format(StorageBackend backend) {
    switch (backend) {
        case StorageBackend::NUMPY: return std::make_unique<NumpyFileFormat>();
        case StorageBackend::BLOCK: return std::make_unique<BlockFileFormat>();
        default:
            throw StorageNotFoundError("backend " + backend_to_string(backend) +
                                       " is not a per-file format");
    }
}

} // namespace tile_pyramid::storage
