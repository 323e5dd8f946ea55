#include "tile_pyramid/io/block_codec.hpp"
#include "tile_pyramid/core/errors.hpp"

#include <zlib.h>
#include <cstring>
#include <string>

namespace tile_pyramid::io {

namespace {

constexpr char kMagic[4] = {'T', 'P', 'Z', 'B'};
constexpr uint8_t kDtypeFloat32 = 1;

template <typename T>
void put_le(std::vector<uint8_t>& out, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        out.push_back(static_cast<uint8_t>((static_cast<uint64_t>(value) >> (8 * i)) & 0xFF));
    }
}

template <typename T>
T get_le(const uint8_t* p) {
    uint64_t v = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        v |= static_cast<uint64_t>(p[i]) << (8 * i);
    }
    return static_cast<T>(v);
}

// Pixel bytes in little-endian float32 order, rows then columns.
std::vector<uint8_t> pixel_bytes(const Matrix2Df& tile) {
    std::vector<uint8_t> raw;
    raw.reserve(static_cast<size_t>(tile.size()) * sizeof(float));
    for (Eigen::Index i = 0; i < tile.size(); ++i) {
        uint32_t bits = 0;
        float v = tile.data()[i];
        std::memcpy(&bits, &v, sizeof(bits));
        put_le<uint32_t>(raw, bits);
    }
    return raw;
}

std::vector<uint8_t> deflate_bytes(const std::vector<uint8_t>& raw, int level) {
    uLongf compressed_size = compressBound(static_cast<uLong>(raw.size()));
    std::vector<uint8_t> compressed(compressed_size);

    int result = compress2(compressed.data(), &compressed_size,
                           reinterpret_cast<const Bytef*>(raw.data()),
                           static_cast<uLong>(raw.size()), level);
    if (result != Z_OK) {
        throw IOError("zlib compression failed (code " + std::to_string(result) + ")");
    }

    compressed.resize(compressed_size);
    return compressed;
}

std::vector<uint8_t> inflate_bytes(const uint8_t* data, size_t size, size_t expected) {
    std::vector<uint8_t> raw(expected);
    uLongf dest_size = static_cast<uLongf>(expected);

    int result = uncompress(raw.data(), &dest_size,
                            reinterpret_cast<const Bytef*>(data), static_cast<uLong>(size));
    if (result != Z_OK) {
        throw IOError("zlib decompression failed (code " + std::to_string(result) + ")");
    }
    if (dest_size != expected) {
        throw IOError("decompressed block has " + std::to_string(dest_size) +
                      " bytes, expected " + std::to_string(expected));
    }
    return raw;
}

uint32_t checksum(const std::vector<uint8_t>& raw) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(raw.data()), static_cast<uInt>(raw.size()));
    return static_cast<uint32_t>(crc);
}

} // namespace

std::vector<uint8_t> encode_block(const Matrix2Df& tile, BlockCompression compression, int level) {
    std::vector<uint8_t> raw = pixel_bytes(tile);
    const uint32_t crc = checksum(raw);

    std::vector<uint8_t> payload = compression == BlockCompression::ZLIB
        ? deflate_bytes(raw, level)
        : std::move(raw);

    std::vector<uint8_t> out;
    out.reserve(kBlockHeaderSize + payload.size());
    out.insert(out.end(), kMagic, kMagic + 4);
    put_le<uint16_t>(out, kBlockVersion);
    out.push_back(kDtypeFloat32);
    out.push_back(static_cast<uint8_t>(compression));
    put_le<uint32_t>(out, static_cast<uint32_t>(tile.rows()));
    put_le<uint32_t>(out, static_cast<uint32_t>(tile.cols()));
    put_le<uint64_t>(out, static_cast<uint64_t>(payload.size()));
    put_le<uint32_t>(out, crc);
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

Matrix2Df decode_block(const uint8_t* data, size_t size) {
    if (size < kBlockHeaderSize) {
        throw IOError("tile block truncated (" + std::to_string(size) + " bytes)");
    }
    if (std::memcmp(data, kMagic, 4) != 0) {
        throw IOError("not a tile block (bad magic)");
    }

    const uint16_t version = get_le<uint16_t>(data + 4);
    if (version != kBlockVersion) {
        throw IOError("unsupported tile block version " + std::to_string(version));
    }
    const uint8_t dtype = data[6];
    if (dtype != kDtypeFloat32) {
        throw IOError("unsupported tile block dtype " + std::to_string(dtype));
    }
    const uint8_t compression = data[7];
    const uint32_t rows = get_le<uint32_t>(data + 8);
    const uint32_t cols = get_le<uint32_t>(data + 12);
    const uint64_t payload_size = get_le<uint64_t>(data + 16);
    const uint32_t crc = get_le<uint32_t>(data + 24);

    if (payload_size != size - kBlockHeaderSize) {
        throw IOError("tile block payload size mismatch");
    }

    const uint8_t* payload = data + kBlockHeaderSize;
    const size_t raw_size = static_cast<size_t>(rows) * cols * sizeof(float);

    std::vector<uint8_t> raw;
    switch (compression) {
        case static_cast<uint8_t>(BlockCompression::NONE):
            if (payload_size != raw_size) {
                throw IOError("uncompressed tile block has wrong size");
            }
            raw.assign(payload, payload + payload_size);
            break;
        case static_cast<uint8_t>(BlockCompression::ZLIB):
            raw = inflate_bytes(payload, static_cast<size_t>(payload_size), raw_size);
            break;
        default:
            throw IOError("unsupported tile block compression " + std::to_string(compression));
    }

    if (checksum(raw) != crc) {
        throw IOError("tile block checksum mismatch");
    }

    Matrix2Df tile(rows, cols);
    for (Eigen::Index i = 0; i < tile.size(); ++i) {
        uint32_t bits = get_le<uint32_t>(raw.data() + i * sizeof(float));
        float v = 0.0f;
        std::memcpy(&v, &bits, sizeof(v));
        tile.data()[i] = v;
    }
    return tile;
}

Matrix2Df decode_block(const std::vector<uint8_t>& data) {
    return decode_block(data.data(), data.size());
}

} // namespace tile_pyramid::io
