#pragma once

#include "tile_pyramid/core/types.hpp"
#include <cstdint>
#include <vector>

namespace tile_pyramid::io {

// On-disk layout of a compressed tile block (all fields little-endian):
//
//   offset  size  field
//   0       4     magic "TPZB"
//   4       2     format version
//   6       1     dtype (1 = float32)
//   7       1     compression (0 = none, 1 = zlib)
//   8       4     rows
//   12      4     cols
//   16      8     payload size in bytes
//   24      4     CRC32 of the uncompressed pixel bytes
//   28      ...   payload
constexpr uint16_t kBlockVersion = 1;
constexpr size_t kBlockHeaderSize = 28;

enum class BlockCompression : uint8_t {
    NONE = 0,
    ZLIB = 1
};

std::vector<uint8_t> encode_block(const Matrix2Df& tile,
                                  BlockCompression compression = BlockCompression::ZLIB,
                                  int level = 6);

// Throws IOError on bad magic, unsupported version or dtype, truncated
// payload or checksum mismatch.
Matrix2Df decode_block(const uint8_t* data, size_t size);
Matrix2Df decode_block(const std::vector<uint8_t>& data);

} // namespace tile_pyramid::io
