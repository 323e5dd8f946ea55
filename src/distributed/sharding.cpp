#include "tile_pyramid/distributed/sharding.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/types.hpp"

namespace tile_pyramid::distributed {

namespace {

constexpr uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

void fnv_mix(uint64_t& h, int32_t v) {
    // Byte-wise so negative indices hash the same on every platform.
    const auto u = static_cast<uint32_t>(v);
    for (int i = 0; i < 4; ++i) {
        h ^= static_cast<uint64_t>((u >> (8 * i)) & 0xFFu);
        h *= kFnvPrime;
    }
}

} // namespace

ChunkIndex chunk_of(int x, int y, int z, const ChunkShape& chunk_shape) {
    if (chunk_shape[0] < 1 || chunk_shape[1] < 1 || chunk_shape[2] < 1) {
        throw ValidationError("chunk shape entries must be >= 1");
    }
    return {floor_div(x, chunk_shape[0]), floor_div(y, chunk_shape[1]),
            floor_div(z, chunk_shape[2])};
}

uint64_t chunk_hash(const ChunkIndex& chunk) {
    uint64_t h = kFnvOffset;
    fnv_mix(h, chunk.cx);
    fnv_mix(h, chunk.cy);
    fnv_mix(h, chunk.cz);
    return h;
}

int server_for_chunk(int x, int y, int z, const ChunkShape& chunk_shape, int n_servers) {
    if (n_servers < 1) {
        throw ValidationError("need at least one server");
    }
    return static_cast<int>(chunk_hash(chunk_of(x, y, z, chunk_shape)) %
                            static_cast<uint64_t>(n_servers));
}

} // namespace tile_pyramid::distributed
