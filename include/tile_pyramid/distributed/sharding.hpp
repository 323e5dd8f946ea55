#pragma once

#include <array>
#include <cstdint>

namespace tile_pyramid::distributed {

// Tiles per chunk along x, y and z. All tiles of a chunk share a server.
using ChunkShape = std::array<int, 3>;

struct ChunkIndex {
    int cx = 0;
    int cy = 0;
    int cz = 0;
};

ChunkIndex chunk_of(int x, int y, int z, const ChunkShape& chunk_shape);

// FNV-1a over the chunk index. Stable across processes and platforms.
uint64_t chunk_hash(const ChunkIndex& chunk);

// Index in [0, n_servers) of the server owning tile (x, y) at level z.
int server_for_chunk(int x, int y, int z, const ChunkShape& chunk_shape, int n_servers);

} // namespace tile_pyramid::distributed
