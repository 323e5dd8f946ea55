#pragma once

#include "tile_pyramid/builder/pyramid_builder.hpp"
#include "tile_pyramid/distributed/sharding.hpp"
#include "tile_pyramid/distributed/transport.hpp"
#include "tile_pyramid/pyramid/image_pyramid.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tile_pyramid::distributed {

struct DistributedOptions {
    std::vector<std::string> servers;  // host:port, index = shard id
    ChunkShape chunk_shape{8, 8, 1};
    double timeout_s = 10.0;
    int repeats = 3;
    std::string pyramid_name = "pyramid";
};

/**
 * Client side of a sharded pyramid. Level-0 contributions are not stored
 * locally; each tile's slice is PUT to the server owning the tile's chunk.
 * update_pyramid() POSTs the client metadata to /<name>/update_pyramid on
 * every server, which finalizes and flushes the worker pyramids, and then
 * records the deepest worker pyramid and the joint extent locally.
 * Timeouts are retried up to `repeats` attempts, then surface as
 * DistributionTimeoutError. Any non-200 answer is a NetworkError.
 */
class DistributedImagePyramid : public pyramid::ImagePyramid {
public:
    DistributedImagePyramid(const fs::path& root, const pyramid::PyramidOptions& options,
                            DistributedOptions dist, std::unique_ptr<TileTransport> transport,
                            const io::MetadataDocument& acquisition = {});

    void update_pyramid() override;

    int server_for_tile(const TileXY& tile) const;
    std::string url_for_server(int server_idx) const;

    const DistributedOptions& distributed_options() const { return dist_; }
    int requests_sent() const { return requests_sent_; }
    int timeouts() const { return timeouts_; }

protected:
    void ingest_tile_slice(const pyramid::TileSlice& slice, const Matrix2Df& frame,
                           const Matrix2Df& weights) override;

private:
    TransportReply send_with_retry(HttpMethod method, const std::string& url,
                                   const std::string& body);

    DistributedOptions dist_;
    std::unique_ptr<TileTransport> transport_;
    int requests_sent_ = 0;
    int timeouts_ = 0;
};

// Pyramid name used on the workers for a pyramid built in `dir`: the base
// name for `out_dir` itself, "<name>_<subdir>" for the per-channel
// pyramids below it.
std::string pyramid_name_for(const std::string& base_name, const fs::path& out_dir,
                             const fs::path& dir);

// build_pyramid factory creating one DistributedImagePyramid per channel,
// each with its own transport and worker-side pyramid name.
builder::PyramidFactory distributed_pyramid_factory(const fs::path& out_dir,
                                                    DistributedOptions dist,
                                                    TransportFactory make_transport);

} // namespace tile_pyramid::distributed
