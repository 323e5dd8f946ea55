#include "tile_pyramid/distributed/distributed_pyramid.hpp"
#include "tile_pyramid/core/errors.hpp"

#include <algorithm>
#include <iostream>

namespace tile_pyramid::distributed {

DistributedImagePyramid::DistributedImagePyramid(const fs::path& root,
                                                 const pyramid::PyramidOptions& options,
                                                 DistributedOptions dist,
                                                 std::unique_ptr<TileTransport> transport,
                                                 const io::MetadataDocument& acquisition)
    : pyramid::ImagePyramid(root, options, acquisition),
      dist_(std::move(dist)),
      transport_(std::move(transport)) {
    if (dist_.servers.empty()) {
        throw ValidationError("distributed pyramid needs at least one server");
    }
    if (dist_.repeats < 1) {
        throw ValidationError("repeats must be >= 1");
    }
    if (!transport_) {
        throw ValidationError("distributed pyramid needs a transport");
    }
    set_metadata_entry("Distributed.Servers", dist_.servers);
    set_metadata_entry("Distributed.PyramidName", dist_.pyramid_name);
}

int DistributedImagePyramid::server_for_tile(const TileXY& tile) const {
    return server_for_chunk(tile.x, tile.y, 0, dist_.chunk_shape,
                            static_cast<int>(dist_.servers.size()));
}

std::string DistributedImagePyramid::url_for_server(int server_idx) const {
    return "http://" + dist_.servers.at(static_cast<size_t>(server_idx)) + "/" + dist_.pyramid_name;
}

void DistributedImagePyramid::ingest_tile_slice(const pyramid::TileSlice& slice,
                                                const Matrix2Df& frame,
                                                const Matrix2Df& weights) {
    TileUpdatePayload payload;
    payload.tile = slice.tile;
    payload.tile_col = slice.tile_col;
    payload.tile_row = slice.tile_row;
    payload.frame = frame.block(slice.frame_row, slice.frame_col, slice.height, slice.width);
    payload.weights = weights.block(slice.frame_row, slice.frame_col, slice.height, slice.width);

    send_with_retry(HttpMethod::PUT, url_for_server(server_for_tile(slice.tile)),
                    encode_payload(payload));
}

void DistributedImagePyramid::update_pyramid() {
    const std::string body = metadata().to_json().dump();

    int depth = 0;
    for (int s = 0; s < static_cast<int>(dist_.servers.size()); ++s) {
        const std::string url = url_for_server(s) + "/update_pyramid";
        const TransportReply reply = send_with_retry(HttpMethod::POST, url, body);

        io::PyramidMetadata worker;
        try {
            worker = io::PyramidMetadata::from_document(
                io::MetadataDocument::from_json(io::json::parse(reply.body)));
        } catch (const io::json::exception& e) {
            throw NetworkError("POST " + url + " returned unreadable metadata: " + e.what());
        } catch (const MetadataError& e) {
            throw NetworkError("POST " + url + " returned incomplete metadata: " + e.what());
        }
        if (worker.tile_size != tile_size()) {
            throw ValidationError("server " + dist_.servers[static_cast<size_t>(s)] +
                                  " uses tile size " + std::to_string(worker.tile_size) +
                                  ", expected " + std::to_string(tile_size()));
        }

        std::cerr << "[DIST] " << dist_.servers[static_cast<size_t>(s)] << ": depth "
                  << worker.depth << ", " << worker.n_tiles_x << "x" << worker.n_tiles_y
                  << " tiles" << std::endl;
        depth = std::max(depth, worker.depth);
        grow_extent(worker.n_tiles_x - 1, worker.n_tiles_y - 1);
    }

    mark_finalized(depth);
    flush();
    save_metadata();
}

TransportReply DistributedImagePyramid::send_with_retry(HttpMethod method,
                                                        const std::string& url,
                                                        const std::string& body) {
    const std::string verb = method_to_string(method);
    for (int attempt = 1; attempt <= dist_.repeats; ++attempt) {
        ++requests_sent_;
        try {
            TransportReply reply = transport_->request(method, url, body, dist_.timeout_s);
            if (reply.status != 200) {
                throw NetworkError(verb + " " + url + " failed with status " +
                                   std::to_string(reply.status));
            }
            return reply;
        } catch (const TransportTimeout&) {
            ++timeouts_;
            if (attempt == dist_.repeats) {
                std::cerr << "[DIST] Error: timeout on " << verb << " " << url << " after "
                          << attempt << " attempts, aborting" << std::endl;
                throw DistributionTimeoutError(verb + " " + url + " after " +
                                               std::to_string(attempt) + " attempts");
            }
            std::cerr << "[DIST] Warning: timeout on " << verb << " " << url << " (attempt "
                      << attempt << "/" << dist_.repeats << "), retrying" << std::endl;
        }
    }
    throw DistributionTimeoutError(verb + " " + url);
}

std::string pyramid_name_for(const std::string& base_name, const fs::path& out_dir,
                             const fs::path& dir) {
    const fs::path rel = dir.lexically_normal().lexically_relative(out_dir.lexically_normal());
    if (rel.empty() || rel == ".") {
        return base_name;
    }
    std::string suffix;
    for (const fs::path& part : rel) {
        if (!suffix.empty()) suffix += "_";
        suffix += part.string();
    }
    return base_name + "_" + suffix;
}

builder::PyramidFactory distributed_pyramid_factory(const fs::path& out_dir,
                                                    DistributedOptions dist,
                                                    TransportFactory make_transport) {
    if (!make_transport) {
        throw ValidationError("distributed pyramid factory needs a transport factory");
    }
    return [out_dir, dist = std::move(dist), make_transport = std::move(make_transport)](
               const fs::path& dir, const pyramid::PyramidOptions& popts,
               const io::MetadataDocument& md) -> std::unique_ptr<pyramid::ImagePyramid> {
        DistributedOptions per_pyramid = dist;
        per_pyramid.pyramid_name = pyramid_name_for(dist.pyramid_name, out_dir, dir);
        return std::make_unique<DistributedImagePyramid>(dir, popts, std::move(per_pyramid),
                                                         make_transport(), md);
    };
}

} // namespace tile_pyramid::distributed
