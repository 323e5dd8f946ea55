#pragma once

#include "tile_pyramid/distributed/tile_payload.hpp"
#include "tile_pyramid/pyramid/image_pyramid.hpp"

#include <string>

namespace tile_pyramid::distributed {

// Worker-side pyramid holding the level-0 tiles shipped to this server.
class PartialPyramid : public pyramid::ImagePyramid {
public:
    using pyramid::ImagePyramid::ImagePyramid;

    static std::unique_ptr<PartialPyramid> load_existing(
        const fs::path& root, size_t cache_size = storage::TileCache::kDefaultMaxSize);

    // Decodes a PUT body and adds it to the addressed tile.
    // Throws ValidationError when the body is malformed or does not fit.
    virtual void apply_update_request(const std::string& body);
    void apply_update(const TileUpdatePayload& payload);

    // Takes over the physical placement (Pyramid.x0, Pyramid.y0,
    // Pyramid.PixelSize) and the acquisition entries of the client's
    // metadata. Tile layout keys stay local. A different Pyramid.TileSize is
    // a ValidationError.
    void adopt_client_metadata(const io::MetadataDocument& client);

    int updates_applied() const { return updates_applied_; }

private:
    int updates_applied_ = 0;
};

struct ServiceResponse {
    int status = 200;
    std::string body;
};

/**
 * HTTP-agnostic request handling for a worker. Routes:
 *   PUT  /<name>                 tile update
 *   POST /<name>/update_pyramid  finalize and return metadata JSON; an
 *                                optional body carries the client metadata
 * Responses: 200 ok, 400 malformed payload, 404 unknown pyramid name,
 * 500 storage failure.
 */
class TileUpdateService {
public:
    TileUpdateService(PartialPyramid& pyramid, std::string name);

    ServiceResponse handle_put(const std::string& name, const std::string& body);
    ServiceResponse handle_update_pyramid(const std::string& name, const std::string& body = {});

    const std::string& name() const { return name_; }
    PartialPyramid& pyramid() { return pyramid_; }

private:
    PartialPyramid& pyramid_;
    std::string name_;
};

} // namespace tile_pyramid::distributed
