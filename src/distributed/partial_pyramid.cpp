#include "tile_pyramid/distributed/partial_pyramid.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/utils.hpp"

#include <iostream>

namespace tile_pyramid::distributed {

std::unique_ptr<PartialPyramid> PartialPyramid::load_existing(const fs::path& root,
                                                              size_t cache_size) {
    io::MetadataDocument doc = io::MetadataDocument::load(root / io::kMetadataFilename);
    return std::make_unique<PartialPyramid>(root, doc, cache_size);
}

void PartialPyramid::apply_update_request(const std::string& body) {
    apply_update(decode_payload(body));
}

void PartialPyramid::apply_update(const TileUpdatePayload& payload) {
    const pyramid::TileSlice slice = payload.slice();
    if (slice.tile_col < 0 || slice.tile_row < 0 ||
        slice.tile_col + slice.width > tile_size() ||
        slice.tile_row + slice.height > tile_size()) {
        throw ValidationError("slice at offset (" + std::to_string(slice.tile_col) + ", " +
                              std::to_string(slice.tile_row) + ") does not fit a " +
                              std::to_string(tile_size()) + " px tile");
    }

    grow_extent(slice.tile.x, slice.tile.y);
    apply_tile_update(slice, payload.frame, payload.weights);
    mark_invalid();
    ++updates_applied_;
}

void PartialPyramid::adopt_client_metadata(const io::MetadataDocument& client) {
    const int client_tile_size = client.get_or<int>("Pyramid.TileSize", tile_size());
    if (client_tile_size != tile_size()) {
        throw ValidationError("client tile size " + std::to_string(client_tile_size) +
                              " does not match worker tile size " +
                              std::to_string(tile_size()));
    }

    set_placement(client.get_or<double>("Pyramid.x0", x0()),
                  client.get_or<double>("Pyramid.y0", y0()),
                  client.get_or<double>("Pyramid.PixelSize", pixel_size()));

    for (const auto& [key, value] : client.entries()) {
        if (!core::starts_with(key, "Pyramid.")) {
            set_metadata_entry(key, value);
        }
    }
}

TileUpdateService::TileUpdateService(PartialPyramid& pyramid, std::string name)
    : pyramid_(pyramid), name_(std::move(name)) {}

ServiceResponse TileUpdateService::handle_put(const std::string& name, const std::string& body) {
    if (name != name_) {
        return {404, "unknown pyramid '" + name + "'"};
    }
    try {
        pyramid_.apply_update_request(body);
    } catch (const ValidationError& e) {
        std::cerr << "[SERVER] Rejected update: " << e.what() << std::endl;
        return {400, e.what()};
    } catch (const std::exception& e) {
        std::cerr << "[SERVER] Error: " << e.what() << std::endl;
        return {500, e.what()};
    }
    return {200, "OK"};
}

ServiceResponse TileUpdateService::handle_update_pyramid(const std::string& name,
                                                         const std::string& body) {
    if (name != name_) {
        return {404, "unknown pyramid '" + name + "'"};
    }
    if (!body.empty()) {
        try {
            pyramid_.adopt_client_metadata(io::MetadataDocument::from_json(io::json::parse(body)));
        } catch (const io::json::exception& e) {
            std::cerr << "[SERVER] Rejected finalize: " << e.what() << std::endl;
            return {400, e.what()};
        } catch (const ValidationError& e) {
            std::cerr << "[SERVER] Rejected finalize: " << e.what() << std::endl;
            return {400, e.what()};
        } catch (const MetadataError& e) {
            std::cerr << "[SERVER] Rejected finalize: " << e.what() << std::endl;
            return {400, e.what()};
        }
    }
    try {
        pyramid_.update_pyramid();
    } catch (const std::exception& e) {
        std::cerr << "[SERVER] Error: " << e.what() << std::endl;
        return {500, e.what()};
    }
    std::cerr << "[SERVER] Pyramid '" << name_ << "' rebuilt, depth " << pyramid_.depth()
              << std::endl;
    return {200, pyramid_.metadata().to_json().dump()};
}

} // namespace tile_pyramid::distributed
