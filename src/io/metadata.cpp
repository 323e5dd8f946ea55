#include "tile_pyramid/io/metadata.hpp"
#include "tile_pyramid/config/configuration.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/utils.hpp"

namespace tile_pyramid::io {

namespace {

void flatten_into(const json& j, const std::string& prefix, std::map<std::string, json>& out) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        if (it->is_object()) {
            flatten_into(*it, key, out);
        } else {
            out[key] = *it;
        }
    }
}

} // namespace

MetadataDocument MetadataDocument::from_json(const json& j) {
    if (!j.is_object()) {
        throw MetadataError("metadata document must be a JSON object");
    }
    MetadataDocument doc;
    flatten_into(j, "", doc.entries_);
    return doc;
}

MetadataDocument MetadataDocument::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw MetadataError("file not found: " + path.string());
    }
    try {
        return from_json(json::parse(core::read_text(path)));
    } catch (const json::parse_error& e) {
        throw MetadataError("cannot parse " + path.string() + ": " + e.what());
    }
}

json MetadataDocument::to_json() const {
    json j = json::object();
    for (const auto& [key, value] : entries_) {
        j[key] = value;
    }
    return j;
}

void MetadataDocument::save(const fs::path& path) const {
    core::ensure_parent_dir(path);
    core::write_text(path, to_json().dump(2) + "\n");
}

bool MetadataDocument::has(const std::string& key) const {
    return entries_.count(key) > 0;
}

void MetadataDocument::set(const std::string& key, const json& value) {
    entries_[key] = value;
}

void MetadataDocument::erase(const std::string& key) {
    entries_.erase(key);
}

const json& MetadataDocument::get(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        throw MetadataError("missing field " + key);
    }
    return it->second;
}

void MetadataDocument::throw_bad_type(const std::string& key, const std::string& what) {
    throw MetadataError("field " + key + " has wrong type: " + what);
}

PyramidMetadata PyramidMetadata::from_document(const MetadataDocument& doc) {
    PyramidMetadata md;
    md.tile_size = doc.get_as<int>("Pyramid.TileSize");
    md.depth = doc.get_as<int>("Pyramid.Depth");
    md.n_tiles_x = doc.get_as<int>("Pyramid.NTilesX");
    md.n_tiles_y = doc.get_as<int>("Pyramid.NTilesY");
    md.x0 = doc.get_as<double>("Pyramid.x0");
    md.y0 = doc.get_as<double>("Pyramid.y0");
    md.pixel_size = doc.get_as<double>("Pyramid.PixelSize");

    if (doc.has("Pyramid.Backend")) {
        try {
            md.backend = config::parse_backend(doc.get_as<std::string>("Pyramid.Backend"));
        } catch (const StorageNotFoundError& e) {
            throw MetadataError(std::string("Pyramid.Backend: ") + e.what());
        }
    }

    if (md.tile_size <= 0) {
        throw MetadataError("Pyramid.TileSize must be positive");
    }
    return md;
}

void PyramidMetadata::write_to(MetadataDocument& doc) const {
    doc.set("Pyramid.TileSize", tile_size);
    doc.set("Pyramid.Depth", depth);
    doc.set("Pyramid.NTilesX", n_tiles_x);
    doc.set("Pyramid.NTilesY", n_tiles_y);
    doc.set("Pyramid.PixelsX", pixels_x());
    doc.set("Pyramid.PixelsY", pixels_y());
    doc.set("Pyramid.x0", x0);
    doc.set("Pyramid.y0", y0);
    doc.set("Pyramid.PixelSize", pixel_size);
    if (backend) {
        doc.set("Pyramid.Backend", backend_to_string(*backend));
    } else {
        doc.erase("Pyramid.Backend");
    }
}

} // namespace tile_pyramid::io
