#pragma once

#include "tile_pyramid/core/types.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace tile_pyramid::io {

using json = nlohmann::json;

/**
 * Key-value metadata with dotted keys ("Camera.ADOffset", "Pyramid.Depth").
 *
 * Stored flat. Nested JSON objects are flattened on read, so
 * {"Pyramid": {"Depth": 3}} and {"Pyramid.Depth": 3} are equivalent.
 */
class MetadataDocument {
public:
    MetadataDocument() = default;

    static MetadataDocument from_json(const json& j);
    static MetadataDocument load(const fs::path& path);

    json to_json() const;
    void save(const fs::path& path) const;

    bool has(const std::string& key) const;
    void set(const std::string& key, const json& value);
    void erase(const std::string& key);

    // Raw value; throws MetadataError when the key is absent.
    const json& get(const std::string& key) const;

    template <typename T>
    T get_as(const std::string& key) const {
        const json& v = get(key);
        try {
            return v.get<T>();
        } catch (const json::exception& e) {
            throw_bad_type(key, e.what());
        }
    }

    template <typename T>
    T get_or(const std::string& key, const T& fallback) const {
        if (!has(key)) return fallback;
        return get_as<T>(key);
    }

    const std::map<std::string, json>& entries() const { return entries_; }

private:
    [[noreturn]] static void throw_bad_type(const std::string& key, const std::string& what);

    std::map<std::string, json> entries_;
};

constexpr const char* kMetadataFilename = "metadata.json";

// The Pyramid.* block of the metadata document.
struct PyramidMetadata {
    int tile_size = 256;
    int depth = 0;
    int n_tiles_x = 0;
    int n_tiles_y = 0;
    double x0 = 0.0;
    double y0 = 0.0;
    double pixel_size = 1.0;
    std::optional<StorageBackend> backend;

    int pixels_x() const { return n_tiles_x * tile_size; }
    int pixels_y() const { return n_tiles_y * tile_size; }

    // Throws MetadataError naming the first missing required field.
    static PyramidMetadata from_document(const MetadataDocument& doc);
    void write_to(MetadataDocument& doc) const;
};

} // namespace tile_pyramid::io
