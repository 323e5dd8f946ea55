#include "tile_pyramid/config/configuration.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/utils.hpp"

#include <fstream>

namespace tile_pyramid::config {

static void read_int_triple(const YAML::Node& n, std::array<int, 3>& out) {
    if (n && n.IsSequence() && n.size() == 3) {
        out[0] = n[0].as<int>();
        out[1] = n[1].as<int>();
        out[2] = n[2].as<int>();
    }
}

StorageBackend parse_backend(const std::string& name) {
    std::string n = core::to_lower(name);
    if (!n.empty() && n[0] == '.') n.erase(0, 1);
    if (n == "tpz" || n == "block") return StorageBackend::BLOCK;
    if (n == "npy" || n == "numpy") return StorageBackend::NUMPY;
    if (n == "db" || n == "sqlite") return StorageBackend::SQLITE;
    throw StorageNotFoundError("unknown backend '" + name + "'");
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["pyramid"]) {
        auto p = node["pyramid"];
        if (p["tile_size"]) cfg.pyramid.tile_size = p["tile_size"].as<int>();
        if (p["backend"]) cfg.pyramid.backend = p["backend"].as<std::string>();
        if (p["cache_size"]) cfg.pyramid.cache_size = p["cache_size"].as<int>();
        if (p["occupancy_threshold"]) cfg.pyramid.occupancy_threshold = p["occupancy_threshold"].as<float>();
    }

    if (node["build"]) {
        auto b = node["build"];
        if (b["skip_move_frames"]) cfg.build.skip_move_frames = b["skip_move_frames"].as<bool>();
        if (b["correlate"]) cfg.build.correlate = b["correlate"].as<bool>();
        if (b["edge_ramp_px"]) cfg.build.edge_ramp_px = b["edge_ramp_px"].as<int>();
        if (b["edge_ramp_fraction"]) cfg.build.edge_ramp_fraction = b["edge_ramp_fraction"].as<float>();
        if (b["frame_pattern"]) cfg.build.frame_pattern = b["frame_pattern"].as<std::string>();
        if (b["data_starts_at"]) cfg.build.data_starts_at = b["data_starts_at"].as<int>();
    }

    if (node["distributed"]) {
        auto d = node["distributed"];
        if (d["enabled"]) cfg.distributed.enabled = d["enabled"].as<bool>();
        if (d["servers"] && d["servers"].IsSequence()) {
            cfg.distributed.servers.clear();
            for (const auto& s : d["servers"]) {
                cfg.distributed.servers.push_back(s.as<std::string>());
            }
        }
        read_int_triple(d["chunk_shape"], cfg.distributed.chunk_shape);
        if (d["timeout_s"]) cfg.distributed.timeout_s = d["timeout_s"].as<float>();
        if (d["repeats"]) cfg.distributed.repeats = d["repeats"].as<int>();
        if (d["pyramid_name"]) cfg.distributed.pyramid_name = d["pyramid_name"].as<std::string>();
    }

    if (node["server"]) {
        auto s = node["server"];
        if (s["bind"]) cfg.server.bind = s["bind"].as<std::string>();
        if (s["port"]) cfg.server.port = s["port"].as<int>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["pyramid"]["tile_size"] = pyramid.tile_size;
    node["pyramid"]["backend"] = pyramid.backend;
    node["pyramid"]["cache_size"] = pyramid.cache_size;
    node["pyramid"]["occupancy_threshold"] = pyramid.occupancy_threshold;

    node["build"]["skip_move_frames"] = build.skip_move_frames;
    node["build"]["correlate"] = build.correlate;
    node["build"]["edge_ramp_px"] = build.edge_ramp_px;
    node["build"]["edge_ramp_fraction"] = build.edge_ramp_fraction;
    node["build"]["frame_pattern"] = build.frame_pattern;
    node["build"]["data_starts_at"] = build.data_starts_at;

    node["distributed"]["enabled"] = distributed.enabled;
    node["distributed"]["servers"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& s : distributed.servers) {
        node["distributed"]["servers"].push_back(s);
    }
    for (int v : distributed.chunk_shape) {
        node["distributed"]["chunk_shape"].push_back(v);
    }
    node["distributed"]["timeout_s"] = distributed.timeout_s;
    node["distributed"]["repeats"] = distributed.repeats;
    node["distributed"]["pyramid_name"] = distributed.pyramid_name;

    node["server"]["bind"] = server.bind;
    node["server"]["port"] = server.port;

    return node;
}

void Config::validate() const {
    if (pyramid.tile_size < 2 || (pyramid.tile_size % 2) != 0) {
        throw ConfigError("pyramid.tile_size must be a positive even number");
    }
    if (pyramid.cache_size < 1) {
        throw ConfigError("pyramid.cache_size must be >= 1");
    }
    if (pyramid.occupancy_threshold < 0.0f) {
        throw ConfigError("pyramid.occupancy_threshold must be >= 0");
    }
    try {
        (void)parse_backend(pyramid.backend);
    } catch (const StorageNotFoundError&) {
        throw ConfigError("pyramid.backend must be one of tpz, npy, db");
    }

    if (build.edge_ramp_px < 0) {
        throw ConfigError("build.edge_ramp_px must be >= 0");
    }
    if (build.edge_ramp_fraction < 0.0f || build.edge_ramp_fraction > 0.5f) {
        throw ConfigError("build.edge_ramp_fraction must be in [0,0.5]");
    }

    for (int v : distributed.chunk_shape) {
        if (v < 1) {
            throw ConfigError("distributed.chunk_shape entries must be >= 1");
        }
    }
    if (distributed.repeats < 1) {
        throw ConfigError("distributed.repeats must be >= 1");
    }
    if (distributed.timeout_s <= 0.0f) {
        throw ConfigError("distributed.timeout_s must be > 0");
    }
    if (distributed.enabled && distributed.servers.empty()) {
        throw ConfigError("distributed.servers must not be empty when distribution is enabled");
    }
    if (distributed.pyramid_name.empty() ||
        distributed.pyramid_name.find('/') != std::string::npos) {
        throw ConfigError("distributed.pyramid_name must be a non-empty name without '/'");
    }

    if (server.port < 1 || server.port > 65535) {
        throw ConfigError("server.port must be in [1,65535]");
    }
}

} // namespace tile_pyramid::config
