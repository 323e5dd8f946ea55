#pragma once

#include "tile_pyramid/core/types.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace tile_pyramid::config {

namespace fs = std::filesystem;

struct PyramidConfig {
  int tile_size = 256;
  std::string backend = "tpz"; // tpz | npy | db
  int cache_size = 1000;       // entries per component cache
  float occupancy_threshold = 0.1f;
};

struct BuildConfig {
  bool skip_move_frames = false;
  bool correlate = false;       // pad the pyramid origin by 300 px
  int edge_ramp_px = 100;
  float edge_ramp_fraction = 0.25f;
  std::string frame_pattern = "*.fit*";
  int data_starts_at = -1;      // -1 = Protocol.DataStartsAt from metadata
};

struct DistributedConfig {
  bool enabled = false;
  std::vector<std::string> servers; // host:port
  std::array<int, 3> chunk_shape{8, 8, 1};
  float timeout_s = 10.0f;
  int repeats = 3;
  std::string pyramid_name = "pyramid";
};

struct ServerConfig {
  std::string bind = "0.0.0.0";
  int port = 8080;
};

struct Config {
  PyramidConfig pyramid;
  BuildConfig build;
  DistributedConfig distributed;
  ServerConfig server;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

StorageBackend parse_backend(const std::string &name);

} // namespace tile_pyramid::config
