#pragma once

#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace tile_pyramid::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_frames(const fs::path& input_dir, const std::string& pattern = "*.fit*");
std::vector<uint8_t> read_bytes(const fs::path& path);
void write_bytes(const fs::path& path, const std::vector<uint8_t>& data);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
void ensure_parent_dir(const fs::path& path);
fs::path make_temp_dir(const std::string& prefix);

// String utilities
std::string to_lower(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);

// Glob pattern matching
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace tile_pyramid::core
