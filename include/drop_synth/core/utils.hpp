#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace drop_synth::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_images(const fs::path& input_dir);
bool is_image_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);

} // namespace drop_synth::core
