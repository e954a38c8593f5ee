#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace dct_redux::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_frames(const fs::path& input_dir, const std::string& pattern = "*.fits");
std::vector<uint8_t> read_bytes(const fs::path& path);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// Math utilities
float compute_median(const Matrix2Df& data);
float compute_median(const VectorXf& data);
float compute_mad(const Matrix2Df& data);
float compute_robust_sigma(const Matrix2Df& data);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& str, char delimiter);

// Glob pattern matching ('*' and '?' only)
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace dct_redux::core
