#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ffcc::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Math utilities
// Modulo with the sign of the divisor: result lies in [0, n).
float floor_mod(float x, float n);
// Round half to even.
float round_half_even(float x);
bool is_strictly_increasing(const std::vector<float>& values);

} // namespace ffcc::core
