#pragma once
#include <string>
#include <cstdint>

namespace headgram {

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(std::string s);

// Case-insensitive ASCII equality
bool iequals(const std::string& a, const std::string& b);

// Local wall-clock "HH:MM" for a Unix epoch timestamp; "--:--" if out of range
std::string format_local_time(int64_t epoch_seconds);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename, creating parent directories as needed
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace headgram
