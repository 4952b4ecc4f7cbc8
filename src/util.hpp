#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <functional>

namespace vantage {

// Unix epoch milliseconds
uint64_t epoch_millis();

// Millisecond time source; injectable so TTL and cooldown logic can be tested
// without sleeping.
using Clock = std::function<uint64_t()>;

inline Clock system_clock() { return [] { return epoch_millis(); }; }

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Lowercase, trim and collapse whitespace runs to a single space
std::string normalize_text(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace vantage
