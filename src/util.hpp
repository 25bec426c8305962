#pragma once
#include <string>
#include <cstdint>

namespace gptshell {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Random RFC 4122 version-4 UUID (lowercase, hyphenated)
std::string generate_uuid();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to path.tmp then rename over path. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

// Read a whole file. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

} // namespace gptshell
