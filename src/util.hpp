#pragma once
#include <string>

namespace eventseq {

// ISO 8601 timestamp
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Canonical form of an event description for cache keys: trimmed, lower-cased.
std::string normalize_text(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Creates the parent directory when missing. Returns false on I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Fixed-point rendering, e.g. format_fixed(0.12345, 3) == "0.123"
std::string format_fixed(double value, int precision);

} // namespace eventseq
