#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace monthclose::utils {

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Trim whitespace from both ends
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Parse a boolean setting ("true", "1", "yes", "on" / "false", "0", "no", "off")
std::optional<bool> parse_bool(const std::string& s);

// Format milliseconds as human-readable duration (e.g., "850 ms", "12.4 s", "3m 05s")
std::string format_duration(int64_t ms);

// Replace all occurrences of 'from' with 'to'
std::string replace_all(const std::string& s, const std::string& from, const std::string& to);

} // namespace monthclose::utils
