#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace monthclose::utils {

// Check if a path segment contains glob wildcards (*, ?, [...])
bool has_glob_chars(const std::string& segment);

// Convert a single glob segment into an equivalent regex pattern
std::string glob_to_regex(const std::string& segment);

// Error message for the first wildcard segment of pattern that does not
// compile (e.g. the reversed range in "[z-a]"), nullopt if all are valid
std::optional<std::string> glob_syntax_error(const std::string& pattern);

// Expand glob pattern to list of regular files. Wildcards may appear in any
// path segment; intermediate segments only match directories. Results are
// sorted and contain no duplicates.
std::vector<std::filesystem::path> expand_glob(const std::string& pattern);

// Check if path is a directory
bool is_directory(const std::filesystem::path& path);

// Ensure directory exists
bool ensure_directory(const std::filesystem::path& dir);

// Modification time, or nullopt if the file vanished or cannot be read
std::optional<std::filesystem::file_time_type> modification_time(const std::filesystem::path& path);

// Format a file time as local "YYYY-MM-DD HH:MM:SS"
std::string format_file_time(std::filesystem::file_time_type ft);

} // namespace monthclose::utils
