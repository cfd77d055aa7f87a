#include "file_utils.h"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace monthclose::utils {

namespace {

// Match the entries of dir against one glob segment
std::vector<std::filesystem::path> match_segment(const std::filesystem::path& dir,
                                                 const std::string& segment,
                                                 bool want_directories) {
    std::vector<std::filesystem::path> matches;

    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return matches;
    }

    std::regex re(glob_to_regex(segment), std::regex::icase);

    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return matches;
    }

    for (const auto& entry : it) {
        std::error_code type_ec;
        bool ok = want_directories ? entry.is_directory(type_ec)
                                   : entry.is_regular_file(type_ec);
        if (!ok || type_ec) {
            continue;
        }
        auto name = entry.path().filename().string();
        if (std::regex_match(name, re)) {
            matches.push_back(entry.path());
        }
    }

    return matches;
}

std::chrono::system_clock::time_point to_system_time(std::filesystem::file_time_type ft) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ft - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
}

} // anonymous namespace

bool has_glob_chars(const std::string& segment) {
    return segment.find_first_of("*?[") != std::string::npos;
}

std::string glob_to_regex(const std::string& segment) {
    std::string regex_pattern;
    bool in_bracket = false;

    for (size_t i = 0; i < segment.size(); ++i) {
        char c = segment[i];

        if (in_bracket) {
            if (c == ']') {
                in_bracket = false;
                regex_pattern += ']';
            } else if (c == '\\') {
                regex_pattern += "\\\\";
            } else {
                regex_pattern += c;
            }
            continue;
        }

        switch (c) {
            case '*': regex_pattern += ".*"; break;
            case '?': regex_pattern += "."; break;
            case '[':
                // Unterminated bracket is a literal '['
                if (segment.find(']', i + 1) == std::string::npos) {
                    regex_pattern += "\\[";
                    break;
                }
                in_bracket = true;
                regex_pattern += '[';
                if (i + 1 < segment.size() && segment[i + 1] == '!') {
                    regex_pattern += '^';
                    ++i;
                }
                break;
            case '.': case '(': case ')': case '+': case '{': case '}':
            case '^': case '$': case '|': case '\\': case ']':
                regex_pattern += '\\';
                regex_pattern += c;
                break;
            default:
                regex_pattern += c;
        }
    }

    return regex_pattern;
}

std::optional<std::string> glob_syntax_error(const std::string& pattern) {
    for (const auto& part : std::filesystem::path(pattern)) {
        auto segment = part.string();
        if (!has_glob_chars(segment)) {
            continue;
        }
        try {
            std::regex re(glob_to_regex(segment), std::regex::icase);
        } catch (const std::regex_error& e) {
            return "invalid wildcard segment '" + segment + "': " + e.what();
        }
    }
    return std::nullopt;
}

std::vector<std::filesystem::path> expand_glob(const std::string& pattern) {
    std::vector<std::filesystem::path> results;
    if (pattern.empty()) {
        return results;
    }

    std::filesystem::path p(pattern);

    // Fast path: no wildcards at all
    if (!has_glob_chars(pattern)) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(p, ec)) {
            results.push_back(p);
        }
        return results;
    }

    std::vector<std::string> segments;
    for (const auto& part : p.relative_path()) {
        auto s = part.string();
        if (!s.empty()) {
            segments.push_back(s);
        }
    }

    std::vector<std::filesystem::path> frontier;
    frontier.push_back(p.has_root_path() ? p.root_path() : std::filesystem::path("."));

    for (size_t i = 0; i < segments.size() && !frontier.empty(); ++i) {
        const auto& segment = segments[i];
        bool last = (i + 1 == segments.size());
        std::vector<std::filesystem::path> next;

        for (const auto& base : frontier) {
            if (!has_glob_chars(segment)) {
                auto candidate = base / segment;
                std::error_code ec;
                bool ok = last ? std::filesystem::is_regular_file(candidate, ec)
                               : std::filesystem::is_directory(candidate, ec);
                if (ok) {
                    next.push_back(candidate);
                }
                continue;
            }

            auto matches = match_segment(base, segment, !last);
            next.insert(next.end(), matches.begin(), matches.end());
        }

        frontier = std::move(next);
    }

    results = std::move(frontier);

    // Relative patterns were walked from "."; strip it back off
    if (!p.has_root_path()) {
        for (auto& r : results) {
            r = r.lexically_relative(".");
        }
    }

    std::sort(results.begin(), results.end());
    results.erase(std::unique(results.begin(), results.end()), results.end());
    return results;
}

bool is_directory(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec) && std::filesystem::is_directory(path, ec);
}

bool ensure_directory(const std::filesystem::path& dir) {
    if (dir.empty()) return true;
    std::error_code ec;
    if (std::filesystem::exists(dir, ec)) {
        return std::filesystem::is_directory(dir, ec);
    }
    std::filesystem::create_directories(dir, ec);
    return !ec;
}

std::optional<std::filesystem::file_time_type> modification_time(const std::filesystem::path& path) {
    std::error_code ec;
    auto ft = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return ft;
}

std::string format_file_time(std::filesystem::file_time_type ft) {
    auto tt = std::chrono::system_clock::to_time_t(to_system_time(ft));
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace monthclose::utils
