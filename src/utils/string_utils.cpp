#include "string_utils.h"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace monthclose::utils {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(),
                                   [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream stream(s);
    std::string part;
    while (std::getline(stream, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";

    std::ostringstream result;
    result << parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        result << delimiter << parts[i];
    }
    return result.str();
}

std::optional<bool> parse_bool(const std::string& s) {
    auto value = to_lower(trim(s));
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    return std::nullopt;
}

std::string format_duration(int64_t ms) {
    std::ostringstream ss;
    if (ms < 1000) {
        ss << ms << " ms";
    } else if (ms < 60 * 1000) {
        ss << std::fixed << std::setprecision(1) << (static_cast<double>(ms) / 1000.0) << " s";
    } else {
        int64_t total_seconds = ms / 1000;
        ss << (total_seconds / 60) << "m "
           << std::setw(2) << std::setfill('0') << (total_seconds % 60) << "s";
    }
    return ss.str();
}

std::string replace_all(const std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;

    std::string result = s;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }
    return result;
}

} // namespace monthclose::utils
