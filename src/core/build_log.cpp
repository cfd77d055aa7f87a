#include "build_log.h"
#include "utils/file_utils.h"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace monthclose::core {

namespace {

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

} // anonymous namespace

BuildLog::BuildLog(std::filesystem::path path)
    : path_(std::move(path)) {
}

std::filesystem::path BuildLog::default_path(const std::filesystem::path& root) {
    return root / "_meta" / "_build_log.csv";
}

std::string BuildLog::format(const BuildRecord& record) {
    std::ostringstream oss;
    oss << iso_timestamp(record.timestamp) << ","
        << csv_field(record.period) << ","
        << csv_field(record.step) << ","
        << csv_field(record.status) << ","
        << record.exit_code << ","
        << std::fixed << std::setprecision(2) << record.elapsed_seconds;
    return oss.str();
}

bool BuildLog::append(const BuildRecord& record) const {
    if (path_.has_parent_path() && !utils::ensure_directory(path_.parent_path())) {
        return false;
    }

    std::error_code ec;
    bool is_new = !std::filesystem::exists(path_, ec) || std::filesystem::file_size(path_, ec) == 0;

    std::ofstream file(path_, std::ios::app);
    if (!file) {
        return false;
    }

    if (is_new) {
        file << kHeader << "\n";
    }
    file << format(record) << "\n";

    return static_cast<bool>(file);
}

} // namespace monthclose::core
