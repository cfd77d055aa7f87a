#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace monthclose::core {

// One executed step, as recorded in the audit log
struct BuildRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string period;          // "2024-10"
    std::string step;
    std::string status;          // "succeeded", "failed"
    int exit_code = 0;
    double elapsed_seconds = 0.0;
};

// Append-only CSV audit trail of executed steps. Never read back.
class BuildLog {
public:
    static constexpr const char* kHeader = "timestamp,period,step,status,exit_code,elapsed_seconds";

    explicit BuildLog(std::filesystem::path path);

    // <root>/_meta/_build_log.csv
    static std::filesystem::path default_path(const std::filesystem::path& root);

    const std::filesystem::path& path() const { return path_; }

    // Creates the directory and header on first use. Returns false if the
    // file could not be written.
    bool append(const BuildRecord& record) const;

    // CSV line for a record, without trailing newline
    static std::string format(const BuildRecord& record);

private:
    std::filesystem::path path_;
};

} // namespace monthclose::core
