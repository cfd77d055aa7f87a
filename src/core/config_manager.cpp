#include "config_manager.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iomanip>

#ifdef _WIN32
#include <windows.h>
#include <shlobj.h>
#else
#include <unistd.h>
#include <pwd.h>
#endif

namespace monthclose::core {

namespace {

std::filesystem::path get_home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) {
        const char* drive = std::getenv("HOMEDRIVE");
        const char* path = std::getenv("HOMEPATH");
        if (drive && path) {
            return std::filesystem::path(drive) / path;
        }
    }
    if (home) {
        return std::filesystem::path(home);
    }
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_PROFILE, NULL, 0, path))) {
        return std::filesystem::path(path);
    }
#else
    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home);
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::filesystem::path(pw->pw_dir);
    }
#endif
    return std::filesystem::path();
}

bool is_known_key(const std::string& key) {
    const auto& keys = ConfigManager::known_keys();
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

} // anonymous namespace

const std::vector<std::string>& ConfigManager::known_keys() {
    static const std::vector<std::string> keys = {
        "build_log", "pipeline_file", "python", "scripts_dir"
    };
    return keys;
}

std::filesystem::path ConfigManager::get_default_config_dir() {
    auto home = get_home_dir();
    if (home.empty()) {
        return std::filesystem::path();
    }
    return home / ".monthclose";
}

ConfigManager::ConfigManager()
    : config_dir_(get_default_config_dir())
    , config_file_(config_dir_ / "config.json") {
}

ConfigManager::ConfigManager(const std::filesystem::path& config_dir)
    : config_dir_(config_dir)
    , config_file_(config_dir / "config.json") {
}

void ConfigManager::ensure_dir() const {
    if (!std::filesystem::exists(config_dir_)) {
        std::filesystem::create_directories(config_dir_);
    }
}

bool ConfigManager::exists() const {
    std::error_code ec;
    return std::filesystem::exists(config_file_, ec);
}

bool ConfigManager::load() {
    if (!exists()) {
        return false;
    }

    try {
        std::ifstream file(config_file_);
        if (!file) {
            return false;
        }

        nlohmann::json j;
        file >> j;

        storage_roots_.clear();
        settings_.clear();

        // Load storage roots
        if (j.contains("storage_roots") && j["storage_roots"].is_array()) {
            for (const auto& path : j["storage_roots"]) {
                if (path.is_string()) {
                    storage_roots_.emplace_back(path.get<std::string>());
                }
            }
        }

        // Load well-known keys
        for (const auto& key : known_keys()) {
            if (!j.contains(key)) continue;
            if (j[key].is_string()) {
                settings_[key] = j[key].get<std::string>();
            } else if (j[key].is_boolean()) {
                settings_[key] = j[key].get<bool>() ? "true" : "false";
            }
        }

        // Load generic settings
        if (j.contains("settings") && j["settings"].is_object()) {
            for (auto& [key, value] : j["settings"].items()) {
                if (value.is_string()) {
                    settings_[key] = value.get<std::string>();
                }
            }
        }

        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ConfigManager::save() const {
    try {
        ensure_dir();

        std::ofstream file(config_file_);
        if (!file) {
            return false;
        }

        file << std::setw(2) << to_json() << std::endl;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void ConfigManager::add_storage_root(const std::filesystem::path& path) {
    // Avoid duplicates
    if (std::find(storage_roots_.begin(), storage_roots_.end(), path) == storage_roots_.end()) {
        storage_roots_.push_back(path);
    }
}

bool ConfigManager::remove_storage_root(const std::filesystem::path& path) {
    auto it = std::find(storage_roots_.begin(), storage_roots_.end(), path);
    if (it != storage_roots_.end()) {
        storage_roots_.erase(it);
        return true;
    }
    return false;
}

std::optional<std::filesystem::path> ConfigManager::scripts_dir() const {
    auto value = get("scripts_dir");
    if (!value || value->empty()) {
        return std::nullopt;
    }
    return std::filesystem::path(*value);
}

std::string ConfigManager::python() const {
    auto value = get("python");
    if (!value || value->empty()) {
        return "python3";
    }
    return *value;
}

std::optional<std::filesystem::path> ConfigManager::pipeline_file() const {
    auto value = get("pipeline_file");
    if (!value || value->empty()) {
        return std::nullopt;
    }
    return std::filesystem::path(*value);
}

bool ConfigManager::build_log() const {
    auto value = get("build_log");
    if (!value) {
        return false;
    }
    return utils::parse_bool(*value).value_or(false);
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    settings_[key] = value;
}

std::optional<std::string> ConfigManager::get(const std::string& key) const {
    auto it = settings_.find(key);
    if (it != settings_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool ConfigManager::unset(const std::string& key) {
    return settings_.erase(key) > 0;
}

nlohmann::json ConfigManager::to_json() const {
    nlohmann::json j;

    j["storage_roots"] = nlohmann::json::array();
    for (const auto& path : storage_roots_) {
        j["storage_roots"].push_back(path.string());
    }

    j["settings"] = nlohmann::json::object();
    for (const auto& [key, value] : settings_) {
        if (key == "build_log") {
            j[key] = build_log();
        } else if (is_known_key(key)) {
            j[key] = value;
        } else {
            j["settings"][key] = value;
        }
    }

    return j;
}

std::vector<std::string> ConfigManager::list_keys() const {
    std::vector<std::string> keys;
    for (const auto& [key, _] : settings_) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace monthclose::core
