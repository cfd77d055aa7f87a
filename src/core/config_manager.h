#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace monthclose::core {

// Configuration manager - handles persistent settings
// Stored in ~/.monthclose/config.json
class ConfigManager {
public:
    // Keys with a meaning of their own; everything else is a generic setting
    static const std::vector<std::string>& known_keys();

    // Default config directory
    static std::filesystem::path get_default_config_dir();

    // Constructor with default config directory
    ConfigManager();

    // Constructor with custom config directory
    explicit ConfigManager(const std::filesystem::path& config_dir);

    // Load configuration from disk
    bool load();

    // Save configuration to disk
    bool save() const;

    // Check if config file exists
    bool exists() const;

    const std::filesystem::path& config_file() const { return config_file_; }

    // --- Storage roots ---

    // Append a candidate base storage root (probed in insertion order)
    void add_storage_root(const std::filesystem::path& path);

    // Remove a candidate root
    bool remove_storage_root(const std::filesystem::path& path);

    const std::vector<std::filesystem::path>& get_storage_roots() const { return storage_roots_; }

    // --- Typed views of well-known keys ---

    // Working directory for step processes
    std::optional<std::filesystem::path> scripts_dir() const;

    // Interpreter for the built-in pipeline ("python3" when unset)
    std::string python() const;

    // Pipeline definition replacing the built-in one
    std::optional<std::filesystem::path> pipeline_file() const;

    // Whether executed steps go to the build log
    bool build_log() const;

    // --- Generic key-value settings ---

    // Set a string value
    void set(const std::string& key, const std::string& value);

    // Get a string value
    std::optional<std::string> get(const std::string& key) const;

    // Remove a setting
    bool unset(const std::string& key);

    // Get all settings as JSON
    nlohmann::json to_json() const;

    // List all keys
    std::vector<std::string> list_keys() const;

private:
    std::filesystem::path config_dir_;
    std::filesystem::path config_file_;

    // Candidate base storage roots
    std::vector<std::filesystem::path> storage_roots_;

    // Well-known keys and generic settings
    std::map<std::string, std::string> settings_;

    void ensure_dir() const;
};

} // namespace monthclose::core
