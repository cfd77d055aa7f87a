#pragma once

#include "cli/parser.h"
#include "core/config_manager.h"
#include "core/output/output.h"
#include <memory>

namespace monthclose::cli::commands {

// Config management command handler
class ConfigCommand {
public:
    ConfigCommand(std::shared_ptr<core::ConfigManager> config_manager,
                  std::shared_ptr<core::output::IOutput> output);

    // Execute config subcommand
    int execute(const ParsedArgs& args);

    // List all config settings
    int list(const ParsedArgs& args);

    // Get a config value
    int get(const ParsedArgs& args);

    // Set a config value
    int set(const ParsedArgs& args);

    // Unset a config value
    int unset(const ParsedArgs& args);

    // Add / remove a candidate storage root
    int add_root(const ParsedArgs& args);
    int remove_root(const ParsedArgs& args);

private:
    std::shared_ptr<core::ConfigManager> config_manager_;
    std::shared_ptr<core::output::IOutput> output_;

    int save_and_report(const ParsedArgs& args, const std::string& message, nlohmann::json j);
};

} // namespace monthclose::cli::commands
