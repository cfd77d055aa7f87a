#pragma once

#include "core/types.h"
#include <CLI/CLI.hpp>
#include <optional>
#include <string>
#include <vector>

namespace monthclose::cli {

// Parsed command type
enum class Command {
    Run,           // monthclose run -y Y -m M [...]
    Plan,          // monthclose plan -y Y -m M [...] (run --dry-run)
    Steps,         // monthclose steps
    Config,        // monthclose config <subcommand>
    Help,          // Show help
    Version        // Show version
};

// Parsed arguments structure
struct ParsedArgs {
    Command command = Command::Help;

    // Period
    int year = 0;
    int month = 0;

    // Run intent
    std::string step;                      // --step
    std::string start_from;                // --start-from
    std::string confirm;                   // --confirm: manual step completed by the operator
    bool force = false;
    bool dry_run = false;

    // Core options
    core::CoreOptions core_options;

    // Subcommand specific
    std::string subcommand;                // Key / directory for config
    std::vector<std::string> subcommand_args;

    // Build the run intent from --step / --start-from / --force / --dry-run
    core::RunIntent intent() const {
        core::RunIntent result;
        if (!step.empty()) {
            result = core::RunIntent::single(step, force);
        } else if (!start_from.empty()) {
            result = core::RunIntent::start_from(start_from, force);
        } else {
            result = core::RunIntent::full(force);
        }
        result.dry_run = dry_run || command == Command::Plan;
        return result;
    }
};

class CliParser {
public:
    CliParser();
    ~CliParser() = default;

    // Parse command line arguments. Throws CLI::ParseError for invalid input.
    ParsedArgs parse(int argc, char** argv);

    // Get help text
    std::string help();

    // Help or version text produced while parsing (-h on a subcommand, -v)
    const std::string& parse_exit_message() const { return exit_message_; }

private:
    std::string exit_message_;

    void setup_main_options(CLI::App& app, ParsedArgs& args);
    void setup_period_options(CLI::App& cmd, ParsedArgs& args);
    void setup_subcommands(CLI::App& app, ParsedArgs& args);
};

} // namespace monthclose::cli
