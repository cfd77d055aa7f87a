#include "parser.h"
#include <monthclose/version.h>
#include <sstream>

namespace monthclose::cli {

namespace {

const char* kDescription = "monthclose - Incremental month-end closing pipeline runner";

} // anonymous namespace

CliParser::CliParser() = default;

ParsedArgs CliParser::parse(int argc, char** argv) {
    ParsedArgs args;
    exit_message_.clear();

    CLI::App app{kDescription};
    app.set_version_flag("-v,--version", MONTHCLOSE_VERSION);
    app.set_help_flag("-h,--help", "Show help");

    setup_main_options(app, args);
    setup_subcommands(app, args);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        if (e.get_exit_code() == 0) {
            // Help or version was requested, possibly on a subcommand
            std::ostringstream out, err;
            app.exit(e, out, err);
            exit_message_ = out.str();
            args.command = dynamic_cast<const CLI::CallForVersion*>(&e) ? Command::Version
                                                                        : Command::Help;
        } else {
            throw;
        }
    }

    return args;
}

std::string CliParser::help() {
    CLI::App app{kDescription};
    ParsedArgs dummy;
    setup_main_options(app, dummy);
    setup_subcommands(app, dummy);
    return app.help();
}

void CliParser::setup_main_options(CLI::App& app, ParsedArgs& args) {
    // Storage and pipeline selection
    app.add_option("--root", args.core_options.root,
                   "Base storage root (replaces the candidate list)");
    app.add_option("--pipeline", args.core_options.pipeline_file,
                   "JSON pipeline definition replacing the built-in steps");
    app.add_option("--config-dir", args.core_options.config_dir,
                   "Configuration directory (default: ~/.monthclose)");

    // Flags
    app.add_flag("--build-log", args.core_options.build_log,
                 "Append executed steps to <root>/_meta/_build_log.csv");
    app.add_flag("--json", args.core_options.json_output, "Output as JSON");
    app.add_flag("--verbose", args.core_options.verbose, "Verbose output (echo step output)");
    app.add_flag("--quiet", args.core_options.quiet, "Suppress output");
}

void CliParser::setup_period_options(CLI::App& cmd, ParsedArgs& args) {
    cmd.add_option("-y,--year", args.year, "Year (YYYY)")
        ->required()
        ->check(CLI::Range(1901, 9999));
    cmd.add_option("-m,--month", args.month, "Month (1-12)")
        ->required()
        ->check(CLI::Range(1, 12));

    auto* step_opt = cmd.add_option("-s,--step", args.step, "Run only this step");
    auto* start_opt = cmd.add_option("--start-from", args.start_from,
                                     "Skip every step before this one");

    // Mutually exclusive
    step_opt->excludes(start_opt);
    start_opt->excludes(step_opt);

    cmd.add_flag("-f,--force", args.force, "Treat every evaluated step as stale");

    // Global options are accepted after the subcommand too
    cmd.fallthrough();
}

void CliParser::setup_subcommands(CLI::App& app, ParsedArgs& args) {
    // Run command
    auto* run_cmd = app.add_subcommand("run", "Run the pipeline for a period");
    setup_period_options(*run_cmd, args);
    run_cmd->add_flag("--dry-run", args.dry_run, "Show the plan without running anything");
    run_cmd->add_option("--confirm", args.confirm,
                        "Record that this manual step was completed, then run");
    run_cmd->callback([&args]() { args.command = Command::Run; });

    // Plan command (alias of run --dry-run)
    auto* plan_cmd = app.add_subcommand("plan", "Show which steps would run for a period");
    setup_period_options(*plan_cmd, args);
    plan_cmd->callback([&args]() {
        args.command = Command::Plan;
        args.dry_run = true;
    });

    // Steps command
    auto* steps_cmd = app.add_subcommand("steps", "List the pipeline steps");
    steps_cmd->fallthrough();
    steps_cmd->callback([&args]() { args.command = Command::Steps; });

    // Config command
    auto* config_cmd = app.add_subcommand("config", "Manage configuration");
    config_cmd->require_subcommand(1);
    config_cmd->fallthrough();

    auto* config_get = config_cmd->add_subcommand("get", "Get config value");
    config_get->add_option("key", args.subcommand, "Config key")->required();
    config_get->callback([&args]() {
        args.command = Command::Config;
        args.subcommand_args.insert(args.subcommand_args.begin(), "get");
    });

    auto* config_set = config_cmd->add_subcommand("set", "Set config value");
    config_set->add_option("key", args.subcommand, "Config key")->required();
    config_set->add_option("value", args.subcommand_args, "Config value")->required();
    config_set->callback([&args]() {
        args.command = Command::Config;
        args.subcommand_args.insert(args.subcommand_args.begin(), "set");
    });

    auto* config_unset = config_cmd->add_subcommand("unset", "Remove config value");
    config_unset->add_option("key", args.subcommand, "Config key")->required();
    config_unset->callback([&args]() {
        args.command = Command::Config;
        args.subcommand_args.insert(args.subcommand_args.begin(), "unset");
    });

    auto* config_add_root = config_cmd->add_subcommand("add-root", "Add a candidate storage root");
    config_add_root->add_option("dir", args.subcommand, "Directory")->required();
    config_add_root->callback([&args]() {
        args.command = Command::Config;
        args.subcommand_args.insert(args.subcommand_args.begin(), "add-root");
    });

    auto* config_remove_root = config_cmd->add_subcommand("remove-root", "Remove a candidate storage root");
    config_remove_root->add_option("dir", args.subcommand, "Directory")->required();
    config_remove_root->callback([&args]() {
        args.command = Command::Config;
        args.subcommand_args.insert(args.subcommand_args.begin(), "remove-root");
    });

    auto* config_list = config_cmd->add_subcommand("list", "List all config");
    config_list->callback([&args]() {
        args.command = Command::Config;
        args.subcommand_args.insert(args.subcommand_args.begin(), "list");
    });
}

} // namespace monthclose::cli
