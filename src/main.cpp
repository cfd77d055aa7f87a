#include "cli/parser.h"
#include "cli/commands/config_command.h"
#include "cli/commands/run_command.h"
#include "cli/commands/steps_command.h"
#include "core/config_manager.h"
#include "core/run_plan.h"
#include "core/output/output.h"
#include "core/output/console_output.h"
#include "core/output/json_output.h"
#include <monthclose/version.h>
#include <iostream>
#include <memory>

#ifdef _WIN32
#include <windows.h>
#endif

using namespace monthclose;

std::shared_ptr<core::output::IOutput> create_output(const cli::ParsedArgs& args) {
    if (args.core_options.json_output) {
        return std::make_shared<core::output::JsonOutput>(
            std::cout, std::cerr, args.core_options.verbose, args.core_options.quiet);
    }
    return std::make_shared<core::output::ConsoleOutput>(
        std::cout, std::cerr, args.core_options.verbose, args.core_options.quiet);
}

int main(int argc, char **argv)
{
#ifdef _WIN32
    // Enable ANSI escape sequences and UTF-8 on Windows 10+
    {
        HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
        if (hOut != INVALID_HANDLE_VALUE) {
            DWORD mode = 0;
            if (GetConsoleMode(hOut, &mode)) {
                SetConsoleMode(hOut, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
            }
        }
        SetConsoleOutputCP(CP_UTF8);
    }
#endif

    try
    {
        // Parse command line
        cli::CliParser parser;
        cli::ParsedArgs args;

        try
        {
            args = parser.parse(argc, argv);
        }
        catch (const CLI::ParseError &e)
        {
            auto output = create_output(args);
            output->error(e.what());
            output->info("Run 'monthclose --help' for usage information");
            return core::kExitConfigError;
        }

        // Create output based on args
        auto output = create_output(args);

        auto config_manager = args.core_options.config_dir
                                  ? std::make_shared<core::ConfigManager>(*args.core_options.config_dir)
                                  : std::make_shared<core::ConfigManager>();
        if (config_manager->exists() && !config_manager->load())
        {
            output->warning("Ignoring unreadable configuration file " +
                            config_manager->config_file().string());
        }

        // Route to appropriate command handler
        switch (args.command)
        {
        case cli::Command::Help:
            if (!parser.parse_exit_message().empty())
            {
                // CLI11 produced subcommand-specific help text
                std::cout << parser.parse_exit_message();
            }
            else
            {
                // No args at all: show top-level help
                std::cout << parser.help() << std::endl;
            }
            return 0;

        case cli::Command::Version:
            std::cout << "monthclose " << MONTHCLOSE_VERSION << std::endl;
            return 0;

        case cli::Command::Run:
        case cli::Command::Plan:
        {
            cli::commands::RunCommand cmd(config_manager, output);
            return cmd.execute(args);
        }

        case cli::Command::Steps:
        {
            cli::commands::StepsCommand cmd(config_manager, output);
            return cmd.execute(args);
        }

        case cli::Command::Config:
        {
            cli::commands::ConfigCommand cmd(config_manager, output);
            return cmd.execute(args);
        }

        default:
            std::cout << parser.help() << std::endl;
            return 0;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
