#include <gtest/gtest.h>
#include "cli/parser.h"
#include <string>
#include <vector>

using namespace monthclose::cli;
using namespace monthclose::core;

namespace {

ParsedArgs parse(CliParser& parser, std::vector<std::string> words) {
    words.insert(words.begin(), "monthclose");
    std::vector<char*> argv;
    for (auto& w : words) {
        argv.push_back(w.data());
    }
    return parser.parse(static_cast<int>(argv.size()), argv.data());
}

} // anonymous namespace

TEST(ParserTest, RunFullPipeline) {
    CliParser parser;
    auto args = parse(parser, {"run", "--year", "2024", "--month", "10"});
    EXPECT_EQ(args.command, Command::Run);
    EXPECT_EQ(args.year, 2024);
    EXPECT_EQ(args.month, 10);

    auto intent = args.intent();
    EXPECT_EQ(intent.mode, RunMode::Full);
    EXPECT_FALSE(intent.force);
    EXPECT_FALSE(intent.dry_run);
}

TEST(ParserTest, RunSingleStepForced) {
    CliParser parser;
    auto args = parse(parser, {"run", "-y", "2025", "-m", "3", "-s", "step4_inventory", "-f"});
    auto intent = args.intent();
    EXPECT_EQ(intent.mode, RunMode::SingleStep);
    EXPECT_EQ(intent.step_key, "step4_inventory");
    EXPECT_TRUE(intent.force);
}

TEST(ParserTest, StartFromWithGlobalOptionsAfterSubcommand) {
    CliParser parser;
    auto args = parse(parser, {"run", "-y", "2024", "-m", "10", "--start-from", "step4_inventory",
                               "--root", "/data", "--build-log", "--json"});
    EXPECT_EQ(args.intent().mode, RunMode::StartFrom);
    EXPECT_EQ(args.start_from, "step4_inventory");
    ASSERT_TRUE(args.core_options.root.has_value());
    EXPECT_EQ(*args.core_options.root, std::filesystem::path("/data"));
    EXPECT_TRUE(args.core_options.build_log);
    EXPECT_TRUE(args.core_options.json_output);
}

TEST(ParserTest, ResumeCommandParses) {
    CliParser parser;
    auto args = parse(parser, {"run", "--year", "2024", "--month", "10",
                               "--confirm", "step3_recalc_entradas", "--start-from", "step4_inventory"});
    EXPECT_EQ(args.command, Command::Run);
    EXPECT_EQ(args.confirm, "step3_recalc_entradas");
    EXPECT_EQ(args.intent().mode, RunMode::StartFrom);
    EXPECT_EQ(args.intent().step_key, "step4_inventory");

    EXPECT_THROW(parse(parser, {"plan", "-y", "2024", "-m", "10", "--confirm", "x"}), CLI::ParseError);
}

TEST(ParserTest, PlanIsDryRun) {
    CliParser parser;
    auto args = parse(parser, {"plan", "-y", "2024", "-m", "10"});
    EXPECT_EQ(args.command, Command::Plan);
    EXPECT_TRUE(args.intent().dry_run);

    auto run = parse(parser, {"run", "-y", "2024", "-m", "10", "--dry-run"});
    EXPECT_EQ(run.command, Command::Run);
    EXPECT_TRUE(run.intent().dry_run);
}

TEST(ParserTest, StepExcludesStartFrom) {
    CliParser parser;
    EXPECT_THROW(parse(parser, {"run", "-y", "2024", "-m", "10", "--step", "a", "--start-from", "b"}),
                 CLI::ParseError);
}

TEST(ParserTest, PeriodIsValidated) {
    CliParser parser;
    EXPECT_THROW(parse(parser, {"run", "-y", "2024", "-m", "13"}), CLI::ParseError);
    EXPECT_THROW(parse(parser, {"run", "-y", "1800", "-m", "1"}), CLI::ParseError);
    EXPECT_THROW(parse(parser, {"run", "-m", "1"}), CLI::ParseError);
}

TEST(ParserTest, ConfigSubcommands) {
    CliParser parser;
    auto set = parse(parser, {"config", "set", "python", "/usr/bin/python3"});
    EXPECT_EQ(set.command, Command::Config);
    EXPECT_EQ(set.subcommand, "python");
    EXPECT_EQ(set.subcommand_args, (std::vector<std::string>{"set", "/usr/bin/python3"}));

    auto root = parse(parser, {"config", "add-root", "/data/Dropbox"});
    EXPECT_EQ(root.subcommand, "/data/Dropbox");
    EXPECT_EQ(root.subcommand_args, std::vector<std::string>{"add-root"});

    auto list = parse(parser, {"config", "list"});
    EXPECT_EQ(list.subcommand_args, std::vector<std::string>{"list"});
}

TEST(ParserTest, StepsCommand) {
    CliParser parser;
    auto args = parse(parser, {"steps", "--verbose"});
    EXPECT_EQ(args.command, Command::Steps);
    EXPECT_TRUE(args.core_options.verbose);
}

TEST(ParserTest, HelpAndVersion) {
    CliParser parser;
    auto none = parse(parser, {});
    EXPECT_EQ(none.command, Command::Help);

    auto version = parse(parser, {"--version"});
    EXPECT_EQ(version.command, Command::Version);

    auto help = parse(parser, {"run", "--help"});
    EXPECT_EQ(help.command, Command::Help);
    EXPECT_NE(parser.parse_exit_message().find("--start-from"), std::string::npos);

    EXPECT_NE(parser.help().find("config"), std::string::npos);
}
