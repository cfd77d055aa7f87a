#include <gtest/gtest.h>
#include "temp_tree.h"
#include "core/step_executor.h"
#include <cstdlib>

using namespace monthclose::core;

#ifndef _WIN32

class StepExecutorTest : public TempTreeTest
{
protected:
    StepExecution run_shell(const std::string &script)
    {
        StepInvocation inv;
        inv.step_key = "shell";
        inv.argv = {"/bin/sh", "-c", script};
        return executor.execute(inv);
    }

    ProcessStepExecutor executor;
};

TEST_F(StepExecutorTest, CapturesStdoutAndExitCode)
{
    auto result = run_shell("echo hello; echo oops >&2; exit 0");
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_data, "hello\n");
    EXPECT_EQ(result.stderr_data, "oops\n");
    EXPECT_FALSE(result.error.has_value());
}

TEST_F(StepExecutorTest, NonZeroExitCode)
{
    auto result = run_shell("exit 3");
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.exit_code, 3);
}

TEST_F(StepExecutorTest, KilledBySignal)
{
    auto result = run_shell("kill -9 $$");
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.exit_code, 128 + 9);
}

TEST_F(StepExecutorTest, LargeOutputDoesNotBlock)
{
    auto result = run_shell("i=0; while [ $i -lt 20000 ]; do echo 0123456789; i=$((i+1)); done; "
                            "echo done >&2");
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.stdout_data.size(), 20000u * 11u);
    EXPECT_EQ(result.stderr_data, "done\n");
}

TEST_F(StepExecutorTest, EnvironmentAndWorkingDirectory)
{
    std::filesystem::create_directories(root_ / "scripts");

    StepInvocation inv;
    inv.step_key = "step1_nfi";
    inv.argv = {"/bin/sh", "-c", "printf '%s|%s|%s' \"$MONTHCLOSE_STEP\" \"$MONTHCLOSE_YEAR\" \"$(pwd -P)\""};
    inv.working_dir = root_ / "scripts";
    inv.environment = {{"MONTHCLOSE_STEP", "step1_nfi"}, {"MONTHCLOSE_YEAR", "2024"}};

    auto result = executor.execute(inv);
    ASSERT_TRUE(result.succeeded()) << result.stderr_data;
    auto expected_dir = std::filesystem::canonical(root_ / "scripts").string();
    EXPECT_EQ(result.stdout_data, "step1_nfi|2024|" + expected_dir);

    // Only the child sees the step variables
    EXPECT_EQ(std::getenv("MONTHCLOSE_STEP"), nullptr);
}

TEST_F(StepExecutorTest, MissingWorkingDirectory)
{
    StepInvocation inv;
    inv.step_key = "x";
    inv.argv = {"/bin/sh", "-c", "true"};
    inv.working_dir = root_ / "does-not-exist";

    auto result = executor.execute(inv);
    EXPECT_EQ(result.exit_code, 127);
    EXPECT_NE(result.stderr_data.find("Cannot enter working directory"), std::string::npos);
}

TEST_F(StepExecutorTest, MissingProgram)
{
    StepInvocation inv;
    inv.step_key = "x";
    inv.argv = {"monthclose-no-such-program-xyz"};

    auto result = executor.execute(inv);
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.exit_code, 127);
    EXPECT_NE(result.stderr_data.find("Failed to execute"), std::string::npos);
}

#endif

TEST(StepExecutorBasicTest, EmptyCommand)
{
    ProcessStepExecutor executor;
    StepInvocation inv;
    inv.step_key = "empty";

    auto result = executor.execute(inv);
    EXPECT_FALSE(result.succeeded());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("empty"), std::string::npos);
}

TEST(WindowsCommandLineTest, PlainArgumentsStayBare)
{
    EXPECT_EQ(windows_command_line({"python", "NFI_1_Create.py", "--year", "2024"}),
              "python NFI_1_Create.py --year 2024");
}

TEST(WindowsCommandLineTest, QuotesSpacesAndEmptyArguments)
{
    EXPECT_EQ(windows_command_line({"C:\\Program Files\\Python\\python.exe", ""}),
              "\"C:\\Program Files\\Python\\python.exe\" \"\"");
}

TEST(WindowsCommandLineTest, EscapesQuotesAndTrailingBackslashes)
{
    // a"b        -> "a\"b"
    EXPECT_EQ(windows_command_line({"a\"b"}), "\"a\\\"b\"");
    // C:\My Dir\ -> "C:\My Dir\\"
    EXPECT_EQ(windows_command_line({"C:\\My Dir\\"}), "\"C:\\My Dir\\\\\"");
    // x\"y       -> "x\\\"y"
    EXPECT_EQ(windows_command_line({"x\\\"y"}), "\"x\\\\\\\"y\"");
}

TEST(WindowsEnvironmentBlockTest, OverridesMergeIntoSortedBlock)
{
    std::vector<std::string> inherited = {"=C:=C:\\work", "Path=C:\\Windows", "TEMP=C:\\Temp",
                                          "monthclose_step=stale"};
    std::map<std::string, std::string> overrides = {{"MONTHCLOSE_STEP", "step4_inventory"},
                                                    {"MONTHCLOSE_YEAR", "2024"}};

    auto block = windows_environment_block(inherited, overrides);

    std::string expected;
    for (const char* entry : {"=C:=C:\\work", "MONTHCLOSE_STEP=step4_inventory", "MONTHCLOSE_YEAR=2024",
                              "Path=C:\\Windows", "TEMP=C:\\Temp"}) {
        expected += entry;
        expected += '\0';
    }
    expected += '\0';
    EXPECT_EQ(block, expected);
}

TEST(WindowsEnvironmentBlockTest, EmptyBlockIsDoublyTerminated)
{
    EXPECT_EQ(windows_environment_block({}, {}), std::string(2, '\0'));
}
