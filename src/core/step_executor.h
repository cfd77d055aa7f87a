#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace monthclose::core {

// Everything needed to start one automatic step
struct StepInvocation {
    std::string step_key;
    std::vector<std::string> argv;                   // Rendered command, argv[0] is the program
    std::filesystem::path working_dir;               // Empty: inherit ours
    std::map<std::string, std::string> environment;  // Added to the inherited environment
    std::vector<std::filesystem::path> inputs;
    std::vector<std::filesystem::path> outputs;
};

// Terminal status of one step process
struct StepExecution {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    int64_t duration_ms = 0;
    std::optional<std::string> error;   // Could not start the process at all

    bool succeeded() const { return !error && exit_code == 0; }
};

// Runs external step executables. The orchestrator only sees this seam.
class IStepExecutor {
public:
    virtual ~IStepExecutor() = default;

    // Blocks until the step terminates; there is no timeout
    virtual StepExecution execute(const StepInvocation& invocation) = 0;
};

using StepExecutorPtr = std::shared_ptr<IStepExecutor>;

// Spawns the step as a child process and captures stdout/stderr
class ProcessStepExecutor : public IStepExecutor {
public:
    StepExecution execute(const StepInvocation& invocation) override;
};

// CreateProcess helpers, available on every platform

// Command line that CommandLineToArgvW splits back into exactly argv
std::string windows_command_line(const std::vector<std::string>& argv);

// Environment block: the inherited "NAME=value" entries with overrides
// applied, sorted by name ignoring case, each NUL-terminated, plus a final NUL
std::string windows_environment_block(const std::vector<std::string>& inherited,
                                      const std::map<std::string, std::string>& overrides);

} // namespace monthclose::core
