#pragma once

#include "cli/parser.h"
#include "core/config_manager.h"
#include "core/output/output.h"
#include "core/run_plan.h"
#include "core/step_executor.h"
#include <filesystem>
#include <memory>
#include <string>

namespace monthclose::cli::commands {

// Run controller: turns the parsed intent into a plan, hands it to the
// orchestrator and maps the outcome to an exit code
class RunCommand {
public:
    RunCommand(std::shared_ptr<core::ConfigManager> config_manager,
               std::shared_ptr<core::output::IOutput> output,
               core::StepExecutorPtr executor = std::make_shared<core::ProcessStepExecutor>());

    // Returns 0 on success or dry run, see core::exit_code_for otherwise
    int execute(const ParsedArgs& args);

    // Human-readable renderings
    static std::string format_plan(const core::RunPlan& plan);
    static std::string format_summary(const core::RunReport& report);

    // Command the operator re-runs, without "--confirm" and "--start-from"
    static std::string resume_prefix(const ParsedArgs& args);

private:
    std::shared_ptr<core::ConfigManager> config_manager_;
    std::shared_ptr<core::output::IOutput> output_;
    core::StepExecutorPtr executor_;
};

} // namespace monthclose::cli::commands
