#pragma once

#include "cli/parser.h"
#include "core/config_manager.h"
#include "core/output/output.h"
#include "core/step_registry.h"
#include <memory>

namespace monthclose::cli::commands {

// Lists the pipeline DAG
class StepsCommand {
public:
    StepsCommand(std::shared_ptr<core::ConfigManager> config_manager,
                 std::shared_ptr<core::output::IOutput> output);

    int execute(const ParsedArgs& args);

    // Text listing: ordinal, key, kind, dependencies, patterns (plus
    // command and instruction when verbose)
    static std::string format_steps(const core::StepRegistry& registry, bool verbose);

private:
    std::shared_ptr<core::ConfigManager> config_manager_;
    std::shared_ptr<core::output::IOutput> output_;
};

} // namespace monthclose::cli::commands
