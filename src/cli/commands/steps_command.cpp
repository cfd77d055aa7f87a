#include "steps_command.h"
#include "pipeline_setup.h"
#include "core/errors.h"
#include "core/run_plan.h"
#include "utils/string_utils.h"
#include <sstream>

namespace monthclose::cli::commands
{

    StepsCommand::StepsCommand(std::shared_ptr<core::ConfigManager> config_manager,
                               std::shared_ptr<core::output::IOutput> output)
        : config_manager_(std::move(config_manager)), output_(std::move(output))
    {
    }

    int StepsCommand::execute(const ParsedArgs &args)
    {
        try
        {
            auto registry = load_registry(args, *config_manager_);
            output_->data(registry.to_json(), format_steps(registry, args.core_options.verbose));
            return 0;
        }
        catch (const core::ConfigurationError &e)
        {
            output_->error(e.what());
            return core::kExitConfigError;
        }
    }

    std::string StepsCommand::format_steps(const core::StepRegistry &registry, bool verbose)
    {
        std::ostringstream text;
        text << "Pipeline steps:\n";

        for (const auto &step : registry.steps())
        {
            text << "\n  " << (step.ordinal + 1) << ". " << step.key;
            if (step.is_manual())
                text << "  [manual]";
            if (step.optional)
                text << "  [optional]";
            text << "\n";

            if (!step.description.empty())
                text << "     " << step.description << "\n";
            if (!step.depends_on.empty())
                text << "     after: " << utils::join(step.depends_on, ", ") << "\n";

            for (const auto &input : step.inputs)
                text << "     in:  " << input << "\n";
            for (const auto &output : step.outputs)
                text << "     out: " << output << "\n";

            if (!verbose)
                continue;

            if (!step.command.empty())
                text << "     command: " << utils::join(step.command, " ") << "\n";
            if (!step.instruction.empty())
                text << "     instruction: " << step.instruction << "\n";
        }

        return text.str();
    }

} // namespace monthclose::cli::commands
