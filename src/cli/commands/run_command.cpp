#include "run_command.h"
#include "pipeline_setup.h"
#include "core/errors.h"
#include "core/orchestrator.h"
#include "core/path_resolver.h"
#include "core/period.h"
#include "utils/string_utils.h"
#include <sstream>

namespace monthclose::cli::commands
{

    namespace
    {

        std::string quote_if_needed(const std::string &s)
        {
            if (s.find_first_of(" \t\"'") == std::string::npos)
                return s;
            return "\"" + utils::replace_all(s, "\"", "\\\"") + "\"";
        }

        std::string planned_action(const core::PlannedStep &step)
        {
            if (!step.in_scope)
                return "skip";
            if (step.will_execute)
                return step.kind == core::StepKind::Manual ? "pause" : "run";
            switch (step.expected_state)
            {
            case core::StepState::SkippedFresh: return "fresh";
            case core::StepState::SkippedOptional: return "skip";
            case core::StepState::MissingInputs: return "MISSING";
            default: return "-";
            }
        }

    } // anonymous namespace

    RunCommand::RunCommand(std::shared_ptr<core::ConfigManager> config_manager,
                           std::shared_ptr<core::output::IOutput> output,
                           core::StepExecutorPtr executor)
        : config_manager_(std::move(config_manager)),
          output_(std::move(output)),
          executor_(std::move(executor))
    {
    }

    int RunCommand::execute(const ParsedArgs &args)
    {
        try
        {
            // Configuration problems surface here, before any step runs
            core::PeriodContext period(args.year, args.month);
            auto registry = load_registry(args, *config_manager_);
            auto root = core::PathResolver::select_root(storage_candidates(args, *config_manager_));

            core::Orchestrator orchestrator(std::move(registry),
                                            core::PathResolver(root, period),
                                            executor_);
            orchestrator.set_working_dir(config_manager_->scripts_dir().value_or(std::filesystem::path()));
            orchestrator.set_resume_prefix(resume_prefix(args));
            if (args.core_options.build_log || config_manager_->build_log())
            {
                orchestrator.set_build_log(core::BuildLog(core::BuildLog::default_path(root)));
            }

            auto intent = args.intent();

            output_->info("Period " + period.to_string() + " (" + period.month_folder() + ")");
            output_->debug("Storage root: " + root.string());

            if (!args.confirm.empty())
            {
                if (intent.dry_run)
                {
                    output_->warning("Dry run: " + args.confirm + " is not confirmed");
                }
                else
                {
                    for (const auto &marker : orchestrator.confirm(args.confirm))
                        output_->debug("Touched " + marker.string());
                    output_->success("Confirmed manual step " + args.confirm);
                }
            }

            auto plan = orchestrator.plan(intent);

            if (intent.dry_run)
            {
                output_->data(plan.to_json(), format_plan(plan));
                return core::kExitSuccess;
            }

            if (output_->is_verbose())
            {
                output_->debug(format_plan(plan));
            }

            auto report = orchestrator.run(plan, output_);

            if (args.core_options.json_output || !args.core_options.quiet)
            {
                output_->data(report.to_json(), format_summary(report));
            }

            return report.exit_code();
        }
        catch (const core::ConfigurationError &e)
        {
            output_->error(e.what());
            return core::kExitConfigError;
        }
    }

    std::string RunCommand::resume_prefix(const ParsedArgs &args)
    {
        std::string prefix = "monthclose run --year " + std::to_string(args.year) +
                             " --month " + std::to_string(args.month);
        if (args.core_options.root)
            prefix += " --root " + quote_if_needed(args.core_options.root->string());
        if (args.core_options.pipeline_file)
            prefix += " --pipeline " + quote_if_needed(args.core_options.pipeline_file->string());
        if (args.core_options.config_dir)
            prefix += " --config-dir " + quote_if_needed(args.core_options.config_dir->string());
        return prefix;
    }

    std::string RunCommand::format_plan(const core::RunPlan &plan)
    {
        std::ostringstream text;
        text << "Plan for " << plan.period.to_string() << " under " << plan.root.string();
        if (plan.intent.force)
            text << " (forced)";
        text << ":\n";

        for (const auto &step : plan.steps)
        {
            text << "  " << (step.ordinal + 1) << ". " << step.key;
            text << std::string(step.key.size() < 24 ? 24 - step.key.size() : 1, ' ');
            text << planned_action(step);
            if (!step.reason.empty())
                text << "  " << step.reason;
            text << "\n";
        }

        text << "\n" << plan.planned_count() << " step(s) would run";
        if (plan.expected_halt)
            text << ", stopping at " << *plan.expected_halt;
        text << "\n";
        return text.str();
    }

    std::string RunCommand::format_summary(const core::RunReport &report)
    {
        std::ostringstream text;
        text << "\nSummary for " << report.period.to_string() << ": "
             << report.planned << " planned, "
             << report.executed_count() << " executed, "
             << report.skipped_count() << " skipped, "
             << report.count(core::StepState::Failed) << " failed"
             << " (" << utils::format_duration(report.total_duration_ms) << ")\n";

        switch (report.halt_reason)
        {
        case core::HaltReason::None:
            text << "Pipeline completed.\n";
            break;
        case core::HaltReason::StepFailed:
            text << "Stopped: step " << report.halted_at.value_or("?") << " failed.\n";
            break;
        case core::HaltReason::MissingInputs:
            text << "Stopped: step " << report.halted_at.value_or("?") << " has no inputs.\n";
            break;
        case core::HaltReason::ManualPause:
            text << "Paused at manual step " << report.halted_at.value_or("?") << ".\n";
            if (report.resume_command)
                text << "Resume with: " << *report.resume_command << "\n";
            break;
        }
        return text.str();
    }

} // namespace monthclose::cli::commands
