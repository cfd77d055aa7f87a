#include "orchestrator.h"
#include "errors.h"
#include "utils/file_utils.h"
#include "utils/string_utils.h"
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace monthclose::core
{

    namespace
    {

        // Last lines of a process's stderr, for error messages
        std::string tail_lines(const std::string &text, size_t max_lines)
        {
            auto lines = utils::split(utils::trim(text), '\n');
            if (lines.size() > max_lines)
            {
                lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(max_lines));
            }
            return utils::join(lines, "\n");
        }

        void echo_lines(const std::string &prefix, const std::string &text,
                        const output::OutputPtr &output)
        {
            if (!output || !output->is_verbose() || text.empty())
                return;
            for (const auto &line : utils::split(text, '\n'))
            {
                if (!line.empty())
                    output->debug(prefix + line);
            }
        }

    } // anonymous namespace

    Orchestrator::Orchestrator(StepRegistry registry, PathResolver resolver, StepExecutorPtr executor)
        : registry_(std::move(registry)),
          resolver_(std::move(resolver)),
          executor_(std::move(executor))
    {
        graph_.build_from_registry(registry_);

        const auto &period = resolver_.period();
        resume_prefix_ = "monthclose run --year " + std::to_string(period.year()) +
                         " --month " + std::to_string(period.month());
    }

    bool Orchestrator::in_scope(const StepDefinition &step, const RunIntent &intent) const
    {
        switch (intent.mode)
        {
        case RunMode::Full:
            return true;
        case RunMode::SingleStep:
            return step.key == intent.step_key;
        case RunMode::StartFrom:
            return step.ordinal >= registry_.at(intent.step_key).ordinal;
        }
        return false;
    }

    std::string Orchestrator::out_of_scope_reason(const RunIntent &intent) const
    {
        if (intent.mode == RunMode::SingleStep)
            return "only " + intent.step_key + " requested";
        return "before start point " + intent.step_key;
    }

    std::optional<std::string> Orchestrator::upstream_trigger(size_t node_id,
                                                              const std::vector<bool> &triggered) const
    {
        auto ancestors = graph_.ancestors(node_id);
        for (auto it = ancestors.rbegin(); it != ancestors.rend(); ++it)
        {
            if (triggered[*it])
                return graph_.node(*it).key;
        }
        return std::nullopt;
    }

    Orchestrator::Decision Orchestrator::decide(const StepDefinition &step,
                                                const StalenessVerdict &verdict,
                                                bool force,
                                                const std::optional<std::string> &upstream,
                                                bool forecast) const
    {
        Decision d;

        if (verdict.is_missing_inputs())
        {
            if (forecast && upstream)
            {
                d.execute = true;
                d.reason = "inputs expected from upstream " + *upstream;
            }
            else if (step.optional)
            {
                d.state = StepState::SkippedOptional;
                d.reason = "optional step has no inputs for " + resolver_.period().to_string();
            }
            else
            {
                // --force cannot manufacture inputs
                std::vector<std::string> patterns;
                for (const auto &pattern : step.inputs)
                    patterns.push_back(resolver_.expand_pattern(pattern).string());
                d.state = StepState::MissingInputs;
                d.reason = "no inputs found matching " + utils::join(patterns, ", ");
            }
            return d;
        }

        d.execute = true;
        if (force)
        {
            d.reason = "forced";
        }
        else if (upstream)
        {
            d.reason = "upstream " + *upstream + " executed";
        }
        else if (verdict.is_stale())
        {
            d.reason = verdict.reason;
        }
        else
        {
            d.execute = false;
            d.state = StepState::SkippedFresh;
            d.reason = verdict.reason;
        }
        return d;
    }

    RunPlan Orchestrator::plan(const RunIntent &intent) const
    {
        if (intent.mode != RunMode::Full)
        {
            registry_.at(intent.step_key); // Throws for an unknown key
        }

        RunPlan result(resolver_.period(), intent, resolver_.root());
        std::vector<bool> scheduled(graph_.size(), false);

        for (size_t id : graph_.execution_order())
        {
            const auto &step = registry_.steps()[id];

            PlannedStep ps;
            ps.key = step.key;
            ps.ordinal = step.ordinal;
            ps.kind = step.kind;
            ps.optional = step.optional;
            ps.in_scope = in_scope(step, intent);

            // Out-of-scope steps are never resolved or evaluated
            if (!ps.in_scope)
            {
                ps.expected_state = StepState::SkippedOutOfScope;
                ps.reason = out_of_scope_reason(intent);
                result.steps.push_back(std::move(ps));
                continue;
            }

            ps.verdict = evaluator_.evaluate(step, resolver_);

            if (result.expected_halt)
            {
                ps.reason = "not reached, run stops at " + *result.expected_halt;
                result.steps.push_back(std::move(ps));
                continue;
            }

            auto d = decide(step, *ps.verdict, intent.force, upstream_trigger(id, scheduled), true);
            ps.will_execute = d.execute;
            ps.reason = d.reason;

            if (d.execute)
            {
                scheduled[id] = true;
                if (step.is_manual())
                {
                    ps.expected_state = StepState::AwaitingManualConfirmation;
                    result.expected_halt = step.key;
                }
                else
                {
                    ps.expected_state = StepState::Succeeded;
                }
            }
            else
            {
                ps.expected_state = d.state;
                if (d.state == StepState::MissingInputs)
                    result.expected_halt = step.key;
            }

            result.steps.push_back(std::move(ps));
        }

        return result;
    }

    RunReport Orchestrator::run(const RunIntent &intent, const output::OutputPtr &output)
    {
        return run(plan(intent), output);
    }

    RunReport Orchestrator::run(const RunPlan &plan, const output::OutputPtr &output)
    {
        auto start_time = std::chrono::steady_clock::now();

        RunReport report(plan.period, plan.intent, plan.root);
        report.planned = plan.planned_count();

        std::vector<bool> executed(graph_.size(), false);

        size_t total = 0;
        for (const auto &ps : plan.steps)
            if (ps.in_scope)
                ++total;
        size_t current = 0;

        for (const auto &ps : plan.steps)
        {
            const auto &step = registry_.steps()[ps.ordinal];

            StepReport sr;
            sr.key = step.key;
            sr.ordinal = step.ordinal;
            sr.kind = step.kind;

            if (!ps.in_scope)
            {
                sr.state = StepState::SkippedOutOfScope;
                sr.reason = ps.reason;
                if (output)
                    output->step_skipped(sr.key, sr.state, sr.reason);
                report.steps.push_back(std::move(sr));
                continue;
            }

            // Nothing after a halt leaves PENDING
            if (report.halt_reason != HaltReason::None)
            {
                sr.reason = "not reached, run stopped at " + report.halted_at.value_or("");
                report.steps.push_back(std::move(sr));
                continue;
            }

            ++current;

            // Earlier steps may have rewritten this step's inputs since planning
            auto verdict = evaluator_.evaluate(step, resolver_);
            auto d = decide(step, verdict, plan.intent.force,
                            upstream_trigger(step.ordinal, executed), false);
            sr.verdict = verdict;
            sr.reason = d.reason;

            if (!d.execute)
            {
                sr.state = d.state;
                if (d.state == StepState::MissingInputs)
                {
                    report.halt_reason = HaltReason::MissingInputs;
                    report.halted_at = step.key;
                    if (output)
                        output->error("Step " + step.key + " has missing inputs: " + d.reason);
                }
                else
                {
                    if (output)
                    {
                        if (d.state == StepState::SkippedOptional)
                            output->warning("Skipping optional step " + step.key + ": " + d.reason);
                        output->step_skipped(sr.key, sr.state, sr.reason);
                    }
                }
                report.steps.push_back(std::move(sr));
                continue;
            }

            if (step.is_manual())
            {
                sr.state = StepState::AwaitingManualConfirmation;
                sr.instruction = step.instruction.empty()
                                     ? "Complete '" + step.description + "' by hand"
                                     : resolver_.render(step.instruction);
                report.halt_reason = HaltReason::ManualPause;
                report.halted_at = step.key;
                report.resume_command = resume_command_for(step.ordinal);
                if (output)
                    output->manual_instruction(step.key, sr.instruction, report.resume_command);
                report.steps.push_back(std::move(sr));
                continue;
            }

            // Automatic step: PENDING -> RUNNING -> SUCCEEDED/FAILED
            if (output)
                output->step_started(current, total, step.key, d.reason);
            sr.state = StepState::Running;

            auto invocation = make_invocation(step, verdict);
            if (output)
                output->debug("$ " + utils::join(invocation.argv, " "));

            auto execution = executor_->execute(invocation);
            sr.duration_ms = execution.duration_ms;

            echo_lines("| ", execution.stdout_data, output);
            echo_lines("! ", execution.stderr_data, output);

            if (execution.succeeded())
            {
                sr.state = StepState::Succeeded;
                sr.exit_code = execution.exit_code;
                executed[step.ordinal] = true;
                if (output)
                    output->step_completed(current, total, step.key, true, sr.duration_ms);
            }
            else
            {
                sr.state = StepState::Failed;
                if (execution.error)
                {
                    sr.error = *execution.error;
                }
                else
                {
                    sr.exit_code = execution.exit_code;
                    std::string message = "exited with code " + std::to_string(execution.exit_code);
                    auto tail = tail_lines(execution.stderr_data, 10);
                    if (!tail.empty())
                        message += ":\n" + tail;
                    sr.error = message;
                }
                report.halt_reason = HaltReason::StepFailed;
                report.halted_at = step.key;
                if (output)
                {
                    output->step_completed(current, total, step.key, false, sr.duration_ms);
                    output->error("Step " + step.key + " " + *sr.error);
                }
            }

            record(sr, output);
            report.steps.push_back(std::move(sr));
        }

        auto end_time = std::chrono::steady_clock::now();
        report.total_duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                       end_time - start_time)
                                       .count();
        return report;
    }

    StepInvocation Orchestrator::make_invocation(const StepDefinition &step,
                                                 const StalenessVerdict &verdict) const
    {
        StepInvocation inv;
        inv.step_key = step.key;
        inv.argv = resolver_.render_command(step.command);
        inv.working_dir = working_dir_;
        inv.inputs = verdict.inputs;
        for (const auto &pattern : step.outputs)
            inv.outputs.push_back(resolver_.expand_pattern(pattern));

        std::vector<std::string> inputs, outputs;
        for (const auto &p : inv.inputs)
            inputs.push_back(p.string());
        for (const auto &p : inv.outputs)
            outputs.push_back(p.string());

        const auto &period = resolver_.period();
        inv.environment["MONTHCLOSE_YEAR"] = std::to_string(period.year());
        inv.environment["MONTHCLOSE_MONTH"] = std::to_string(period.month());
        inv.environment["MONTHCLOSE_STEP"] = step.key;
        inv.environment["MONTHCLOSE_ROOT"] = resolver_.root().string();
        inv.environment["MONTHCLOSE_INPUTS"] = utils::join(inputs, "\n");
        inv.environment["MONTHCLOSE_OUTPUTS"] = utils::join(outputs, "\n");
        return inv;
    }

    std::vector<std::filesystem::path> Orchestrator::confirm(const std::string &step_key) const
    {
        const auto &step = registry_.at(step_key);
        if (!step.is_manual())
        {
            throw ConfigurationError(ConfigErrorCode::NotManualStep,
                                     "Step '" + step_key + "' is automatic and cannot be confirmed");
        }

        std::vector<std::filesystem::path> touched;
        auto now = std::filesystem::file_time_type::clock::now();
        for (const auto &pattern : step.outputs)
        {
            auto path = resolver_.expand_pattern(pattern);
            if (!utils::ensure_directory(path.parent_path()))
                throw std::runtime_error("Cannot create directory " + path.parent_path().string());

            // Existing files keep their content, only the mtime moves
            std::error_code ec;
            if (!std::filesystem::exists(path, ec))
            {
                std::ofstream marker(path);
                if (!marker)
                    throw std::runtime_error("Cannot write " + path.string());
                marker << step.key << " confirmed for " << resolver_.period().to_string() << "\n";
            }
            std::filesystem::last_write_time(path, now, ec);
            if (ec)
                throw std::runtime_error("Cannot update " + path.string() + ": " + ec.message());

            touched.push_back(path);
        }
        return touched;
    }

    std::string Orchestrator::resume_command_for(size_t node_id) const
    {
        std::string command = resume_prefix_ + " --confirm " + graph_.node(node_id).key;
        auto order = graph_.execution_order();
        for (size_t i = 0; i + 1 < order.size(); ++i)
        {
            if (order[i] == node_id)
                return command + " --start-from " + graph_.node(order[i + 1]).key;
        }
        return command;
    }

    void Orchestrator::record(const StepReport &report, const output::OutputPtr &output) const
    {
        if (!build_log_)
            return;

        BuildRecord rec;
        rec.timestamp = std::chrono::system_clock::now();
        rec.period = resolver_.period().to_string();
        rec.step = report.key;
        rec.status = step_state_to_string(report.state);
        rec.exit_code = report.exit_code.value_or(-1);
        rec.elapsed_seconds = static_cast<double>(report.duration_ms) / 1000.0;

        if (!build_log_->append(rec) && output)
        {
            output->warning("Could not write build log " + build_log_->path().string());
        }
    }

} // namespace monthclose::core
