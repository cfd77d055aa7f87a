#pragma once

#include "build_log.h"
#include "path_resolver.h"
#include "pipeline_graph.h"
#include "run_plan.h"
#include "staleness.h"
#include "step_executor.h"
#include "step_registry.h"
#include "output/output.h"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace monthclose::core
{

    // Walks the step DAG for one period: evaluates staleness, invokes stale
    // automatic steps, skips fresh ones and halts at manual steps, failures
    // and missing inputs. Strictly sequential.
    class Orchestrator
    {
    public:
        Orchestrator(StepRegistry registry, PathResolver resolver, StepExecutorPtr executor);

        // Working directory for step processes (scripts live there)
        void set_working_dir(std::filesystem::path dir) { working_dir_ = std::move(dir); }

        // Record executed steps in an audit log
        void set_build_log(std::optional<BuildLog> log) { build_log_ = std::move(log); }

        // Command line the operator re-runs after a manual step, without
        // the trailing "--confirm <key> --start-from <next>"
        void set_resume_prefix(std::string prefix) { resume_prefix_ = std::move(prefix); }

        const StepRegistry &registry() const { return registry_; }
        const PipelineGraph &graph() const { return graph_; }
        const PathResolver &resolver() const { return resolver_; }

        // Forecast the run without invoking anything. Throws
        // ConfigurationError(UnknownStep) for an unknown --step/--start-from key.
        RunPlan plan(const RunIntent &intent) const;

        // Execute a plan. Verdicts are recomputed right before each step.
        RunReport run(const RunPlan &plan, const output::OutputPtr &output = nullptr);

        // plan() followed by run()
        RunReport run(const RunIntent &intent, const output::OutputPtr &output = nullptr);

        // Record that the operator finished a manual step by touching its
        // declared outputs, which turns the step fresh until its inputs
        // change again. Returns the touched files. Throws
        // ConfigurationError(UnknownStep / NotManualStep) and
        // std::runtime_error when a file cannot be written.
        std::vector<std::filesystem::path> confirm(const std::string &step_key) const;

    private:
        StepRegistry registry_;
        PathResolver resolver_;
        PipelineGraph graph_;
        StalenessEvaluator evaluator_;
        StepExecutorPtr executor_;
        std::filesystem::path working_dir_;
        std::optional<BuildLog> build_log_;
        std::string resume_prefix_;

        struct Decision
        {
            bool execute = false;
            StepState state = StepState::Pending;   // When not executing
            std::string reason;
        };

        // forecast: missing inputs behind a scheduled upstream step are expected
        Decision decide(const StepDefinition &step,
                        const StalenessVerdict &verdict,
                        bool force,
                        const std::optional<std::string> &upstream,
                        bool forecast) const;

        bool in_scope(const StepDefinition &step, const RunIntent &intent) const;

        std::string out_of_scope_reason(const RunIntent &intent) const;

        // Nearest ancestor marked in triggered
        std::optional<std::string> upstream_trigger(size_t node_id,
                                                    const std::vector<bool> &triggered) const;

        StepInvocation make_invocation(const StepDefinition &step,
                                       const StalenessVerdict &verdict) const;

        // Command that confirms the manual step node_id and continues with
        // the step after it
        std::string resume_command_for(size_t node_id) const;

        void record(const StepReport &report, const output::OutputPtr &output) const;
    };

} // namespace monthclose::core
