#pragma once

#include "period.h"
#include "staleness.h"
#include "types.h"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace monthclose::core
{

    // Exit codes of the run controller
    constexpr int kExitSuccess = 0;
    constexpr int kExitStepFailed = 1;
    constexpr int kExitConfigError = 2;
    constexpr int kExitManualPause = 3;
    constexpr int kExitMissingInputs = 4;

    inline int exit_code_for(HaltReason reason)
    {
        switch (reason)
        {
        case HaltReason::None: return kExitSuccess;
        case HaltReason::StepFailed: return kExitStepFailed;
        case HaltReason::ManualPause: return kExitManualPause;
        case HaltReason::MissingInputs: return kExitMissingInputs;
        }
        return kExitStepFailed;
    }

    // Forecast for one step, computed before anything runs
    struct PlannedStep
    {
        std::string key;
        size_t ordinal = 0;
        StepKind kind = StepKind::Automatic;
        bool optional = false;
        bool in_scope = false;
        std::optional<StalenessVerdict> verdict;   // Absent for out-of-scope steps
        bool will_execute = false;                 // Manual steps: will pause
        StepState expected_state = StepState::Pending;
        std::string reason;

        nlohmann::json to_json() const
        {
            nlohmann::json j;
            j["key"] = key;
            j["ordinal"] = ordinal + 1;
            j["kind"] = step_kind_to_string(kind);
            j["optional"] = optional;
            j["in_scope"] = in_scope;
            if (verdict)
                j["verdict"] = verdict->to_json();
            j["will_execute"] = will_execute;
            j["expected_state"] = step_state_to_string(expected_state);
            j["reason"] = reason;
            return j;
        }
    };

    // Ordered forecast of a run for one period and intent
    struct RunPlan
    {
        PeriodContext period;
        RunIntent intent;
        std::filesystem::path root;
        std::vector<PlannedStep> steps;            // Execution order
        std::optional<std::string> expected_halt;  // Step the run is forecast to stop at

        RunPlan(PeriodContext p, RunIntent i, std::filesystem::path r)
            : period(p), intent(std::move(i)), root(std::move(r)) {}

        size_t planned_count() const
        {
            size_t n = 0;
            for (const auto &s : steps)
                if (s.will_execute)
                    ++n;
            return n;
        }

        nlohmann::json to_json() const
        {
            nlohmann::json j;
            j["period"] = period.to_json();
            j["intent"] = intent.to_json();
            j["root"] = root.string();
            j["steps"] = nlohmann::json::array();
            for (const auto &s : steps)
                j["steps"].push_back(s.to_json());
            j["planned"] = planned_count();
            if (expected_halt)
                j["expected_halt"] = *expected_halt;
            return j;
        }
    };

    // What actually happened to one step
    struct StepReport
    {
        std::string key;
        size_t ordinal = 0;
        StepKind kind = StepKind::Automatic;
        StepState state = StepState::Pending;
        std::string reason;
        std::optional<StalenessVerdict> verdict;
        std::optional<int> exit_code;
        int64_t duration_ms = 0;
        std::optional<std::string> error;
        std::string instruction;                   // Manual steps awaiting the operator

        bool executed() const
        {
            return state == StepState::Succeeded || state == StepState::Failed;
        }

        bool skipped() const
        {
            return state == StepState::SkippedFresh || state == StepState::SkippedOptional ||
                   state == StepState::SkippedOutOfScope;
        }

        nlohmann::json to_json() const
        {
            nlohmann::json j;
            j["key"] = key;
            j["ordinal"] = ordinal + 1;
            j["kind"] = step_kind_to_string(kind);
            j["state"] = step_state_to_string(state);
            j["reason"] = reason;
            if (verdict)
                j["verdict"] = verdict->to_json();
            if (exit_code)
                j["exit_code"] = *exit_code;
            if (executed())
                j["duration_ms"] = duration_ms;
            if (error)
                j["error"] = *error;
            if (!instruction.empty())
                j["instruction"] = instruction;
            return j;
        }
    };

    // Result of a run
    struct RunReport
    {
        PeriodContext period;
        RunIntent intent;
        std::filesystem::path root;
        std::vector<StepReport> steps;
        HaltReason halt_reason = HaltReason::None;
        std::optional<std::string> halted_at;
        std::optional<std::string> resume_command;
        int64_t total_duration_ms = 0;
        size_t planned = 0;

        RunReport(PeriodContext p, RunIntent i, std::filesystem::path r)
            : period(p), intent(std::move(i)), root(std::move(r)) {}

        bool success() const { return halt_reason == HaltReason::None; }

        int exit_code() const { return exit_code_for(halt_reason); }

        const StepReport *find(const std::string &step_key) const
        {
            for (const auto &s : steps)
                if (s.key == step_key)
                    return &s;
            return nullptr;
        }

        size_t count(StepState state) const
        {
            size_t n = 0;
            for (const auto &s : steps)
                if (s.state == state)
                    ++n;
            return n;
        }

        size_t executed_count() const
        {
            size_t n = 0;
            for (const auto &s : steps)
                if (s.executed())
                    ++n;
            return n;
        }

        size_t skipped_count() const
        {
            size_t n = 0;
            for (const auto &s : steps)
                if (s.skipped())
                    ++n;
            return n;
        }

        nlohmann::json to_json() const
        {
            nlohmann::json j;
            j["success"] = success();
            j["period"] = period.to_json();
            j["intent"] = intent.to_json();
            j["root"] = root.string();
            j["halt_reason"] = halt_reason_to_string(halt_reason);
            if (halted_at)
                j["halted_at"] = *halted_at;
            if (resume_command)
                j["resume_command"] = *resume_command;
            j["steps"] = nlohmann::json::array();
            for (const auto &s : steps)
                j["steps"].push_back(s.to_json());
            j["summary"] = {
                {"planned", planned},
                {"executed", executed_count()},
                {"skipped", skipped_count()},
                {"failed", count(StepState::Failed)}};
            j["total_duration_ms"] = total_duration_ms;
            j["exit_code"] = exit_code();
            return j;
        }
    };

} // namespace monthclose::core
