#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace monthclose::core {

// Step kind
enum class StepKind {
    Automatic,    // Invokes an external executable
    Manual        // Human-gated pause, never executed by us
};

inline std::string step_kind_to_string(StepKind kind) {
    switch (kind) {
        case StepKind::Automatic: return "automatic";
        case StepKind::Manual: return "manual";
    }
    return "unknown";
}

// Staleness decision for one step
enum class Verdict {
    Stale,
    Fresh,
    MissingInputs
};

inline std::string verdict_to_string(Verdict verdict) {
    switch (verdict) {
        case Verdict::Stale: return "stale";
        case Verdict::Fresh: return "fresh";
        case Verdict::MissingInputs: return "missing_inputs";
    }
    return "unknown";
}

// Per-step state during a run
enum class StepState {
    Pending,
    SkippedOutOfScope,           // Excluded by --step / --start-from, never evaluated
    SkippedFresh,
    SkippedOptional,             // Optional step with no inputs for this period
    Running,
    Succeeded,
    Failed,
    MissingInputs,
    AwaitingManualConfirmation
};

inline std::string step_state_to_string(StepState state) {
    switch (state) {
        case StepState::Pending: return "pending";
        case StepState::SkippedOutOfScope: return "skipped_out_of_scope";
        case StepState::SkippedFresh: return "skipped_fresh";
        case StepState::SkippedOptional: return "skipped_optional";
        case StepState::Running: return "running";
        case StepState::Succeeded: return "succeeded";
        case StepState::Failed: return "failed";
        case StepState::MissingInputs: return "missing_inputs";
        case StepState::AwaitingManualConfirmation: return "awaiting_manual_confirmation";
    }
    return "unknown";
}

// Why a run stopped before the end of the DAG
enum class HaltReason {
    None,
    MissingInputs,
    StepFailed,
    ManualPause
};

inline std::string halt_reason_to_string(HaltReason reason) {
    switch (reason) {
        case HaltReason::None: return "none";
        case HaltReason::MissingInputs: return "missing_inputs";
        case HaltReason::StepFailed: return "step_failed";
        case HaltReason::ManualPause: return "manual_pause";
    }
    return "unknown";
}

// Run intent mode
enum class RunMode {
    Full,         // Every step in DAG order
    SingleStep,   // --step <key>
    StartFrom     // --start-from <key>
};

inline std::string run_mode_to_string(RunMode mode) {
    switch (mode) {
        case RunMode::Full: return "full";
        case RunMode::SingleStep: return "step";
        case RunMode::StartFrom: return "start_from";
    }
    return "unknown";
}

// Operator-supplied run intent
struct RunIntent {
    RunMode mode = RunMode::Full;
    std::string step_key;                // Target of --step / --start-from
    bool force = false;                  // Treat every evaluated step as stale
    bool dry_run = false;                // Plan only, invoke nothing

    static RunIntent full(bool force = false) {
        RunIntent intent;
        intent.force = force;
        return intent;
    }

    static RunIntent single(const std::string& key, bool force = false) {
        RunIntent intent;
        intent.mode = RunMode::SingleStep;
        intent.step_key = key;
        intent.force = force;
        return intent;
    }

    static RunIntent start_from(const std::string& key, bool force = false) {
        RunIntent intent;
        intent.mode = RunMode::StartFrom;
        intent.step_key = key;
        intent.force = force;
        return intent;
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["mode"] = run_mode_to_string(mode);
        if (!step_key.empty()) j["step"] = step_key;
        j["force"] = force;
        j["dry_run"] = dry_run;
        return j;
    }
};

// Core options (shared by every command)
struct CoreOptions {
    bool json_output = false;            // Output as JSON
    bool verbose = false;                // Verbose output
    bool quiet = false;                  // Suppress output
    std::optional<std::filesystem::path> root;           // --root override
    std::optional<std::filesystem::path> pipeline_file;  // --pipeline override
    std::optional<std::filesystem::path> config_dir;     // --config-dir override
    bool build_log = false;              // Append executed steps to the build log

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["json_output"] = json_output;
        j["verbose"] = verbose;
        j["quiet"] = quiet;
        if (root) j["root"] = root->string();
        if (pipeline_file) j["pipeline_file"] = pipeline_file->string();
        if (config_dir) j["config_dir"] = config_dir->string();
        j["build_log"] = build_log;
        return j;
    }
};

} // namespace monthclose::core
