#pragma once

#include "path_resolver.h"
#include "step_definition.h"
#include "types.h"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace monthclose::core {

// Outcome of comparing a step's input and output timestamps
struct StalenessVerdict {
    std::string step_key;
    Verdict verdict = Verdict::Stale;
    std::string reason;

    std::optional<std::filesystem::path> newest_input;
    std::optional<std::filesystem::file_time_type> newest_input_time;
    std::optional<std::filesystem::path> oldest_output;
    std::optional<std::filesystem::file_time_type> oldest_output_time;

    std::vector<std::filesystem::path> inputs;   // Resolved input files
    std::vector<std::filesystem::path> outputs;  // Resolved output files

    bool is_stale() const { return verdict == Verdict::Stale; }
    bool is_fresh() const { return verdict == Verdict::Fresh; }
    bool is_missing_inputs() const { return verdict == Verdict::MissingInputs; }

    nlohmann::json to_json() const;
};

// Decides whether a step must run, from filesystem timestamps only.
// A step is STALE when its newest input is strictly newer than its oldest
// output, or when a declared output pattern matches no file. Equal
// timestamps are FRESH.
class StalenessEvaluator {
public:
    StalenessVerdict evaluate(const StepDefinition& step, const PathResolver& resolver) const;
};

} // namespace monthclose::core
