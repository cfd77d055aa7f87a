#include "staleness.h"
#include "utils/file_utils.h"
#include <algorithm>

namespace monthclose::core {

nlohmann::json StalenessVerdict::to_json() const {
    nlohmann::json j;
    j["step"] = step_key;
    j["verdict"] = verdict_to_string(verdict);
    j["reason"] = reason;
    if (newest_input) {
        j["newest_input"] = newest_input->string();
        j["newest_input_time"] = utils::format_file_time(*newest_input_time);
    }
    if (oldest_output) {
        j["oldest_output"] = oldest_output->string();
        j["oldest_output_time"] = utils::format_file_time(*oldest_output_time);
    }
    j["inputs"] = nlohmann::json::array();
    for (const auto& p : inputs) {
        j["inputs"].push_back(p.string());
    }
    j["outputs"] = nlohmann::json::array();
    for (const auto& p : outputs) {
        j["outputs"].push_back(p.string());
    }
    return j;
}

StalenessVerdict StalenessEvaluator::evaluate(const StepDefinition& step,
                                              const PathResolver& resolver) const {
    StalenessVerdict v;
    v.step_key = step.key;

    // Files can disappear between the listing and the stat; those are dropped
    for (const auto& path : resolver.resolve(step.inputs)) {
        auto mtime = utils::modification_time(path);
        if (!mtime) {
            continue;
        }
        v.inputs.push_back(path);
        if (!v.newest_input_time || *mtime > *v.newest_input_time) {
            v.newest_input = path;
            v.newest_input_time = mtime;
        }
    }

    if (v.inputs.empty()) {
        v.verdict = Verdict::MissingInputs;
        v.reason = "no inputs found";
        return v;
    }

    // A declared output that matches nothing counts as older than any input
    std::optional<std::string> missing_output;
    for (const auto& pattern : step.outputs) {
        size_t found = 0;
        for (const auto& path : resolver.resolve({pattern})) {
            auto mtime = utils::modification_time(path);
            if (!mtime) {
                continue;
            }
            ++found;
            v.outputs.push_back(path);
            if (!v.oldest_output_time || *mtime < *v.oldest_output_time) {
                v.oldest_output = path;
                v.oldest_output_time = mtime;
            }
        }
        if (found == 0 && !missing_output) {
            missing_output = resolver.expand_pattern(pattern).string();
        }
    }

    std::sort(v.outputs.begin(), v.outputs.end());
    v.outputs.erase(std::unique(v.outputs.begin(), v.outputs.end()), v.outputs.end());

    if (v.outputs.empty()) {
        v.verdict = Verdict::Stale;
        v.reason = "no outputs found";
        return v;
    }

    if (missing_output) {
        v.verdict = Verdict::Stale;
        v.reason = "output " + *missing_output + " not found";
        return v;
    }

    if (*v.newest_input_time > *v.oldest_output_time) {
        v.verdict = Verdict::Stale;
        v.reason = "input " + v.newest_input->string() + " (" +
                   utils::format_file_time(*v.newest_input_time) + ") is newer than output " +
                   v.oldest_output->string() + " (" +
                   utils::format_file_time(*v.oldest_output_time) + ")";
    } else {
        v.verdict = Verdict::Fresh;
        v.reason = "outputs up to date (newest input " +
                   utils::format_file_time(*v.newest_input_time) + ")";
    }

    return v;
}

} // namespace monthclose::core
