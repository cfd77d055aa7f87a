#pragma once

#include "step_definition.h"
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace monthclose::core {

// Ordered catalog of pipeline steps. The array position is the ordinal and
// the only valid execution order.
class StepRegistry {
public:
    // The monthly closing pipeline: NFI and NF branches, aggregation,
    // entries update, manual recalculation, inventory and report
    static StepRegistry builtin(const std::string& python = "python3");

    // Parse {"steps": [...]}; throws ConfigurationError(InvalidPipeline)
    static StepRegistry from_json(const nlohmann::json& j);

    // Load a pipeline definition file
    static StepRegistry load_file(const std::filesystem::path& path);

    // Assigns ordinals from positions and validates
    explicit StepRegistry(std::vector<StepDefinition> steps);

    const std::vector<StepDefinition>& steps() const { return steps_; }
    size_t size() const { return steps_.size(); }

    // nullptr when absent
    const StepDefinition* find(const std::string& key) const;

    // Throws ConfigurationError(UnknownStep) when absent
    const StepDefinition& at(const std::string& key) const;

    std::vector<std::string> keys() const;

    nlohmann::json to_json() const;

private:
    std::vector<StepDefinition> steps_;

    void validate() const;
};

} // namespace monthclose::core
