#pragma once

#include "types.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace monthclose::core
{

    // One unit of work in the pipeline, with its declared inputs and outputs.
    // All strings may reference template variables ({year}, {tag}, ...);
    // input/output patterns are relative to the base storage root.
    struct StepDefinition
    {
        std::string key;                     // e.g., "step2_nfi_agg"
        size_t ordinal = 0;                  // Position in the DAG (0-based)
        std::string description;
        StepKind kind = StepKind::Automatic;
        std::vector<std::string> command;    // argv template, empty for manual steps
        std::vector<std::string> inputs;     // Glob patterns
        std::vector<std::string> outputs;    // Glob patterns
        bool optional = false;               // May have no inputs for a period
        std::string instruction;             // Operator instruction (manual steps)
        std::vector<std::string> depends_on; // Upstream step keys

        bool is_manual() const { return kind == StepKind::Manual; }

        nlohmann::json to_json() const
        {
            nlohmann::json j;
            j["key"] = key;
            j["ordinal"] = ordinal + 1;
            if (!description.empty())
                j["description"] = description;
            j["kind"] = step_kind_to_string(kind);
            if (!command.empty())
                j["command"] = command;
            j["inputs"] = inputs;
            j["outputs"] = outputs;
            j["optional"] = optional;
            if (!instruction.empty())
                j["instruction"] = instruction;
            j["depends_on"] = depends_on;
            return j;
        }

        // Ordinal is assigned by the registry from the array position
        static StepDefinition from_json(const nlohmann::json &j)
        {
            StepDefinition s;
            s.key = j.at("key").get<std::string>();
            s.description = j.value("description", "");
            bool manual = j.contains("kind") ? j.at("kind").get<std::string>() == "manual"
                                             : j.value("manual", false);
            s.kind = manual ? StepKind::Manual : StepKind::Automatic;
            if (j.contains("command"))
                s.command = j.at("command").get<std::vector<std::string>>();
            if (j.contains("inputs"))
                s.inputs = j.at("inputs").get<std::vector<std::string>>();
            if (j.contains("outputs"))
                s.outputs = j.at("outputs").get<std::vector<std::string>>();
            s.optional = j.value("optional", false);
            s.instruction = j.value("instruction", "");
            if (j.contains("depends_on"))
                s.depends_on = j.at("depends_on").get<std::vector<std::string>>();
            return s;
        }
    };

} // namespace monthclose::core
