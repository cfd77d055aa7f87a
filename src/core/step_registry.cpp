#include "step_registry.h"
#include "errors.h"
#include "path_resolver.h"
#include "utils/file_utils.h"
#include <algorithm>
#include <fstream>
#include <map>
#include <set>

namespace monthclose::core {

namespace {

const std::string kInvoices = "nfs/{year}/Serie */{month_folder}/*.xml";
const std::string kAccounting = "nfs/Mauricio/Contabilidade/{tag}";
const std::string kData = "KBB MF/AAA/Balancetes/Fechamentos/data";

StepDefinition automatic_step(const std::string& key,
                              const std::string& description,
                              const std::string& python,
                              const std::string& script) {
    StepDefinition s;
    s.key = key;
    s.description = description;
    s.kind = StepKind::Automatic;
    s.command = {python, script, "--year", "{year}", "--month", "{month}"};
    return s;
}

[[noreturn]] void invalid(const std::string& message) {
    throw ConfigurationError(ConfigErrorCode::InvalidPipeline, message);
}

void check_templates(const StepDefinition& step,
                     const std::vector<std::string>& templates,
                     const char* field) {
    const auto& known = known_template_variables();
    for (const auto& tmpl : templates) {
        for (const auto& name : template_variables(tmpl)) {
            if (std::find(known.begin(), known.end(), name) == known.end()) {
                throw ConfigurationError(ConfigErrorCode::UnknownTemplateVariable,
                    "Step '" + step.key + "' " + field + " uses unknown template variable '{" +
                    name + "}'");
            }
        }
    }
}

void check_globs(const StepDefinition& step,
                 const std::vector<std::string>& patterns,
                 const char* field) {
    for (const auto& pattern : patterns) {
        if (auto error = utils::glob_syntax_error(pattern)) {
            invalid("Step '" + step.key + "' " + field + " pattern '" + pattern + "' has an " + *error);
        }
    }
}

} // anonymous namespace

StepRegistry StepRegistry::builtin(const std::string& python) {
    std::vector<StepDefinition> steps;

    auto nfi = automatic_step("step1_nfi", "Extract invoice items (NFI) from XML per series",
                              python, "NFI_1_Create.py");
    nfi.inputs = {kInvoices};
    nfi.outputs = {kAccounting + "/NFI_{year}_{mm}_Serie *.xlsx"};
    steps.push_back(nfi);

    auto nf = automatic_step("step1_nf", "Extract invoice headers (NF) from XML per series",
                             python, "NF_1_Create.py");
    nf.inputs = {kInvoices};
    nf.outputs = {kAccounting + "/NF_{year}_{mm}_Serie *.xlsx"};
    nf.optional = true;
    steps.push_back(nf);

    auto nf_agg = automatic_step("step2_nf_agg", "Combine NF series into one workbook",
                                 python, "NF_2_Aggregate.py");
    nf_agg.inputs = {kAccounting + "/NF_{year}_{mm}_Serie *.xlsx"};
    nf_agg.outputs = {kAccounting + "/Combined_NFs_{year}_{mm}.xlsx"};
    nf_agg.optional = true;
    nf_agg.depends_on = {"step1_nf"};
    steps.push_back(nf_agg);

    auto nfi_agg = automatic_step("step2_nfi_agg", "Combine NFI series into one workbook",
                                  python, "NFI_2_Aggregate.py");
    nfi_agg.inputs = {kAccounting + "/NFI_{year}_{mm}_Serie *.xlsx"};
    nfi_agg.outputs = {kAccounting + "/NFI_{year}_{mm}_todos.xlsx"};
    nfi_agg.depends_on = {"step1_nfi"};
    steps.push_back(nfi_agg);

    auto entradas = automatic_step("step3_update_entradas", "Update T_Entradas with the period's entries",
                                   python, "Atualiza_Entradas.py");
    entradas.inputs = {
        kAccounting + "/Combined_NFs_{year}_{mm}.xlsx",
        kAccounting + "/NFI_{year}_{mm}_todos.xlsx",
        kData + "/clean/{prev_tag}/R_Estoq_fdm_{prev_tag}.xlsx",
    };
    entradas.outputs = {kData + "/Tables/T_Entradas.xlsx"};
    entradas.depends_on = {"step2_nf_agg", "step2_nfi_agg"};
    steps.push_back(entradas);

    StepDefinition recalc;
    recalc.key = "step3_recalc_entradas";
    recalc.description = "Recalculate T_Entradas formulas in Excel";
    recalc.kind = StepKind::Manual;
    recalc.inputs = entradas.outputs;
    recalc.outputs = {"_meta/confirm/step3_recalc_entradas_{tag}.ok"};
    recalc.instruction = "Open {root}/" + kData + "/Tables/T_Entradas.xlsx in Excel, "
                         "recalculate all formulas, save and close the file.";
    recalc.depends_on = {"step3_update_entradas"};
    steps.push_back(recalc);

    auto inventory = automatic_step("step4_inventory", "Compute end-of-month inventory",
                                    python, "process_inv.py");
    inventory.inputs = {
        kData + "/clean/{tag}/*Estoq_{tag}_clean.xlsx",
        kData + "/clean/{tag}/T_EstTrans_{tag}_clean.xlsx",
        kData + "/clean/{tag}/B_EFull*_{tag}_clean.xlsx",
        kData + "/Tables/T_Entradas.xlsx",
        kData + "/Tables/T_ProdF.xlsx",
    };
    inventory.outputs = {kData + "/clean/{tag}/R_Estoq_fdm_{tag}.xlsx"};
    inventory.depends_on = {"step3_recalc_entradas"};
    steps.push_back(inventory);

    auto report = automatic_step("step5_report", "Build the monthly summary workbook",
                                 python, "remake_dataset01.py");
    report.inputs = {
        kData + "/clean/{tag}/*_{tag}_clean.xlsx",
        kData + "/clean/{tag}/R_Estoq_fdm_{tag}.xlsx",
        kData + "/Tables/T_*.xlsx",
        kData + "/Template/PivotTemplate.xlsm",
    };
    report.outputs = {kData + "/clean/{tag}/R_Resumo_{tag}.xlsm"};
    report.depends_on = {"step4_inventory"};
    steps.push_back(report);

    return StepRegistry(std::move(steps));
}

StepRegistry StepRegistry::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("steps") || !j["steps"].is_array()) {
        invalid("Pipeline definition must be an object with a \"steps\" array");
    }

    std::vector<StepDefinition> steps;
    try {
        for (const auto& step_json : j["steps"]) {
            steps.push_back(StepDefinition::from_json(step_json));
        }
    } catch (const nlohmann::json::exception& e) {
        invalid(std::string("Malformed step in pipeline definition: ") + e.what());
    }

    return StepRegistry(std::move(steps));
}

StepRegistry StepRegistry::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        invalid("Cannot open pipeline definition: " + path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        invalid("Failed to parse pipeline definition " + path.string() + ": " + e.what());
    }

    return from_json(j);
}

StepRegistry::StepRegistry(std::vector<StepDefinition> steps)
    : steps_(std::move(steps)) {
    for (size_t i = 0; i < steps_.size(); ++i) {
        steps_[i].ordinal = i;
    }
    validate();
}

void StepRegistry::validate() const {
    if (steps_.empty()) {
        invalid("Pipeline has no steps");
    }

    std::map<std::string, size_t> ordinal_of;

    for (const auto& step : steps_) {
        if (step.key.empty()) {
            invalid("Step at position " + std::to_string(step.ordinal + 1) + " has no key");
        }
        if (ordinal_of.count(step.key) > 0) {
            invalid("Duplicate step key '" + step.key + "'");
        }

        if (step.is_manual() && !step.command.empty()) {
            invalid("Manual step '" + step.key + "' must not have a command");
        }
        if (!step.is_manual() && step.command.empty()) {
            invalid("Automatic step '" + step.key + "' has no command");
        }
        if (step.inputs.empty()) {
            invalid("Step '" + step.key + "' declares no inputs");
        }
        if (step.outputs.empty()) {
            invalid("Step '" + step.key + "' declares no outputs");
        }

        // Edges may only point backwards, which also rules out cycles
        std::set<std::string> seen_deps;
        for (const auto& dep : step.depends_on) {
            if (!seen_deps.insert(dep).second) {
                invalid("Step '" + step.key + "' lists dependency '" + dep + "' twice");
            }
            if (ordinal_of.count(dep) == 0) {
                bool exists = std::any_of(steps_.begin(), steps_.end(),
                                          [&dep](const StepDefinition& s) { return s.key == dep; });
                if (exists) {
                    invalid("Step '" + step.key + "' depends on later step '" + dep + "'");
                }
                invalid("Step '" + step.key + "' depends on unknown step '" + dep + "'");
            }
        }

        check_templates(step, step.command, "command");
        check_templates(step, step.inputs, "inputs");
        check_templates(step, step.outputs, "outputs");
        check_templates(step, {step.instruction}, "instruction");
        check_globs(step, step.inputs, "input");
        check_globs(step, step.outputs, "output");

        // Manual steps are confirmed by touching their outputs
        if (step.is_manual()) {
            for (const auto& pattern : step.outputs) {
                if (utils::has_glob_chars(pattern)) {
                    invalid("Manual step '" + step.key + "' output '" + pattern +
                            "' must name a single file, not a wildcard");
                }
            }
        }

        ordinal_of[step.key] = step.ordinal;
    }
}

const StepDefinition* StepRegistry::find(const std::string& key) const {
    auto it = std::find_if(steps_.begin(), steps_.end(),
                           [&key](const StepDefinition& s) { return s.key == key; });
    return it == steps_.end() ? nullptr : &*it;
}

const StepDefinition& StepRegistry::at(const std::string& key) const {
    const auto* step = find(key);
    if (!step) {
        std::string message = "Unknown step '" + key + "'. Available steps:";
        for (const auto& s : steps_) {
            message += " " + s.key;
        }
        throw ConfigurationError(ConfigErrorCode::UnknownStep, message);
    }
    return *step;
}

std::vector<std::string> StepRegistry::keys() const {
    std::vector<std::string> result;
    result.reserve(steps_.size());
    for (const auto& step : steps_) {
        result.push_back(step.key);
    }
    return result;
}

nlohmann::json StepRegistry::to_json() const {
    nlohmann::json j;
    j["steps"] = nlohmann::json::array();
    for (const auto& step : steps_) {
        j["steps"].push_back(step.to_json());
    }
    return j;
}

} // namespace monthclose::core
