#pragma once

#include "cli/parser.h"
#include "core/config_manager.h"
#include "core/step_registry.h"
#include <filesystem>
#include <vector>

namespace monthclose::cli::commands {

// Step catalog for this invocation: --pipeline, then config pipeline_file,
// then the built-in pipeline using the configured interpreter
core::StepRegistry load_registry(const ParsedArgs& args, const core::ConfigManager& config);

// Candidate storage roots in probe order: --root alone when given,
// otherwise the configured roots followed by the built-in ones
std::vector<std::filesystem::path> storage_candidates(const ParsedArgs& args,
                                                      const core::ConfigManager& config);

} // namespace monthclose::cli::commands
