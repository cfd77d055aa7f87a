#include "pipeline_setup.h"
#include "core/path_resolver.h"
#include <algorithm>

namespace monthclose::cli::commands {

core::StepRegistry load_registry(const ParsedArgs& args, const core::ConfigManager& config) {
    if (args.core_options.pipeline_file) {
        return core::StepRegistry::load_file(*args.core_options.pipeline_file);
    }
    if (auto file = config.pipeline_file()) {
        return core::StepRegistry::load_file(*file);
    }
    return core::StepRegistry::builtin(config.python());
}

std::vector<std::filesystem::path> storage_candidates(const ParsedArgs& args,
                                                      const core::ConfigManager& config) {
    if (args.core_options.root) {
        return {*args.core_options.root};
    }

    auto candidates = config.get_storage_roots();
    for (const auto& path : core::PathResolver::default_candidates()) {
        if (std::find(candidates.begin(), candidates.end(), path) == candidates.end()) {
            candidates.push_back(path);
        }
    }
    return candidates;
}

} // namespace monthclose::cli::commands
