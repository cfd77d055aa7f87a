#pragma once

#include "period.h"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace monthclose::core {

// Substitute {name} placeholders. Throws ConfigurationError
// (UnknownTemplateVariable) for a name missing from vars.
std::string render_template(const std::string& tmpl,
                            const std::map<std::string, std::string>& vars);

// Names referenced by {name} placeholders, in order of appearance
std::vector<std::string> template_variables(const std::string& tmpl);

// Every variable name a step template may use
const std::vector<std::string>& known_template_variables();

// Expands period-dependent path templates under the base storage root.
// Read-only: only existence and directory listings are queried.
class PathResolver {
public:
    // Built-in candidate roots, probed after any configured ones
    static std::vector<std::filesystem::path> default_candidates();

    // First candidate that exists as a directory. Throws
    // ConfigurationError(NoStorageRootFound) when none does.
    static std::filesystem::path select_root(const std::vector<std::filesystem::path>& candidates);

    PathResolver(std::filesystem::path root, PeriodContext period);

    const std::filesystem::path& root() const { return root_; }
    const PeriodContext& period() const { return period_; }

    // Period variables plus {root}
    const std::map<std::string, std::string>& variables() const { return variables_; }

    // Render a template with this resolver's variables
    std::string render(const std::string& tmpl) const;

    // Rendered pattern anchored at the root (absolute patterns stay as-is)
    std::filesystem::path expand_pattern(const std::string& pattern) const;

    // Concrete files matching any of the patterns (sorted, unique, may be empty)
    std::vector<std::filesystem::path> resolve(const std::vector<std::string>& patterns) const;

    // Render every argument of a command template
    std::vector<std::string> render_command(const std::vector<std::string>& command) const;

private:
    std::filesystem::path root_;
    PeriodContext period_;
    std::map<std::string, std::string> variables_;
};

} // namespace monthclose::core
