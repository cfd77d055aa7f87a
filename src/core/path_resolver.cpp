#include "path_resolver.h"
#include "errors.h"
#include "utils/file_utils.h"
#include <algorithm>

namespace monthclose::core {

std::string render_template(const std::string& tmpl,
                            const std::map<std::string, std::string>& vars) {
    std::string result;
    result.reserve(tmpl.size());

    size_t pos = 0;
    while (pos < tmpl.size()) {
        auto open = tmpl.find('{', pos);
        if (open == std::string::npos) {
            result.append(tmpl, pos, std::string::npos);
            break;
        }
        auto close = tmpl.find('}', open + 1);
        if (close == std::string::npos) {
            // Unterminated brace is literal text
            result.append(tmpl, pos, std::string::npos);
            break;
        }

        result.append(tmpl, pos, open - pos);
        std::string name = tmpl.substr(open + 1, close - open - 1);
        auto it = vars.find(name);
        if (it == vars.end()) {
            throw ConfigurationError(ConfigErrorCode::UnknownTemplateVariable,
                "Unknown template variable '{" + name + "}' in \"" + tmpl + "\"");
        }
        result += it->second;
        pos = close + 1;
    }

    return result;
}

std::vector<std::string> template_variables(const std::string& tmpl) {
    std::vector<std::string> names;
    size_t pos = 0;
    while (true) {
        auto open = tmpl.find('{', pos);
        if (open == std::string::npos) break;
        auto close = tmpl.find('}', open + 1);
        if (close == std::string::npos) break;
        names.push_back(tmpl.substr(open + 1, close - open - 1));
        pos = close + 1;
    }
    return names;
}

const std::vector<std::string>& known_template_variables() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> v;
        for (const auto& [name, _] : PeriodContext(2000, 1).variables()) {
            v.push_back(name);
        }
        v.push_back("root");
        std::sort(v.begin(), v.end());
        return v;
    }();
    return names;
}

std::vector<std::filesystem::path> PathResolver::default_candidates() {
    return {
        "/Users/mauricioalouan/Dropbox",
        "/Users/simon/Library/CloudStorage/Dropbox",
    };
}

std::filesystem::path PathResolver::select_root(const std::vector<std::filesystem::path>& candidates) {
    for (const auto& candidate : candidates) {
        if (utils::is_directory(candidate)) {
            return candidate;
        }
    }

    std::string message = "No storage root found. None of the candidate directories exist:";
    for (const auto& candidate : candidates) {
        message += "\n  - " + candidate.string();
    }
    throw ConfigurationError(ConfigErrorCode::NoStorageRootFound, message);
}

PathResolver::PathResolver(std::filesystem::path root, PeriodContext period)
    : root_(std::move(root)), period_(period), variables_(period_.variables()) {
    variables_["root"] = root_.string();
}

std::string PathResolver::render(const std::string& tmpl) const {
    return render_template(tmpl, variables_);
}

std::filesystem::path PathResolver::expand_pattern(const std::string& pattern) const {
    return root_ / render(pattern);
}

std::vector<std::filesystem::path> PathResolver::resolve(const std::vector<std::string>& patterns) const {
    std::vector<std::filesystem::path> paths;
    for (const auto& pattern : patterns) {
        auto matches = utils::expand_glob(expand_pattern(pattern).string());
        paths.insert(paths.end(), matches.begin(), matches.end());
    }
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
    return paths;
}

std::vector<std::string> PathResolver::render_command(const std::vector<std::string>& command) const {
    std::vector<std::string> argv;
    argv.reserve(command.size());
    for (const auto& arg : command) {
        argv.push_back(render(arg));
    }
    return argv;
}

} // namespace monthclose::core
