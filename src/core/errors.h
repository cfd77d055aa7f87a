#pragma once

#include <stdexcept>
#include <string>

namespace monthclose::core {

enum class ConfigErrorCode {
    NoStorageRootFound,
    UnknownStep,
    NotManualStep,
    InvalidPeriod,
    InvalidPipeline,
    UnknownTemplateVariable
};

inline std::string config_error_code_to_string(ConfigErrorCode code) {
    switch (code) {
        case ConfigErrorCode::NoStorageRootFound: return "no_storage_root_found";
        case ConfigErrorCode::UnknownStep: return "unknown_step";
        case ConfigErrorCode::NotManualStep: return "not_manual_step";
        case ConfigErrorCode::InvalidPeriod: return "invalid_period";
        case ConfigErrorCode::InvalidPipeline: return "invalid_pipeline";
        case ConfigErrorCode::UnknownTemplateVariable: return "unknown_template_variable";
    }
    return "unknown";
}

// Fatal setup problem: nothing runs once one of these is raised
class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(ConfigErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ConfigErrorCode code() const { return code_; }

private:
    ConfigErrorCode code_;
};

} // namespace monthclose::core
