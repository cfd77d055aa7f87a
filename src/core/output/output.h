#pragma once

#include "core/types.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace monthclose::core::output {

// Sink for everything the operator sees
class IOutput {
public:
    virtual ~IOutput() = default;

    // Messages
    virtual void info(const std::string& message) = 0;
    virtual void success(const std::string& message) = 0;
    virtual void warning(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    virtual void debug(const std::string& message) = 0;    // Verbose only

    // Final result: the JSON document in JSON mode, otherwise the text
    // (the document itself when text is empty)
    virtual void data(const nlohmann::json& j, const std::string& text) = 0;

    // Per-step status lines
    virtual void step_started(size_t current, size_t total,
                              const std::string& step_key, const std::string& reason) = 0;
    virtual void step_completed(size_t current, size_t total,
                                const std::string& step_key, bool success, int64_t duration_ms) = 0;
    virtual void step_skipped(const std::string& step_key, StepState state,
                              const std::string& reason) = 0;

    // Manual step: what the operator must do and how to continue afterwards
    virtual void manual_instruction(const std::string& step_key,
                                    const std::string& instruction,
                                    const std::optional<std::string>& resume_command) = 0;

    virtual bool is_verbose() const = 0;
    virtual bool is_quiet() const = 0;
};

using OutputPtr = std::shared_ptr<IOutput>;

} // namespace monthclose::core::output
