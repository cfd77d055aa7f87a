#include "json_output.h"

namespace monthclose::core::output {

JsonOutput::JsonOutput(std::ostream& out, std::ostream& err, bool verbose, bool quiet)
    : out_(out), err_(err), verbose_(verbose), quiet_(quiet) {
}

void JsonOutput::emit(const nlohmann::json& event) {
    err_ << event.dump() << std::endl;
}

void JsonOutput::message(const std::string& level, const std::string& text) {
    emit({{"type", "message"}, {"level", level}, {"message", text}});
}

void JsonOutput::info(const std::string& text) {
    if (quiet_) return;
    message("info", text);
}

void JsonOutput::success(const std::string& text) {
    if (quiet_) return;
    message("success", text);
}

void JsonOutput::warning(const std::string& text) {
    message("warning", text);
}

void JsonOutput::error(const std::string& text) {
    message("error", text);
}

void JsonOutput::debug(const std::string& text) {
    if (!verbose_) return;
    message("debug", text);
}

void JsonOutput::data(const nlohmann::json& j, const std::string& /*text*/) {
    out_ << j.dump(verbose_ ? 2 : -1) << std::endl;
}

void JsonOutput::step_started(size_t current, size_t total,
                              const std::string& step_key, const std::string& reason) {
    if (quiet_) return;
    emit({{"type", "step_started"}, {"current", current}, {"total", total},
          {"step", step_key}, {"reason", reason}});
}

void JsonOutput::step_completed(size_t current, size_t total,
                                const std::string& step_key, bool success, int64_t duration_ms) {
    if (quiet_ && success) return;
    emit({{"type", "step_completed"}, {"current", current}, {"total", total},
          {"step", step_key}, {"success", success}, {"duration_ms", duration_ms}});
}

void JsonOutput::step_skipped(const std::string& step_key, StepState state,
                              const std::string& reason) {
    if (quiet_) return;
    emit({{"type", "step_skipped"}, {"step", step_key},
          {"state", step_state_to_string(state)}, {"reason", reason}});
}

void JsonOutput::manual_instruction(const std::string& step_key,
                                    const std::string& instruction,
                                    const std::optional<std::string>& resume_command) {
    nlohmann::json event = {{"type", "manual_instruction"}, {"step", step_key},
                            {"instruction", instruction}};
    if (resume_command) {
        event["resume_command"] = *resume_command;
    }
    emit(event);
}

} // namespace monthclose::core::output
