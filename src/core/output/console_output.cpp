#include "console_output.h"
#include "utils/string_utils.h"
#include <iomanip>

namespace monthclose::core::output {

ConsoleOutput::ConsoleOutput(std::ostream& out, std::ostream& err, bool verbose, bool quiet)
    : out_(out), err_(err), verbose_(verbose), quiet_(quiet) {
}

void ConsoleOutput::info(const std::string& message) {
    if (quiet_) return;
    out_ << message << std::endl;
}

void ConsoleOutput::success(const std::string& message) {
    if (quiet_) return;
    out_ << "✓ " << message << std::endl;
}

void ConsoleOutput::warning(const std::string& message) {
    err_ << "⚠ Warning: " << message << std::endl;
}

void ConsoleOutput::error(const std::string& message) {
    err_ << "✗ Error: " << message << std::endl;
}

void ConsoleOutput::debug(const std::string& message) {
    if (!verbose_ || quiet_) return;
    out_ << "  " << message << std::endl;
}

void ConsoleOutput::data(const nlohmann::json& j, const std::string& text) {
    if (text.empty()) {
        out_ << std::setw(2) << j << std::endl;
    } else {
        out_ << text;
        if (text.back() != '\n') out_ << std::endl;
    }
}

void ConsoleOutput::step_started(size_t current, size_t total,
                                 const std::string& step_key, const std::string& reason) {
    if (quiet_) return;
    out_ << "[" << current << "/" << total << "] ▶ " << step_key;
    if (!reason.empty()) {
        out_ << " (" << reason << ")";
    }
    out_ << std::endl;
}

void ConsoleOutput::step_completed(size_t current, size_t total,
                                   const std::string& step_key, bool success, int64_t duration_ms) {
    if (success) {
        if (quiet_) return;
        out_ << "[" << current << "/" << total << "] ✓ " << step_key
             << " (" << utils::format_duration(duration_ms) << ")" << std::endl;
    } else {
        err_ << "[" << current << "/" << total << "] ✗ " << step_key
             << " failed after " << utils::format_duration(duration_ms) << std::endl;
    }
}

void ConsoleOutput::step_skipped(const std::string& step_key, StepState state,
                                 const std::string& reason) {
    if (quiet_) return;
    // Out-of-scope steps are only listed when asked for detail
    if (state == StepState::SkippedOutOfScope && !verbose_) return;

    out_ << "      - " << step_key;
    switch (state) {
        case StepState::SkippedFresh: out_ << " up to date"; break;
        case StepState::SkippedOptional: out_ << " skipped (optional)"; break;
        case StepState::SkippedOutOfScope: out_ << " not in scope"; break;
        default: out_ << " " << step_state_to_string(state); break;
    }
    if (!reason.empty()) {
        out_ << ": " << reason;
    }
    out_ << std::endl;
}

void ConsoleOutput::manual_instruction(const std::string& step_key,
                                       const std::string& instruction,
                                       const std::optional<std::string>& resume_command) {
    // Shown even in quiet mode: the run cannot continue without it
    out_ << std::endl;
    out_ << "⏸ Manual step " << step_key << " requires your action:" << std::endl;
    out_ << "    " << instruction << std::endl;
    if (resume_command) {
        out_ << "  When done, continue with:" << std::endl;
        out_ << "    " << *resume_command << std::endl;
    } else {
        out_ << "  This is the last step; nothing remains to run afterwards." << std::endl;
    }
}

} // namespace monthclose::core::output
