#pragma once

#include "output.h"
#include <ostream>

namespace monthclose::core::output {

// Human-readable output. Status lines go to out, problems to err.
class ConsoleOutput : public IOutput {
public:
    ConsoleOutput(std::ostream& out, std::ostream& err, bool verbose = false, bool quiet = false);

    void info(const std::string& message) override;
    void success(const std::string& message) override;
    void warning(const std::string& message) override;
    void error(const std::string& message) override;
    void debug(const std::string& message) override;

    void data(const nlohmann::json& j, const std::string& text) override;

    void step_started(size_t current, size_t total,
                      const std::string& step_key, const std::string& reason) override;
    void step_completed(size_t current, size_t total,
                        const std::string& step_key, bool success, int64_t duration_ms) override;
    void step_skipped(const std::string& step_key, StepState state,
                      const std::string& reason) override;

    void manual_instruction(const std::string& step_key,
                            const std::string& instruction,
                            const std::optional<std::string>& resume_command) override;

    bool is_verbose() const override { return verbose_; }
    bool is_quiet() const override { return quiet_; }

private:
    std::ostream& out_;
    std::ostream& err_;
    bool verbose_;
    bool quiet_;
};

} // namespace monthclose::core::output
