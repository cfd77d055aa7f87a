#include "step_executor.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/wait.h>
#include <unistd.h>
#include <poll.h>
#endif

namespace monthclose::core {

namespace {

#ifndef _WIN32
void run_process(const StepInvocation& invocation, StepExecution& result) {
    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        result.error = std::string("Failed to create pipes: ") + std::strerror(errno);
        return;
    }
    if (pipe(stderr_pipe) != 0) {
        result.error = std::string("Failed to create pipes: ") + std::strerror(errno);
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return;
    }

    // Build argv before forking
    std::vector<char*> argv;
    for (const auto& arg : invocation.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();

    if (pid < 0) {
        result.error = std::string("Failed to fork process: ") + std::strerror(errno);
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return;
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        for (const auto& [name, value] : invocation.environment) {
            setenv(name.c_str(), value.c_str(), 1);
        }

        if (!invocation.working_dir.empty() && chdir(invocation.working_dir.c_str()) != 0) {
            std::string msg = "Cannot enter working directory " + invocation.working_dir.string() +
                              ": " + std::strerror(errno) + "\n";
            (void)!write(STDERR_FILENO, msg.data(), msg.size());
            _exit(127);
        }

        execvp(argv[0], argv.data());

        // If execvp returns, it failed
        std::string msg = "Failed to execute " + invocation.argv[0] + ": " + std::strerror(errno) + "\n";
        (void)!write(STDERR_FILENO, msg.data(), msg.size());
        _exit(127);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    std::array<pollfd, 2> fds{};
    fds[0].fd = stdout_pipe[0];
    fds[0].events = POLLIN;
    fds[1].fd = stderr_pipe[0];
    fds[1].events = POLLIN;

    std::array<std::string*, 2> sinks = {&result.stdout_data, &result.stderr_data};
    size_t open_fds = fds.size();

    // Drain both pipes until the child closes them; steps may run for hours
    while (open_fds > 0) {
        int poll_result = poll(fds.data(), fds.size(), -1);
        if (poll_result < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            char buf[4096];
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }

    for (auto& fd : fds) {
        if (fd.fd >= 0) {
            close(fd.fd);
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.error = std::string("Failed to wait for process: ") + std::strerror(errno);
            return;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
}
#else
// Windows implementation
bool read_available(HANDLE pipe, std::string& out) {
    DWORD available = 0;
    if (!PeekNamedPipe(pipe, NULL, 0, NULL, &available, NULL) || available == 0) {
        return false;
    }

    char buf[4096];
    while (available > 0) {
        DWORD to_read = (available < sizeof(buf)) ? available : sizeof(buf);
        DWORD bytes_read = 0;
        if (!ReadFile(pipe, buf, to_read, &bytes_read, NULL) || bytes_read == 0) {
            break;
        }
        out.append(buf, bytes_read);
        available -= bytes_read;
    }
    return true;
}

void run_process(const StepInvocation& invocation, StepExecution& result) {
    std::string cmdline_str = windows_command_line(invocation.argv);

    // Our own environment stays untouched; the child gets a merged copy
    std::vector<std::string> inherited;
    if (LPCH env = GetEnvironmentStringsA()) {
        for (const char* entry = env; *entry; entry += std::strlen(entry) + 1) {
            inherited.emplace_back(entry);
        }
        FreeEnvironmentStringsA(env);
    }
    std::string env_block = windows_environment_block(inherited, invocation.environment);

    SECURITY_ATTRIBUTES sa;
    sa.nLength = sizeof(SECURITY_ATTRIBUTES);
    sa.bInheritHandle = TRUE;
    sa.lpSecurityDescriptor = NULL;

    HANDLE stdout_read, stdout_write;
    HANDLE stderr_read, stderr_write;

    if (!CreatePipe(&stdout_read, &stdout_write, &sa, 0)) {
        result.error = "Failed to create pipes";
        return;
    }
    if (!CreatePipe(&stderr_read, &stderr_write, &sa, 0)) {
        result.error = "Failed to create pipes";
        CloseHandle(stdout_read); CloseHandle(stdout_write);
        return;
    }

    SetHandleInformation(stdout_read, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stderr_read, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    si.hStdOutput = stdout_write;
    si.hStdError = stderr_write;
    si.dwFlags |= STARTF_USESTDHANDLES;

    PROCESS_INFORMATION pi = {};

    std::string cwd = invocation.working_dir.string();
    if (!CreateProcessA(NULL, cmdline_str.data(), NULL, NULL, TRUE, 0, env_block.data(),
                        cwd.empty() ? NULL : cwd.c_str(), &si, &pi)) {
        result.error = "Failed to create process: " + invocation.argv[0];
        CloseHandle(stdout_read); CloseHandle(stdout_write);
        CloseHandle(stderr_read); CloseHandle(stderr_write);
        return;
    }

    CloseHandle(stdout_write);
    CloseHandle(stderr_write);

    // Keep the pipes drained so the child never blocks on a full buffer
    while (WaitForSingleObject(pi.hProcess, 100) != WAIT_OBJECT_0) {
        read_available(stdout_read, result.stdout_data);
        read_available(stderr_read, result.stderr_data);
    }
    while (read_available(stdout_read, result.stdout_data)) {
    }
    while (read_available(stderr_read, result.stderr_data)) {
    }

    DWORD exit_code = 0;
    GetExitCodeProcess(pi.hProcess, &exit_code);
    result.exit_code = static_cast<int>(exit_code);

    CloseHandle(stdout_read);
    CloseHandle(stderr_read);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);
}
#endif

// Variable names compare case-insensitively on Windows
struct NameLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) { return std::toupper(x) < std::toupper(y); });
    }
};

std::string quote_windows_argument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
        return arg;
    }

    // Backslashes are literal unless they precede a quote
    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
            continue;
        }
        if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
        } else {
            quoted.append(backslashes, '\\');
        }
        quoted += c;
        backslashes = 0;
    }
    quoted.append(backslashes * 2, '\\');
    quoted += '"';
    return quoted;
}

} // anonymous namespace

std::string windows_command_line(const std::vector<std::string>& argv) {
    std::string cmdline;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) cmdline += ' ';
        cmdline += quote_windows_argument(argv[i]);
    }
    return cmdline;
}

std::string windows_environment_block(const std::vector<std::string>& inherited,
                                      const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string, NameLess> merged;
    for (const auto& entry : inherited) {
        // Per-drive entries such as "=C:=C:\work" start with '='
        auto eq = entry.find('=', 1);
        if (eq == std::string::npos) {
            continue;
        }
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [name, value] : overrides) {
        merged.erase(name);
        merged[name] = value;
    }

    std::string block;
    for (const auto& [name, value] : merged) {
        block += name;
        block += '=';
        block += value;
        block += '\0';
    }
    if (block.empty()) {
        block += '\0';
    }
    block += '\0';
    return block;
}

StepExecution ProcessStepExecutor::execute(const StepInvocation& invocation) {
    StepExecution result;

    if (invocation.argv.empty()) {
        result.error = "Step '" + invocation.step_key + "' has an empty command";
        return result;
    }

    auto start_time = std::chrono::steady_clock::now();
    run_process(invocation, result);
    auto end_time = std::chrono::steady_clock::now();

    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time).count();

    return result;
}

} // namespace monthclose::core
