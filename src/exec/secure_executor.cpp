#include "exec/secure_executor.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"
#include "exec/command_parser.hpp"
#include "exec/text_decoding.hpp"

namespace sous::exec {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

// Per stream; anything beyond is read and discarded so the child never blocks.
constexpr std::size_t kMaxCaptureBytes = 4 * 1024 * 1024;

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_bytes;
    std::string stderr_bytes;
    double duration_ms = 0.0;
};

// argv/envp storage built before fork so the child only calls
// async-signal-safe functions.
struct ExecImage {
    std::string program;
    std::vector<std::string> args;
    std::vector<std::string> env;
    std::vector<char*> argv;
    std::vector<char*> envp;

    void seal() {
        argv.clear();
        envp.clear();
        for (auto& arg : args) argv.push_back(arg.data());
        argv.push_back(nullptr);
        for (auto& entry : env) envp.push_back(entry.data());
        envp.push_back(nullptr);
    }
};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            static_cast<void>(close(fds[i]));
            fds[i] = -1;
        }
    }
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            const auto available = kMaxCaptureBytes - std::min(kMaxCaptureBytes, out.size());
            out.append(buffer, std::min(available, static_cast<std::size_t>(n)));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

bool is_executable_file(const std::filesystem::path& path) {
    struct stat info {};
    return stat(path.c_str(), &info) == 0 && S_ISREG(info.st_mode) &&
           access(path.c_str(), X_OK) == 0;
}

// PATH lookup against the child's environment, not ours.
std::optional<std::string> resolve_program(const std::string& name,
                                           const Environment& env) {
    if (name.find('/') != std::string::npos) {
        return is_executable_file(name) ? std::optional<std::string>(name) : std::nullopt;
    }
    auto it = env.find("PATH");
    if (it == env.end()) {
        return std::nullopt;
    }
    const std::string& search_path = it->second;
    std::size_t start = 0;
    while (start <= search_path.size()) {
        const auto end = search_path.find(':', start);
        const std::string dir = search_path.substr(
            start, end == std::string::npos ? std::string::npos : end - start);
        const std::filesystem::path candidate =
            std::filesystem::path(dir.empty() ? "." : dir) / name;
        if (is_executable_file(candidate)) {
            return candidate.string();
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return std::nullopt;
}

void kill_process_group(const pid_t pid) {
    if (killpg(pid, SIGKILL) != 0) {
        static_cast<void>(kill(pid, SIGKILL));
    }
}

core::errors::Result<ProcessCapture> run_process(
    ExecImage& image, const std::filesystem::path& cwd, const std::uint32_t timeout_ms,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    ProcessCapture capture;
    if (cancel_token && cancel_token->load()) {
        capture.cancelled = true;
        return capture;
    }

    image.seal();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return AgentError{ErrorCategory::Internal, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return AgentError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setsid());
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        const int dev_null = open("/dev/null", O_RDONLY);
        if (dev_null >= 0) {
            static_cast<void>(dup2(dev_null, STDIN_FILENO));
            static_cast<void>(close(dev_null));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        execve(image.program.c_str(), image.argv.data(), image.envp.data());
        _exit(127);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        if (!capture.cancelled && cancel_token && cancel_token->load() && !child_exited) {
            capture.cancelled = true;
            kill_process_group(pid);
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (!capture.timed_out && timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(timeout_ms) && !child_exited) {
            capture.timed_out = true;
            kill_process_group(pid);
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(usleep(10 * 1000));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_bytes);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_bytes);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
                // Background grandchildren may still hold the pipes open.
                if (capture.timed_out || capture.cancelled) {
                    kill_process_group(pid);
                }
            }
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    }

    capture.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    return capture;
}

std::string basename_of(const std::string& executable) {
    return std::filesystem::path(executable).filename().string();
}

}  // namespace

SecureCommandExecutor::SecureCommandExecutor(std::filesystem::path initial_workdir,
                                             core::config::ExecutorConfig config,
                                             Environment base_environment)
    : initial_workdir_(std::move(initial_workdir)),
      config_(std::move(config)),
      base_environment_(std::move(base_environment)) {
    state_.current_working_directory = initial_workdir_;
}

std::filesystem::path SecureCommandExecutor::current_workdir() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.current_working_directory;
}

void SecureCommandExecutor::reset_workdir() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.current_working_directory = initial_workdir_;
}

bool SecureCommandExecutor::is_shell_builtin(const std::string& executable) const {
    return config_.shell_builtins.count(executable) > 0;
}

bool SecureCommandExecutor::is_allowed_executable(const std::string& executable) const {
    return config_.allowed_executables.count(executable) > 0 ||
           config_.allowed_executables.count(basename_of(executable)) > 0;
}

std::filesystem::path SecureCommandExecutor::home_directory() const {
    auto it = base_environment_.find("HOME");
    if (it != base_environment_.end() && !it->second.empty()) {
        return it->second;
    }
    return initial_workdir_;
}

core::errors::Result<CommandOutput> SecureCommandExecutor::change_directory(
    const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    std::filesystem::path target;
    if (args.size() < 2 || args[1] == "~" || args[1] == "-") {
        target = home_directory();
    } else if (args[1].rfind("~/", 0) == 0) {
        target = home_directory() / args[1].substr(2);
    } else {
        target = args[1];
        if (target.is_relative()) {
            target = state_.current_working_directory / target;
        }
    }

    std::error_code ec;
    const auto resolved = std::filesystem::weakly_canonical(target, ec);
    if (ec || !std::filesystem::exists(resolved, ec)) {
        return AgentError{ErrorCategory::Execution,
                          "Directory does not exist: " + target.string(),
                          "invalid_directory"};
    }
    if (!std::filesystem::is_directory(resolved, ec) || ec) {
        return AgentError{ErrorCategory::Execution,
                          "Not a directory: " + target.string(), "invalid_directory"};
    }

    state_.current_working_directory = resolved;
    CommandOutput output;
    output.stdout_text = "Changed directory to: " + resolved.string();
    output.exit_code = 0;
    return output;
}

core::errors::Result<CommandOutput> SecureCommandExecutor::execute(
    const std::string& command, std::optional<std::uint32_t> timeout_ms,
    const Environment& extra_env,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    auto split = split_command(command);
    if (core::errors::is_error(split)) {
        return core::errors::get_error(split);
    }
    const auto& args = core::errors::get_value(split);
    if (args.empty()) {
        return AgentError{ErrorCategory::Input, "Command cannot be empty.", "empty_command"};
    }

    const std::string& executable = args.front();
    if (executable == "cd") {
        return change_directory(args);
    }

    const bool builtin = is_shell_builtin(executable);
    if (!builtin && !is_allowed_executable(executable)) {
        return AgentError{ErrorCategory::Policy,
                          "Executable not allowed: " + executable,
                          "executable_not_allowed",
                          "Only curated development tools may be run."};
    }

    Environment env = base_environment_;
    for (const auto& [name, value] : extra_env) {
        env[name] = value;
    }

    ExecImage image;
    if (builtin) {
        image.program = "/bin/sh";
        image.args = {"sh", "-c", command};
    } else {
        const auto program = resolve_program(executable, env);
        if (!program.has_value()) {
            return AgentError{ErrorCategory::Execution,
                              "Executable not found on PATH: " + executable,
                              "executable_not_found"};
        }
        image.program = program.value();
        image.args = args;
    }
    for (const auto& [name, value] : env) {
        image.env.push_back(name + "=" + value);
    }

    const std::uint32_t effective_timeout = timeout_ms.value_or(config_.default_timeout_ms);
    const auto cwd = current_workdir();
    SOUS_LOG_DEBUG("exec: " + command + " (cwd=" + cwd.string() + ")");

    auto capture_result = run_process(image, cwd, effective_timeout, cancel_token);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);

    if (capture.timed_out) {
        return AgentError{ErrorCategory::Execution,
                          "Command timed out after " + std::to_string(effective_timeout) +
                              " ms: " + command,
                          "command_timeout"};
    }
    if (capture.cancelled) {
        return AgentError{ErrorCategory::Execution, "Command cancelled: " + command,
                          "command_cancelled"};
    }

    CommandOutput output;
    output.stdout_text = decode_utf8_lossy(capture.stdout_bytes);
    output.stderr_text = decode_utf8_lossy(capture.stderr_bytes);
    output.exit_code = capture.exit_code;
    output.duration_ms = capture.duration_ms;
    return output;
}

}  // namespace sous::exec
