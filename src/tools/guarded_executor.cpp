#include "tools/guarded_executor.hpp"

#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <optional>
#include <poll.h>
#include <signal.h>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <sys/wait.h>
#include <system_error>
#include <type_traits>
#include <utility>
#include <unistd.h>
#include <vector>
#include "core/logging/logger.hpp"
#include "core/util/common.hpp"

namespace saferclaw::tools {

using core::config::SafetyConfig;
using protocol::ActionKind;
using protocol::ExecutionError;
using protocol::ExecutionResult;
using session::AuditStatus;
using core::util::kAlwaysFalse;

namespace {

constexpr const char* kFallbackPath = "/usr/bin:/bin:/usr/sbin:/sbin";

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool spawn_failed = false;
    std::string spawn_error;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

double elapsed_ms(const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(
               std::chrono::steady_clock::now() - started)
        .count();
}

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kProbeSize = 1024;
    char buffer[kProbeSize];
    in.read(buffer, static_cast<std::streamsize>(kProbeSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// Reads everything currently available. Bytes past `limit` are drained and
// dropped so a chatty child never blocks on a full pipe.
void drain_pipe(int& fd, std::string& out, const std::size_t limit, bool& truncated) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            const std::size_t room = out.size() < limit ? limit - out.size() : 0;
            const std::size_t take = std::min(room, static_cast<std::size_t>(n));
            out.append(buffer, take);
            if (take < static_cast<std::size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            close_fd(fd);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        close_fd(fd);
        return;
    }
}

std::vector<std::string> build_environment(const SafetyConfig& config) {
    std::vector<std::string> env;
    for (const auto& name : config.allowed_env) {
        const char* value = std::getenv(name.c_str());
        if (value != nullptr) {
            env.push_back(name + "=" + value);
        }
    }
    return env;
}

std::string lookup_path_variable(const std::vector<std::string>& env) {
    for (const auto& entry : env) {
        if (entry.rfind("PATH=", 0) == 0) {
            return entry.substr(5);
        }
    }
    return kFallbackPath;
}

bool is_executable_file(const std::filesystem::path& candidate) {
    struct stat st {};
    if (stat(candidate.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode) && access(candidate.c_str(), X_OK) == 0;
}

// Resolves argv[0] to a concrete file before forking; no shell PATH search.
std::optional<std::filesystem::path> resolve_executable(
    const std::string& name, const std::filesystem::path& cwd,
    const std::string& search_path) {
    if (name.find('/') != std::string::npos) {
        std::filesystem::path candidate(name);
        if (candidate.is_relative()) {
            candidate = cwd / candidate;
        }
        if (is_executable_file(candidate)) {
            return candidate;
        }
        return std::nullopt;
    }

    std::size_t start = 0;
    while (start <= search_path.size()) {
        const auto end = search_path.find(':', start);
        const std::string dir = search_path.substr(
            start, end == std::string::npos ? std::string::npos : end - start);
        if (!dir.empty()) {
            const std::filesystem::path candidate = std::filesystem::path(dir) / name;
            if (is_executable_file(candidate)) {
                return candidate;
            }
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return std::nullopt;
}

ProcessCapture spawn_and_capture(const std::vector<std::string>& argv,
                                 const std::filesystem::path& cwd,
                                 const SafetyConfig& config) {
    ProcessCapture capture;
    const std::vector<std::string> env = build_environment(config);
    const auto executable =
        resolve_executable(argv.front(), cwd, lookup_path_variable(env));
    if (!executable.has_value()) {
        capture.spawn_failed = true;
        capture.spawn_error = "Executable not found: " + argv.front();
        return capture;
    }

    std::vector<char*> child_argv;
    child_argv.reserve(argv.size() + 1);
    for (const auto& token : argv) {
        child_argv.push_back(const_cast<char*>(token.c_str()));
    }
    child_argv.push_back(nullptr);

    std::vector<char*> child_env;
    child_env.reserve(env.size() + 1);
    for (const auto& entry : env) {
        child_env.push_back(const_cast<char*>(entry.c_str()));
    }
    child_env.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        for (int* fds : {stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        capture.spawn_failed = true;
        capture.spawn_error = "Failed to create process pipes.";
        return capture;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        for (int* fds : {stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        capture.spawn_failed = true;
        capture.spawn_error = "Failed to fork process.";
        return capture;
    }

    if (pid == 0) {
        // Own process group so a timeout can take down grandchildren too.
        static_cast<void>(setpgid(0, 0));
        const int dev_null = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (dev_null >= 0) {
            static_cast<void>(dup2(dev_null, STDIN_FILENO));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        if (chdir(cwd.c_str()) == 0) {
            execve(executable->c_str(), child_argv.data(), child_env.data());
        }
        const int err = errno;
        static_cast<void>(write(status_pipe[1], &err, sizeof(err)));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    int child_errno = 0;
    ssize_t status_bytes = 0;
    do {
        status_bytes = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (status_bytes < 0 && errno == EINTR);
    close_fd(status_pipe[0]);
    if (status_bytes == static_cast<ssize_t>(sizeof(child_errno))) {
        int ignored = 0;
        static_cast<void>(waitpid(pid, &ignored, 0));
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        capture.spawn_failed = true;
        capture.spawn_error = "Failed to execute " + executable->string() + ": " +
                              std::strerror(child_errno);
        return capture;
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::seconds(config.command_timeout_seconds);
    bool child_exited = false;
    int status = 0;

    while (true) {
        if (!capture.timed_out && std::chrono::steady_clock::now() >= deadline) {
            capture.timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
            static_cast<void>(kill(pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_pipe[0] >= 0) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_pipe[0] >= 0) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        }

        drain_pipe(stdout_pipe[0], capture.stdout_text, config.max_output_bytes,
                   capture.stdout_truncated);
        drain_pipe(stderr_pipe[0], capture.stderr_text, config.max_output_bytes,
                   capture.stderr_truncated);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            } else if (nfds == 0) {
                static_cast<void>(poll(nullptr, 0, 20));
            }
        }

        if (child_exited && stdout_pipe[0] < 0 && stderr_pipe[0] < 0) {
            break;
        }
        if (child_exited && capture.timed_out) {
            break;
        }
    }

    close_fd(stdout_pipe[0]);
    close_fd(stderr_pipe[0]);

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    }
    return capture;
}

void mark_truncated(std::string& text, const bool truncated) {
    if (truncated) {
        text += protocol::kTruncationMarker;
    }
}

ExecutionResult failure(const ActionKind kind, const ExecutionError error,
                        std::string message) {
    ExecutionResult result;
    result.kind = kind;
    result.success = false;
    result.error = error;
    result.error_message = std::move(message);
    return result;
}

}  // namespace

GuardedExecutor::GuardedExecutor(const session::AuditRecorder& audit)
    : audit_(audit) {}

core::errors::Result<ExecutionResult> GuardedExecutor::execute(
    const protocol::ActionRequest& request, const policy::PolicyDecision& decision,
    const SafetyConfig& config) const {
    if (!decision.allowed) {
        throw std::logic_error(
            "GuardedExecutor::execute called with a denied decision (" +
            policy::to_string(decision.reason) + ")");
    }
    return execute_audited(request, config);
}

core::errors::Result<ExecutionResult> GuardedExecutor::execute_audited(
    const protocol::ActionRequest& request, const SafetyConfig& config) const {
    auto attempted = audit_.record_action(request, AuditStatus::Attempted);
    if (core::errors::is_error(attempted)) {
        return core::errors::get_error(attempted);
    }

    const auto started = std::chrono::steady_clock::now();
    core::errors::Result<ExecutionResult> outcome = std::visit(
        [this, &config](const auto& action) -> core::errors::Result<ExecutionResult> {
            using T = std::decay_t<decltype(action)>;
            if constexpr (std::is_same_v<T, protocol::CommandAction>) {
                return run_command(action, config);
            } else if constexpr (std::is_same_v<T, protocol::ReadFileAction>) {
                return read_file(action, config);
            } else if constexpr (std::is_same_v<T, protocol::WriteFileAction>) {
                return write_file(action, config);
            } else if constexpr (std::is_same_v<T, protocol::PlanAction>) {
                return run_plan(action, config);
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled action kind");
            }
        },
        request.action);
    if (core::errors::is_error(outcome)) {
        return core::errors::get_error(outcome);
    }

    ExecutionResult result = core::errors::get_value(outcome);
    result.duration_ms = elapsed_ms(started);

    std::optional<std::string> reason;
    std::optional<std::string> detail;
    if (!result.success) {
        reason = protocol::to_string(result.error);
        detail = result.error_message;
        LOG_WARN("Action failed [" + reason.value() + "]: " + result.error_message);
    }
    auto recorded = audit_.record_action(
        request, result.success ? AuditStatus::Succeeded : AuditStatus::Failed, reason,
        detail);
    if (core::errors::is_error(recorded)) {
        return core::errors::get_error(recorded);
    }
    return result;
}

ExecutionResult GuardedExecutor::run_command(const protocol::CommandAction& command,
                                             const SafetyConfig& config) const {
    const policy::PolicyEngine policy_engine;
    auto cwd = policy_engine.resolve_allowed_path(config.working_directory.string(),
                                                  config);
    if (core::errors::is_error(cwd)) {
        return failure(ActionKind::Command, ExecutionError::SpawnFailure,
                       core::errors::get_error(cwd).message);
    }

    const ProcessCapture capture =
        spawn_and_capture(command.argv, core::errors::get_value(cwd), config);
    if (capture.spawn_failed) {
        LOG_ERROR("Spawn failed: " + capture.spawn_error);
        return failure(ActionKind::Command, ExecutionError::SpawnFailure,
                       capture.spawn_error);
    }
    if (capture.timed_out) {
        return failure(ActionKind::Command, ExecutionError::Timeout,
                       "Command timed out after " +
                           std::to_string(config.command_timeout_seconds) + "s.");
    }

    ExecutionResult result;
    result.kind = ActionKind::Command;
    result.exit_code = capture.exit_code;
    result.stdout_text = capture.stdout_text;
    result.stderr_text = capture.stderr_text;
    result.byte_count = capture.stdout_text.size();
    result.truncated = capture.stdout_truncated || capture.stderr_truncated;
    mark_truncated(result.stdout_text, capture.stdout_truncated);
    mark_truncated(result.stderr_text, capture.stderr_truncated);

    result.success = (capture.exit_code == 0);
    if (!result.success) {
        result.error = ExecutionError::NonZeroExit;
        result.error_message =
            "Command failed with exit code " + std::to_string(capture.exit_code);
    }
    return result;
}

ExecutionResult GuardedExecutor::read_file(const protocol::ReadFileAction& read,
                                           const SafetyConfig& config) const {
    const policy::PolicyEngine policy_engine;
    auto resolved = policy_engine.resolve_allowed_path(read.path, config);
    if (core::errors::is_error(resolved)) {
        return failure(ActionKind::ReadFile, ExecutionError::IoFailure,
                       core::errors::get_error(resolved).message);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return failure(ActionKind::ReadFile, ExecutionError::IoFailure,
                       "File does not exist: " + file_path.string());
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return failure(ActionKind::ReadFile, ExecutionError::IoFailure,
                       "Path is not a regular file: " + file_path.string());
    }
    if (is_probably_binary(file_path)) {
        return failure(ActionKind::ReadFile, ExecutionError::IoFailure,
                       "Refusing to read binary file: " + file_path.string());
    }

    int fd = open(file_path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) {
        return failure(ActionKind::ReadFile, ExecutionError::IoFailure,
                       "Failed to open file: " + file_path.string() + ": " +
                           std::strerror(errno));
    }

    ExecutionResult result;
    result.kind = ActionKind::ReadFile;
    char buffer[4096];
    while (true) {
        const ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            close_fd(fd);
            return failure(ActionKind::ReadFile, ExecutionError::IoFailure,
                           "I/O error while reading file: " + file_path.string() +
                               ": " + std::strerror(err));
        }
        if (n == 0) {
            break;
        }
        const std::size_t room = config.max_output_bytes - result.stdout_text.size();
        const std::size_t take = std::min(room, static_cast<std::size_t>(n));
        result.stdout_text.append(buffer, take);
        if (take < static_cast<std::size_t>(n)) {
            result.truncated = true;
            break;
        }
    }
    close_fd(fd);

    result.byte_count = result.stdout_text.size();
    mark_truncated(result.stdout_text, result.truncated);
    result.success = true;
    return result;
}

ExecutionResult GuardedExecutor::write_file(const protocol::WriteFileAction& write,
                                            const SafetyConfig& config) const {
    const policy::PolicyEngine policy_engine;
    auto resolved = policy_engine.resolve_allowed_path(write.path, config);
    if (core::errors::is_error(resolved)) {
        return failure(ActionKind::WriteFile, ExecutionError::IoFailure,
                       core::errors::get_error(resolved).message);
    }

    std::error_code ec;
    const std::filesystem::path parent = core::errors::get_value(resolved).parent_path();
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return failure(ActionKind::WriteFile, ExecutionError::IoFailure,
                       "Unable to create directory: " + parent.string());
    }

    // Re-resolve right before opening: a symlink planted after the first
    // check must not redirect the write.
    auto target = policy_engine.resolve_allowed_path(write.path, config);
    if (core::errors::is_error(target)) {
        return failure(ActionKind::WriteFile, ExecutionError::IoFailure,
                       core::errors::get_error(target).message);
    }
    const std::filesystem::path file_path = core::errors::get_value(target);

    int fd = open(file_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC,
                  0644);
    if (fd < 0) {
        return failure(ActionKind::WriteFile, ExecutionError::IoFailure,
                       "Failed to open file for writing: " + file_path.string() +
                           ": " + std::strerror(errno));
    }

    std::size_t written = 0;
    while (written < write.content.size()) {
        const ssize_t n = ::write(fd, write.content.data() + written,
                                  write.content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            close_fd(fd);
            return failure(ActionKind::WriteFile, ExecutionError::IoFailure,
                           "I/O error while writing file: " + file_path.string() +
                               ": " + std::strerror(err));
        }
        written += static_cast<std::size_t>(n);
    }
    if (close(fd) != 0) {
        return failure(ActionKind::WriteFile, ExecutionError::IoFailure,
                       "Failed to close file: " + file_path.string());
    }

    ExecutionResult result;
    result.kind = ActionKind::WriteFile;
    result.success = true;
    result.byte_count = written;
    return result;
}

core::errors::Result<ExecutionResult> GuardedExecutor::run_plan(
    const protocol::PlanAction& plan, const SafetyConfig& config) const {
    ExecutionResult result;
    result.kind = ActionKind::Plan;
    result.success = true;

    std::size_t index = 1;
    for (const auto& step : plan.steps) {
        if (!result.success) {
            auto skipped = audit_.record_action(step, AuditStatus::Skipped,
                                                std::string("previous_step_failed"));
            if (core::errors::is_error(skipped)) {
                return core::errors::get_error(skipped);
            }
            result.steps.push_back(failure(protocol::kind_of(step),
                                           ExecutionError::Skipped,
                                           "Not run: an earlier step failed."));
            ++index;
            continue;
        }

        auto step_result = execute_audited(step, config);
        if (core::errors::is_error(step_result)) {
            return core::errors::get_error(step_result);
        }
        const ExecutionResult& executed = core::errors::get_value(step_result);
        result.byte_count += executed.byte_count;
        result.truncated = result.truncated || executed.truncated;
        if (!executed.success) {
            result.success = false;
            result.error = executed.error;
            result.error_message = "Plan step " + std::to_string(index) +
                                   " failed: " + executed.error_message;
        }
        result.steps.push_back(executed);
        ++index;
    }
    return result;
}

}  // namespace saferclaw::tools
