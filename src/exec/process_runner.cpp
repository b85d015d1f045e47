#include "exec/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include "core/logging/logger.hpp"
#include "core/shell/shell_words.hpp"

namespace drift::exec {

using core::errors::DriftError;
using core::errors::ErrorCategory;

namespace {

// How long killed commands get to release their pipes. Descendants that left
// the process group can hold them open indefinitely.
constexpr std::int64_t kPipeGraceMs = 1000;

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pair(int fds[2]) {
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
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(const ProcessSpec& spec, char* const* argv,
                             const int stdout_fd, const int stderr_fd) {
    static_cast<void>(setpgid(0, 0));

    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        static_cast<void>(dup2(null_fd, STDIN_FILENO));
        static_cast<void>(close(null_fd));
    }
    static_cast<void>(dup2(stdout_fd, STDOUT_FILENO));
    static_cast<void>(dup2(stderr_fd, STDERR_FILENO));

    if (!spec.working_directory.empty() && chdir(spec.working_directory.c_str()) != 0) {
        static const char kMessage[] = "drift: cannot enter working directory\n";
        static_cast<void>(write(STDERR_FILENO, kMessage, sizeof(kMessage) - 1));
        _exit(kSpawnFailureExitCode);
    }

    execvp(argv[0], argv);
    static const char kPrefix[] = "drift: cannot execute ";
    static_cast<void>(write(STDERR_FILENO, kPrefix, sizeof(kPrefix) - 1));
    static_cast<void>(write(STDERR_FILENO, argv[0], std::strlen(argv[0])));
    static_cast<void>(write(STDERR_FILENO, "\n", 1));
    _exit(kSpawnFailureExitCode);
}

}  // namespace

core::errors::Result<std::vector<std::string>> command_argv(const std::string& command) {
    if (core::shell::has_shell_metacharacters(command)) {
        return std::vector<std::string>{"/bin/sh", "-c", command};
    }
    const auto words = core::shell::split_words(command);
    if (!words.has_value() || words->empty()) {
        return DriftError{ErrorCategory::Execution,
                          "Command has no program to run: " + command,
                          "execution_failure"};
    }
    return words.value();
}

core::errors::Result<ProcessCapture> run_process(const ProcessSpec& spec) {
    if (spec.argv.empty()) {
        return DriftError{ErrorCategory::Execution, "Empty argument vector.",
                          "execution_failure"};
    }

    // Built before fork so the child does not allocate.
    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0) {
        return DriftError{ErrorCategory::Execution, "Failed to create process pipes.",
                          "execution_failure"};
    }
    if (pipe(stderr_pipe) != 0) {
        close_pair(stdout_pipe);
        return DriftError{ErrorCategory::Execution, "Failed to create process pipes.",
                          "execution_failure"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return DriftError{ErrorCategory::Execution,
                          std::string("Failed to fork process: ") + std::strerror(errno),
                          "execution_failure"};
    }

    if (pid == 0) {
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stderr_pipe[0]));
        exec_child(spec, argv.data(), stdout_pipe[1], stderr_pipe[1]);
    }

    // Also set from the parent so a timeout before the child runs still
    // targets the right group.
    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;
    std::int64_t killed_at_ms = 0;

    while (stdout_open || stderr_open || !child_exited) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (capture.timed_out && child_exited && elapsed - killed_at_ms > kPipeGraceMs) {
            DRIFT_LOG_WARN("Abandoning output pipes still held after timeout");
            if (stdout_open) {
                static_cast<void>(close(stdout_pipe[0]));
                stdout_open = false;
            }
            if (stderr_open) {
                static_cast<void>(close(stderr_pipe[0]));
                stderr_open = false;
            }
            break;
        }
        if (!capture.timed_out && spec.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(spec.timeout_ms)) {
            capture.timed_out = true;
            killed_at_ms = elapsed;
            DRIFT_LOG_WARN("Command exceeded " + std::to_string(spec.timeout_ms) +
                           " ms, killing process group " + std::to_string(pid));
            // Grandchildren may hold the pipes open after the child exits.
            static_cast<void>(kill(-pid, SIGKILL));
            if (!child_exited) {
                static_cast<void>(kill(pid, SIGKILL));
            }
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
            static_cast<void>(usleep(10000));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }
    }

    if (capture.timed_out) {
        capture.exit_code = kTimeoutExitCode;
    } else if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    capture.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    return capture;
}

}  // namespace drift::exec
