#include "runtime/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace xcdelta::runtime {

using core::errors::DeltaError;
using core::errors::ErrorCategory;

namespace {

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

// Splits buffered output into lines, keeping any unterminated tail.
void emit_lines(std::string& pending, const OutputStream stream,
                const LineHandler& on_line) {
    std::size_t start = 0;
    while (true) {
        const auto newline = pending.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        std::string line = pending.substr(start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (on_line) {
            on_line(stream, line);
        }
        start = newline + 1;
    }
    pending.erase(0, start);
}

void drain_pipe(const int fd, bool& is_open, std::string& pending,
                const OutputStream stream, const LineHandler& on_line) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            pending.append(buffer, static_cast<std::size_t>(n));
            emit_lines(pending, stream, on_line);
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            break;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        break;
    }

    if (!pending.empty() && on_line) {
        on_line(stream, pending);
    }
    pending.clear();
}

// Built before fork(); the child may not allocate.
std::vector<std::string> merged_environment(
    const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string text(*entry);
        const auto eq = text.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[text.substr(0, eq)] = text.substr(eq + 1);
    }
    for (const auto& entry : overrides) {
        merged[entry.first] = entry.second;
    }

    std::vector<std::string> flattened;
    flattened.reserve(merged.size());
    for (const auto& entry : merged) {
        flattened.push_back(entry.first + "=" + entry.second);
    }
    return flattened;
}

void kill_group(const pid_t pid) {
    // The child leads its own process group, so helpers it spawned go too.
    if (kill(-pid, SIGKILL) != 0) {
        static_cast<void>(kill(pid, SIGKILL));
    }
}

}  // namespace

core::errors::Result<ProcessExit> ProcessRunner::run(const ProcessSpec& spec,
                                                     const LineHandler& on_line) const {
    if (spec.argv.empty() || spec.argv.front().empty()) {
        return DeltaError{ErrorCategory::InvalidRequest,
                          "Process command line cannot be empty.",
                          "empty_command"};
    }
    if (spec.cancel_token && spec.cancel_token->load()) {
        ProcessExit exit;
        exit.cancelled = true;
        return exit;
    }

    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const std::vector<std::string> env_entries = merged_environment(spec.environment);
    std::vector<char*> envp;
    envp.reserve(env_entries.size() + 1);
    for (const auto& entry : env_entries) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return DeltaError{ErrorCategory::Internal, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return DeltaError{ErrorCategory::Internal, "Failed to fork process.",
                          "process_spawn_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        if (chdir(spec.working_directory.c_str()) != 0) {
            _exit(126);
        }
        environ = envp.data();
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessExit exit;
    std::string stdout_pending;
    std::string stderr_pending;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool killed = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        if (!killed && !child_exited && spec.cancel_token && spec.cancel_token->load()) {
            exit.cancelled = true;
            killed = true;
            kill_group(pid);
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (!killed && !child_exited && spec.timeout_ms > 0 &&
            static_cast<std::uint64_t>(elapsed) > spec.timeout_ms) {
            exit.timed_out = true;
            killed = true;
            kill_group(pid);
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
        } else if (!child_exited) {
            static_cast<void>(usleep(10000));
        }

        drain_pipe(stdout_pipe[0], stdout_open, stdout_pending, OutputStream::Stdout,
                   on_line);
        drain_pipe(stderr_pipe[0], stderr_open, stderr_pending, OutputStream::Stderr,
                   on_line);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // A grandchild holding the pipes open must not keep a killed run alive.
        if (child_exited && killed) {
            if (stdout_open) {
                static_cast<void>(close(stdout_pipe[0]));
                stdout_open = false;
            }
            if (stderr_open) {
                static_cast<void>(close(stderr_pipe[0]));
                stderr_open = false;
            }
        }
    }

    if (WIFEXITED(status)) {
        exit.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit.exit_code = 128 + WTERMSIG(status);
    } else {
        exit.exit_code = -1;
    }

    exit.duration_ms = std::chrono::duration<double, std::milli>(
                           std::chrono::steady_clock::now() - started)
                           .count();
    return exit;
}

}  // namespace xcdelta::runtime
