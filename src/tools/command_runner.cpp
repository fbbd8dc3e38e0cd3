#include "tools/command_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace taskrun::tools {

using core::errors::ErrorCategory;
using core::errors::TaskError;

namespace {

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

// Reads whatever is available. Closes the descriptor on EOF or a hard error.
void drain(const int fd, bool& open, std::string& out) {
    if (!open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        open = false;
        static_cast<void>(close(fd));
        return;
    }
}

int decode_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    quoted.reserve(value.size() + 2);
    for (const char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

core::errors::Result<CommandOutcome> CommandRunner::run(const CommandRequest& request) const {
    if (request.command.empty()) {
        return TaskError{ErrorCategory::Input, "Command cannot be empty.", "empty_command"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(request.working_directory, ec) || ec) {
        return TaskError{ErrorCategory::Input,
                         "Working directory does not exist: " +
                             request.working_directory.string(),
                         "invalid_working_directory"};
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0) {
        return TaskError{ErrorCategory::Internal, "Failed to create stdout pipe.",
                         "pipe_creation_failed"};
    }
    if (pipe(err_pipe) != 0) {
        close_pair(out_pipe);
        return TaskError{ErrorCategory::Internal, "Failed to create stderr pipe.",
                         "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(out_pipe);
        close_pair(err_pipe);
        return TaskError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        // Own process group, so a timeout also reaches the shell's children.
        static_cast<void>(setpgid(0, 0));
        if (chdir(request.working_directory.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(out_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(err_pipe[1], STDERR_FILENO));
        close_pair(out_pipe);
        close_pair(err_pipe);
        execl("/bin/sh", "sh", "-c", request.command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(out_pipe[1]));
    static_cast<void>(close(err_pipe[1]));
    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    CommandOutcome outcome;
    bool out_open = true;
    bool err_open = true;
    bool exited = false;
    int status = 0;

    while (out_open || err_open || !exited) {
        if (!outcome.timed_out && request.timeout_ms > 0) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - started)
                                     .count();
            if (elapsed > static_cast<std::int64_t>(request.timeout_ms)) {
                outcome.timed_out = true;
                static_cast<void>(kill(-pid, SIGKILL));
            }
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) {
            fds[nfds].fd = out_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (err_open) {
            fds[nfds].fd = err_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        drain(out_pipe[0], out_open, outcome.stdout_text);
        drain(err_pipe[0], err_open, outcome.stderr_text);

        if (!exited && waitpid(pid, &status, WNOHANG) == pid) {
            exited = true;
        }
    }

    outcome.exit_code = decode_status(status);
    outcome.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    return outcome;
}

}  // namespace taskrun::tools
