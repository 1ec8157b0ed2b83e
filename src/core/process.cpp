#include "toolroute/core/process.hpp"

#include <array>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace toolroute::core {

namespace {

void append_capped(std::string& out, const char* data, size_t n, size_t cap, bool& truncated) {
    if (out.size() >= cap) {
        truncated = true;
        return;
    }
    size_t room = cap - out.size();
    if (n > room) {
        n = room;
        truncated = true;
    }
    out.append(data, n);
}

}  // namespace

Result<ProcessResult, Error> run_process(const std::vector<std::string>& argv,
                                         const ProcessOptions& options) {
    if (argv.empty()) {
        return Result<ProcessResult, Error>::err(ErrorCode::ExecError, "Empty command");
    }

    int stdin_pipe[2];
    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdin_pipe) != 0) {
        return Result<ProcessResult, Error>::err(ErrorCode::ExecError, "Failed to create pipes");
    }
    if (pipe(stdout_pipe) != 0) {
        close(stdin_pipe[0]); close(stdin_pipe[1]);
        return Result<ProcessResult, Error>::err(ErrorCode::ExecError, "Failed to create pipes");
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdin_pipe[0]); close(stdin_pipe[1]);
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return Result<ProcessResult, Error>::err(ErrorCode::ExecError, "Failed to create pipes");
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();

    if (pid < 0) {
        close(stdin_pipe[0]); close(stdin_pipe[1]);
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return Result<ProcessResult, Error>::err(ErrorCode::ExecError, "Failed to fork");
    }

    if (pid == 0) {
        // Child process
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        close(stdin_pipe[0]); close(stdin_pipe[1]);
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);

        if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
            _exit(126);
        }

        execvp(c_argv[0], c_argv.data());
        _exit(127);
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    // Small payloads only; a plugin that never reads stdin gets EPIPE, not a hang
    signal(SIGPIPE, SIG_IGN);
    if (!options.stdin_data.empty()) {
        const char* data = options.stdin_data.data();
        size_t left = options.stdin_data.size();
        while (left > 0) {
            ssize_t n = write(stdin_pipe[1], data, left);
            if (n <= 0) {
                if (n < 0 && errno == EINTR) continue;
                break;
            }
            data += n;
            left -= static_cast<size_t>(n);
        }
    }
    close(stdin_pipe[1]);

    ProcessResult result;
    struct pollfd fds[2];
    fds[0].fd = stdout_pipe[0];
    fds[0].events = POLLIN;
    fds[1].fd = stderr_pipe[0];
    fds[1].events = POLLIN;

    std::array<char, 4096> buffer;
    auto start = std::chrono::steady_clock::now();
    int open_fds = 2;

    while (open_fds > 0) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        int remaining_ms = options.timeout_ms -
            static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());

        if (remaining_ms <= 0) {
            kill(pid, SIGKILL);
            result.timed_out = true;
            break;
        }

        int ret = poll(fds, 2, std::min(remaining_ms, 100));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) continue;

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0) continue;
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
                if (n > 0) {
                    auto& out = (i == 0) ? result.stdout_output : result.stderr_output;
                    append_capped(out, buffer.data(), static_cast<size_t>(n),
                                  options.max_output, result.truncated);
                } else {
                    close(fds[i].fd);
                    fds[i].fd = -1;
                    --open_fds;
                }
            }
        }
    }

    for (auto& fd : fds) {
        if (fd.fd >= 0) close(fd.fd);
    }

    int status = 0;
    waitpid(pid, &status, 0);
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }

    if (!result.timed_out && result.exit_code == 127 && result.stdout_output.empty()) {
        return Result<ProcessResult, Error>::err(
            ErrorCode::ExecError,
            "Failed to start process",
            argv[0]
        );
    }

    return Result<ProcessResult, Error>::ok(std::move(result));
}

}  // namespace toolroute::core
