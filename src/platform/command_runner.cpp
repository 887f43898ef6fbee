/**
 * @file command_runner.cpp
 * @brief POSIX fork/exec implementation of run_command().
 */

#include "platform/command_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

namespace fleet_router {

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr int kExitTimeout = 124;
constexpr int kExitExecFailed = 127;

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void append_limited(std::string& dst, const char* src, ssize_t n,
                    size_t limit, bool& truncated) {
    if (n <= 0) return;
    const size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    const size_t take = std::min<size_t>(static_cast<size_t>(n), avail);
    dst.append(src, take);
    if (take < static_cast<size_t>(n)) truncated = true;
}

/// Drain whatever is readable; closes the fd on EOF or hard error.
void drain(int& fd, std::string& dst, size_t limit, bool& truncated) {
    char buf[4096];
    while (fd >= 0) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            append_limited(dst, buf, n, limit, truncated);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        if (n < 0 && errno == EINTR) continue;
        close_fd(fd);
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

}  // anonymous namespace

Result<CommandResult> run_command(const CommandSpec& spec) {
    if (spec.argv.empty() || spec.argv.front().empty()) {
        return Error{ErrorCode::InvalidArgument, "empty command"};
    }
    ignore_sigpipe_once();

    // argv is built before fork so the child only calls async-signal-safe functions.
    std::vector<std::string> args = spec.argv;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe(in_pipe) != 0 || ::pipe(out_pipe) != 0 || ::pipe(err_pipe) != 0) {
        std::string reason = std::strerror(errno);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return Error{"pipe() failed: " + reason};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        std::string reason = std::strerror(errno);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return Error{"fork() failed: " + reason};
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            ::close(p[0]);
            ::close(p[1]);
        }
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(argv[0], argv.data());
        _exit(kExitExecFailed);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    int in_fd = in_pipe[1];
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    ::fcntl(in_fd, F_SETFL, O_NONBLOCK);
    ::fcntl(out_fd, F_SETFL, O_NONBLOCK);
    ::fcntl(err_fd, F_SETFL, O_NONBLOCK);

    if (spec.stdin_data.empty()) close_fd(in_fd);
    size_t written = 0;

    CommandResult result;
    bool stderr_truncated = false;
    const auto deadline = SteadyClock::now() + std::chrono::milliseconds(spec.timeout_ms);

    auto kill_child = [&] {
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
    };

    // ── I/O until both output pipes reach EOF ──
    while (out_fd >= 0 || err_fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - SteadyClock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        pollfd fds[3];
        nfds_t count = 0;
        if (out_fd >= 0) fds[count++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[count++] = {err_fd, POLLIN, 0};
        if (in_fd >= 0) fds[count++] = {in_fd, POLLOUT, 0};

        int ready = ::poll(fds, count, static_cast<int>(std::min<long long>(remaining, 100)));
        if (ready < 0 && errno != EINTR) break;

        drain(out_fd, result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
        drain(err_fd, result.stderr_text, spec.max_output_bytes, stderr_truncated);

        if (in_fd >= 0) {
            ssize_t n = ::write(in_fd, spec.stdin_data.data() + written,
                                spec.stdin_data.size() - written);
            if (n > 0) written += static_cast<size_t>(n);
            if ((n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                || written >= spec.stdin_data.size()) {
                close_fd(in_fd);
            }
        }
    }
    close_fd(in_fd);

    // ── Reap ──
    int status = 0;
    bool reaped = false;
    while (!result.timed_out) {
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            reaped = true;
            break;
        }
        if (w < 0 && errno != EINTR) break;
        if (SteadyClock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    if (!reaped) {
        kill_child();
        ::waitpid(pid, &status, 0);
    }
    close_fd(out_fd);
    close_fd(err_fd);

    result.exit_code = result.timed_out ? kExitTimeout : decode_status(status);
    return result;
}

std::string describe_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

}  // namespace fleet_router
