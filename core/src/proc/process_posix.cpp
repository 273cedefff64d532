/**
 * @file process_posix.cpp
 * @brief fork/exec child processes with bounded waits
 */

#include "ftbench/proc/process.hpp"
#include "ftbench/log.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ftbench { namespace proc {

using Clock = std::chrono::steady_clock;

constexpr int kMaxDrainChunks = 16;

static int64_t ms_until(Clock::time_point deadline) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now()).count();
}

ft_status Process::spawn(const std::vector<std::string>& argv,
                         const Options& opts, std::unique_ptr<Process>* out) {
    if (!out || argv.empty()) return FT_ERROR_INVALID_ARG;

    /* Everything the child touches is prepared before fork */
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int fds[2] = {-1, -1};
    const bool capture = opts.capture_stdout || opts.capture_stderr;
    if (capture && ::pipe2(fds, O_CLOEXEC) != 0) {
        ft_log(FT_LOG_ERROR, "proc", "pipe2: %s", std::strerror(errno));
        return FT_ERROR_SPAWN;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ft_log(FT_LOG_ERROR, "proc", "fork: %s", std::strerror(errno));
        if (capture) { ::close(fds[0]); ::close(fds[1]); }
        return FT_ERROR_SPAWN;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(opts.capture_stdout ? fds[1] : devnull, STDOUT_FILENO);
        ::dup2(opts.capture_stderr ? fds[1] : devnull, STDERR_FILENO);
        ::execvp(cargv[0], cargv.data());
        ::_exit(127);
    }

    /* Child calls setpgid too; whichever runs first wins */
    if (::setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH)
        ft_log(FT_LOG_DEBUG, "proc", "setpgid(%d): %s", (int)pid, std::strerror(errno));

    int read_fd = -1;
    if (capture) {
        ::close(fds[1]);
        read_fd = fds[0];
        int fl = ::fcntl(read_fd, F_GETFL, 0);
        if (fl < 0 || ::fcntl(read_fd, F_SETFL, fl | O_NONBLOCK) < 0)
            ft_log(FT_LOG_WARN, "proc", "pipe O_NONBLOCK: %s", std::strerror(errno));
    }

    out->reset(new Process(pid, read_fd));
    ft_log(FT_LOG_TRACE, "proc", "spawned pid %d: %s", (int)pid, argv[0].c_str());
    return FT_OK;
}

ft_status Process::spawn_shell(const std::string& cmd, bool capture,
                               std::unique_ptr<Process>* out) {
    Options opts;
    opts.capture_stdout = capture;
    return spawn({"/bin/sh", "-c", cmd}, opts, out);
}

Process::~Process() {
    if (!reaped_) terminate(100);
    close_pipe();
}

bool Process::reap(bool block) {
    if (reaped_) return true;
    int st = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &st, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == 0) return false;
    reaped_ = true;
    if (r == pid_) {
        if (WIFEXITED(st))   exit_code_   = WEXITSTATUS(st);
        if (WIFSIGNALED(st)) term_signal_ = WTERMSIG(st);
    } else {
        ft_log(FT_LOG_WARN, "proc", "waitpid(%d): %s", (int)pid_, std::strerror(errno));
    }
    return true;
}

void Process::drain(int poll_ms) {
    if (out_fd_ < 0) {
        if (poll_ms > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(poll_ms));
        return;
    }

    struct pollfd pfd;
    pfd.fd      = out_fd_;
    pfd.events  = POLLIN;
    pfd.revents = 0;
    int r = ::poll(&pfd, 1, poll_ms);
    if (r <= 0) return;

    /* At most kMaxDrainChunks reads per call, even if the writer never pauses */
    char buf[4096];
    for (int chunk = 0; chunk < kMaxDrainChunks; ++chunk) {
        ssize_t n = ::read(out_fd_, buf, sizeof(buf));
        if (n > 0) {
            output_.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) { close_pipe(); return; }         /* EOF */
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) close_pipe();
        return;
    }
}

void Process::close_pipe() {
    if (out_fd_ >= 0) {
        ::close(out_fd_);
        out_fd_ = -1;
    }
}

bool Process::running() {
    if (reaped_) return false;
    drain(0);
    return !reap(false);
}

ft_status Process::wait_for(uint64_t timeout_ms) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    for (;;) {
        if (reap(false)) {
            /* Collect what is left; a surviving grandchild may hold the
             * pipe open, so stop once a short poll yields nothing or the
             * deadline passes. */
            size_t before;
            do {
                before = output_.size();
                drain(10);
            } while (out_fd_ >= 0 && output_.size() != before &&
                     ms_until(deadline) > 0);
            return FT_OK;
        }

        int64_t left = ms_until(deadline);
        if (left <= 0) return FT_ERROR_TIMEOUT;
        drain(static_cast<int>(std::min<int64_t>(left, 20)));
    }
}

ft_status Process::terminate(uint64_t grace_ms) {
    if (reaped_) {
        close_pipe();
        return FT_OK;
    }

    if (::kill(-pid_, SIGTERM) != 0 && ::kill(pid_, SIGTERM) != 0 && errno != ESRCH)
        ft_log(FT_LOG_WARN, "proc", "SIGTERM %d: %s", (int)pid_, std::strerror(errno));

    auto deadline = Clock::now() + std::chrono::milliseconds(grace_ms);
    while (!reap(false)) {
        if (ms_until(deadline) <= 0) {
            ft_log(FT_LOG_DEBUG, "proc", "pid %d ignored SIGTERM, killing", (int)pid_);
            if (::kill(-pid_, SIGKILL) != 0 && ::kill(pid_, SIGKILL) != 0 && errno != ESRCH)
                ft_log(FT_LOG_WARN, "proc", "SIGKILL %d: %s", (int)pid_, std::strerror(errno));
            reap(true);
            break;
        }
        drain(10);
    }

    close_pipe();
    return FT_OK;
}

}} // namespace ftbench::proc
