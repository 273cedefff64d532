/**
 * @file process.hpp
 * @brief ftbench proc: Child process handle (POSIX)
 *
 * A Process is a forked child running in its own process group, with its
 * stdout optionally captured through a non-blocking pipe. Waiting is
 * always bounded; terminate() signals the whole group (SIGTERM, then
 * SIGKILL after a grace period) and reaps it. The destructor terminates a
 * child that is still running, so a handle never leaks a zombie.
 */

#ifndef FTBENCH_PROC_PROCESS_HPP
#define FTBENCH_PROC_PROCESS_HPP

#include "ftbench/ft_status.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

namespace ftbench { namespace proc {

class Process {
public:
    struct Options {
        bool capture_stdout = true;
        bool capture_stderr = false;   /* merged into the stdout pipe */
    };

    /** fork + execvp(argv[0], argv). */
    static ft_status spawn(const std::vector<std::string>& argv,
                           const Options& opts, std::unique_ptr<Process>* out);

    /** Run `cmd` through /bin/sh -c. */
    static ft_status spawn_shell(const std::string& cmd, bool capture,
                                 std::unique_ptr<Process>* out);

    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    pid_t pid() const { return pid_; }

    /** Non-blocking: true while the child has not been reaped. */
    bool running();

    /** Wait up to timeout_ms for the child to exit, draining stdout
     *  meanwhile. FT_OK once reaped, FT_ERROR_TIMEOUT if still running. */
    ft_status wait_for(uint64_t timeout_ms);

    /** SIGTERM the process group, SIGKILL after grace_ms, then reap. */
    ft_status terminate(uint64_t grace_ms = 500);

    /** Captured stdout so far. */
    const std::string& output() const { return output_; }

    /** Exit status once reaped; -1 while running or when killed by a signal. */
    int exit_code() const { return exit_code_; }
    int term_signal() const { return term_signal_; }

private:
    Process(pid_t pid, int out_fd) : pid_(pid), out_fd_(out_fd) {}

    bool reap(bool block);
    void drain(int poll_ms);
    void close_pipe();

    pid_t       pid_         = -1;
    int         out_fd_      = -1;
    bool        reaped_      = false;
    int         exit_code_   = -1;
    int         term_signal_ = 0;
    std::string output_;
};

}} // namespace ftbench::proc

#endif // FTBENCH_PROC_PROCESS_HPP
