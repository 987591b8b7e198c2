#pragma once

#include <sys/types.h>

#include <optional>
#include <string>

#include "command.hpp"
#include "unique_fd.hpp"

namespace daemon_runner {
namespace process {

// How a child process ended
struct ExitStatus {
    enum class Reason { EXITED, SIGNALED };

    Reason reason = Reason::EXITED;
    int code = 0;  // Exit code for EXITED, signal number for SIGNALED

    bool success() const { return reason == Reason::EXITED && code == 0; }
    std::string to_string() const;

    bool operator==(const ExitStatus &other) const { return reason == other.reason && code == other.code; }
    bool operator!=(const ExitStatus &other) const { return !(*this == other); }

    static ExitStatus from_wait_status(int wait_status);
};

// ChildProcess owns one spawned OS process.
// Responsibilities:
// - Spawn with stdout/stderr redirected to pipes (stdin from /dev/null)
// - Non-blocking exit polling, caching the exit status once reaped
// - Signalling (SIGTERM / SIGKILL)
// - Kill on discard: the destructor always sends SIGKILL and reaps the child
class ChildProcess {
public:
    explicit ChildProcess(Command command);
    ~ChildProcess();

    // Delete copy/move
    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    // Spawn the process. Fails if the pipes cannot be created, fork fails or
    // the child cannot exec the program. Returns false and sets last_error()
    // on failure; the message includes the rendered command line.
    bool spawn();

    // OS process id, -1 before a successful spawn
    pid_t pid() const { return pid_; }

    bool spawned() const { return pid_ > 0; }

    // Non-blocking exit check. On success `status` is empty while the child is
    // running and holds the exit status once it has exited. Returns false on a
    // waitpid failure (sets last_error()).
    bool try_wait(std::optional<ExitStatus> &status);

    // Exit status if already observed by try_wait(), without polling
    const std::optional<ExitStatus> &exit_status() const { return exit_status_; }

    // Send SIGTERM. Returns true once the signal is issued, or when the process
    // has already exited.
    bool terminate();

    // Send SIGKILL. Same return semantics as terminate().
    bool kill();

    // Take ownership of the read ends of the output pipes.
    // Returns an invalid descriptor if already taken or not spawned.
    UniqueFd take_stdout() { return std::move(stdout_read_); }
    UniqueFd take_stderr() { return std::move(stderr_read_); }

    const Command &command() const { return command_; }

    // Get last error
    const std::string &last_error() const { return error_; }

private:
    Command command_;
    pid_t pid_ = -1;
    std::optional<ExitStatus> exit_status_;
    UniqueFd stdout_read_;
    UniqueFd stderr_read_;
    std::string error_;

    bool send_signal(int signal, const char *signal_name);
};

}  // namespace process
}  // namespace daemon_runner
