#pragma once

#include <string>

#include "process/command.hpp"
#include "result.hpp"

namespace daemon_runner {
namespace runner {

// DaemonAdapter is the hook set a concrete daemon type supplies to DaemonRunner.
//
// State is the daemon-defined blob the reader threads feed. The line handlers
// run on the reader threads with the runtime lock held: they must only mutate
// `state` (and read immutable adapter data) and must not block. Lines they do
// not recognise are ignored; they cannot report errors.
template <typename State>
class DaemonAdapter {
public:
    virtual ~DaemonAdapter() = default;

    // Idempotent setup before the first spawn (create directories, write the
    // config file). A second call before any process exists is a no-op.
    virtual Result prepare() = 0;

    // Executable and arguments; called on every start-up (start and restart)
    virtual process::Command build_command() const = 0;

    // Zero-value state for a fresh runtime record
    virtual State initial_state() const = 0;

    virtual void handle_stdout_line(State &state, const std::string &line) = 0;
    virtual void handle_stderr_line(State &state, const std::string &line) = 0;

    // Name used in log lines, e.g. `bitcoind "alice"`
    virtual std::string display_name() const = 0;
};

}  // namespace runner
}  // namespace daemon_runner
