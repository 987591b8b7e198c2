#pragma once

#include <optional>
#include <string>

#include "process/child_process.hpp"

namespace daemon_runner {
namespace runner {

// Lifecycle status of a supervised daemon.
// INIT -> RUNNING -> STOPPED; STOPPED -> RUNNING only through restart().
struct DaemonStatus {
    enum class State { INIT, RUNNING, STOPPED };

    State state = State::INIT;
    std::optional<process::ExitStatus> exit;  // Set only for STOPPED

    static DaemonStatus init() { return DaemonStatus{}; }
    static DaemonStatus running() { return DaemonStatus{State::RUNNING, std::nullopt}; }
    static DaemonStatus stopped(const process::ExitStatus &exit_status) {
        return DaemonStatus{State::STOPPED, exit_status};
    }

    bool is_init() const { return state == State::INIT; }
    bool is_running() const { return state == State::RUNNING; }
    bool is_stopped() const { return state == State::STOPPED; }

    // "Init", "Running", "Stopped(exit code 0)"
    std::string to_string() const;

    bool operator==(const DaemonStatus &other) const { return state == other.state && exit == other.exit; }
    bool operator!=(const DaemonStatus &other) const { return !(*this == other); }
};

}  // namespace runner
}  // namespace daemon_runner
