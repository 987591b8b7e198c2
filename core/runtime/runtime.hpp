#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "config.hpp"
#include "process/child_process.hpp"
#include "runner/i_daemon_runner.hpp"

namespace daemon_runner {
namespace runtime {

// Exit code of run() when the daemon was SIGKILLed after stop_timeout_ms
constexpr int kForcedShutdownExitCode = 2;

// Supervises the single daemon described by a RunnerConfig until it exits
// or a shutdown is requested (signal or stop()).
class Runtime {
public:
    explicit Runtime(const RunnerConfig &config);

    // Supervise an already constructed daemon instead of building one from config
    Runtime(const RunnerConfig &config, std::unique_ptr<runner::IDaemonRunner> daemon);

    ~Runtime();

    // Build the daemon from config (no-op when one was injected)
    bool initialize(std::string &error);

    // Main loop (blocking). Returns the process exit code:
    // 0 on requested shutdown, 1 on start or stop failure, kForcedShutdownExitCode
    // when the daemon ignored SIGTERM and had to be killed, otherwise the
    // daemon's own exit code.
    int run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Release (and thereby kill) the daemon
    void shutdown();

    runner::IDaemonRunner *daemon() { return daemon_.get(); }

    // 128 + signal number for signalled exits, like a shell
    static int exit_code_for(const process::ExitStatus &exit);

private:
    bool build_daemon(std::string &error);

    // SIGTERM, then wait up to stop_timeout_ms. Returns the exit code for run().
    int stop_daemon();

    RunnerConfig config_;
    std::unique_ptr<runner::IDaemonRunner> daemon_;

    // Logs milestone changes and drains daemon output; set per daemon type
    std::function<void()> report_progress_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace daemon_runner
