#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>

#include "daemon_adapter.hpp"
#include "daemon_status.hpp"
#include "i_daemon_runner.hpp"
#include "line_reader.hpp"
#include "logging/logger.hpp"
#include "process/child_process.hpp"
#include "result.hpp"
#include "runtime_data.hpp"

namespace daemon_runner {
namespace runner {

struct RunnerOptions {
    // Delay before each reader thread starts reading its pipe. Tolerates
    // daemons that are slow to produce output right after spawn; tunable,
    // not a correctness requirement.
    std::chrono::milliseconds reader_start_delay{1000};

    // Output lines longer than this are split into several lines (see LineReader)
    size_t max_line_length = kDefaultMaxLineLength;

    // How long restart() waits for a running daemon to exit after SIGTERM.
    // A daemon still alive after that is killed before the new one is spawned.
    std::chrono::milliseconds restart_stop_timeout{5000};
};

enum class OutputStream { STDOUT, STDERR };

inline const char *output_stream_name(OutputStream stream) {
    return stream == OutputStream::STDOUT ? "stdout" : "stderr";
}

inline Result invalid_state(const std::string &operation, const DaemonStatus &status) {
    return Result::failure(ErrorCode::INVALID_STATE, "cannot " + operation + ": daemon is " + status.to_string());
}

// DaemonRunner supervises one external daemon process.
//
// Lifecycle: INIT --start()--> RUNNING --exit/stop()--> STOPPED --restart()--> RUNNING
//
// start() prepares the adapter, spawns the command and launches two reader
// threads (stdout, stderr) that feed every output line to the adapter's
// handlers under the runtime lock. stop() only sends SIGTERM; the exit is
// observed by a later status() poll. Destroying the runner kills the daemon.
//
// The reader threads are not joined by stop(): state updates from lines that
// were already buffered may still land shortly after stop() returns.
template <typename State>
class DaemonRunner : public IDaemonRunner {
public:
    using Adapter = DaemonAdapter<State>;
    using Runtime = RuntimeData<State>;

    explicit DaemonRunner(std::shared_ptr<Adapter> adapter, RunnerOptions options = RunnerOptions())
        : adapter_(std::move(adapter)), options_(options) {}

    ~DaemonRunner() override {
        auto rt = runtime();
        if (!rt) {
            return;
        }

        std::unique_ptr<process::ChildProcess> process;
        {
            std::lock_guard<std::mutex> lock(rt->mutex);
            process = std::move(rt->process);
        }
        if (process && !process->exit_status()) {
            LOG_DEBUG("[" << adapter_->display_name() << "] Runner discarded, killing PID " << process->pid());
        }
        // Kill-on-discard happens in ~ChildProcess
        process.reset();
    }

    // Delete copy/move
    DaemonRunner(const DaemonRunner &) = delete;
    DaemonRunner &operator=(const DaemonRunner &) = delete;

    // Start the daemon for the first time. Only valid from INIT; restarting
    // after a stop goes through restart().
    Result start() override {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

        DaemonStatus current;
        Result polled = status(current);
        if (!polled.ok()) {
            return polled;
        }
        if (!current.is_init()) {
            return invalid_state("start", current);
        }

        Result prepared = adapter_->prepare();
        if (!prepared.ok()) {
            LOG_ERROR("[" << adapter_->display_name() << "] Prepare failed: " << prepared.message);
            return prepared;
        }

        auto rt = std::make_shared<Runtime>(adapter_->initial_state());
        Result started = start_up(rt);
        if (!started.ok()) {
            return started;
        }

        std::lock_guard<std::mutex> lock(slot_mutex_);
        runtime_ = std::move(rt);
        return Result::success();
    }

    // Restart with the same state. A running daemon gets SIGTERM and up to
    // restart_stop_timeout to exit; after that it is SIGKILLed. The new
    // process is spawned only once the old one is gone.
    Result restart() override {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

        DaemonStatus current;
        Result polled = status(current);
        if (!polled.ok()) {
            return polled;
        }
        if (current.is_init()) {
            return invalid_state("restart", current);
        }
        if (current.is_running()) {
            Result stopped = stop_locked();
            if (!stopped.ok()) {
                return stopped;
            }
            Result exited = wait_for_exit(options_.restart_stop_timeout);
            if (!exited.ok()) {
                return exited;
            }
        }

        return start_up(runtime());
    }

    // Send SIGTERM to the daemon. No-op if it already stopped. State is kept
    // so that the daemon can be restarted with restart().
    Result stop() override {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        return stop_locked();
    }

    // Non-blocking liveness check. The only operation that observes RUNNING -> STOPPED.
    Result status(DaemonStatus &out) override {
        auto rt = runtime();
        if (!rt) {
            out = DaemonStatus::init();
            return Result::success();
        }

        std::lock_guard<std::mutex> lock(rt->mutex);
        if (!rt->process) {
            return Result::failure(ErrorCode::IO_FAILURE, "runtime record has no process");
        }

        std::optional<process::ExitStatus> exit;
        if (!rt->process->try_wait(exit)) {
            return Result::failure(ErrorCode::IO_FAILURE, rt->process->last_error());
        }
        out = exit ? DaemonStatus::stopped(*exit) : DaemonStatus::running();
        return Result::success();
    }

    std::optional<pid_t> pid() const override {
        auto rt = runtime();
        if (!rt) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(rt->mutex);
        if (!rt->process) {
            return std::nullopt;
        }
        return rt->process->pid();
    }

    std::string display_name() const override { return adapter_->display_name(); }

    // Run fn(State &) under the runtime lock.
    // Returns std::optional<R> (empty before start()) or, for void fn, whether it ran.
    template <typename Fn>
    auto with_state(Fn &&fn) const {
        using R = std::invoke_result_t<Fn, State &>;
        auto rt = runtime();
        if constexpr (std::is_void_v<R>) {
            if (!rt) {
                return false;
            }
            std::lock_guard<std::mutex> lock(rt->mutex);
            fn(rt->state);
            return true;
        } else {
            if (!rt) {
                return std::optional<R>();
            }
            std::lock_guard<std::mutex> lock(rt->mutex);
            return std::optional<R>(fn(rt->state));
        }
    }

    // Copy of the current state, empty before start()
    std::optional<State> state_snapshot() const {
        return with_state([](State &state) { return state; });
    }

    const RunnerOptions &options() const { return options_; }

protected:
    Adapter &adapter() { return *adapter_; }
    const Adapter &adapter() const { return *adapter_; }

private:
    std::shared_ptr<Adapter> adapter_;
    RunnerOptions options_;

    // Serialises start/restart/stop against each other
    std::mutex lifecycle_mutex_;

    // Guards the runtime_ slot itself (not its contents)
    mutable std::mutex slot_mutex_;
    std::shared_ptr<Runtime> runtime_;

    std::shared_ptr<Runtime> runtime() const {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        return runtime_;
    }

    Result stop_locked() {
        DaemonStatus current;
        Result polled = status(current);
        if (!polled.ok()) {
            return polled;
        }
        if (current.is_init()) {
            return invalid_state("stop", current);
        }
        if (current.is_stopped()) {
            return Result::success();
        }

        auto rt = runtime();
        std::lock_guard<std::mutex> lock(rt->mutex);

        LOG_INFO("[" << adapter_->display_name() << "] Stopping daemon (PID=" << rt->process->pid() << ")");
        if (!rt->process->terminate()) {
            LOG_ERROR("[" << adapter_->display_name() << "] " << rt->process->last_error());
            return Result::failure(ErrorCode::IO_FAILURE, rt->process->last_error());
        }

        LOG_INFO("[" << adapter_->display_name() << "] Stop signal sent");
        return Result::success();
    }

    // Poll until the daemon exits or `timeout` elapses, then SIGKILL it if
    // it is still alive. The kill is reaped by start_up() replacing the handle.
    Result wait_for_exit(std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            DaemonStatus current;
            Result polled = status(current);
            if (!polled.ok()) {
                return polled;
            }
            if (current.is_stopped()) {
                return Result::success();
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        auto rt = runtime();
        std::lock_guard<std::mutex> lock(rt->mutex);
        LOG_WARN("[" << adapter_->display_name() << "] Daemon did not exit within " << timeout.count()
                     << "ms of SIGTERM, killing PID " << rt->process->pid());
        if (!rt->process->kill()) {
            return Result::failure(ErrorCode::IO_FAILURE, rt->process->last_error());
        }
        return Result::success();
    }

    // Spawn the adapter's command and attach fresh reader threads to `rt`.
    // Used by start() (fresh record) and restart() (existing record).
    Result start_up(const std::shared_ptr<Runtime> &rt) {
        const std::string name = adapter_->display_name();
        LOG_INFO("[" << name << "] Starting daemon");

        auto child = std::make_unique<process::ChildProcess>(adapter_->build_command());
        LOG_DEBUG("[" << name << "] Launching with command: " << child->command().to_string());

        if (!child->spawn()) {
            LOG_ERROR("[" << name << "] " << child->last_error());
            return Result::failure(ErrorCode::SPAWN_FAILURE, child->last_error());
        }

        const pid_t pid = child->pid();
        process::UniqueFd stdout_fd = child->take_stdout();
        process::UniqueFd stderr_fd = child->take_stderr();

        std::unique_ptr<process::ChildProcess> previous;
        std::thread previous_stdout;
        std::thread previous_stderr;
        Result result = Result::success();
        {
            std::lock_guard<std::mutex> lock(rt->mutex);
            previous = std::move(rt->process);
            rt->process = std::move(child);
            previous_stdout = std::move(rt->stdout_thread);
            previous_stderr = std::move(rt->stderr_thread);

            try {
                rt->stdout_thread = std::thread(&DaemonRunner::reader_loop, rt, adapter_, OutputStream::STDOUT,
                                                std::move(stdout_fd), options_, name);
                rt->stderr_thread = std::thread(&DaemonRunner::reader_loop, rt, adapter_, OutputStream::STDERR,
                                                std::move(stderr_fd), options_, name);
            } catch (const std::system_error &e) {
                // Closing the pipes through the kill retires a loop that did start
                rt->process->kill();
                result = Result::failure(ErrorCode::IO_FAILURE,
                                         std::string("failed to start reader thread: ") + e.what());
            }
        }

        // Loops of the previous process retire on their own when its pipes close
        if (previous_stdout.joinable()) {
            previous_stdout.detach();
        }
        if (previous_stderr.joinable()) {
            previous_stderr.detach();
        }
        previous.reset();

        if (!result.ok()) {
            LOG_ERROR("[" << name << "] " << result.message);
            return result;
        }

        LOG_INFO("[" << name << "] Daemon started. PID: " << pid);
        return result;
    }

    static void reader_loop(std::shared_ptr<Runtime> rt, std::shared_ptr<Adapter> adapter, OutputStream stream,
                            process::UniqueFd fd, RunnerOptions options, std::string name) {
        if (options.reader_start_delay.count() > 0) {
            std::this_thread::sleep_for(options.reader_start_delay);
        }

        LineReader reader(std::move(fd), options.max_line_length);
        Result result = reader.run([&](const std::string &line) {
            std::lock_guard<std::mutex> lock(rt->mutex);
            if (stream == OutputStream::STDOUT) {
                adapter->handle_stdout_line(rt->state, line);
            } else {
                adapter->handle_stderr_line(rt->state, line);
            }
        });

        if (!result.ok()) {
            LOG_ERROR("[" << name << "] " << output_stream_name(stream)
                          << " reader stopped: " << result.to_string());
        } else {
            LOG_TRACE("[" << name << "] " << output_stream_name(stream) << " reader finished after "
                          << reader.lines_delivered() << " lines");
        }
    }
};

}  // namespace runner
}  // namespace daemon_runner
