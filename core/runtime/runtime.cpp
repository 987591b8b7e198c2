#include "runtime.hpp"

#include <algorithm>
#include <optional>
#include <sstream>
#include <thread>

#include "daemons/bitcoind.hpp"
#include "daemons/elementsd.hpp"
#include "daemons/generic.hpp"
#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace daemon_runner {
namespace runtime {

namespace {

// Forward collected stderr to the log, one line per entry
void log_stderr(const std::string &name, const std::string &output) {
    if (output.empty()) {
        return;
    }
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        LOG_DEBUG("[" << name << "] stderr: " << line);
    }
}

}  // namespace

Runtime::Runtime(const RunnerConfig &config) : config_(config) {}

Runtime::Runtime(const RunnerConfig &config, std::unique_ptr<runner::IDaemonRunner> daemon)
    : config_(config), daemon_(std::move(daemon)) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing daemon runner");

    if (!daemon_ && !build_daemon(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Supervising " << daemon_->display_name());
    return true;
}

bool Runtime::build_daemon(std::string &error) {
    const auto &daemon = config_.daemon;

    runner::RunnerOptions options;
    options.reader_start_delay = std::chrono::milliseconds(config_.runner.reader_start_delay_ms);
    options.restart_stop_timeout = std::chrono::milliseconds(config_.runner.restart_stop_timeout_ms);
    options.max_line_length = static_cast<size_t>(config_.runner.max_line_length);

    switch (daemon.type) {
        case DaemonType::BITCOIND: {
            auto node = daemons::Bitcoind::create(daemon.executable, daemon.bitcoind, error, daemon.name, options);
            if (!node) {
                return false;
            }
            daemons::Bitcoind *raw = node.get();
            report_progress_ = [raw]() { log_stderr(raw->display_name(), raw->take_stderr()); };
            daemon_ = std::move(node);
            break;
        }
        case DaemonType::ELEMENTSD: {
            auto node = daemons::Elementsd::create(daemon.executable, daemon.elementsd, error, daemon.name, options);
            if (!node) {
                return false;
            }
            daemons::Elementsd *raw = node.get();
            auto last_height = std::make_shared<std::optional<uint32_t>>();
            report_progress_ = [raw, last_height]() {
                auto tip = raw->last_update_tip();
                if (tip && (!*last_height || **last_height != tip->height)) {
                    LOG_INFO("[" << raw->display_name() << "] Tip height " << tip->height << " (" << tip->block_hash
                                 << ")");
                    *last_height = tip->height;
                }
                log_stderr(raw->display_name(), raw->take_stderr());
            };
            daemon_ = std::move(node);
            break;
        }
        case DaemonType::GENERIC: {
            auto node = daemons::GenericDaemon::create(daemon.generic, error, daemon.name, options);
            if (!node) {
                return false;
            }
            daemons::GenericDaemon *raw = node.get();
            auto was_ready = std::make_shared<bool>(false);
            report_progress_ = [raw, was_ready]() {
                if (!*was_ready && raw->is_ready()) {
                    LOG_INFO("[" << raw->display_name() << "] Daemon is ready");
                    *was_ready = true;
                }
                LOG_TRACE("[" << raw->display_name() << "] " << raw->stdout_line_count() << " stdout / "
                              << raw->stderr_line_count() << " stderr lines");
            };
            daemon_ = std::move(node);
            break;
        }
    }

    return true;
}

int Runtime::run() {
    if (!daemon_) {
        LOG_ERROR("[Runtime] Not initialized");
        return 1;
    }

    const std::string name = daemon_->display_name();

    runner::Result started = daemon_->start();
    if (!started.ok()) {
        LOG_ERROR("[Runtime] Failed to start " << name << ": " << started.to_string());
        return 1;
    }

    running_ = true;
    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    const auto interval = std::chrono::milliseconds(config_.runner.poll_interval_ms);

    // Main loop: status polling and progress reporting
    while (running_) {
        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal " << SignalHandler::last_signal() << " received, stopping " << name);
            running_ = false;
            break;
        }

        runner::DaemonStatus status;
        runner::Result polled = daemon_->status(status);
        if (!polled.ok()) {
            LOG_ERROR("[Runtime] Status check failed for " << name << ": " << polled.to_string());
            return 1;
        }

        if (report_progress_) {
            report_progress_();
        }

        if (status.is_stopped()) {
            LOG_WARN("[Runtime] " << name << " exited on its own: " << status.exit->to_string());
            return exit_code_for(*status.exit);
        }

        std::this_thread::sleep_for(interval);
    }

    LOG_INFO("[Runtime] Shutting down");
    return stop_daemon();
}

int Runtime::stop_daemon() {
    const std::string name = daemon_->display_name();

    runner::Result stopped = daemon_->stop();
    if (!stopped.ok()) {
        LOG_ERROR("[Runtime] Failed to stop " << name << ": " << stopped.to_string());
        return 1;
    }

    const auto timeout = std::chrono::milliseconds(config_.runner.stop_timeout_ms);
    const auto poll = std::min(std::chrono::milliseconds(50), std::chrono::milliseconds(config_.runner.poll_interval_ms));
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (std::chrono::steady_clock::now() < deadline) {
        runner::DaemonStatus status;
        runner::Result polled = daemon_->status(status);
        if (!polled.ok()) {
            LOG_ERROR("[Runtime] Status check failed for " << name << ": " << polled.to_string());
            return 1;
        }
        if (status.is_stopped()) {
            if (report_progress_) {
                report_progress_();
            }
            LOG_INFO("[Runtime] " << name << " stopped: " << status.exit->to_string());
            return 0;
        }
        std::this_thread::sleep_for(poll);
    }

    LOG_WARN("[Runtime] " << name << " did not exit within " << config_.runner.stop_timeout_ms
                          << "ms, killing it");
    shutdown();
    return kForcedShutdownExitCode;
}

void Runtime::shutdown() {
    if (daemon_) {
        LOG_DEBUG("[Runtime] Releasing " << daemon_->display_name());
        report_progress_ = nullptr;
        daemon_.reset();
    }
}

int Runtime::exit_code_for(const process::ExitStatus &exit) {
    if (exit.reason == process::ExitStatus::Reason::SIGNALED) {
        return 128 + exit.code;
    }
    return exit.code;
}

}  // namespace runtime
}  // namespace daemon_runner
