#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "runner/daemon_adapter.hpp"
#include "runner/daemon_runner.hpp"

namespace daemon_runner {
namespace daemons {

// stdout lines longer than this are never matched against ready_pattern:
// libstdc++'s std::regex recurses per character and would overflow the
// reader thread's stack.
constexpr size_t kMaxReadyMatchLength = 4096;

// Any daemon described purely by configuration
struct GenericConfig {
    std::string executable;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string working_dir;  // Created by prepare() when missing

    // ECMAScript regex; the daemon is "ready" once a stdout line of at most
    // kMaxReadyMatchLength bytes matches
    std::optional<std::string> ready_pattern;

    size_t tail_lines = 100;  // Recent lines kept per stream
};

struct GenericState {
    size_t stdout_lines = 0;
    size_t stderr_lines = 0;
    std::deque<std::string> stdout_tail;
    std::deque<std::string> stderr_tail;
    bool ready = false;
};

class GenericAdapter : public runner::DaemonAdapter<GenericState> {
public:
    // Throws std::regex_error for an invalid ready_pattern; use GenericDaemon::create()
    GenericAdapter(std::string name, GenericConfig config);

    runner::Result prepare() override;
    process::Command build_command() const override;
    GenericState initial_state() const override { return GenericState{}; }

    void handle_stdout_line(GenericState &state, const std::string &line) override;
    void handle_stderr_line(GenericState &state, const std::string &line) override;

    std::string display_name() const override;

    const GenericConfig &config() const { return config_; }

private:
    std::string name_;
    GenericConfig config_;
    std::optional<std::regex> ready_regex_;
    bool prepared_ = false;

    void push_tail(std::deque<std::string> &tail, const std::string &line) const;
};

class GenericDaemon : public runner::DaemonRunner<GenericState> {
public:
    // Returns nullptr and sets `error` for a missing executable or a bad ready_pattern
    static std::unique_ptr<GenericDaemon> create(const GenericConfig &config, std::string &error,
                                                 const std::string &name = "",
                                                 runner::RunnerOptions options = runner::RunnerOptions());

    // True once a stdout line matched ready_pattern (always false without one)
    bool is_ready() const;

    size_t stdout_line_count() const;
    size_t stderr_line_count() const;

    std::vector<std::string> recent_stdout() const;
    std::vector<std::string> recent_stderr() const;

    const GenericAdapter &node() const { return *node_; }

private:
    GenericDaemon(std::shared_ptr<GenericAdapter> node, runner::RunnerOptions options);

    std::shared_ptr<GenericAdapter> node_;
};

}  // namespace daemons
}  // namespace daemon_runner
