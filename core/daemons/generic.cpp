#include "generic.hpp"

#include <filesystem>
#include <system_error>

#include "logging/logger.hpp"

namespace daemon_runner {
namespace daemons {

GenericAdapter::GenericAdapter(std::string name, GenericConfig config)
    : name_(std::move(name)), config_(std::move(config)) {
    if (config_.ready_pattern) {
        ready_regex_.emplace(*config_.ready_pattern);
    }
}

runner::Result GenericAdapter::prepare() {
    if (prepared_) {
        return runner::Result::success();
    }

    if (!config_.working_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config_.working_dir, ec);
        if (ec) {
            return runner::Result::failure(runner::ErrorCode::ADAPTER_FAILURE,
                                           "Cannot create working directory " + config_.working_dir + ": " +
                                               ec.message());
        }
    }

    prepared_ = true;
    return runner::Result::success();
}

process::Command GenericAdapter::build_command() const {
    process::Command cmd(config_.executable, config_.args);
    cmd.env = config_.env;
    cmd.working_dir = config_.working_dir;
    return cmd;
}

void GenericAdapter::push_tail(std::deque<std::string> &tail, const std::string &line) const {
    if (config_.tail_lines == 0) {
        return;
    }
    tail.push_back(line);
    while (tail.size() > config_.tail_lines) {
        tail.pop_front();
    }
}

void GenericAdapter::handle_stdout_line(GenericState &state, const std::string &line) {
    ++state.stdout_lines;
    push_tail(state.stdout_tail, line);

    if (!state.ready && ready_regex_ && line.size() <= kMaxReadyMatchLength &&
        std::regex_search(line, *ready_regex_)) {
        state.ready = true;
    }
}

void GenericAdapter::handle_stderr_line(GenericState &state, const std::string &line) {
    ++state.stderr_lines;
    push_tail(state.stderr_tail, line);
}

std::string GenericAdapter::display_name() const {
    std::string program = std::filesystem::path(config_.executable).filename().string();
    if (program.empty()) {
        program = "daemon";
    }
    if (name_.empty()) {
        return "<unnamed> " + program;
    }
    return program + " \"" + name_ + "\"";
}

std::unique_ptr<GenericDaemon> GenericDaemon::create(const GenericConfig &config, std::string &error,
                                                     const std::string &name, runner::RunnerOptions options) {
    if (config.executable.empty()) {
        error = "executable must not be empty";
        return nullptr;
    }

    std::shared_ptr<GenericAdapter> node;
    try {
        node = std::make_shared<GenericAdapter>(name, config);
    } catch (const std::regex_error &e) {
        error = "Invalid ready_pattern '" + config.ready_pattern.value_or("") + "': " + e.what();
        return nullptr;
    }
    return std::unique_ptr<GenericDaemon>(new GenericDaemon(std::move(node), options));
}

GenericDaemon::GenericDaemon(std::shared_ptr<GenericAdapter> node, runner::RunnerOptions options)
    : runner::DaemonRunner<GenericState>(node, options), node_(std::move(node)) {}

bool GenericDaemon::is_ready() const {
    return with_state([](GenericState &state) { return state.ready; }).value_or(false);
}

size_t GenericDaemon::stdout_line_count() const {
    return with_state([](GenericState &state) { return state.stdout_lines; }).value_or(0);
}

size_t GenericDaemon::stderr_line_count() const {
    return with_state([](GenericState &state) { return state.stderr_lines; }).value_or(0);
}

std::vector<std::string> GenericDaemon::recent_stdout() const {
    auto lines = with_state([](GenericState &state) {
        return std::vector<std::string>(state.stdout_tail.begin(), state.stdout_tail.end());
    });
    return lines.value_or(std::vector<std::string>());
}

std::vector<std::string> GenericDaemon::recent_stderr() const {
    auto lines = with_state([](GenericState &state) {
        return std::vector<std::string>(state.stderr_tail.begin(), state.stderr_tail.end());
    });
    return lines.value_or(std::vector<std::string>());
}

}  // namespace daemons
}  // namespace daemon_runner
