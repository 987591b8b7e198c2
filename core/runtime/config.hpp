#pragma once

#include <optional>
#include <string>

#include "daemons/bitcoind.hpp"
#include "daemons/elementsd.hpp"
#include "daemons/generic.hpp"

namespace daemon_runner {
namespace runtime {

enum class DaemonType { BITCOIND, ELEMENTSD, GENERIC };

std::optional<DaemonType> parse_daemon_type(const std::string &type_str);
std::string daemon_type_to_string(DaemonType type);

struct LoggingConfig {
    std::string level = "info";  // trace, debug, info, warn, error
};

// runner: section
struct RunnerSettings {
    int reader_start_delay_ms = 1000;  // Delay before reader threads start reading
    int poll_interval_ms = 500;        // CLI status poll period (>= 10ms)
    int stop_timeout_ms = 5000;        // CLI wait for exit after SIGTERM (>= 100ms)
    int restart_stop_timeout_ms = 5000;  // restart() wait for exit after SIGTERM (>= 0)
    int max_line_length = 65536;         // Longer output lines are split (>= 256)
};

// daemon: section. Only the config matching `type` is populated.
struct DaemonConfig {
    std::string name;
    DaemonType type = DaemonType::GENERIC;
    std::string executable;

    daemons::BitcoindConfig bitcoind;
    daemons::ElementsdConfig elementsd;
    daemons::GenericConfig generic;
};

struct RunnerConfig {
    LoggingConfig logging;
    RunnerSettings runner;
    DaemonConfig daemon;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RunnerConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RunnerConfig &config, std::string &error);

}  // namespace runtime
}  // namespace daemon_runner
