// daemon-runner
// Supervises one daemon described by a YAML config file

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    // Parse CLI arguments
    std::string config_path = "daemon-runner.yaml";  // Default

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: daemon-runner [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: daemon-runner.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n\n";
            std::cerr << "Exit codes: 0 clean shutdown, 1 config/start/stop failure,\n";
            std::cerr << "  2 daemon killed after stop_timeout_ms, else the daemon's own exit code\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    // Check if config exists
    if (!std::filesystem::exists(config_path)) {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("daemon-runner starting...");
    LOG_INFO("Loading config: " << config_path);

    // Load configuration
    daemon_runner::runtime::RunnerConfig config;
    std::string error;

    if (!daemon_runner::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    // Initialize logger level
    daemon_runner::logging::Logger::set_level(daemon_runner::logging::string_to_level(config.logging.level));

    daemon_runner::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    // Install signal handler for graceful shutdown
    daemon_runner::runtime::SignalHandler::install();

    int exit_code = runtime.run();

    LOG_INFO("Shutdown complete (exit code " << exit_code << ")");
    return exit_code;
}
