#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <regex>
#include <sstream>
#include <vector>

#include "logging/logger.hpp"

namespace daemon_runner {
namespace runtime {

namespace {

template <typename T>
void read_optional(const YAML::Node &node, const char *key, std::optional<T> &out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

template <typename T>
void read_value(const YAML::Node &node, const char *key, T &out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

void load_node_common(const YAML::Node &node, daemons::NodeConfig &config) {
    read_value(node, "version", config.version);
    read_value(node, "datadir", config.datadir);
    read_value(node, "debug", config.debug);
    read_value(node, "printtoconsole", config.printtoconsole);
    read_value(node, "daemon", config.daemon);
    read_value(node, "listen", config.listen);
    read_optional(node, "port", config.port);
    read_value(node, "txindex", config.txindex);

    if (node["connect"]) {
        config.connect.clear();
        for (const auto &peer : node["connect"]) {
            config.connect.push_back(peer.as<std::string>());
        }
    }

    read_optional(node, "rpccookie", config.rpccookie);
    read_optional(node, "rpcport", config.rpcport);
    read_optional(node, "rpcuser", config.rpcuser);
    read_optional(node, "rpcpass", config.rpcpass);

    read_optional(node, "addresstype", config.addresstype);
    read_optional(node, "blockmintxfee", config.blockmintxfee);
    read_optional(node, "minrelaytxfee", config.minrelaytxfee);
}

bool load_bitcoind(const YAML::Node &node, daemons::BitcoindConfig &config, std::string &error) {
    load_node_common(node, config);
    if (node["network"]) {
        auto network_str = node["network"].as<std::string>();
        auto network = daemons::parse_network(network_str);
        if (!network) {
            error = "Invalid daemon.node.network '" + network_str + "': must be mainnet, testnet or regtest";
            return false;
        }
        config.network = *network;
    }
    return true;
}

bool load_elementsd(const YAML::Node &node, daemons::ElementsdConfig &config, std::string &error) {
    load_node_common(node, config);

    read_value(node, "chain", config.chain);
    read_value(node, "validatepegin", config.validatepegin);
    read_optional(node, "signblockscript", config.signblockscript);
    read_optional(node, "con_max_block_sig_size", config.con_max_block_sig_size);
    read_optional(node, "fedpegscript", config.fedpegscript);

    // Each PAK entry is a [online_pubkey, offline_pubkey] pair
    if (node["pak_pubkeys"]) {
        config.pak_pubkeys.clear();
        for (const auto &pair : node["pak_pubkeys"]) {
            if (!pair.IsSequence() || pair.size() != 2) {
                error = "daemon.node.pak_pubkeys entries must be [online, offline] pairs";
                return false;
            }
            config.pak_pubkeys.emplace_back(pair[0].as<std::string>(), pair[1].as<std::string>());
        }
    }

    read_optional(node, "con_dyna_deploy_start", config.con_dyna_deploy_start);
    read_optional(node, "con_nminerconfirmationwindow", config.con_nminerconfirmationwindow);
    read_optional(node, "con_nrulechangeactivationthreshold", config.con_nrulechangeactivationthreshold);

    read_optional(node, "mainchain_rpchost", config.mainchain_rpchost);
    read_optional(node, "mainchain_rpcport", config.mainchain_rpcport);
    read_optional(node, "mainchain_rpcuser", config.mainchain_rpcuser);
    read_optional(node, "mainchain_rpcpass", config.mainchain_rpcpass);
    return true;
}

void load_generic(const YAML::Node &daemon, daemons::GenericConfig &config) {
    if (daemon["args"]) {
        config.args.clear();
        for (const auto &arg : daemon["args"]) {
            config.args.push_back(arg.as<std::string>());
        }
    }

    if (daemon["env"]) {
        config.env.clear();
        for (const auto &entry : daemon["env"]) {
            config.env[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }

    read_value(daemon, "working_dir", config.working_dir);

    if (daemon["ready_pattern"]) {
        auto pattern = daemon["ready_pattern"].as<std::string>();
        if (!pattern.empty()) {
            config.ready_pattern = pattern;
        }
    }

    read_value(daemon, "tail_lines", config.tail_lines);
}

}  // namespace

std::optional<DaemonType> parse_daemon_type(const std::string &type_str) {
    if (type_str == "bitcoind") {
        return DaemonType::BITCOIND;
    }
    if (type_str == "elementsd") {
        return DaemonType::ELEMENTSD;
    }
    if (type_str == "generic") {
        return DaemonType::GENERIC;
    }
    return std::nullopt;
}

std::string daemon_type_to_string(DaemonType type) {
    switch (type) {
        case DaemonType::BITCOIND:
            return "bitcoind";
        case DaemonType::ELEMENTSD:
            return "elementsd";
        case DaemonType::GENERIC:
            return "generic";
        default:
            return "unknown";
    }
}

bool validate_config(const RunnerConfig &config, std::string &error) {
    // Validate Logging settings
    if (!logging::is_valid_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    // Validate Runner settings
    if (config.runner.reader_start_delay_ms < 0) {
        error = "runner.reader_start_delay_ms must be >= 0";
        return false;
    }
    if (config.runner.poll_interval_ms < 10) {
        error = "runner.poll_interval_ms must be >= 10ms";
        return false;
    }
    if (config.runner.stop_timeout_ms < 100) {
        error = "runner.stop_timeout_ms must be >= 100ms";
        return false;
    }
    if (config.runner.restart_stop_timeout_ms < 0) {
        error = "runner.restart_stop_timeout_ms must be >= 0";
        return false;
    }
    if (config.runner.max_line_length < 256) {
        error = "runner.max_line_length must be >= 256 bytes";
        return false;
    }

    // Validate Daemon settings
    const auto &daemon = config.daemon;
    if (daemon.executable.empty()) {
        error = "Daemon missing 'executable' field";
        return false;
    }

    switch (daemon.type) {
        case DaemonType::BITCOIND:
            if (!daemons::validate_node_config(daemon.bitcoind, error)) {
                error = "daemon.node: " + error;
                return false;
            }
            break;
        case DaemonType::ELEMENTSD:
            if (!daemons::validate_elementsd_config(daemon.elementsd, error)) {
                error = "daemon.node: " + error;
                return false;
            }
            break;
        case DaemonType::GENERIC:
            if (daemon.generic.ready_pattern) {
                try {
                    std::regex check(*daemon.generic.ready_pattern);
                } catch (const std::regex_error &e) {
                    error = "Invalid daemon.ready_pattern '" + *daemon.generic.ready_pattern + "': " + e.what();
                    return false;
                }
            }
            break;
    }

    return true;
}

bool load_config(const std::string &config_path, RunnerConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"logging", "runner", "daemon"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            read_value(yaml["logging"], "level", config.logging.level);
        }

        // Load runner config
        if (yaml["runner"]) {
            const auto &runner = yaml["runner"];
            read_value(runner, "reader_start_delay_ms", config.runner.reader_start_delay_ms);
            read_value(runner, "poll_interval_ms", config.runner.poll_interval_ms);
            read_value(runner, "stop_timeout_ms", config.runner.stop_timeout_ms);
            read_value(runner, "restart_stop_timeout_ms", config.runner.restart_stop_timeout_ms);
            read_value(runner, "max_line_length", config.runner.max_line_length);
        }

        // Load daemon config
        const auto &daemon = yaml["daemon"];
        if (!daemon) {
            error = "Config must specify a 'daemon' section";
            return false;
        }

        read_value(daemon, "name", config.daemon.name);
        read_value(daemon, "executable", config.daemon.executable);

        if (daemon["type"]) {
            auto type_str = daemon["type"].as<std::string>();
            auto type = parse_daemon_type(type_str);
            if (!type) {
                error = "Invalid daemon type '" + type_str + "': must be bitcoind, elementsd or generic";
                return false;
            }
            config.daemon.type = *type;
        }

        const YAML::Node node = daemon["node"] ? daemon["node"] : YAML::Node(YAML::NodeType::Map);
        switch (config.daemon.type) {
            case DaemonType::BITCOIND:
                if (!load_bitcoind(node, config.daemon.bitcoind, error)) {
                    return false;
                }
                break;
            case DaemonType::ELEMENTSD:
                if (!load_elementsd(node, config.daemon.elementsd, error)) {
                    return false;
                }
                break;
            case DaemonType::GENERIC:
                config.daemon.generic.executable = config.daemon.executable;
                load_generic(daemon, config.daemon.generic);
                break;
        }

        if (!validate_config(config, error)) {
            return false;
        }

        std::stringstream daemon_msg;
        daemon_msg << "[Config] Daemon: " << daemon_type_to_string(config.daemon.type) << " ("
                   << config.daemon.executable << ")";
        if (!config.daemon.name.empty()) {
            daemon_msg << " name=" << config.daemon.name;
        }
        LOG_INFO(daemon_msg.str());

        LOG_INFO("[Config] Reader start delay: " << config.runner.reader_start_delay_ms << "ms");
        LOG_INFO("[Config] Poll interval: " << config.runner.poll_interval_ms << "ms");
        LOG_DEBUG("[Config] Max line length: " << config.runner.max_line_length << " bytes");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace daemon_runner
