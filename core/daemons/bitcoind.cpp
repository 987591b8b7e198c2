#include "bitcoind.hpp"

#include <filesystem>
#include <sstream>

#include "logging/logger.hpp"

namespace daemon_runner {
namespace daemons {

std::optional<Network> parse_network(const std::string &network_str) {
    if (network_str == "mainnet" || network_str == "bitcoin" || network_str == "main") {
        return Network::MAINNET;
    }
    if (network_str == "testnet" || network_str == "test") {
        return Network::TESTNET;
    }
    if (network_str == "regtest") {
        return Network::REGTEST;
    }
    return std::nullopt;
}

std::string network_to_string(Network network) {
    switch (network) {
        case Network::MAINNET:
            return "mainnet";
        case Network::TESTNET:
            return "testnet";
        case Network::REGTEST:
            return "regtest";
        default:
            return "unknown";
    }
}

void BitcoindConfig::write_into(std::ostream &out) const {
    const uint64_t v = effective_version(kBitcoindDefaultVersion);

    out << "datadir=" << datadir << "\n";

    // 0.17 moved network specific options into [section]s
    if (network == Network::TESTNET) {
        out << "testnet=1\n";
        if (v > 170000) {
            out << "[testnet]\n";
        }
    } else if (network == Network::REGTEST) {
        out << "regtest=1\n";
        if (v > 170000) {
            out << "[regtest]\n";
        }
    }

    write_basic_options(out, *this);
    write_connect_and_rpc_options(out, *this);
    write_fee_options(out, *this);
}

BitcoindAdapter::BitcoindAdapter(std::string name, std::string executable, BitcoindConfig config)
    : name_(std::move(name)), executable_(std::move(executable)), config_(std::move(config)) {}

runner::Result BitcoindAdapter::prepare() {
    if (config_file_) {
        return runner::Result::success();
    }

    std::string error;
    if (!validate_node_config(config_, error)) {
        return runner::Result::failure(runner::ErrorCode::CONFIG, error);
    }

    std::ostringstream content;
    config_.write_into(content);

    std::string path;
    if (!write_config_file(config_.datadir, kBitcoindConfigFilename, content.str(), path, error)) {
        return runner::Result::failure(runner::ErrorCode::ADAPTER_FAILURE, error);
    }

    LOG_DEBUG("[" << display_name() << "] Wrote config file " << path);
    config_file_ = path;
    return runner::Result::success();
}

process::Command BitcoindAdapter::build_command() const {
    std::string conf = config_file_
                           ? *config_file_
                           : (std::filesystem::path(config_.datadir) / kBitcoindConfigFilename).string();

    process::Command cmd(executable_);
    cmd.arg("-conf=" + conf).arg("-printtoconsole=1");
    return cmd;
}

void BitcoindAdapter::handle_stderr_line(BitcoindState &state, const std::string &line) {
    state.stderr_output += line;
    state.stderr_output += '\n';
}

std::string BitcoindAdapter::display_name() const {
    if (name_.empty()) {
        return "<unnamed> bitcoind";
    }
    return "bitcoind \"" + name_ + "\"";
}

std::unique_ptr<Bitcoind> Bitcoind::create(const std::string &executable, const BitcoindConfig &config,
                                           std::string &error, const std::string &name,
                                           runner::RunnerOptions options) {
    if (!validate_node_config(config, error)) {
        return nullptr;
    }
    auto node = std::make_shared<BitcoindAdapter>(name, executable, config);
    return std::unique_ptr<Bitcoind>(new Bitcoind(std::move(node), options));
}

Bitcoind::Bitcoind(std::shared_ptr<BitcoindAdapter> node, runner::RunnerOptions options)
    : runner::DaemonRunner<BitcoindState>(node, options), node_(std::move(node)) {}

std::string Bitcoind::take_stderr() {
    auto taken = with_state([](BitcoindState &state) {
        std::string out;
        out.swap(state.stderr_output);
        return out;
    });
    return taken.value_or(std::string());
}

std::unique_ptr<rpc::RpcClient> Bitcoind::rpc_client() const {
    auto info = rpc_info();
    if (!info) {
        return nullptr;
    }
    return std::make_unique<rpc::RpcClient>(*info);
}

}  // namespace daemons
}  // namespace daemon_runner
