#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "node_config.hpp"
#include "rpc/rpc_client.hpp"
#include "runner/daemon_adapter.hpp"
#include "runner/daemon_runner.hpp"

namespace daemon_runner {
namespace daemons {

constexpr const char *kBitcoindConfigFilename = "bitcoin.conf";
constexpr uint64_t kBitcoindDefaultVersion = 180000;

enum class Network { MAINNET, TESTNET, REGTEST };

std::optional<Network> parse_network(const std::string &network_str);
std::string network_to_string(Network network);

struct BitcoindConfig : NodeConfig {
    std::optional<Network> network;  // Empty means mainnet

    // Render bitcoin.conf
    void write_into(std::ostream &out) const;
};

struct BitcoindState {
    std::string stderr_output;  // Every stderr line, newline terminated
};

// Adapter for Bitcoin Core's bitcoind
class BitcoindAdapter : public runner::DaemonAdapter<BitcoindState> {
public:
    BitcoindAdapter(std::string name, std::string executable, BitcoindConfig config);

    // Create the datadir and write bitcoin.conf once
    runner::Result prepare() override;

    // <executable> -conf=<datadir>/bitcoin.conf -printtoconsole=1
    process::Command build_command() const override;

    BitcoindState initial_state() const override { return BitcoindState{}; }

    void handle_stdout_line(BitcoindState &, const std::string &) override {}
    void handle_stderr_line(BitcoindState &state, const std::string &line) override;

    std::string display_name() const override;

    const BitcoindConfig &config() const { return config_; }

    // Path of the written config file; empty before prepare()
    const std::optional<std::string> &config_file() const { return config_file_; }

private:
    std::string name_;
    std::string executable_;
    BitcoindConfig config_;
    std::optional<std::string> config_file_;
};

// A supervised bitcoind with its daemon specific accessors
class Bitcoind : public runner::DaemonRunner<BitcoindState> {
public:
    // Returns nullptr and sets `error` when the config is invalid (e.g. relative datadir)
    static std::unique_ptr<Bitcoind> create(const std::string &executable, const BitcoindConfig &config,
                                            std::string &error, const std::string &name = "",
                                            runner::RunnerOptions options = runner::RunnerOptions());

    // Take (and clear) the stderr collected so far
    std::string take_stderr();

    const std::string &datadir() const { return node_->config().datadir; }

    // RPC endpoint and credentials; don't connect before start()
    std::optional<rpc::RpcInfo> rpc_info() const { return make_rpc_info(node_->config()); }

    // nullptr when no RPC port or credentials are configured
    std::unique_ptr<rpc::RpcClient> rpc_client() const;

    const BitcoindAdapter &node() const { return *node_; }

private:
    Bitcoind(std::shared_ptr<BitcoindAdapter> node, runner::RunnerOptions options);

    std::shared_ptr<BitcoindAdapter> node_;
};

}  // namespace daemons
}  // namespace daemon_runner
