#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "node_config.hpp"
#include "rpc/rpc_client.hpp"
#include "runner/daemon_adapter.hpp"
#include "runner/daemon_runner.hpp"

namespace daemon_runner {
namespace daemons {

constexpr const char *kElementsdConfigFilename = "elements.conf";
constexpr uint64_t kElementsdDefaultVersion = 180100;

// Older liquidd nodes were released as 2.x.x and 3.x.x versions
constexpr uint64_t kOldLiquidVersion = 2000000;
// First version with dynamic federations
constexpr uint64_t kDynafedVersion = 180100;

struct ElementsdConfig : NodeConfig {
    std::string chain;  // Required, e.g. "elementsregtest" or "liquidv1"
    bool validatepegin = false;
    std::optional<std::string> signblockscript;  // Hex encoded script
    std::optional<uint64_t> con_max_block_sig_size;
    std::optional<std::string> fedpegscript;  // Hex encoded script
    std::vector<std::pair<std::string, std::string>> pak_pubkeys;  // Hex encoded (online, offline) keys
    std::optional<uint32_t> con_dyna_deploy_start;
    std::optional<uint32_t> con_nminerconfirmationwindow;
    std::optional<uint32_t> con_nrulechangeactivationthreshold;

    // Only written when validatepegin is set
    std::optional<std::string> mainchain_rpchost;
    std::optional<uint16_t> mainchain_rpcport;
    std::optional<std::string> mainchain_rpcuser;
    std::optional<std::string> mainchain_rpcpass;

    // Render elements.conf. Callers validate `chain` first.
    void write_into(std::ostream &out) const;
};

// Common node checks plus a non-empty chain, hex scripts and keys, and
// control-character free strings
bool validate_elementsd_config(const ElementsdConfig &config, std::string &error);

struct UpdateTip {
    uint32_t height = 0;
    std::string block_hash;  // 64 hex characters

    bool operator==(const UpdateTip &other) const {
        return height == other.height && block_hash == other.block_hash;
    }
    bool operator!=(const UpdateTip &other) const { return !(*this == other); }
};

// Parse "... UpdateTip: new best=<hash> height=<n> version=..." log lines.
// Empty for any other line, a malformed hash or an out of range height.
std::optional<UpdateTip> parse_update_tip(const std::string &line);

struct ElementsdState {
    std::optional<UpdateTip> last_update_tip;
    std::string stderr_output;
};

// Adapter for Elements / Liquid's elementsd
class ElementsdAdapter : public runner::DaemonAdapter<ElementsdState> {
public:
    ElementsdAdapter(std::string name, std::string executable, ElementsdConfig config);

    runner::Result prepare() override;
    process::Command build_command() const override;
    ElementsdState initial_state() const override { return ElementsdState{}; }

    // Tracks the chain tip from UpdateTip lines
    void handle_stdout_line(ElementsdState &state, const std::string &line) override;
    void handle_stderr_line(ElementsdState &state, const std::string &line) override;

    std::string display_name() const override;

    const ElementsdConfig &config() const { return config_; }
    const std::optional<std::string> &config_file() const { return config_file_; }

private:
    std::string name_;
    std::string executable_;
    ElementsdConfig config_;
    std::optional<std::string> config_file_;
};

class Elementsd : public runner::DaemonRunner<ElementsdState> {
public:
    static std::unique_ptr<Elementsd> create(const std::string &executable, const ElementsdConfig &config,
                                             std::string &error, const std::string &name = "",
                                             runner::RunnerOptions options = runner::RunnerOptions());

    // Most recent tip seen on stdout, empty before the first UpdateTip
    std::optional<UpdateTip> last_update_tip() const;

    std::string take_stderr();

    const std::string &datadir() const { return node_->config().datadir; }
    std::optional<rpc::RpcInfo> rpc_info() const { return make_rpc_info(node_->config()); }
    std::unique_ptr<rpc::RpcClient> rpc_client() const;

    const ElementsdAdapter &node() const { return *node_; }

private:
    Elementsd(std::shared_ptr<ElementsdAdapter> node, runner::RunnerOptions options);

    std::shared_ptr<ElementsdAdapter> node_;
};

}  // namespace daemons
}  // namespace daemon_runner
