#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "rpc/rpc_client.hpp"

namespace daemon_runner {
namespace daemons {

// Options shared by bitcoind and elementsd config files.
// `version` selects the config dialect: two digits per section,
// 0.18.1.0 => 180100. Zero means "use the daemon's default".
struct NodeConfig {
    uint64_t version = 0;

    std::string datadir;  // Must be absolute
    bool debug = false;
    bool printtoconsole = false;
    bool daemon = false;
    bool listen = false;
    std::optional<uint16_t> port;
    bool txindex = false;
    std::vector<std::string> connect;

    std::optional<std::string> rpccookie;
    std::optional<uint16_t> rpcport;
    std::optional<std::string> rpcuser;
    std::optional<std::string> rpcpass;

    std::optional<std::string> addresstype;
    std::optional<double> blockmintxfee;
    std::optional<double> minrelaytxfee;

    uint64_t effective_version(uint64_t default_version) const { return version > 0 ? version : default_version; }
};

// "debug=1"-style boolean flags
inline int flag(bool value) { return value ? 1 : 0; }

// Write debug/printtoconsole/daemon/listen/port/txindex
void write_basic_options(std::ostream &out, const NodeConfig &config);

// Write connect= lines and the RPC block (server=1 when cookie or user is set)
void write_connect_and_rpc_options(std::ostream &out, const NodeConfig &config);

// Write addresstype/blockmintxfee/minrelaytxfee
void write_fee_options(std::ostream &out, const NodeConfig &config);

// http://127.0.0.1:<rpcport> plus cookie or user/password auth.
// Empty when no rpcport, or no usable credentials, are configured.
std::optional<rpc::RpcInfo> make_rpc_info(const NodeConfig &config);

// A value written after "key=" in a conf file: no control characters, so it
// cannot end its line and inject further options
bool check_conf_value(const std::string &field, const std::string &value, std::string &error);

// Non-empty, even length, hex digits only
bool is_hex_string(const std::string &value);

// Validate fields common to every node daemon
bool validate_node_config(const NodeConfig &config, std::string &error);

// Create `datadir` (recursively) and write `content` to datadir/filename.
// Returns the written path through `path`.
bool write_config_file(const std::string &datadir, const std::string &filename, const std::string &content,
                       std::string &path, std::string &error);

}  // namespace daemons
}  // namespace daemon_runner
