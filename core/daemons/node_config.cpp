#include "node_config.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace daemon_runner {
namespace daemons {

namespace fs = std::filesystem;

namespace {

// Fee rates in BTC/kvB: plain decimal, never scientific notation (0.00001, not 1e-05)
std::string format_amount(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(8) << value;
    std::string s = out.str();
    auto dot = s.find('.');
    if (dot != std::string::npos) {
        while (!s.empty() && s.back() == '0') {
            s.pop_back();
        }
        if (!s.empty() && s.back() == '.') {
            s.pop_back();
        }
    }
    return s;
}

}  // namespace

void write_basic_options(std::ostream &out, const NodeConfig &config) {
    out << "debug=" << flag(config.debug) << "\n";
    out << "printtoconsole=" << flag(config.printtoconsole) << "\n";
    out << "daemon=" << flag(config.daemon) << "\n";
    out << "listen=" << flag(config.listen) << "\n";
    if (config.port) {
        out << "port=" << *config.port << "\n";
    }
    out << "txindex=" << flag(config.txindex) << "\n";
}

void write_connect_and_rpc_options(std::ostream &out, const NodeConfig &config) {
    for (const auto &peer : config.connect) {
        out << "connect=" << peer << "\n";
    }

    if (config.rpccookie || config.rpcuser) {
        out << "server=1\n";
    }
    if (config.rpccookie) {
        out << "rpccookiefile=" << *config.rpccookie << "\n";
    }
    if (config.rpcport) {
        out << "rpcport=" << *config.rpcport << "\n";
    }
    if (config.rpcuser) {
        out << "rpcuser=" << *config.rpcuser << "\n";
    }
    if (config.rpcpass) {
        out << "rpcpassword=" << *config.rpcpass << "\n";
    }
}

void write_fee_options(std::ostream &out, const NodeConfig &config) {
    if (config.addresstype) {
        out << "addresstype=" << *config.addresstype << "\n";
    }
    if (config.blockmintxfee) {
        out << "blockmintxfee=" << format_amount(*config.blockmintxfee) << "\n";
    }
    if (config.minrelaytxfee) {
        out << "minrelaytxfee=" << format_amount(*config.minrelaytxfee) << "\n";
    }
}

std::optional<rpc::RpcInfo> make_rpc_info(const NodeConfig &config) {
    if (!config.rpcport) {
        return std::nullopt;
    }

    rpc::RpcInfo info;
    info.url = "http://127.0.0.1:" + std::to_string(*config.rpcport);
    if (config.rpccookie) {
        info.auth = rpc::RpcAuth::cookie(*config.rpccookie);
    } else if (config.rpcuser && config.rpcpass) {
        info.auth = rpc::RpcAuth::user_pass(*config.rpcuser, *config.rpcpass);
    } else {
        return std::nullopt;
    }
    return info;
}

bool check_conf_value(const std::string &field, const std::string &value, std::string &error) {
    for (char c : value) {
        unsigned char byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7f) {
            error = field + " must not contain control characters";
            return false;
        }
    }
    return true;
}

bool is_hex_string(const std::string &value) {
    if (value.empty() || value.size() % 2 != 0) {
        return false;
    }
    for (char c : value) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool validate_node_config(const NodeConfig &config, std::string &error) {
    if (config.datadir.empty() || !fs::path(config.datadir).is_absolute()) {
        error = "datadir should be an absolute path";
        return false;
    }
    if (!check_conf_value("datadir", config.datadir, error)) {
        return false;
    }
    for (const auto &peer : config.connect) {
        if (!check_conf_value("connect", peer, error)) {
            return false;
        }
    }

    const std::pair<const char *, const std::optional<std::string> *> optional_values[] = {
        {"rpccookie", &config.rpccookie},
        {"rpcuser", &config.rpcuser},
        {"rpcpass", &config.rpcpass},
        {"addresstype", &config.addresstype},
    };
    for (const auto &entry : optional_values) {
        if (*entry.second && !check_conf_value(entry.first, **entry.second, error)) {
            return false;
        }
    }
    return true;
}

bool write_config_file(const std::string &datadir, const std::string &filename, const std::string &content,
                       std::string &path, std::string &error) {
    std::error_code ec;
    fs::create_directories(datadir, ec);
    if (ec) {
        error = "Cannot create datadir " + datadir + ": " + ec.message();
        return false;
    }

    fs::path file_path = fs::path(datadir) / filename;
    std::ofstream file(file_path, std::ios::out | std::ios::trunc);
    if (!file) {
        error = "Cannot create config file " + file_path.string();
        return false;
    }
    file << content;
    file.close();
    if (!file) {
        error = "Failed writing config file " + file_path.string();
        return false;
    }

    path = file_path.string();
    return true;
}

}  // namespace daemons
}  // namespace daemon_runner
