#include "elementsd.hpp"

#include <filesystem>
#include <limits>
#include <sstream>
#include <utility>

#include "logging/logger.hpp"

namespace daemon_runner {
namespace daemons {

void ElementsdConfig::write_into(std::ostream &out) const {
    const uint64_t v = effective_version(kElementsdDefaultVersion);

    out << "datadir=" << datadir << "\n";

    out << "chain=" << chain << "\n";
    if (v >= 170000 && v < kOldLiquidVersion) {
        out << "[" << chain << "]\n";
    }

    write_basic_options(out, *this);

    if (signblockscript) {
        out << "signblockscript=" << *signblockscript << "\n";
    }
    if (con_max_block_sig_size) {
        out << "con_max_block_sig_size=" << *con_max_block_sig_size << "\n";
    }
    if (fedpegscript) {
        out << "fedpegscript=" << *fedpegscript << "\n";
    }
    for (const auto &pak : pak_pubkeys) {
        if (v >= kDynafedVersion && v < kOldLiquidVersion) {
            out << "pak=" << pak.first << pak.second << "\n";
        } else {
            out << "pak=" << pak.first << ":" << pak.second << "\n";
        }
    }
    if (con_dyna_deploy_start) {
        out << "con_dyna_deploy_start=" << *con_dyna_deploy_start << "\n";
    }
    if (con_nminerconfirmationwindow) {
        out << "con_nminerconfirmationwindow=" << *con_nminerconfirmationwindow << "\n";
    }
    if (con_nrulechangeactivationthreshold) {
        out << "con_nrulechangeactivationthreshold=" << *con_nrulechangeactivationthreshold << "\n";
    }

    write_connect_and_rpc_options(out, *this);

    out << "validatepegin=" << flag(validatepegin) << "\n";
    if (validatepegin) {
        if (mainchain_rpchost) {
            out << "mainchainrpchost=" << *mainchain_rpchost << "\n";
        }
        if (mainchain_rpcport) {
            out << "mainchainrpcport=" << *mainchain_rpcport << "\n";
        }
        if (mainchain_rpcuser) {
            out << "mainchainrpcuser=" << *mainchain_rpcuser << "\n";
        }
        if (mainchain_rpcpass) {
            out << "mainchainrpcpassword=" << *mainchain_rpcpass << "\n";
        }
    }

    write_fee_options(out, *this);
}

bool validate_elementsd_config(const ElementsdConfig &config, std::string &error) {
    if (!validate_node_config(config, error)) {
        return false;
    }
    if (config.chain.empty()) {
        error = "elementsd requires a chain name";
        return false;
    }
    if (!check_conf_value("chain", config.chain, error)) {
        return false;
    }

    if (config.signblockscript && !is_hex_string(*config.signblockscript)) {
        error = "signblockscript must be hex encoded";
        return false;
    }
    if (config.fedpegscript && !is_hex_string(*config.fedpegscript)) {
        error = "fedpegscript must be hex encoded";
        return false;
    }
    for (const auto &keys : config.pak_pubkeys) {
        if (!is_hex_string(keys.first) || !is_hex_string(keys.second)) {
            error = "pak_pubkeys must be hex encoded";
            return false;
        }
    }

    const std::pair<const char *, const std::optional<std::string> *> mainchain_values[] = {
        {"mainchain_rpchost", &config.mainchain_rpchost},
        {"mainchain_rpcuser", &config.mainchain_rpcuser},
        {"mainchain_rpcpass", &config.mainchain_rpcpass},
    };
    for (const auto &entry : mainchain_values) {
        if (*entry.second && !check_conf_value(entry.first, **entry.second, error)) {
            return false;
        }
    }
    return true;
}

namespace {

const std::string kUpdateTipMarker = "UpdateTip: new best=";

bool is_lower_hex(char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); }

// Parse "<hash> height=<n> version=" starting at `pos`
std::optional<UpdateTip> parse_update_tip_fields(const std::string &line, size_t pos) {
    static const std::string kHeight = " height=";
    static const std::string kVersion = " version=";

    const size_t hash_begin = pos;
    while (pos < line.size() && is_lower_hex(line[pos])) {
        ++pos;
    }
    if (pos - hash_begin != 64 || line.compare(pos, kHeight.size(), kHeight) != 0) {
        return std::nullopt;
    }
    std::string hash = line.substr(hash_begin, 64);
    pos += kHeight.size();

    const size_t height_begin = pos;
    uint64_t height = 0;
    while (pos < line.size() && line[pos] >= '0' && line[pos] <= '9') {
        height = height * 10 + static_cast<uint64_t>(line[pos] - '0');
        if (height > std::numeric_limits<uint32_t>::max()) {
            return std::nullopt;
        }
        ++pos;
    }
    if (pos == height_begin || line.compare(pos, kVersion.size(), kVersion) != 0) {
        return std::nullopt;
    }

    UpdateTip tip;
    tip.height = static_cast<uint32_t>(height);
    tip.block_hash = std::move(hash);
    return tip;
}

}  // namespace

// Linear scan rather than std::regex: libstdc++'s recursive matcher exhausts
// the reader thread's stack on very long lines.
std::optional<UpdateTip> parse_update_tip(const std::string &line) {
    for (size_t at = line.find(kUpdateTipMarker); at != std::string::npos;
         at = line.find(kUpdateTipMarker, at + 1)) {
        auto tip = parse_update_tip_fields(line, at + kUpdateTipMarker.size());
        if (tip) {
            return tip;
        }
    }
    return std::nullopt;
}

ElementsdAdapter::ElementsdAdapter(std::string name, std::string executable, ElementsdConfig config)
    : name_(std::move(name)), executable_(std::move(executable)), config_(std::move(config)) {}

runner::Result ElementsdAdapter::prepare() {
    if (config_file_) {
        return runner::Result::success();
    }

    std::string error;
    if (!validate_elementsd_config(config_, error)) {
        return runner::Result::failure(runner::ErrorCode::CONFIG, error);
    }

    std::ostringstream content;
    config_.write_into(content);

    std::string path;
    if (!write_config_file(config_.datadir, kElementsdConfigFilename, content.str(), path, error)) {
        return runner::Result::failure(runner::ErrorCode::ADAPTER_FAILURE, error);
    }

    LOG_DEBUG("[" << display_name() << "] Wrote config file " << path);
    config_file_ = path;
    return runner::Result::success();
}

process::Command ElementsdAdapter::build_command() const {
    std::string conf = config_file_
                           ? *config_file_
                           : (std::filesystem::path(config_.datadir) / kElementsdConfigFilename).string();

    process::Command cmd(executable_);
    cmd.arg("-conf=" + conf).arg("-printtoconsole=1");
    return cmd;
}

void ElementsdAdapter::handle_stdout_line(ElementsdState &state, const std::string &line) {
    auto tip = parse_update_tip(line);
    if (tip) {
        LOG_TRACE("[" << display_name() << "] New tip: height=" << tip->height << " hash=" << tip->block_hash);
        state.last_update_tip = std::move(tip);
    }
}

void ElementsdAdapter::handle_stderr_line(ElementsdState &state, const std::string &line) {
    state.stderr_output += line;
    state.stderr_output += '\n';
}

std::string ElementsdAdapter::display_name() const {
    if (name_.empty()) {
        return "<unnamed> elementsd";
    }
    return "elementsd \"" + name_ + "\"";
}

std::unique_ptr<Elementsd> Elementsd::create(const std::string &executable, const ElementsdConfig &config,
                                             std::string &error, const std::string &name,
                                             runner::RunnerOptions options) {
    if (!validate_elementsd_config(config, error)) {
        return nullptr;
    }
    auto node = std::make_shared<ElementsdAdapter>(name, executable, config);
    return std::unique_ptr<Elementsd>(new Elementsd(std::move(node), options));
}

Elementsd::Elementsd(std::shared_ptr<ElementsdAdapter> node, runner::RunnerOptions options)
    : runner::DaemonRunner<ElementsdState>(node, options), node_(std::move(node)) {}

std::optional<UpdateTip> Elementsd::last_update_tip() const {
    auto tip = with_state([](ElementsdState &state) { return state.last_update_tip; });
    if (!tip) {
        return std::nullopt;
    }
    return *tip;
}

std::string Elementsd::take_stderr() {
    auto taken = with_state([](ElementsdState &state) {
        std::string out;
        out.swap(state.stderr_output);
        return out;
    });
    return taken.value_or(std::string());
}

std::unique_ptr<rpc::RpcClient> Elementsd::rpc_client() const {
    auto info = rpc_info();
    if (!info) {
        return nullptr;
    }
    return std::make_unique<rpc::RpcClient>(*info);
}

}  // namespace daemons
}  // namespace daemon_runner
