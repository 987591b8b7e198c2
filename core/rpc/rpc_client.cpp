#include "rpc_client.hpp"

#include <httplib.h>

#include <chrono>
#include <fstream>
#include <sstream>

#include "logging/logger.hpp"

namespace daemon_runner {
namespace rpc {

RpcAuth RpcAuth::user_pass(const std::string &user, const std::string &password) {
    RpcAuth auth;
    auth.kind = Kind::USER_PASS;
    auth.user = user;
    auth.password = password;
    return auth;
}

RpcAuth RpcAuth::cookie(const std::string &cookie_file) {
    RpcAuth auth;
    auth.kind = Kind::COOKIE_FILE;
    auth.cookie_file = cookie_file;
    return auth;
}

bool RpcAuth::credentials(std::string &user_out, std::string &password_out, std::string &error) const {
    if (kind == Kind::USER_PASS) {
        user_out = user;
        password_out = password;
        return true;
    }

    std::ifstream file(cookie_file);
    if (!file) {
        error = "Cannot open RPC cookie file: " + cookie_file;
        return false;
    }
    std::string content;
    std::getline(file, content);

    auto colon = content.find(':');
    if (colon == std::string::npos) {
        error = "Malformed RPC cookie file (expected user:password): " + cookie_file;
        return false;
    }
    user_out = content.substr(0, colon);
    password_out = content.substr(colon + 1);
    return true;
}

RpcClient::RpcClient(std::string url, RpcAuth auth, int timeout_ms)
    : url_(std::move(url)), auth_(std::move(auth)), timeout_ms_(timeout_ms) {}

RpcClient::RpcClient(const RpcInfo &info, int timeout_ms) : RpcClient(info.url, info.auth, timeout_ms) {}

bool RpcClient::call(const std::string &method, const nlohmann::json &params, nlohmann::json &result,
                     std::string &error) {
    last_rpc_error_code_.store(0);

    std::string user;
    std::string password;
    if (!auth_.credentials(user, password, error)) {
        return false;
    }

    const uint64_t id = next_id_.fetch_add(1);
    nlohmann::json request = {{"jsonrpc", "1.0"},
                              {"id", id},
                              {"method", method},
                              {"params", params.is_null() ? nlohmann::json::array() : params}};

    httplib::Client client(url_);
    client.set_connection_timeout(std::chrono::milliseconds(timeout_ms_));
    client.set_read_timeout(std::chrono::milliseconds(timeout_ms_));
    client.set_write_timeout(std::chrono::milliseconds(timeout_ms_));
    client.set_basic_auth(user, password);

    LOG_TRACE("[rpc] " << url_ << " -> " << method << " " << request["params"].dump());

    auto response = client.Post("/", request.dump(), "application/json");
    if (!response) {
        error = "RPC connection error (" + url_ + "): " + httplib::to_string(response.error());
        return false;
    }

    // Nodes answer RPC errors with HTTP 500 and a JSON body; auth failures have no body
    auto body = nlohmann::json::parse(response->body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        std::ostringstream msg;
        msg << "RPC " << method << " failed: HTTP " << response->status;
        if (response->status == 200) {
            msg << " (malformed JSON response)";
        }
        error = msg.str();
        return false;
    }

    if (body.contains("error") && !body["error"].is_null()) {
        const auto &rpc_error = body["error"];
        int code = rpc_error.value("code", 0);
        last_rpc_error_code_.store(code);
        error = "RPC " + method + " error " + std::to_string(code) + ": " + rpc_error.value("message", std::string());
        return false;
    }

    if (body.contains("id") && body["id"] != nlohmann::json(id)) {
        error = "RPC " + method + " response id mismatch (expected " + std::to_string(id) + ", got " +
                body["id"].dump() + ")";
        return false;
    }

    if (!body.contains("result")) {
        error = "RPC " + method + " response missing 'result'";
        return false;
    }

    result = body["result"];
    return true;
}

bool RpcClient::get_best_block_hash(std::string &hash, std::string &error) {
    nlohmann::json result;
    if (!call("getbestblockhash", nlohmann::json::array(), result, error)) {
        return false;
    }
    if (!result.is_string()) {
        error = "getbestblockhash returned a non-string result";
        return false;
    }
    hash = result.get<std::string>();
    return true;
}

bool RpcClient::get_block_count(int64_t &count, std::string &error) {
    nlohmann::json result;
    if (!call("getblockcount", nlohmann::json::array(), result, error)) {
        return false;
    }
    if (!result.is_number_integer()) {
        error = "getblockcount returned a non-integer result";
        return false;
    }
    count = result.get<int64_t>();
    return true;
}

}  // namespace rpc
}  // namespace daemon_runner
