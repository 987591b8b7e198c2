#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace daemon_runner {
namespace rpc {

// Credentials for a node's JSON-RPC interface
struct RpcAuth {
    enum class Kind { USER_PASS, COOKIE_FILE };

    Kind kind = Kind::USER_PASS;
    std::string user;
    std::string password;
    std::string cookie_file;  // Written by the node on startup as "user:password"

    static RpcAuth user_pass(const std::string &user, const std::string &password);
    static RpcAuth cookie(const std::string &cookie_file);

    // Resolve to a user/password pair. The cookie file is re-read on every
    // call since the node rewrites it on each start.
    bool credentials(std::string &user_out, std::string &password_out, std::string &error) const;
};

// Where and how to reach a running node, e.g. {"http://127.0.0.1:18443", user_pass(...)}
struct RpcInfo {
    std::string url;
    RpcAuth auth;
};

/**
 * @brief Minimal JSON-RPC 1.0 client for bitcoind-style nodes
 *
 * Each call is a blocking HTTP POST to "/" with basic auth. Errors
 * (connection, HTTP status without a JSON body, JSON-RPC error object,
 * malformed response) are reported through the `error` out-parameter.
 * Safe to call from several threads.
 */
class RpcClient {
public:
    RpcClient(std::string url, RpcAuth auth, int timeout_ms = 30000);
    explicit RpcClient(const RpcInfo &info, int timeout_ms = 30000);

    // Delete copy
    RpcClient(const RpcClient &) = delete;
    RpcClient &operator=(const RpcClient &) = delete;

    bool call(const std::string &method, const nlohmann::json &params, nlohmann::json &result, std::string &error);

    // Convenience wrappers
    bool get_best_block_hash(std::string &hash, std::string &error);
    bool get_block_count(int64_t &count, std::string &error);

    const std::string &url() const { return url_; }

    // JSON-RPC error code of the last failed call (0 if none or not an RPC error)
    int last_rpc_error_code() const { return last_rpc_error_code_.load(); }

private:
    std::string url_;
    RpcAuth auth_;
    int timeout_ms_;
    std::atomic<uint64_t> next_id_{1};
    std::atomic<int> last_rpc_error_code_{0};
};

}  // namespace rpc
}  // namespace daemon_runner
