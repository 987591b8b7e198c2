#include "daemons/node_config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>

#include "test_helpers.hpp"

using namespace daemon_runner;
using namespace daemon_runner::daemons;
using namespace daemon_runner::tests;

TEST(NodeConfigTest, EffectiveVersionFallsBackToDefault) {
    NodeConfig config;
    EXPECT_EQ(config.effective_version(180000), 180000u);

    config.version = 170100;
    EXPECT_EQ(config.effective_version(180000), 170100u);
}

TEST(NodeConfigTest, BasicOptionsAsFlags) {
    NodeConfig config;
    config.debug = true;
    config.listen = true;
    config.port = 18444;

    std::ostringstream out;
    write_basic_options(out, config);

    EXPECT_EQ(out.str(),
              "debug=1\n"
              "printtoconsole=0\n"
              "daemon=0\n"
              "listen=1\n"
              "port=18444\n"
              "txindex=0\n");
}

TEST(NodeConfigTest, RpcBlockWithCookie) {
    NodeConfig config;
    config.connect = {"127.0.0.1:18444", "127.0.0.1:18445"};
    config.rpccookie = "/data/.cookie";
    config.rpcport = 18443;

    std::ostringstream out;
    write_connect_and_rpc_options(out, config);

    EXPECT_EQ(out.str(),
              "connect=127.0.0.1:18444\n"
              "connect=127.0.0.1:18445\n"
              "server=1\n"
              "rpccookiefile=/data/.cookie\n"
              "rpcport=18443\n");
}

TEST(NodeConfigTest, NoServerWithoutCredentials) {
    NodeConfig config;
    config.rpcport = 18443;

    std::ostringstream out;
    write_connect_and_rpc_options(out, config);

    EXPECT_EQ(out.str(), "rpcport=18443\n");
}

TEST(NodeConfigTest, FeesUsePlainDecimals) {
    NodeConfig config;
    config.addresstype = "bech32";
    config.blockmintxfee = 0.00001;
    config.minrelaytxfee = 1.0;

    std::ostringstream out;
    write_fee_options(out, config);

    EXPECT_EQ(out.str(),
              "addresstype=bech32\n"
              "blockmintxfee=0.00001\n"
              "minrelaytxfee=1\n");
}

TEST(NodeConfigTest, RpcInfoPrefersCookie) {
    NodeConfig config;
    config.rpcport = 18443;
    config.rpccookie = "/data/.cookie";
    config.rpcuser = "alice";
    config.rpcpass = "secret";

    auto info = make_rpc_info(config);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->url, "http://127.0.0.1:18443");
    EXPECT_EQ(info->auth.kind, rpc::RpcAuth::Kind::COOKIE_FILE);
    EXPECT_EQ(info->auth.cookie_file, "/data/.cookie");
}

TEST(NodeConfigTest, RpcInfoUserPass) {
    NodeConfig config;
    config.rpcport = 18443;
    config.rpcuser = "alice";
    config.rpcpass = "secret";

    auto info = make_rpc_info(config);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->auth.kind, rpc::RpcAuth::Kind::USER_PASS);
    EXPECT_EQ(info->auth.user, "alice");
    EXPECT_EQ(info->auth.password, "secret");
}

TEST(NodeConfigTest, RpcInfoMissingPieces) {
    NodeConfig no_port;
    no_port.rpcuser = "alice";
    no_port.rpcpass = "secret";
    EXPECT_FALSE(make_rpc_info(no_port).has_value());

    NodeConfig no_password;
    no_password.rpcport = 18443;
    no_password.rpcuser = "alice";
    EXPECT_FALSE(make_rpc_info(no_password).has_value());

    NodeConfig no_credentials;
    no_credentials.rpcport = 18443;
    EXPECT_FALSE(make_rpc_info(no_credentials).has_value());
}

TEST(NodeConfigTest, DatadirMustBeAbsolute) {
    NodeConfig config;
    std::string error;

    config.datadir = "relative/dir";
    EXPECT_FALSE(validate_node_config(config, error));
    EXPECT_EQ(error, "datadir should be an absolute path");

    config.datadir = "";
    EXPECT_FALSE(validate_node_config(config, error));

    config.datadir = "/var/lib/node";
    EXPECT_TRUE(validate_node_config(config, error));
}

TEST(NodeConfigTest, ControlCharactersRejected) {
    NodeConfig config;
    config.datadir = "/var/lib/node";
    config.rpcuser = "alice";
    config.rpcpass = "x\nrpcbind=0.0.0.0";
    std::string error;

    EXPECT_FALSE(validate_node_config(config, error));
    EXPECT_EQ(error, "rpcpass must not contain control characters");

    config.rpcpass = "secret";
    config.rpccookie = std::string("/tmp/cookie\0x", 13);
    EXPECT_FALSE(validate_node_config(config, error));
    EXPECT_EQ(error, "rpccookie must not contain control characters");

    config.rpccookie.reset();
    config.datadir = "/var/lib/node\nprinttoconsole=0";
    EXPECT_FALSE(validate_node_config(config, error));
    EXPECT_EQ(error, "datadir must not contain control characters");

    config.datadir = "/var/lib/n\xC3\xB6"
                     "de";
    config.addresstype = "bech32\t";
    EXPECT_FALSE(validate_node_config(config, error));
    EXPECT_EQ(error, "addresstype must not contain control characters");

    // Non-ASCII text is fine
    config.addresstype = "bech32";
    EXPECT_TRUE(validate_node_config(config, error)) << error;
}

TEST(NodeConfigTest, HexStrings) {
    EXPECT_TRUE(is_hex_string("5121"));
    EXPECT_TRUE(is_hex_string("02AAbb"));
    EXPECT_FALSE(is_hex_string(""));
    EXPECT_FALSE(is_hex_string("512"));
    EXPECT_FALSE(is_hex_string("51\n21"));
    EXPECT_FALSE(is_hex_string("OP_TRUE!"));
}

TEST(NodeConfigTest, WriteConfigFileCreatesDirectories) {
    TempDir dir("node_config");
    std::string datadir = (dir.path() / "a" / "b").string();
    std::string path;
    std::string error;

    ASSERT_TRUE(write_config_file(datadir, "node.conf", "key=value\n", path, error)) << error;

    EXPECT_EQ(path, (dir.path() / "a" / "b" / "node.conf").string());
    EXPECT_EQ(read_file(path), "key=value\n");
}

TEST(NodeConfigTest, WriteConfigFileReportsFailure) {
    TempDir dir("node_config");
    // A regular file where the datadir should be
    std::string blocker = write_script(dir.path(), "not_a_dir", "");
    std::string path;
    std::string error;

    EXPECT_FALSE(write_config_file(blocker + "/sub", "node.conf", "x", path, error));
    EXPECT_NE(error.find("Cannot create datadir"), std::string::npos);
    EXPECT_TRUE(path.empty());
}
