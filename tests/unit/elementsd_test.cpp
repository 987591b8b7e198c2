#include "daemons/elementsd.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <sstream>
#include <thread>

#include "test_helpers.hpp"

using namespace daemon_runner;
using namespace daemon_runner::daemons;
using namespace daemon_runner::tests;

namespace {

const std::string kHash = "0f9188f13cb7b2c71f2a335e3a4fc328bf5beb436012afca590b1a11466e2206";

std::string render(const ElementsdConfig &config) {
    std::ostringstream out;
    config.write_into(out);
    return out.str();
}

ElementsdConfig base_config() {
    ElementsdConfig config;
    config.datadir = "/tmp/liquid";
    config.chain = "elementsregtest";
    return config;
}

}  // namespace

/******************************************************************************
 * Config File Tests
 ******************************************************************************/

TEST(ElementsdConfigTest, MinimalWithChainSection) {
    EXPECT_EQ(render(base_config()),
              "datadir=/tmp/liquid\n"
              "chain=elementsregtest\n"
              "[elementsregtest]\n"
              "debug=0\n"
              "printtoconsole=0\n"
              "daemon=0\n"
              "listen=0\n"
              "txindex=0\n"
              "validatepegin=0\n");
}

TEST(ElementsdConfigTest, FullOptionOrder) {
    ElementsdConfig config = base_config();
    config.signblockscript = "5121";
    config.con_max_block_sig_size = 150;
    config.fedpegscript = "51";
    config.pak_pubkeys = {{"02aa", "03bb"}};
    config.con_dyna_deploy_start = 0;
    config.con_nminerconfirmationwindow = 144;
    config.con_nrulechangeactivationthreshold = 108;
    config.connect = {"127.0.0.1:7041"};
    config.rpcuser = "user";
    config.rpcpass = "pass";
    config.rpcport = 7040;
    config.validatepegin = true;
    config.mainchain_rpchost = "127.0.0.1";
    config.mainchain_rpcport = 18443;
    config.mainchain_rpcuser = "btc";
    config.mainchain_rpcpass = "btcpass";
    config.blockmintxfee = 0.00001;

    EXPECT_EQ(render(config),
              "datadir=/tmp/liquid\n"
              "chain=elementsregtest\n"
              "[elementsregtest]\n"
              "debug=0\n"
              "printtoconsole=0\n"
              "daemon=0\n"
              "listen=0\n"
              "txindex=0\n"
              "signblockscript=5121\n"
              "con_max_block_sig_size=150\n"
              "fedpegscript=51\n"
              "pak=02aa03bb\n"
              "con_dyna_deploy_start=0\n"
              "con_nminerconfirmationwindow=144\n"
              "con_nrulechangeactivationthreshold=108\n"
              "connect=127.0.0.1:7041\n"
              "server=1\n"
              "rpcport=7040\n"
              "rpcuser=user\n"
              "rpcpassword=pass\n"
              "validatepegin=1\n"
              "mainchainrpchost=127.0.0.1\n"
              "mainchainrpcport=18443\n"
              "mainchainrpcuser=btc\n"
              "mainchainrpcpassword=btcpass\n"
              "blockmintxfee=0.00001\n");
}

TEST(ElementsdConfigTest, MainchainRpcOnlyWithPeginValidation) {
    ElementsdConfig config = base_config();
    config.mainchain_rpchost = "127.0.0.1";

    std::string conf = render(config);
    EXPECT_NE(conf.find("validatepegin=0\n"), std::string::npos);
    EXPECT_EQ(conf.find("mainchainrpchost"), std::string::npos);
}

TEST(ElementsdConfigTest, PreDynafedPakUsesColon) {
    ElementsdConfig config = base_config();
    config.version = 170300;
    config.pak_pubkeys = {{"02aa", "03bb"}};

    std::string conf = render(config);
    EXPECT_NE(conf.find("[elementsregtest]\n"), std::string::npos);
    EXPECT_NE(conf.find("pak=02aa:03bb\n"), std::string::npos);
}

TEST(ElementsdConfigTest, OldLiquidVersionHasNoSectionAndColonPak) {
    ElementsdConfig config = base_config();
    config.chain = "liquidv1";
    config.version = 3140100;
    config.pak_pubkeys = {{"02aa", "03bb"}};

    std::string conf = render(config);
    EXPECT_NE(conf.find("chain=liquidv1\n"), std::string::npos);
    EXPECT_EQ(conf.find("[liquidv1]"), std::string::npos);
    EXPECT_NE(conf.find("pak=02aa:03bb\n"), std::string::npos);
}

TEST(ElementsdConfigTest, ValidationRequiresChain) {
    ElementsdConfig config = base_config();
    std::string error;
    EXPECT_TRUE(validate_elementsd_config(config, error)) << error;

    config.chain.clear();
    EXPECT_FALSE(validate_elementsd_config(config, error));
    EXPECT_EQ(error, "elementsd requires a chain name");

    config.chain = "elementsregtest";
    config.datadir = "liquid";
    EXPECT_FALSE(validate_elementsd_config(config, error));
    EXPECT_EQ(error, "datadir should be an absolute path");
}

TEST(ElementsdConfigTest, ValidationRejectsInjectedLines) {
    ElementsdConfig config = base_config();
    std::string error;

    config.chain = "elementsregtest\nfedpegscript=51";
    EXPECT_FALSE(validate_elementsd_config(config, error));
    EXPECT_EQ(error, "chain must not contain control characters");

    config = base_config();
    config.validatepegin = true;
    config.mainchain_rpcpass = "pw\nvalidatepegin=0";
    EXPECT_FALSE(validate_elementsd_config(config, error));
    EXPECT_EQ(error, "mainchain_rpcpass must not contain control characters");
}

TEST(ElementsdConfigTest, ValidationRequiresHexScriptsAndKeys) {
    ElementsdConfig config = base_config();
    std::string error;

    config.signblockscript = "51\n21";
    EXPECT_FALSE(validate_elementsd_config(config, error));
    EXPECT_EQ(error, "signblockscript must be hex encoded");

    config = base_config();
    config.fedpegscript = "";
    EXPECT_FALSE(validate_elementsd_config(config, error));
    EXPECT_EQ(error, "fedpegscript must be hex encoded");

    config = base_config();
    config.pak_pubkeys = {{"02aa", "03bb"}, {"02cc", "zz"}};
    EXPECT_FALSE(validate_elementsd_config(config, error));
    EXPECT_EQ(error, "pak_pubkeys must be hex encoded");

    config.pak_pubkeys = {{"02aa", "03bb"}, {"02cc", "03dd"}};
    config.signblockscript = "5121";
    config.fedpegscript = "51";
    EXPECT_TRUE(validate_elementsd_config(config, error)) << error;
}

/******************************************************************************
 * UpdateTip Parsing Tests
 ******************************************************************************/

TEST(UpdateTipTest, ParsesLogLine) {
    std::string line = "2019-09-04T12:00:00Z UpdateTip: new best=" + kHash +
                       " height=42 version=0x20000000 log2_work=1 tx=43 date='2019-09-04T12:00:00Z' progress=1.0";

    auto tip = parse_update_tip(line);
    ASSERT_TRUE(tip.has_value());
    EXPECT_EQ(tip->height, 42u);
    EXPECT_EQ(tip->block_hash, kHash);
}

TEST(UpdateTipTest, IgnoresOtherLines) {
    EXPECT_FALSE(parse_update_tip("").has_value());
    EXPECT_FALSE(parse_update_tip("Loading block index...").has_value());
    EXPECT_FALSE(parse_update_tip("UpdateTip: new best=" + kHash + " height=42").has_value());
}

TEST(UpdateTipTest, RejectsMalformedFields) {
    // Hash must be a full 32-byte hex string
    EXPECT_FALSE(parse_update_tip("UpdateTip: new best=abcd height=1 version=0x1").has_value());
    // Height must fit in 32 bits
    EXPECT_FALSE(parse_update_tip("UpdateTip: new best=" + kHash + " height=4294967296 version=0x1").has_value());
    EXPECT_FALSE(parse_update_tip("UpdateTip: new best=" + kHash + " height= version=0x1").has_value());
    // Uppercase hex is not what the daemon prints
    std::string upper = kHash;
    upper[1] = 'F';
    EXPECT_FALSE(parse_update_tip("UpdateTip: new best=" + upper + " height=1 version=0x1").has_value());
    // A 65th hex digit makes the hash too long
    EXPECT_FALSE(parse_update_tip("UpdateTip: new best=" + kHash + "0 height=1 version=0x1").has_value());
}

TEST(UpdateTipTest, LaterMarkerOnTheSameLine) {
    std::string line = "UpdateTip: new best=bogus UpdateTip: new best=" + kHash + " height=4294967295 version=0x1";

    auto tip = parse_update_tip(line);
    ASSERT_TRUE(tip.has_value());
    EXPECT_EQ(tip->height, 4294967295u);
}

/******************************************************************************
 * Adapter & Facade Tests
 ******************************************************************************/

class ElementsdTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = base_config();
        config_.datadir = (dir_.path() / "elementsd").string();
        options_.reader_start_delay = std::chrono::milliseconds(10);
    }

    TempDir dir_{"elementsd"};
    ElementsdConfig config_;
    runner::RunnerOptions options_;
};

TEST_F(ElementsdTest, StdoutTracksLatestTip) {
    ElementsdAdapter adapter("", "elementsd", config_);
    ElementsdState state = adapter.initial_state();
    EXPECT_FALSE(state.last_update_tip.has_value());

    adapter.handle_stdout_line(state, "UpdateTip: new best=" + kHash + " height=1 version=0x1");
    adapter.handle_stdout_line(state, "unrelated");
    adapter.handle_stdout_line(state, "UpdateTip: new best=" + kHash + " height=2 version=0x1");

    ASSERT_TRUE(state.last_update_tip.has_value());
    EXPECT_EQ(state.last_update_tip->height, 2u);
    EXPECT_TRUE(state.stderr_output.empty());
}

TEST_F(ElementsdTest, MegabyteLineOnReaderThread) {
    ElementsdAdapter adapter("", "elementsd", config_);
    ElementsdState state = adapter.initial_state();

    const std::string filler(1 << 20, 'x');
    const std::string marker_flood = [] {
        std::string s;
        while (s.size() < (1u << 20)) {
            s += "UpdateTip: new best=" + std::string(40, 'a') + " ";
        }
        return s;
    }();

    // Same stack budget as the daemon's stdout reader
    std::thread reader([&]() {
        adapter.handle_stdout_line(state, filler);
        adapter.handle_stdout_line(state, marker_flood);
        EXPECT_FALSE(state.last_update_tip.has_value());

        adapter.handle_stdout_line(state, filler + " UpdateTip: new best=" + kHash + " height=9 version=0x1");
    });
    reader.join();

    ASSERT_TRUE(state.last_update_tip.has_value());
    EXPECT_EQ(state.last_update_tip->height, 9u);
    EXPECT_EQ(state.last_update_tip->block_hash, kHash);
}

TEST_F(ElementsdTest, DisplayName) {
    EXPECT_EQ(ElementsdAdapter("liquid", "elementsd", config_).display_name(), "elementsd \"liquid\"");
    EXPECT_EQ(ElementsdAdapter("", "elementsd", config_).display_name(), "<unnamed> elementsd");
}

TEST_F(ElementsdTest, CreateRejectsEmptyChain) {
    config_.chain.clear();
    std::string error;

    auto node = Elementsd::create("/usr/bin/elementsd", config_, error);
    EXPECT_TRUE(node == nullptr);
    EXPECT_EQ(error, "elementsd requires a chain name");
}

TEST_F(ElementsdTest, PrepareWritesElementsConf) {
    ElementsdAdapter adapter("", "/usr/bin/elementsd", config_);
    ASSERT_TRUE(adapter.prepare().ok());

    std::filesystem::path conf = std::filesystem::path(config_.datadir) / "elements.conf";
    EXPECT_EQ(read_file(conf), render(config_));

    process::Command cmd = adapter.build_command();
    EXPECT_EQ(cmd.args, (std::vector<std::string>{"-conf=" + conf.string(), "-printtoconsole=1"}));
}

TEST_F(ElementsdTest, StubDaemonReportsTip) {
    std::string stub = write_script(dir_.path(), "fake_elementsd",
                                    "echo \"UpdateTip: new best=" + kHash + " height=7 version=0x20000000\"\n"
                                    "echo \"init message: Done loading\" >&2\n"
                                    "exec sleep 30\n");
    std::string error;
    auto node = Elementsd::create(stub, config_, error, "liquid", options_);
    ASSERT_TRUE(node != nullptr) << error;
    EXPECT_FALSE(node->last_update_tip().has_value());

    ASSERT_TRUE(node->start().ok());

    ASSERT_TRUE(wait_until([&]() { return node->last_update_tip().has_value(); }));
    EXPECT_EQ(node->last_update_tip()->height, 7u);
    EXPECT_EQ(node->last_update_tip()->block_hash, kHash);

    ASSERT_TRUE(wait_until([&]() { return node->with_state([](ElementsdState &s) { return !s.stderr_output.empty(); }).value_or(false); }));
    EXPECT_EQ(node->take_stderr(), "init message: Done loading\n");

    ASSERT_TRUE(node->stop().ok());
}
