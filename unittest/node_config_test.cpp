#include <gtest/gtest.h>
#include "backup/node_config.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>

using json = nlohmann::json;

class NodeConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() / ("peervault_config_" + utils::randomHex(6) + ".json");
    }

    void TearDown() override {
        std::filesystem::remove(path_);
    }

    std::filesystem::path path_;
};

TEST_F(NodeConfigTest, MissingKeysKeepDefaults) {
    auto config = parseNodeConfig(json{{"data_dir", "/var/lib/peervault"}, {"callsign", "alfa"}});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->callsign, "ALFA");
    EXPECT_EQ(config->identityFile, "/var/lib/peervault/backup-config/identity.json");
    EXPECT_EQ(config->inviteTimeoutSeconds, 60);
    EXPECT_EQ(config->freshnessWindowSeconds, 300);
    EXPECT_EQ(config->discoveryTimeoutSeconds, 10);
    EXPECT_EQ(config->logLevel, "info");
    EXPECT_TRUE(config->peers.empty());
}

TEST_F(NodeConfigTest, RequiresDataDirAndCallsign) {
    EXPECT_FALSE(parseNodeConfig(json{{"callsign", "ALFA"}}).has_value());
    EXPECT_FALSE(parseNodeConfig(json{{"data_dir", "/tmp"}}).has_value());
    EXPECT_FALSE(parseNodeConfig(json{{"data_dir", "/tmp"}, {"callsign", "../root"}}).has_value());
    EXPECT_FALSE(parseNodeConfig(json{{"data_dir", "/tmp"}, {"callsign", "ALFA"},
                                      {"invite_timeout_seconds", "soon"}}).has_value());
}

TEST_F(NodeConfigTest, SaveAndLoad) {
    NodeConfig config;
    config.dataDir = "/data/alfa";
    config.callsign = "ALFA";
    config.identityFile = "/data/alfa/id.json";
    config.stationUrl = "https://station.example";
    config.workerThreads = 8;
    config.excludedDirectories = {"cache"};
    config.peers = {PeerInfo{"BASE1", true}, PeerInfo{"BASE2", false}};
    ASSERT_TRUE(saveNodeConfig(config, path_.string()));

    auto loaded = loadNodeConfig(path_.string());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->stationUrl, "https://station.example");
    EXPECT_EQ(loaded->workerThreads, 8);
    ASSERT_EQ(loaded->excludedDirectories.size(), 1u);
    EXPECT_EQ(loaded->excludedDirectories[0], "cache");
    ASSERT_EQ(loaded->peers.size(), 2u);
    EXPECT_EQ(loaded->peers[0].callsign, "BASE1");
    EXPECT_TRUE(loaded->peers[0].online);
    EXPECT_FALSE(loaded->peers[1].online);
}

TEST_F(NodeConfigTest, LogLevelNames) {
    EXPECT_EQ(Logger::parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLogLevel("WARN"), LogLevel::WARNING);
    EXPECT_EQ(Logger::parseLogLevel("Error"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parseLogLevel("chatty"), LogLevel::INFO);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
