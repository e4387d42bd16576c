#include <gtest/gtest.h>
#include "main/node_cli.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

class NodeCLITest : public ::testing::Test {
protected:
    void SetUp() override {
        dataDir_ = std::filesystem::temp_directory_path() / ("peervault_cli_" + utils::randomHex(6));
        std::filesystem::create_directories(dataDir_);
        config_.dataDir = dataDir_.string();
        config_.callsign = "ALFA";
        config_.identityFile = (dataDir_ / "backup-config" / "identity.json").string();
        config_.stationUrl = "http://127.0.0.1:9";
        config_.workerThreads = 1;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dataDir_, ec);
    }

    // Runs "serve" over |input| and returns every JSON line written to stdout
    std::vector<json> serve(const std::string& input, int& exitCode) {
        std::istringstream in(input);
        std::ostringstream out;
        std::streambuf* oldIn = std::cin.rdbuf(in.rdbuf());
        std::streambuf* oldOut = std::cout.rdbuf(out.rdbuf());
        {
            NodeCLI cli(config_);
            exitCode = cli.run({"serve"});
        }
        std::cin.rdbuf(oldIn);
        std::cout.rdbuf(oldOut);

        std::vector<json> lines;
        std::istringstream written(out.str());
        std::string line;
        while (std::getline(written, line)) {
            if (!line.empty()) {
                lines.push_back(json::parse(line));
            }
        }
        return lines;
    }

    std::filesystem::path dataDir_;
    NodeConfig config_;
};

TEST_F(NodeCLITest, ServeSurvivesMistypedInput) {
    std::string input =
        "{\"kind\": 5}\n"
        "[1, 2]\n"
        "not json\n"
        "{\"kind\": \"command\", \"command\": 7, \"id\": 1}\n"
        "{\"kind\": \"message\", \"message\": {\"type\": \"backup_start\", \"snapshot_id\": \"2026-01-01\", \"from\": 42}}\n"
        "{\"kind\": \"peer\", \"callsign\": [\"BASE1\"]}\n"
        "{\"kind\": \"command\", \"command\": \"status\", \"id\": 2}\n";

    int exitCode = -1;
    std::vector<json> lines = serve(input, exitCode);
    EXPECT_EQ(exitCode, 0);

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].value("kind", ""), "command_result");
    EXPECT_EQ(lines[0].value("id", 0), 2);
    EXPECT_EQ(lines[0].value("command", ""), "status");
    EXPECT_TRUE(lines[0].contains("state"));
}

TEST_F(NodeCLITest, UnknownCommandIsReported) {
    int exitCode = -1;
    std::vector<json> lines = serve("{\"kind\": \"command\", \"command\": \"reboot\", \"id\": \"x\"}\n", exitCode);
    EXPECT_EQ(exitCode, 0);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].value("error", ""), "unknown command");
    EXPECT_EQ(lines[0].value("id", ""), "x");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
