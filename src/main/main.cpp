#include "main/node_cli.hpp"
#include "backup/node_config.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::string configPath;
    bool verbose = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            NodeCLI::printUsage();
            return 0;
        } else if (arg == "--version") {
            std::cout << "peervault version 1.0.0\n";
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            args.push_back(arg);
        }
    }

    if (configPath.empty()) {
        std::cerr << "Error: --config is required" << std::endl;
        NodeCLI::printUsage();
        return 1;
    }

    auto config = loadNodeConfig(configPath);
    if (!config) {
        std::cerr << "Error: failed to load configuration from " << configPath << std::endl;
        return 1;
    }

    if (!Logger::initialize(config->logFile, Logger::parseLogLevel(config->logLevel))) {
        std::cerr << "Failed to initialize logger" << std::endl;
        return 1;
    }
    Logger::setConsoleOutput(verbose);
    if (verbose) {
        Logger::setLogLevel(LogLevel::DEBUG);
    }

    int result = 1;
    try {
        NodeCLI cli(*config);
        result = cli.run(args);
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        Logger::error("Error in main: " + std::string(e.what()));
    }

    Logger::shutdown();
    return result;
}
