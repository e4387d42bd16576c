#pragma once

#include "backup/backup_node.hpp"
#include "backup/node_config.hpp"
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Command-line front end of a node. One-shot commands act and exit; "serve"
// keeps the node running and exchanges JSON lines on stdin/stdout with
// whatever bridges it to the messaging fabric.
class NodeCLI {
public:
    explicit NodeCLI(const NodeConfig& config);
    ~NodeCLI();

    int run(const std::vector<std::string>& args);
    static void printUsage();

private:
    bool openNode();
    int handleInit();
    int handleStatus();
    int handleProvider(const std::vector<std::string>& args);
    int handleAccept(const std::vector<std::string>& args);
    int handleDecline(const std::vector<std::string>& args);
    int handleRemoveClient(const std::vector<std::string>& args);
    int handleRemoveProvider(const std::vector<std::string>& args);
    int handleBackup(const std::vector<std::string>& args);
    int handleRestore(const std::vector<std::string>& args);
    int handleSnapshots(const std::vector<std::string>& args);
    int handleServe();

    void handleServeLine(const std::string& line);
    void dispatchServeRequest(const nlohmann::json& request);
    void dropFinishedInvites();
    void handleServeCommand(const nlohmann::json& request);
    int waitForTransfer(TransferJob& job, const TransferStatus& started);
    void emit(const nlohmann::json& j);

    NodeConfig config_;
    std::unique_ptr<BackupNode> node_;
    std::mutex outputMutex_;
    std::vector<std::future<void>> pending_;
};
