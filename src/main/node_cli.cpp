#include "main/node_cli.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "identity/openssl_identity.hpp"
#include "transport/station_transport.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>

using json = nlohmann::json;

namespace {

std::optional<int64_t> parseInt64(const std::string& text) {
    try {
        size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Value following |flag|, if present
std::optional<std::string> optionValue(const std::vector<std::string>& args, const std::string& flag) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag) {
            return args[i + 1];
        }
    }
    return std::nullopt;
}

bool hasFlag(const std::vector<std::string>& args, const std::string& flag) {
    for (const auto& arg : args) {
        if (arg == flag) {
            return true;
        }
    }
    return false;
}

json relationshipsJson(RelationshipStore& store) {
    return json{
        {"settings", store.getSettings()},
        {"clients", store.getClients()},
        {"providers", store.getProviders()}
    };
}

} // namespace

NodeCLI::NodeCLI(const NodeConfig& config)
    : config_(config) {
}

NodeCLI::~NodeCLI() {
    for (auto& task : pending_) {
        if (task.valid()) {
            task.wait();
        }
    }
}

void NodeCLI::printUsage() {
    std::cout << "Usage: peervault --config FILE <command> [options]\n"
              << "Commands:\n"
              << "  init                                  Generate and save a new identity\n"
              << "  status                                Show settings and relationships\n"
              << "  provider enable [--max-total B] [--max-client B] [--max-snapshots N] [--auto-accept]\n"
              << "  provider disable\n"
              << "  accept CALLSIGN [--max-storage B] [--max-snapshots N]\n"
              << "  decline CALLSIGN\n"
              << "  remove-client CALLSIGN [--erase]\n"
              << "  remove-provider CALLSIGN\n"
              << "  backup PROVIDER                       Back up the data directory now\n"
              << "  restore PROVIDER SNAPSHOT             Restore a snapshot into the data directory\n"
              << "  snapshots PROVIDER                    List snapshots held by a provider\n"
              << "  serve                                 Run the node, JSON lines on stdin/stdout\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config FILE   Node configuration (JSON)\n"
              << "  --verbose           Mirror the log to stderr at debug level\n"
              << "  --version           Show the version\n"
              << "  -h, --help          Show this help message\n";
}

bool NodeCLI::openNode() {
    std::shared_ptr<OpenSslIdentity> identity;
    if (std::filesystem::exists(config_.identityFile)) {
        auto loaded = OpenSslIdentity::load(config_.identityFile);
        if (!loaded) {
            std::cerr << "Error: failed to load identity from " << config_.identityFile << std::endl;
            return false;
        }
        identity = std::make_shared<OpenSslIdentity>(*loaded);
    } else {
        Logger::warning("No identity at " + config_.identityFile + "; run 'peervault init'");
        identity = std::make_shared<OpenSslIdentity>();
    }

    auto transport = std::make_shared<StationTransport>(config_.stationUrl, config_.callsign,
                                                        config_.requestTimeoutSeconds);
    node_ = std::make_unique<BackupNode>(config_, identity, transport);
    if (!node_->initialize()) {
        std::cerr << "Error: failed to load backup state from " << config_.dataDir << std::endl;
        return false;
    }
    return true;
}

int NodeCLI::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage();
        return 1;
    }

    const std::string& command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (command == "init") {
        return handleInit();
    }
    if (!openNode()) {
        return 1;
    }

    if (command == "status") return handleStatus();
    if (command == "provider") return handleProvider(rest);
    if (command == "accept") return handleAccept(rest);
    if (command == "decline") return handleDecline(rest);
    if (command == "remove-client") return handleRemoveClient(rest);
    if (command == "remove-provider") return handleRemoveProvider(rest);
    if (command == "backup") return handleBackup(rest);
    if (command == "restore") return handleRestore(rest);
    if (command == "snapshots") return handleSnapshots(rest);
    if (command == "serve") return handleServe();

    std::cerr << "Error: unknown command " << command << std::endl;
    printUsage();
    return 1;
}

int NodeCLI::handleInit() {
    if (std::filesystem::exists(config_.identityFile)) {
        std::cerr << "Error: identity already exists at " << config_.identityFile << std::endl;
        return 1;
    }
    OpenSslIdentity identity = OpenSslIdentity::generate();
    if (!identity.save(config_.identityFile)) {
        std::cerr << "Error: failed to save identity" << std::endl;
        return 1;
    }
    Logger::info("Generated identity for " + config_.callsign);
    std::cout << identity.publicKey() << std::endl;
    return 0;
}

int NodeCLI::handleStatus() {
    json status = relationshipsJson(node_->relationshipStore());
    status["callsign"] = config_.callsign;
    status["public_key"] = node_->identity().publicKey();
    std::cout << status.dump(4) << std::endl;
    return 0;
}

int NodeCLI::handleProvider(const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage();
        return 1;
    }

    if (args[0] == "disable") {
        return node_->relationships().disableProvider() ? 0 : 1;
    }
    if (args[0] != "enable") {
        printUsage();
        return 1;
    }

    ProviderSettings settings = node_->relationshipStore().getSettings();
    if (auto value = optionValue(args, "--max-total")) {
        auto parsed = parseInt64(*value);
        if (!parsed || *parsed <= 0) {
            std::cerr << "Error: invalid --max-total " << *value << std::endl;
            return 1;
        }
        settings.maxTotalStorageBytes = *parsed;
    }
    if (auto value = optionValue(args, "--max-client")) {
        auto parsed = parseInt64(*value);
        if (!parsed || *parsed <= 0) {
            std::cerr << "Error: invalid --max-client " << *value << std::endl;
            return 1;
        }
        settings.defaultMaxClientStorageBytes = *parsed;
    }
    if (auto value = optionValue(args, "--max-snapshots")) {
        auto parsed = parseInt64(*value);
        if (!parsed || *parsed <= 0) {
            std::cerr << "Error: invalid --max-snapshots " << *value << std::endl;
            return 1;
        }
        settings.defaultMaxSnapshots = static_cast<int>(*parsed);
    }
    if (hasFlag(args, "--auto-accept")) {
        settings.autoAcceptFromContacts = true;
    }
    return node_->relationships().enableProvider(settings) ? 0 : 1;
}

int NodeCLI::handleAccept(const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage();
        return 1;
    }
    std::optional<int64_t> maxStorage;
    std::optional<int> maxSnapshots;
    if (auto value = optionValue(args, "--max-storage")) {
        maxStorage = parseInt64(*value);
        if (!maxStorage) {
            std::cerr << "Error: invalid --max-storage " << *value << std::endl;
            return 1;
        }
    }
    if (auto value = optionValue(args, "--max-snapshots")) {
        auto parsed = parseInt64(*value);
        if (!parsed) {
            std::cerr << "Error: invalid --max-snapshots " << *value << std::endl;
            return 1;
        }
        maxSnapshots = static_cast<int>(*parsed);
    }
    return node_->relationships().acceptInvite(args[0], maxStorage, maxSnapshots) ? 0 : 1;
}

int NodeCLI::handleDecline(const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage();
        return 1;
    }
    return node_->relationships().declineInvite(args[0]) ? 0 : 1;
}

int NodeCLI::handleRemoveClient(const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage();
        return 1;
    }
    return node_->relationships().removeClient(args[0], hasFlag(args, "--erase")) ? 0 : 1;
}

int NodeCLI::handleRemoveProvider(const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage();
        return 1;
    }
    return node_->relationships().removeProvider(args[0]) ? 0 : 1;
}

int NodeCLI::waitForTransfer(TransferJob& job, const TransferStatus& started) {
    if (started.state != TransferState::InProgress || started.errorCode != BackupErrorCode::None) {
        std::cerr << "Error: " << started.error << std::endl;
        return 1;
    }

    auto subscription = job.statusChannel().subscribe([](const TransferStatus& status) {
        std::cout << "\rProgress: " << status.progressPercent << "% ("
                  << status.filesTransferred << "/" << status.filesTotal << " files)" << std::flush;
    });
    while (!job.waitForCompletion(std::chrono::seconds(1))) {
    }
    job.statusChannel().unsubscribe(subscription);

    TransferStatus finished = job.getStatus();
    std::cout << std::endl;
    if (finished.state != TransferState::Complete) {
        std::cerr << "Error: " << finished.error << " (" << toString(finished.errorCode) << ")" << std::endl;
        return 1;
    }
    std::cout << "Snapshot " << finished.snapshotId << " complete" << std::endl;
    return 0;
}

int NodeCLI::handleBackup(const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage();
        return 1;
    }
    BackupExecutor& executor = node_->backupExecutor();
    return waitForTransfer(executor, executor.startBackup(args[0]));
}

int NodeCLI::handleRestore(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        printUsage();
        return 1;
    }
    RestoreExecutor& executor = node_->restoreExecutor();
    return waitForTransfer(executor, executor.startRestore(args[0], args[1]));
}

int NodeCLI::handleSnapshots(const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage();
        return 1;
    }
    auto snapshots = node_->restoreExecutor().listRemoteSnapshots(args[0]);
    if (!snapshots) {
        std::cerr << "Error: failed to list snapshots on " << args[0] << std::endl;
        return 1;
    }
    std::cout << json(*snapshots).dump(4) << std::endl;
    return 0;
}

void NodeCLI::emit(const json& j) {
    std::lock_guard<std::mutex> lock(outputMutex_);
    std::cout << j.dump() << std::endl;
}

int NodeCLI::handleServe() {
    auto backupSubscription = node_->backupExecutor().statusChannel().subscribe([this](const TransferStatus& s) {
        emit(json{{"kind", "backup_status"}, {"status", s}});
    });
    auto restoreSubscription = node_->restoreExecutor().statusChannel().subscribe([this](const TransferStatus& s) {
        emit(json{{"kind", "restore_status"}, {"status", s}});
    });

    node_->scheduler().start();
    Logger::info("Node " + config_.callsign + " serving");

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        handleServeLine(line);
    }

    Logger::info("Input closed, shutting down");
    node_->scheduler().stop();
    for (auto& task : pending_) {
        task.wait();
    }
    pending_.clear();
    node_->backupExecutor().statusChannel().unsubscribe(backupSubscription);
    node_->restoreExecutor().statusChannel().unsubscribe(restoreSubscription);
    return 0;
}

void NodeCLI::handleServeLine(const std::string& line) {
    json request;
    try {
        request = json::parse(line);
    } catch (const json::exception& e) {
        Logger::warning("Ignoring malformed input line: " + std::string(e.what()));
        return;
    }

    // Wrongly typed fields throw from value(); the line is dropped, serving goes on
    try {
        dispatchServeRequest(request);
    } catch (const json::exception& e) {
        Logger::warning("Ignoring invalid input line: " + std::string(e.what()));
    }
}

void NodeCLI::dispatchServeRequest(const json& request) {
    std::string kind = request.value("kind", "");
    if (kind == "message") {
        node_->handleMessage(request.value("message", json::object()));
    } else if (kind == "api") {
        ApiResponse response = node_->handleApiRequest(request.value("from", ""),
                                                       request.value("method", "GET"),
                                                       request.value("path", ""),
                                                       request.value("body", ""));
        emit(json{{"kind", "api_response"},
                  {"id", request.value("id", json())},
                  {"status", response.statusCode},
                  {"body", response.body}});
    } else if (kind == "peer") {
        node_->peerDirectory().setPeer(request.value("callsign", ""), request.value("online", true));
    } else if (kind == "command") {
        handleServeCommand(request);
    } else {
        Logger::warning("Ignoring input of unknown kind: " + kind);
    }
}

void NodeCLI::dropFinishedInvites() {
    auto finished = std::remove_if(pending_.begin(), pending_.end(), [](std::future<void>& task) {
        if (task.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return false;
        }
        try {
            task.get();
        } catch (const std::exception& e) {
            Logger::error("Invite task failed: " + std::string(e.what()));
        }
        return true;
    });
    pending_.erase(finished, pending_.end());
}

void NodeCLI::handleServeCommand(const json& request) {
    std::string command = request.value("command", "");
    json id = request.value("id", json());

    if (command == "invite") {
        std::string callsign = request.value("callsign", "");
        int intervalDays = request.value("interval_days", kDefaultBackupIntervalDays);
        // sendInvite blocks until the answer arrives on stdin, so it cannot run on this thread
        dropFinishedInvites();
        pending_.push_back(std::async(std::launch::async, [this, id, callsign, intervalDays]() {
            auto provider = node_->relationships().sendInvite(callsign, intervalDays);
            json result{{"kind", "command_result"}, {"id", id}, {"command", "invite"}};
            result["success"] = provider.has_value();
            if (provider) {
                result["provider"] = *provider;
            }
            emit(result);
        }));
    } else if (command == "backup") {
        BackupStatus status = node_->backupExecutor().startBackup(request.value("callsign", ""));
        emit(json{{"kind", "command_result"}, {"id", id}, {"command", command}, {"status", status}});
    } else if (command == "restore") {
        RestoreStatus status = node_->restoreExecutor().startRestore(request.value("callsign", ""),
                                                                     request.value("snapshot_id", ""));
        emit(json{{"kind", "command_result"}, {"id", id}, {"command", command}, {"status", status}});
    } else if (command == "discover") {
        int timeout = request.value("timeout_seconds", config_.discoveryTimeoutSeconds);
        std::string discoveryId = node_->discovery().startDiscovery(timeout);
        emit(json{{"kind", "command_result"}, {"id", id}, {"command", command}, {"discovery_id", discoveryId}});
    } else if (command == "discovery_status") {
        auto status = node_->discovery().getDiscoveryStatus(request.value("discovery_id", ""));
        json result{{"kind", "command_result"}, {"id", id}, {"command", command}};
        result["discovery"] = status ? json(*status) : json();
        emit(result);
    } else if (command == "adopt") {
        DiscoveredProvider provider;
        provider.callsign = utils::toUpper(request.value("callsign", ""));
        provider.publicKey = request.value("npub", "");
        provider.maxStorageBytes = request.value("max_storage_bytes", static_cast<int64_t>(0));
        bool adopted = node_->discovery().adoptProvider(provider);
        emit(json{{"kind", "command_result"}, {"id", id}, {"command", command}, {"success", adopted}});
    } else if (command == "status") {
        json result{{"kind", "command_result"}, {"id", id}, {"command", command}};
        result["state"] = relationshipsJson(node_->relationshipStore());
        result["backup"] = node_->backupExecutor().getStatus();
        result["restore"] = node_->restoreExecutor().getStatus();
        emit(result);
    } else {
        emit(json{{"kind", "command_result"}, {"id", id}, {"command", command},
                  {"error", "unknown command"}});
    }
}
