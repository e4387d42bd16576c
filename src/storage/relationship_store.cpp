#include "storage/relationship_store.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

bool writeJsonFile(const fs::path& path, const json& j) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        Logger::error("Failed to create directory " + path.parent_path().string() + ": " + ec.message());
        return false;
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            Logger::error("Failed to open file for writing: " + tmp.string());
            return false;
        }
        file << j.dump(4);
        if (!file) {
            Logger::error("Failed to write file: " + tmp.string());
            return false;
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        Logger::error("Failed to replace " + path.string() + ": " + ec.message());
        return false;
    }
    return true;
}

std::optional<json> readJsonFile(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    try {
        json j;
        file >> j;
        return j;
    } catch (const std::exception& e) {
        Logger::error("Failed to parse " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

RelationshipStore::RelationshipStore(const std::string& dataDir)
    : dataDir_(dataDir) {
}

fs::path RelationshipStore::clientDirectory(const std::string& callsign) const {
    return dataDir_ / "backups" / utils::toUpper(callsign);
}

fs::path RelationshipStore::providerDirectory(const std::string& callsign) const {
    return dataDir_ / "backup-config" / "providers" / utils::toUpper(callsign);
}

bool RelationshipStore::load() {
    ProviderSettings settings;
    settings.updatedAt = utils::nowSeconds();
    std::map<std::string, ClientRelationship> clients;
    std::map<std::string, ProviderRelationship> providers;

    try {
        if (auto j = readJsonFile(dataDir_ / "backups" / "settings.json")) {
            settings = j->get<ProviderSettings>();
        }

        fs::path backupsDir = dataDir_ / "backups";
        if (fs::is_directory(backupsDir)) {
            for (const auto& entry : fs::directory_iterator(backupsDir)) {
                if (!entry.is_directory()) {
                    continue;
                }
                auto j = readJsonFile(entry.path() / "config.json");
                if (!j) {
                    continue;
                }
                auto client = j->get<ClientRelationship>();
                clients[client.clientCallsign] = client;
            }
        }

        fs::path providersDir = dataDir_ / "backup-config" / "providers";
        if (fs::is_directory(providersDir)) {
            for (const auto& entry : fs::directory_iterator(providersDir)) {
                if (!entry.is_directory()) {
                    continue;
                }
                auto j = readJsonFile(entry.path() / "config.json");
                if (!j) {
                    continue;
                }
                auto provider = j->get<ProviderRelationship>();
                providers[provider.providerCallsign] = provider;
            }
        }
    } catch (const std::exception& e) {
        Logger::error("Failed to load backup relationships: " + std::string(e.what()));
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = settings;
    clients_ = std::move(clients);
    providers_ = std::move(providers);
    Logger::info("Loaded " + std::to_string(clients_.size()) + " backup clients and " +
                 std::to_string(providers_.size()) + " backup providers");
    return true;
}

ProviderSettings RelationshipStore::getSettings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

bool RelationshipStore::saveSettings(const ProviderSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    ProviderSettings updated = settings;
    updated.updatedAt = utils::nowSeconds();
    if (!writeJsonFile(dataDir_ / "backups" / "settings.json", updated)) {
        return false;
    }
    settings_ = updated;
    return true;
}

std::optional<ClientRelationship> RelationshipStore::getClient(const std::string& callsign) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(utils::toUpper(callsign));
    if (it == clients_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ClientRelationship> RelationshipStore::getClients() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ClientRelationship> result;
    for (const auto& entry : clients_) {
        result.push_back(entry.second);
    }
    return result;
}

bool RelationshipStore::writeClientLocked(const ClientRelationship& client) {
    if (!writeJsonFile(clientDirectory(client.clientCallsign) / "config.json", client)) {
        return false;
    }
    clients_[client.clientCallsign] = client;
    return true;
}

bool RelationshipStore::saveClient(const ClientRelationship& client) {
    ClientRelationship normalized = client;
    normalized.clientCallsign = utils::toUpper(client.clientCallsign);
    if (!isValidCallsign(normalized.clientCallsign)) {
        Logger::error("Refusing to store client with invalid callsign: " + client.clientCallsign);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(normalized.clientCallsign);
    if (it != clients_.end() && !isAllowedTransition(it->second.status, normalized.status)) {
        Logger::warning("Rejected client status change for " + normalized.clientCallsign + ": " +
                        toString(it->second.status) + " -> " + toString(normalized.status));
        return false;
    }
    return writeClientLocked(normalized);
}

bool RelationshipStore::updateClient(const std::string& callsign,
                                     const std::function<void(ClientRelationship&)>& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(utils::toUpper(callsign));
    if (it == clients_.end()) {
        return false;
    }

    ClientRelationship updated = it->second;
    mutate(updated);
    updated.clientCallsign = it->second.clientCallsign;
    if (!isAllowedTransition(it->second.status, updated.status)) {
        Logger::warning("Rejected client status change for " + updated.clientCallsign + ": " +
                        toString(it->second.status) + " -> " + toString(updated.status));
        return false;
    }
    return writeClientLocked(updated);
}

bool RelationshipStore::removeClient(const std::string& callsign, bool eraseData) {
    std::string normalized = utils::toUpper(callsign);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(normalized);
    if (it == clients_.end()) {
        return false;
    }

    if (eraseData) {
        std::error_code ec;
        fs::remove_all(clientDirectory(normalized), ec);
        if (ec) {
            Logger::error("Failed to delete backup data for " + normalized + ": " + ec.message());
            return false;
        }
        clients_.erase(it);
        Logger::info("Deleted backup client " + normalized + " and all stored data");
        return true;
    }

    ClientRelationship updated = it->second;
    updated.status = RelationshipStatus::Terminated;
    if (!isAllowedTransition(it->second.status, updated.status)) {
        Logger::warning("Cannot terminate client " + normalized + " in status " +
                        toString(it->second.status));
        return false;
    }
    return writeClientLocked(updated);
}

std::optional<ProviderRelationship> RelationshipStore::getProvider(const std::string& callsign) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(utils::toUpper(callsign));
    if (it == providers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ProviderRelationship> RelationshipStore::getProviders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProviderRelationship> result;
    for (const auto& entry : providers_) {
        result.push_back(entry.second);
    }
    return result;
}

bool RelationshipStore::writeProviderLocked(const ProviderRelationship& provider) {
    if (!writeJsonFile(providerDirectory(provider.providerCallsign) / "config.json", provider)) {
        return false;
    }
    providers_[provider.providerCallsign] = provider;
    return true;
}

bool RelationshipStore::saveProvider(const ProviderRelationship& provider) {
    ProviderRelationship normalized = provider;
    normalized.providerCallsign = utils::toUpper(provider.providerCallsign);
    if (!isValidCallsign(normalized.providerCallsign)) {
        Logger::error("Refusing to store provider with invalid callsign: " + provider.providerCallsign);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(normalized.providerCallsign);
    if (it != providers_.end() && !isAllowedTransition(it->second.status, normalized.status)) {
        Logger::warning("Rejected provider status change for " + normalized.providerCallsign + ": " +
                        toString(it->second.status) + " -> " + toString(normalized.status));
        return false;
    }
    return writeProviderLocked(normalized);
}

bool RelationshipStore::updateProvider(const std::string& callsign,
                                       const std::function<void(ProviderRelationship&)>& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(utils::toUpper(callsign));
    if (it == providers_.end()) {
        return false;
    }

    ProviderRelationship updated = it->second;
    mutate(updated);
    updated.providerCallsign = it->second.providerCallsign;
    if (!isAllowedTransition(it->second.status, updated.status)) {
        Logger::warning("Rejected provider status change for " + updated.providerCallsign + ": " +
                        toString(it->second.status) + " -> " + toString(updated.status));
        return false;
    }
    return writeProviderLocked(updated);
}

bool RelationshipStore::hasQuotaAvailable(const std::string& clientCallsign, int64_t additionalBytes) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(utils::toUpper(clientCallsign));
    if (it == clients_.end()) {
        return false;
    }
    return it->second.currentStorageBytes + additionalBytes <= it->second.maxStorageBytes;
}
