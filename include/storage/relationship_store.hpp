#pragma once

#include "storage/backup_models.hpp"
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Persists provider settings and both sides of every backup relationship.
//
// Layout under dataDir:
//   backups/settings.json
//   backups/{CLIENT}/config.json
//   backup-config/providers/{PROVIDER}/config.json
//
// Every change is written to disk before the in-memory index is updated.
// Callsigns are normalized to upper case on the way in.
class RelationshipStore {
public:
    explicit RelationshipStore(const std::string& dataDir);

    // Reads all records from disk, replacing the in-memory index
    bool load();

    ProviderSettings getSettings() const;
    bool saveSettings(const ProviderSettings& settings);

    std::optional<ClientRelationship> getClient(const std::string& callsign) const;
    std::vector<ClientRelationship> getClients() const;
    // Inserts or replaces; refuses a status change that is not an allowed transition
    bool saveClient(const ClientRelationship& client);
    // Atomic read-modify-write; false for unknown callsigns or refused transitions
    bool updateClient(const std::string& callsign,
                      const std::function<void(ClientRelationship&)>& mutate);
    // eraseData removes the record and every stored snapshot
    bool removeClient(const std::string& callsign, bool eraseData);

    std::optional<ProviderRelationship> getProvider(const std::string& callsign) const;
    std::vector<ProviderRelationship> getProviders() const;
    bool saveProvider(const ProviderRelationship& provider);
    bool updateProvider(const std::string& callsign,
                        const std::function<void(ProviderRelationship&)>& mutate);

    // Advisory check; nothing on the upload path enforces it
    bool hasQuotaAvailable(const std::string& clientCallsign, int64_t additionalBytes) const;

    std::filesystem::path dataDir() const { return dataDir_; }
    std::filesystem::path clientDirectory(const std::string& callsign) const;
    std::filesystem::path providerDirectory(const std::string& callsign) const;

private:
    bool writeClientLocked(const ClientRelationship& client);
    bool writeProviderLocked(const ProviderRelationship& provider);

    std::filesystem::path dataDir_;
    mutable std::mutex mutex_;
    ProviderSettings settings_;
    std::map<std::string, ClientRelationship> clients_;
    std::map<std::string, ProviderRelationship> providers_;
};

// Writes |j| to a temporary sibling and renames it into place
bool writeJsonFile(const std::filesystem::path& path, const nlohmann::json& j);
std::optional<nlohmann::json> readJsonFile(const std::filesystem::path& path);
