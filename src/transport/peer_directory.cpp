#include "transport/configured_peer_directory.hpp"
#include "common/utils.hpp"
#include <algorithm>

void to_json(nlohmann::json& j, const PeerInfo& peer) {
    j = nlohmann::json{{"callsign", peer.callsign}, {"online", peer.online}};
}

void from_json(const nlohmann::json& j, PeerInfo& peer) {
    peer.callsign = utils::toUpper(j.at("callsign").get<std::string>());
    peer.online = j.value("online", true);
}

bool PeerDirectory::isKnown(const std::string& callsign) const {
    std::string normalized = utils::toUpper(callsign);
    for (const auto& peer : knownPeers()) {
        if (peer.callsign == normalized) {
            return true;
        }
    }
    return false;
}

ConfiguredPeerDirectory::ConfiguredPeerDirectory(const std::vector<PeerInfo>& peers) {
    for (const auto& peer : peers) {
        setPeer(peer.callsign, peer.online);
    }
}

std::vector<PeerInfo> ConfiguredPeerDirectory::knownPeers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_;
}

void ConfiguredPeerDirectory::setPeer(const std::string& callsign, bool online) {
    std::string normalized = utils::toUpper(callsign);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(peers_.begin(), peers_.end(),
                           [&](const PeerInfo& p) { return p.callsign == normalized; });
    if (it != peers_.end()) {
        it->online = online;
    } else {
        peers_.push_back(PeerInfo{normalized, online});
    }
}

void ConfiguredPeerDirectory::removePeer(const std::string& callsign) {
    std::string normalized = utils::toUpper(callsign);
    std::lock_guard<std::mutex> lock(mutex_);
    peers_.erase(std::remove_if(peers_.begin(), peers_.end(),
                                [&](const PeerInfo& p) { return p.callsign == normalized; }),
                 peers_.end());
}
