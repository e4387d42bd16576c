#pragma once

#include "transport/peer_transport.hpp"
#include <mutex>

// Peer list taken from the node configuration. Online state can be updated
// at runtime by the serve loop.
class ConfiguredPeerDirectory : public PeerDirectory {
public:
    ConfiguredPeerDirectory() = default;
    explicit ConfiguredPeerDirectory(const std::vector<PeerInfo>& peers);

    std::vector<PeerInfo> knownPeers() const override;

    void setPeer(const std::string& callsign, bool online);
    void removePeer(const std::string& callsign);

private:
    mutable std::mutex mutex_;
    std::vector<PeerInfo> peers_;
};
