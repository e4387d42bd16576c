#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct ApiResponse {
    bool success{false};
    int statusCode{0};
    std::string body;
    std::string error;
};

// Delivery of control messages and request/response calls to a named peer.
// Outbound messages carry "type" and "target"; the receiving side sees the
// sender's callsign under "from".
class PeerTransport {
public:
    virtual ~PeerTransport() = default;

    virtual bool sendMessage(const std::string& targetCallsign, const nlohmann::json& message) = 0;

    virtual ApiResponse apiRequest(const std::string& targetCallsign,
                                   const std::string& method,
                                   const std::string& path,
                                   const std::string& body = "") = 0;
};

struct PeerInfo {
    std::string callsign;
    bool online{false};
};

void to_json(nlohmann::json& j, const PeerInfo& peer);
void from_json(const nlohmann::json& j, PeerInfo& peer);

class PeerDirectory {
public:
    virtual ~PeerDirectory() = default;

    virtual std::vector<PeerInfo> knownPeers() const = 0;
    virtual bool isKnown(const std::string& callsign) const;
};
