#pragma once

#include "transport/peer_transport.hpp"
#include <string>

// PeerTransport over a relay station's HTTP proxy. Requests for peer X go to
// {stationUrl}/{X}{path}; control messages are POSTed to
// {stationUrl}/{X}/api/backup/message.
class StationTransport : public PeerTransport {
public:
    StationTransport(const std::string& stationUrl, const std::string& ownCallsign,
                     long timeoutSeconds = 30);
    ~StationTransport() override;

    StationTransport(const StationTransport&) = delete;
    StationTransport& operator=(const StationTransport&) = delete;

    bool sendMessage(const std::string& targetCallsign, const nlohmann::json& message) override;

    ApiResponse apiRequest(const std::string& targetCallsign,
                           const std::string& method,
                           const std::string& path,
                           const std::string& body = "") override;

private:
    std::string buildUrl(const std::string& targetCallsign, const std::string& path) const;

    std::string stationUrl_;
    std::string ownCallsign_;
    long timeoutSeconds_;
};
