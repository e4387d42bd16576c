#include "transport/station_transport.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <curl/curl.h>
#include <stdexcept>

static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t realsize = size * nmemb;
    userp->append(static_cast<char*>(contents), realsize);
    return realsize;
}

StationTransport::StationTransport(const std::string& stationUrl, const std::string& ownCallsign,
                                   long timeoutSeconds)
    : stationUrl_(stationUrl)
    , ownCallsign_(utils::toUpper(ownCallsign))
    , timeoutSeconds_(timeoutSeconds) {
    while (!stationUrl_.empty() && stationUrl_.back() == '/') {
        stationUrl_.pop_back();
    }
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        throw std::runtime_error("Failed to initialize CURL");
    }
    Logger::debug("Station transport using " + stationUrl_);
}

StationTransport::~StationTransport() {
    curl_global_cleanup();
}

std::string StationTransport::buildUrl(const std::string& targetCallsign, const std::string& path) const {
    return stationUrl_ + "/" + utils::toUpper(targetCallsign) + path;
}

bool StationTransport::sendMessage(const std::string& targetCallsign, const nlohmann::json& message) {
    nlohmann::json payload = message;
    payload["target"] = utils::toUpper(targetCallsign);
    payload["from"] = ownCallsign_;

    ApiResponse response = apiRequest(targetCallsign, "POST", "/api/backup/message", payload.dump());
    if (!response.success) {
        Logger::warning("Failed to deliver " + message.value("type", std::string("message")) +
                        " to " + targetCallsign + ": " + response.error);
    }
    return response.success;
}

ApiResponse StationTransport::apiRequest(const std::string& targetCallsign,
                                         const std::string& method,
                                         const std::string& path,
                                         const std::string& body) {
    ApiResponse response;
    std::string url = buildUrl(targetCallsign, path);

    // One handle per request; requests come from several worker threads
    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize CURL";
        Logger::error(response.error);
        return response;
    }

    std::string fromHeader = "X-Callsign: " + ownCallsign_;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");
    headers = curl_slist_append(headers, fromHeader.c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    Logger::debug(method + " " + url);
    CURLcode res = curl_easy_perform(curl);
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    response.statusCode = static_cast<int>(httpCode);
    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
        Logger::error("Request to " + url + " failed: " + response.error);
        return response;
    }

    // Server errors count as transport failures; 4xx is a valid answer
    if (httpCode >= 500) {
        response.error = "HTTP " + std::to_string(httpCode);
        Logger::error("Request to " + url + " failed with HTTP code: " + std::to_string(httpCode));
        return response;
    }

    response.success = httpCode >= 200 && httpCode < 300;
    if (!response.success) {
        response.error = "HTTP " + std::to_string(httpCode);
    }
    return response;
}
