#pragma once

#include "network/IHttpClient.h"
#include <curl/curl.h>
#include <mutex>

namespace tradeagent {
namespace network {

// libcurl client for one Alpaca REST host (trading or market data).
// Authenticates with the APCA-API-KEY-ID / APCA-API-SECRET-KEY headers.
class AlpacaHttpClient : public IHttpClient {
public:
    AlpacaHttpClient(
        const std::string& base_url,
        const std::string& api_key,
        const std::string& secret_key,
        long timeout_seconds = 30
    );
    ~AlpacaHttpClient();

    AlpacaHttpClient(const AlpacaHttpClient&) = delete;
    AlpacaHttpClient& operator=(const AlpacaHttpClient&) = delete;

    HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) override;

    HttpResponse post(
        const std::string& endpoint,
        const nlohmann::json& body
    ) override;

    HttpResponse del(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) override;

    const std::string& getBaseUrl() const { return base_url_; }

private:
    std::string base_url_;
    std::string api_key_;
    std::string secret_key_;
    long timeout_seconds_;
    CURL* curl_;
    std::mutex mutex_;

    std::map<std::string, std::string> authHeaders() const;

    HttpResponse performRequest(
        const std::string& method,
        const std::string& url,
        const std::string& body_data,
        const std::map<std::string, std::string>& headers
    );

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

    std::string buildQueryString(const std::map<std::string, std::string>& params);
};

} // namespace network
} // namespace tradeagent
