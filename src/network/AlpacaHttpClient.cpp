#include "network/AlpacaHttpClient.h"
#include "common/Logger.h"
#include <sstream>
#include <stdexcept>

namespace tradeagent {
namespace network {

AlpacaHttpClient::AlpacaHttpClient(
    const std::string& base_url,
    const std::string& api_key,
    const std::string& secret_key,
    long timeout_seconds
)
    : base_url_(base_url)
    , api_key_(api_key)
    , secret_key_(secret_key)
    , timeout_seconds_(timeout_seconds)
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }

    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    if (!curl_) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }
}

AlpacaHttpClient::~AlpacaHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

std::map<std::string, std::string> AlpacaHttpClient::authHeaders() const {
    std::map<std::string, std::string> headers;
    headers["APCA-API-KEY-ID"] = api_key_;
    headers["APCA-API-SECRET-KEY"] = secret_key_;
    headers["Accept"] = "application/json";
    return headers;
}

HttpResponse AlpacaHttpClient::get(
    const std::string& endpoint,
    const std::map<std::string, std::string>& query_params
) {
    std::string url = base_url_ + endpoint;
    if (!query_params.empty()) {
        url += "?" + buildQueryString(query_params);
    }
    return performRequest("GET", url, "", authHeaders());
}

HttpResponse AlpacaHttpClient::post(
    const std::string& endpoint,
    const nlohmann::json& body
) {
    auto headers = authHeaders();
    headers["Content-Type"] = "application/json";
    return performRequest("POST", base_url_ + endpoint, body.dump(), headers);
}

HttpResponse AlpacaHttpClient::del(
    const std::string& endpoint,
    const std::map<std::string, std::string>& query_params
) {
    std::string url = base_url_ + endpoint;
    if (!query_params.empty()) {
        url += "?" + buildQueryString(query_params);
    }
    return performRequest("DELETE", url, "", authHeaders());
}

HttpResponse AlpacaHttpClient::performRequest(
    const std::string& method,
    const std::string& url,
    const std::string& body_data,
    const std::map<std::string, std::string>& headers
) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);

    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body_data.c_str());
    } else if (method == "DELETE") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "DELETE");
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header_line = key + ": " + value;
        header_list = curl_slist_append(header_list, header_line.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);

    if (res != CURLE_OK) {
        curl_slist_free_all(header_list);
        throw std::runtime_error("CURL error (" + method + " " + url + "): " +
                                 std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(header_list);

    response.status_code = static_cast<int>(http_code);
    response.body = response_body;
    response.headers = response_headers;

    if (response.isRateLimited()) {
        LOG_WARN("Alpaca rate limit hit: {} {}", method, url);
    }

    return response;
}

size_t AlpacaHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t AlpacaHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = value;
    }

    return total_size;
}

std::string AlpacaHttpClient::buildQueryString(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        char* escaped = curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.size()));
        oss << key << "=" << (escaped ? escaped : value.c_str());
        if (escaped) curl_free(escaped);
        first = false;
    }
    return oss.str();
}

} // namespace network
} // namespace tradeagent
