#include "http_client.h"
#include "logger.h"
#include <curl/curl.h>

namespace holo_oracle {
namespace http {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

} // namespace

void global_init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void global_cleanup() {
    curl_global_cleanup();
}

Result<Response> post_json(const std::string& url,
                           const std::string& body,
                           const std::string& bearer_token,
                           int timeout_ms,
                           int connect_timeout_ms) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return Result<Response>::failure("Failed to initialize CURL");
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    if (!bearer_token.empty()) {
        std::string auth = "Authorization: Bearer " + bearer_token;
        headers = curl_slist_append(headers, auth.c_str());
    }

    Response response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return Result<Response>::failure(curl_easy_strerror(res));
    }
    if (response.status >= 400) {
        return Result<Response>::failure("HTTP " + std::to_string(response.status) + ": " +
                                         response.body.substr(0, 200));
    }
    return Result<Response>::success(std::move(response));
}

} // namespace http
} // namespace holo_oracle
