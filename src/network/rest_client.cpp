#include "rest_client.hpp"
#include <algorithm>
#include <chrono>
#include <memory>
#include <curl/curl.h>
#include "../utils/logger.hpp"

namespace arbgate {

RestClient::RestClient()
    : user_agent_("ArbGate/1.0")
    , connect_timeout_ms_(2000)
    , verify_ssl_(true) {
}

void RestClient::GlobalInit() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void RestClient::GlobalCleanup() {
    curl_global_cleanup();
}

void RestClient::SetUserAgent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

void RestClient::SetConnectTimeout(long timeout_ms) {
    connect_timeout_ms_ = timeout_ms;
}

void RestClient::SetSslVerification(bool verify) {
    verify_ssl_ = verify;
}

HttpResponse RestClient::Get(const std::string& url, long timeout_ms) {
    HttpRequest request;
    request.url = url;
    request.timeout_ms = timeout_ms;
    return Request(request);
}

HttpResponse RestClient::Request(const HttpRequest& request) {
    const auto start_time = std::chrono::steady_clock::now();
    total_requests_++;

    HttpResponse response;

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        failed_requests_++;
        response.error_message = "Failed to initialize CURL handle";
        ARBGATE_LOG_ERROR("Failed to initialize CURL handle");
        return response;
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, RestClient::WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, request.timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, std::min(connect_timeout_ms_, request.timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, verify_ssl_ ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, verify_ssl_ ? 2L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list(nullptr, &curl_slist_free_all);
    for (const auto& header : request.headers) {
        const std::string line = header.first + ": " + header.second;
        header_list.reset(curl_slist_append(header_list.release(), line.c_str()));
    }
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    const CURLcode result = curl_easy_perform(curl.get());

    long response_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);
    response.status_code = response_code;

    if (result != CURLE_OK) {
        failed_requests_++;
        response.error_message = curl_easy_strerror(result);
        ARBGATE_LOG_DEBUG("GET {} failed: {}", request.url, response.error_message);
    } else if (response_code >= 400) {
        failed_requests_++;
        ARBGATE_LOG_DEBUG("GET {} -> HTTP {}", request.url, response_code);
    }

    response.response_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    return response;
}

double RestClient::GetErrorRate() const {
    const long long total = total_requests_;
    if (total == 0) return 0.0;
    return static_cast<double>(failed_requests_) / total * 100.0;
}

size_t RestClient::WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    const size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

} // namespace arbgate
