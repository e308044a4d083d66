#pragma once

#include <atomic>
#include <map>
#include <string>

namespace arbgate {

struct HttpResponse {
    long status_code = 0;
    std::string body;
    long response_time_ms = 0;
    std::string error_message;    // transport failure, empty otherwise

    bool IsSuccess() const { return error_message.empty() && status_code >= 200 && status_code < 300; }
    bool IsClientError() const { return status_code >= 400 && status_code < 500; }
    bool IsServerError() const { return status_code >= 500; }
};

struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    long timeout_ms = 5000;
    bool follow_redirects = true;
};

// Blocking libcurl GET client. Each request uses its own easy handle, so one
// client may be shared across threads.
class RestClient {
public:
    RestClient();

    // curl_global_init; call once before any thread issues a request.
    static void GlobalInit();
    static void GlobalCleanup();

    void SetUserAgent(const std::string& user_agent);
    void SetConnectTimeout(long timeout_ms);
    void SetSslVerification(bool verify);

    HttpResponse Get(const std::string& url, long timeout_ms);
    HttpResponse Request(const HttpRequest& request);

    const std::string& GetUserAgent() const { return user_agent_; }
    long GetConnectTimeout() const { return connect_timeout_ms_; }
    bool GetSslVerification() const { return verify_ssl_; }

    long long GetTotalRequests() const { return total_requests_; }
    long long GetFailedRequests() const { return failed_requests_; }
    double GetErrorRate() const;

private:
    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp);

    std::string user_agent_;
    long connect_timeout_ms_;
    bool verify_ssl_;

    std::atomic<long long> total_requests_{0};
    std::atomic<long long> failed_requests_{0};
};

} // namespace arbgate
