#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace hashcalc {
namespace marketdata {

/**
 * HTTP response structure
 */
struct HttpResponse {
    int status_code;
    std::string body;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds duration;
};

/**
 * HTTP client error
 */
class HttpClientError : public std::runtime_error {
public:
    HttpClientError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

/**
 * HTTP GET client with retry logic and timeout support
 *
 * Features:
 * - Exponential backoff retry (1s, 2s, 4s) on 408, 429 and 5xx
 * - Configurable timeout (default 60s)
 * - Query parameters URL-encoded through libcurl
 * - One CURL handle per client, guarded by a mutex
 */
class HttpClient {
public:
    using QueryParams = std::map<std::string, std::string>;

    /**
     * Constructor
     * @param base_url Base URL for all requests (e.g., "https://api.blockchain.info")
     * @param timeout_ms Timeout in milliseconds (default: 60000)
     */
    explicit HttpClient(const std::string& base_url, long timeout_ms = 60000);

    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * GET request with automatic retry
     * @param path Path relative to base_url (e.g., "/charts/hash-rate")
     * @param params Query parameters appended as ?k=v&...
     * @param headers Additional headers
     * @return HttpResponse
     * @throws HttpClientError on failure after retries
     */
    HttpResponse get(const std::string& path,
                     const QueryParams& params = {},
                     const std::map<std::string, std::string>& headers = {});

    /**
     * Builds the full request URL, escaping parameter values
     */
    std::string build_url(const std::string& path, const QueryParams& params) const;

    /**
     * Whether a status code is worth another attempt (408, 429, 5xx)
     */
    static bool should_retry(int status_code);

    /**
     * Override the retry delays (tests use zeros)
     */
    void set_retry_delays(std::chrono::milliseconds first,
                          std::chrono::milliseconds second,
                          std::chrono::milliseconds third);

    const std::string& base_url() const { return base_url_; }
    long timeout_ms() const { return timeout_ms_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    std::string base_url_;
    long timeout_ms_;

    static constexpr int MAX_RETRIES = 3;
    std::chrono::milliseconds retry_delays_[MAX_RETRIES];
};

} // namespace marketdata
} // namespace hashcalc
