#include "api/http_client.hpp"
#include <curl/curl.h>
#include <mutex>
#include <sstream>
#include <thread>

namespace hashcalc {
namespace marketdata {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header(buffer, total_size);

    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);

    // "Name: Value\r\n"
    size_t colon_pos = header.find(':');
    if (colon_pos != std::string::npos) {
        std::string name = header.substr(0, colon_pos);
        std::string value = header.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        headers->insert({name, value});
    }

    return total_size;
}

std::once_flag curl_global_once;

} // anonymous namespace

struct HttpClient::Impl {
    CURL* curl;
    std::mutex mutex;

    Impl() {
        // curl_global_init is not thread safe; run it once for the process
        std::call_once(curl_global_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
        curl = curl_easy_init();
        if (!curl) {
            throw HttpClientError("Failed to initialize CURL");
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

HttpClient::HttpClient(const std::string& base_url, long timeout_ms)
    : impl_(std::make_unique<Impl>())
    , base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , retry_delays_{std::chrono::milliseconds(1000), std::chrono::milliseconds(2000),
                    std::chrono::milliseconds(4000)}
{
    if (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

HttpClient::~HttpClient() = default;

bool HttpClient::should_retry(int status_code) {
    // Retry on: timeout (408), rate limit (429), server errors (500-599)
    if (status_code == 408 || status_code == 429) {
        return true;
    }
    return status_code >= 500 && status_code < 600;
}

void HttpClient::set_retry_delays(std::chrono::milliseconds first,
                                  std::chrono::milliseconds second,
                                  std::chrono::milliseconds third) {
    retry_delays_[0] = first;
    retry_delays_[1] = second;
    retry_delays_[2] = third;
}

std::string HttpClient::build_url(const std::string& path, const QueryParams& params) const {
    std::string url = base_url_ + path;
    char sep = url.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : params) {
        char* escaped = curl_easy_escape(impl_->curl, value.c_str(),
                                         static_cast<int>(value.size()));
        url += sep;
        url += key + "=" + (escaped ? escaped : value);
        if (escaped) {
            curl_free(escaped);
        }
        sep = '&';
    }
    return url;
}

HttpResponse HttpClient::get(const std::string& path,
                             const QueryParams& params,
                             const std::map<std::string, std::string>& headers) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    const std::string url = build_url(path, params);

    for (int attempt = 0; ; ++attempt) {
        auto start = std::chrono::steady_clock::now();

        curl_easy_reset(impl_->curl);
        curl_easy_setopt(impl_->curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
        curl_easy_setopt(impl_->curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(impl_->curl, CURLOPT_USERAGENT, "hashcalc/1.0");

        struct curl_slist* curl_headers = nullptr;
        curl_headers = curl_slist_append(curl_headers, "Accept: application/json");
        for (const auto& [key, value] : headers) {
            std::string header_line = key + ": " + value;
            curl_headers = curl_slist_append(curl_headers, header_line.c_str());
        }
        curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, curl_headers);

        std::string response_body;
        std::map<std::string, std::string> response_headers;
        curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(impl_->curl, CURLOPT_WRITEDATA, &response_body);
        curl_easy_setopt(impl_->curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(impl_->curl, CURLOPT_HEADERDATA, &response_headers);

        CURLcode res = curl_easy_perform(impl_->curl);
        curl_slist_free_all(curl_headers);

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        int status_code = 0;
        std::string error_msg;
        if (res != CURLE_OK) {
            // Transport failures (DNS, connect, timeout) count as a timeout
            status_code = res == CURLE_OPERATION_TIMEDOUT ? 408 : 0;
            error_msg = std::string("CURL error: ") + curl_easy_strerror(res);
        } else {
            long code = 0;
            curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &code);
            status_code = static_cast<int>(code);

            if (status_code < 400) {
                HttpResponse response;
                response.status_code = status_code;
                response.body = std::move(response_body);
                response.headers = std::move(response_headers);
                response.duration = duration;
                return response;
            }

            std::ostringstream oss;
            if (status_code == 404) {
                oss << "Resource not found: " << url;
            } else if (status_code == 429) {
                oss << "Rate limited by " << base_url_;
            } else if (status_code >= 500) {
                oss << "Server error " << status_code << " from " << base_url_;
            } else {
                oss << "HTTP " << status_code << ": " << response_body.substr(0, 200);
            }
            error_msg = oss.str();
        }

        if (!should_retry(status_code) || attempt >= MAX_RETRIES) {
            throw HttpClientError(error_msg, status_code);
        }
        std::this_thread::sleep_for(retry_delays_[attempt]);
    }
}

} // namespace marketdata
} // namespace hashcalc
