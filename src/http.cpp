#include "http.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <string>

namespace vantage {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* /*clientp*/,
                             curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                             curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    return (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed)) ? 1 : 0;
}

static size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

// ── One POST transfer on its own easy handle ──────────────────

class CurlPost {
public:
    CurlPost() : curl_(curl_easy_init()) {}
    ~CurlPost() {
        curl_slist_free_all(headers_);
        if (curl_) curl_easy_cleanup(curl_);
    }
    CurlPost(const CurlPost&) = delete;
    CurlPost& operator=(const CurlPost&) = delete;

    HttpResponse perform(const std::string& url, const std::string& body,
                         const std::vector<Header>& headers, long timeout_seconds) {
        HttpResponse response;
        if (!curl_) {
            response.error = "curl_easy_init failed";
            return response;
        }

        for (const auto& h : headers) {
            headers_ = curl_slist_append(headers_, (h.first + ": " + h.second).c_str());
        }

        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, append_body);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);

        // The whole attempt, connect included, is bounded by timeout_seconds.
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds);
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, std::min(timeout_seconds, 10L));
        // Worker threads must not receive SIGALRM from the resolver.
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

        if (g_http_abort_flag) {
            curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
        }

        CURLcode res = curl_easy_perform(curl_);
        switch (res) {
            case CURLE_OK:
                curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status_code);
                break;
            case CURLE_OPERATION_TIMEDOUT:
                response.error = "timed out after " + std::to_string(timeout_seconds) + "s";
                break;
            case CURLE_ABORTED_BY_CALLBACK:
                response.error = "aborted";
                break;
            default:
                response.error = curl_easy_strerror(res);
                break;
        }
        return response;
    }

private:
    CURL* curl_;
    curl_slist* headers_ = nullptr;
};

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    CurlPost transfer;
    return transfer.perform(url, body, headers, timeout_seconds);
}

} // namespace vantage
