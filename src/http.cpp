#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace eventseq {

namespace {

const std::atomic<bool>* g_abort_flag = nullptr;

int transfer_progress(void* /*clientp*/, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    return g_abort_flag && g_abort_flag->load(std::memory_order_relaxed) ? 1 : 0;
}

size_t collect_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

// One easy handle per transfer; owns its header list.
class CurlRequest {
public:
    CurlRequest() : curl_(curl_easy_init()) {}
    ~CurlRequest() {
        curl_slist_free_all(headers_);
        if (curl_) curl_easy_cleanup(curl_);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    CURL* handle() const { return curl_; }
    explicit operator bool() const { return curl_ != nullptr; }

    void prepare(const std::string& url, const std::vector<Header>& headers,
                 long timeout_seconds) {
        for (const auto& [name, value] : headers) {
            headers_ = curl_slist_append(headers_, (name + ": " + value).c_str());
        }
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds);
        // Signals cannot be used for timeouts on pairwise worker threads.
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
        if (g_abort_flag) {
            curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, transfer_progress);
        }
    }

    HttpResponse perform() {
        HttpResponse response;
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, collect_body);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
        CURLcode rc = curl_easy_perform(curl_);
        if (rc != CURLE_OK) {
            response.status_code = 0;
            response.body = curl_easy_strerror(rc);
            return response;
        }
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status_code);
        return response;
    }

private:
    CURL* curl_;
    curl_slist* headers_ = nullptr;
};

} // namespace

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_abort_flag = flag;
}

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    CurlRequest req;
    if (!req) return {0, "curl_easy_init failed"};
    req.prepare(url, headers, timeout_seconds);
    curl_easy_setopt(req.handle(), CURLOPT_POST, 1L);
    curl_easy_setopt(req.handle(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(req.handle(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    return req.perform();
}

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds) {
    CurlRequest req;
    if (!req) return {0, "curl_easy_init failed"};
    req.prepare(url, headers, timeout_seconds);
    curl_easy_setopt(req.handle(), CURLOPT_HTTPGET, 1L);
    return req.perform();
}

std::string url_encode(const std::string& value) {
    CurlRequest req;
    if (!req) return {};
    char* escaped = curl_easy_escape(req.handle(), value.c_str(),
                                     static_cast<int>(value.size()));
    if (!escaped) return {};
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

} // namespace eventseq
