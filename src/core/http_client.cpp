/**
 * @file http_client.cpp
 * @brief Lightweight HTTP client using libcurl with a shared connection cache
 */

#include "http_client.h"
#include <curl/curl.h>
#include <stdexcept>
#include <array>

/// Callback invoked by libcurl for each body chunk. Only the size is kept.
static size_t count_callback(char* /*ptr*/, size_t size, size_t nmemb, void* userdata) {
    auto* n = static_cast<size_t*>(userdata);
    *n += size * nmemb;
    return size * nmemb;
}

/// Shared caches plus the mutexes libcurl asks us to hold around them.
struct HttpClient::Share {
    CURLSH* handle = nullptr;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks;

    static void lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<Share*>(userptr)->locks[data].lock();
    }

    static void unlock(CURL*, curl_lock_data data, void* userptr) {
        static_cast<Share*>(userptr)->locks[data].unlock();
    }

    Share() {
        handle = curl_share_init();
        if (!handle) {
            throw std::runtime_error("curl_share_init failed");
        }
        curl_share_setopt(handle, CURLSHOPT_LOCKFUNC, &Share::lock);
        curl_share_setopt(handle, CURLSHOPT_UNLOCKFUNC, &Share::unlock);
        curl_share_setopt(handle, CURLSHOPT_USERDATA, this);
        curl_share_setopt(handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        curl_share_setopt(handle, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    }

    ~Share() {
        curl_share_cleanup(handle);
    }
};

void HostGate::acquire(const std::string& host) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (limit_ > 0) {
        cv_.wait(lock, [&] { return active_[host] < limit_; });
    }
    active_[host]++;
}

void HostGate::release(const std::string& host) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(host);
        if (it != active_.end() && --it->second == 0) {
            active_.erase(it);
        }
    }
    cv_.notify_all();
}

size_t HostGate::in_flight(const std::string& host) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(host);
    return it == active_.end() ? 0 : it->second;
}

/// Initialize global libcurl state and the shared caches.
HttpClient::HttpClient(const Options& opts)
    : opts_(opts), gate_(opts.max_host_connections) {
    CURLcode c = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (c != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
    try {
        share_ = std::make_unique<Share>();
    } catch (...) {
        curl_global_cleanup();
        throw;
    }
}

/// Release the shared caches, then global libcurl state.
HttpClient::~HttpClient() {
    share_.reset();
    curl_global_cleanup();
}

std::string HttpClient::host_key(const std::string& url) {
    CURLU* u = curl_url();
    if (!u) return "";

    std::string key;
    if (curl_url_set(u, CURLUPART_URL, url.c_str(), 0) == CURLUE_OK) {
        char* scheme = nullptr;
        char* host = nullptr;
        char* port = nullptr;
        if (curl_url_get(u, CURLUPART_SCHEME, &scheme, 0) == CURLUE_OK &&
            curl_url_get(u, CURLUPART_HOST, &host, 0) == CURLUE_OK &&
            curl_url_get(u, CURLUPART_PORT, &port, CURLU_DEFAULT_PORT) == CURLUE_OK) {
            key = std::string(scheme) + "://" + host + ":" + port;
        }
        curl_free(scheme);
        curl_free(host);
        curl_free(port);
    }
    curl_url_cleanup(u);
    return key;
}

/// Execute an HTTP request and populate a response object.
bool HttpClient::perform(const HttpRequest& req, HttpResponse& resp) const {
    std::string host = host_key(req.url);
    if (host.empty()) {
        resp.error = "malformed URL: " + req.url;
        return false;
    }
    if (req.method != "GET" && req.method != "POST") {
        resp.error = "unsupported method: " + req.method;
        return false;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        resp.error = "curl_easy_init failed";
        return false;
    }

    size_t body_bytes = 0;

    // Basic configuration
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, opts_.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, opts_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, opts_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, opts_.max_redirects);

    // Body is drained into a byte counter
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, count_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body_bytes);

    // Connection reuse
    curl_easy_setopt(curl, CURLOPT_SHARE, share_->handle);
    curl_easy_setopt(curl, CURLOPT_MAXCONNECTS, opts_.max_connections);
    curl_easy_setopt(curl, CURLOPT_MAXAGE_CONN, opts_.idle_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

    // Misc options
    curl_easy_setopt(curl, CURLOPT_USERAGENT, opts_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_VERBOSE, 0L);
    if (opts_.accept_encoding) curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    // Request headers
    struct curl_slist* curl_headers = nullptr;
    for (const auto& h : req.headers) {
        std::string line = h.first + ": " + h.second;
        curl_headers = curl_slist_append(curl_headers, line.c_str());
    }
    if (curl_headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers);

    // Probes carry no body. A plain POST (not a custom verb) lets libcurl
    // switch to GET after a 301/302/303 redirect.
    if (req.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
    }

    // Error buffer setup
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

    // Perform request
    CURLcode rc;
    {
        HostGate::Lease lease(gate_, host);
        rc = curl_easy_perform(curl);
    }
    if (rc != CURLE_OK) {
        resp.error = errbuf[0] ? std::string(errbuf) : curl_easy_strerror(rc);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body_bytes = body_bytes;

    // Cleanup
    if (curl_headers) curl_slist_free_all(curl_headers);
    curl_easy_cleanup(curl);
    return rc == CURLE_OK;
}
