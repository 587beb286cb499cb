#pragma once
#include <string>
#include <map>
#include <mutex>
#include <condition_variable>
#include <memory>

// HTTP client wrapper around libcurl.
// All requests issued through one client share a connection cache, a DNS
// cache and TLS sessions, so paired probes against the same target reuse
// established connections. Concurrent connections per host are capped.

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
};

struct HttpResponse {
    long status = 0;
    std::string error;
    size_t body_bytes = 0;
};

// Blocks callers while a host already has `limit` requests in flight.
class HostGate {
public:
    explicit HostGate(size_t limit) : limit_(limit) {}

    void acquire(const std::string& host);
    void release(const std::string& host);
    size_t in_flight(const std::string& host) const;

    class Lease {
    public:
        Lease(HostGate& gate, std::string host) : gate_(gate), host_(std::move(host)) {
            gate_.acquire(host_);
        }
        ~Lease() { gate_.release(host_); }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

    private:
        HostGate& gate_;
        std::string host_;
    };

private:
    size_t limit_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, size_t> active_;
};

class HttpClient {
public:
    struct Options {
        long timeout_seconds;
        long connect_timeout_seconds;
        bool follow_redirects;
        long max_redirects;
        std::string user_agent;
        bool accept_encoding;
        long max_connections;        // Size of the shared connection cache
        size_t max_host_connections; // Concurrent requests per host, 0 = no cap
        long idle_timeout_seconds;   // Max idle age of a cached connection

        Options()
            : timeout_seconds(10),
              connect_timeout_seconds(10),
              follow_redirects(true),
              max_redirects(10),
              user_agent("authcheck/1.0"),
              accept_encoding(false),
              max_connections(100),
              max_host_connections(10),
              idle_timeout_seconds(90)
        {}
    };

    /**
     * @brief Create an HTTP client with the given options
     * @param opts Client configuration (timeouts, redirects, pooling)
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    explicit HttpClient(const Options& opts = Options());

    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Make an HTTP request and fill in the response
     *
     * The response body is drained and counted, not stored.
     *
     * @param req Request details; method is GET or POST, sent without a body
     * @param resp Response object that gets populated
     * @return true if a complete response was received, false on error
     */
    bool perform(const HttpRequest& req, HttpResponse& resp) const;

    /**
     * @brief Extract the connection key (scheme://host:port) of a URL
     * @param url Absolute URL
     * @return Connection key, or empty string if the URL cannot be parsed
     */
    static std::string host_key(const std::string& url);

private:
    struct Share;

    Options opts_;
    std::unique_ptr<Share> share_;
    mutable HostGate gate_;
};
