#pragma once
#include "http_client.h"
#include <schema/comparison_outcome.h>
#include <string>
#include <map>
#include <chrono>

// Probing of a single endpoint under one header configuration.
// A probe never throws and never aborts a run: transport failures come back
// as an inconclusive ProbeOutcome carrying the error text.

class Prober {
public:
    virtual ~Prober() = default;

    /**
     * @brief Issue one request and report status and body size
     * @param url Absolute endpoint URL
     * @param method HTTP method, sent without a body
     * @param headers Request headers of one authentication context
     * @return Completed outcome, or inconclusive on any failure
     */
    virtual ProbeOutcome probe(const std::string& url,
                               const std::string& method,
                               const std::map<std::string, std::string>& headers) const = 0;
};

// Prober backed by the shared libcurl client.
class HttpProber : public Prober {
public:
    explicit HttpProber(const HttpClient& client);

    ProbeOutcome probe(const std::string& url,
                       const std::string& method,
                       const std::map<std::string, std::string>& headers) const override;

private:
    const HttpClient& client_;
};

// Retries inconclusive probes of another prober with exponential backoff.
class RetryingProber : public Prober {
public:
    struct Options {
        int retries;                        // Extra attempts after the first
        std::chrono::milliseconds backoff;  // Delay before the first retry, doubled after each

        Options()
            : retries(1),
              backoff(250)
        {}
    };

    RetryingProber(const Prober& inner, const Options& opts = Options());

    ProbeOutcome probe(const std::string& url,
                       const std::string& method,
                       const std::map<std::string, std::string>& headers) const override;

private:
    const Prober& inner_;
    Options opts_;
};
