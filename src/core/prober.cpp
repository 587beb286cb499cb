// Endpoint probing on top of HttpClient

#include "prober.h"
#include <thread>

HttpProber::HttpProber(const HttpClient& client)
    : client_(client)
{}

ProbeOutcome HttpProber::probe(const std::string& url,
                               const std::string& method,
                               const std::map<std::string, std::string>& headers) const {
    HttpRequest req;
    req.method = method;
    req.url = url;
    req.headers = headers;

    HttpResponse resp;
    if (!client_.perform(req, resp)) {
        return ProbeOutcome::inconclusive(resp.error.empty() ? "request failed" : resp.error);
    }
    return ProbeOutcome::completed(resp.status, resp.body_bytes);
}

RetryingProber::RetryingProber(const Prober& inner, const Options& opts)
    : inner_(inner), opts_(opts)
{}

ProbeOutcome RetryingProber::probe(const std::string& url,
                                   const std::string& method,
                                   const std::map<std::string, std::string>& headers) const {
    ProbeOutcome outcome = inner_.probe(url, method, headers);

    auto delay = opts_.backoff;
    for (int attempt = 0; attempt < opts_.retries && !outcome.ok; ++attempt) {
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        delay *= 2;
        outcome = inner_.probe(url, method, headers);
    }
    return outcome;
}
