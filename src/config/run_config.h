#pragma once
#include "core/http_client.h"
#include "core/prober.h"
#include "core/scheduler.h"
#include <string>

namespace config {

// Tunables of a run: transport, retry and concurrency settings.
// Loaded from an optional JSON or flat YAML file; CLI flags applied after
// loading override file values.

struct RunConfig {
    HttpClient::Options http;
    RetryingProber::Options retry;
    FanoutScheduler::Options scheduler;
    bool color;
    std::string rejected;   // First file value that was out of range, reported by validate()

    RunConfig() : color(true) {}

    /**
     * @brief Load configuration from a JSON or YAML file
     *
     * Unknown keys are ignored. A missing or unreadable file yields the
     * defaults and `ok == false`.
     *
     * @param path Path to the configuration file
     * @param ok Set to whether the file was read
     * @return Loaded configuration
     */
    static RunConfig load(const std::string& path, bool& ok);

    /// Parse configuration text (JSON object or `key: value` lines).
    static RunConfig parse(const std::string& content);

    /**
     * @brief Sanity-check values that would make a run meaningless
     * @return Empty string if valid, otherwise a description of the problem
     */
    std::string validate() const;
};

} // namespace config
