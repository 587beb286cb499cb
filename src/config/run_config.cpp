// Run configuration loading

#include "run_config.h"
#include <fstream>
#include <iterator>
#include <regex>
#include <nlohmann/json.hpp>

namespace config {

using json = nlohmann::json;

// Minimal YAML "key: value" reader for the flat keys we know.
static bool yaml_value(const std::string& yaml, const std::string& key, std::string& out) {
    std::regex rx("(^|\\n)\\s*" + key + "\\s*:\\s*\"?([^\"#\\r\\n]*?)\"?\\s*(#[^\\n]*)?(\\r?\\n|$)");
    std::smatch m;
    if (std::regex_search(yaml, m, rx)) {
        out = m[2].str();
        return true;
    }
    return false;
}

static bool parse_bool(const std::string& s, bool defv) {
    if (s == "true" || s == "yes" || s == "on" || s == "1") return true;
    if (s == "false" || s == "no" || s == "off" || s == "0") return false;
    return defv;
}

static long parse_long(const std::string& s, long defv) {
    try {
        size_t used = 0;
        long v = std::stol(s, &used);
        return used == s.size() ? v : defv;
    } catch (const std::exception&) {
        return defv;
    }
}

// Store a count read from the file; negative values are rejected instead of
// wrapping around to a huge size_t.
static void set_count(RunConfig& c, const char* key, long value, size_t& out) {
    if (value < 0) {
        if (c.rejected.empty()) c.rejected = std::string(key) + " must not be negative";
        return;
    }
    out = static_cast<size_t>(value);
}

static void apply_json(const json& j, RunConfig& c) {
    c.http.timeout_seconds = j.value("timeout_seconds", c.http.timeout_seconds);
    c.http.connect_timeout_seconds = j.value("connect_timeout_seconds", c.http.connect_timeout_seconds);
    c.http.follow_redirects = j.value("follow_redirects", c.http.follow_redirects);
    c.http.max_redirects = j.value("max_redirects", c.http.max_redirects);
    c.http.max_connections = j.value("max_connections", c.http.max_connections);
    if (j.contains("max_host_connections")) {
        set_count(c, "max_host_connections", j.at("max_host_connections").get<long>(),
                  c.http.max_host_connections);
    }
    c.http.idle_timeout_seconds = j.value("idle_timeout_seconds", c.http.idle_timeout_seconds);
    c.http.user_agent = j.value("user_agent", c.http.user_agent);
    c.retry.retries = j.value("retries", c.retry.retries);
    c.retry.backoff = std::chrono::milliseconds(
        j.value("retry_backoff_ms", static_cast<long>(c.retry.backoff.count())));
    if (j.contains("concurrency")) {
        set_count(c, "concurrency", j.at("concurrency").get<long>(), c.scheduler.concurrency);
    }
    c.color = j.value("color", c.color);
}

static void apply_yaml(const std::string& yaml, RunConfig& c) {
    std::string v;
    if (yaml_value(yaml, "timeout_seconds", v)) c.http.timeout_seconds = parse_long(v, c.http.timeout_seconds);
    if (yaml_value(yaml, "connect_timeout_seconds", v)) c.http.connect_timeout_seconds = parse_long(v, c.http.connect_timeout_seconds);
    if (yaml_value(yaml, "follow_redirects", v)) c.http.follow_redirects = parse_bool(v, c.http.follow_redirects);
    if (yaml_value(yaml, "max_redirects", v)) c.http.max_redirects = parse_long(v, c.http.max_redirects);
    if (yaml_value(yaml, "max_connections", v)) c.http.max_connections = parse_long(v, c.http.max_connections);
    if (yaml_value(yaml, "max_host_connections", v)) {
        set_count(c, "max_host_connections",
                  parse_long(v, static_cast<long>(c.http.max_host_connections)),
                  c.http.max_host_connections);
    }
    if (yaml_value(yaml, "idle_timeout_seconds", v)) c.http.idle_timeout_seconds = parse_long(v, c.http.idle_timeout_seconds);
    if (yaml_value(yaml, "user_agent", v) && !v.empty()) c.http.user_agent = v;
    if (yaml_value(yaml, "retries", v)) c.retry.retries = static_cast<int>(parse_long(v, c.retry.retries));
    if (yaml_value(yaml, "retry_backoff_ms", v)) {
        c.retry.backoff = std::chrono::milliseconds(parse_long(v, static_cast<long>(c.retry.backoff.count())));
    }
    if (yaml_value(yaml, "concurrency", v)) {
        set_count(c, "concurrency", parse_long(v, static_cast<long>(c.scheduler.concurrency)),
                  c.scheduler.concurrency);
    }
    if (yaml_value(yaml, "color", v)) c.color = parse_bool(v, c.color);
}

RunConfig RunConfig::parse(const std::string& content) {
    RunConfig c;

    json j = json::parse(content, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        try {
            apply_json(j, c);
            return c;
        } catch (const json::exception&) {
            // Wrong value types, fall through to the YAML reader
            c = RunConfig();
        }
    }

    apply_yaml(content, c);
    return c;
}

RunConfig RunConfig::load(const std::string& path, bool& ok) {
    std::ifstream in(path);
    if (!in.is_open()) {
        ok = false;
        return RunConfig();
    }

    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    ok = true;
    return parse(content);
}

std::string RunConfig::validate() const {
    if (!rejected.empty()) return rejected;
    if (http.timeout_seconds <= 0) return "timeout_seconds must be positive";
    if (http.connect_timeout_seconds <= 0) return "connect_timeout_seconds must be positive";
    if (http.max_redirects < 0) return "max_redirects must not be negative";
    if (http.max_connections <= 0) return "max_connections must be positive";
    if (http.idle_timeout_seconds <= 0) return "idle_timeout_seconds must be positive";
    if (retry.retries < 0) return "retries must not be negative";
    if (retry.backoff.count() < 0) return "retry_backoff_ms must not be negative";
    return "";
}

} // namespace config
