/**
 * @file test_run_config.cpp
 * @brief Unit tests for run configuration loading
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "config/run_config.h"
#include <filesystem>
#include <fstream>

using namespace config;
namespace fs = std::filesystem;

TEST_CASE("Defaults", "[config]") {
    RunConfig c;
    REQUIRE(c.scheduler.concurrency == 20);
    REQUIRE(c.retry.retries == 1);
    REQUIRE(c.retry.backoff.count() == 250);
    REQUIRE(c.http.timeout_seconds == 10);
    REQUIRE(c.color);
    REQUIRE(c.validate().empty());
}

TEST_CASE("JSON configuration", "[config]") {
    auto c = RunConfig::parse(R"({
        "timeout_seconds": 5,
        "concurrency": 8,
        "retries": 0,
        "retry_backoff_ms": 100,
        "max_host_connections": 4,
        "user_agent": "scanner/2",
        "follow_redirects": false,
        "color": false,
        "unknown_key": [1, 2]
    })");

    REQUIRE(c.http.timeout_seconds == 5);
    REQUIRE(c.scheduler.concurrency == 8);
    REQUIRE(c.retry.retries == 0);
    REQUIRE(c.retry.backoff.count() == 100);
    REQUIRE(c.http.max_host_connections == 4);
    REQUIRE(c.http.user_agent == "scanner/2");
    REQUIRE_FALSE(c.http.follow_redirects);
    REQUIRE_FALSE(c.color);
    REQUIRE(c.http.connect_timeout_seconds == 10);
}

TEST_CASE("YAML configuration", "[config]") {
    auto c = RunConfig::parse(
        "# run settings\n"
        "timeout_seconds: 3\n"
        "concurrency: 50   # many hosts\n"
        "user_agent: \"probe/1\"\n"
        "color: off\n"
        "retries: 2\n");

    REQUIRE(c.http.timeout_seconds == 3);
    REQUIRE(c.scheduler.concurrency == 50);
    REQUIRE(c.http.user_agent == "probe/1");
    REQUIRE_FALSE(c.color);
    REQUIRE(c.retry.retries == 2);
}

TEST_CASE("Unparseable values keep defaults", "[config]") {
    auto c = RunConfig::parse("timeout_seconds: soon\ncolor: maybe\n");
    REQUIRE(c.http.timeout_seconds == 10);
    REQUIRE(c.color);

    auto j = RunConfig::parse(R"({"timeout_seconds": "soon"})");
    REQUIRE(j.http.timeout_seconds == 10);
}

TEST_CASE("Validation", "[config]") {
    RunConfig c;
    c.http.timeout_seconds = 0;
    REQUIRE(c.validate() == "timeout_seconds must be positive");

    RunConfig r;
    r.retry.retries = -1;
    REQUIRE(r.validate() == "retries must not be negative");

    RunConfig u;
    u.scheduler.concurrency = 0;
    REQUIRE(u.validate().empty());
}

TEST_CASE("Negative counts are rejected", "[config]") {
    auto yaml = RunConfig::parse("concurrency: -5\n");
    REQUIRE(yaml.scheduler.concurrency == 20);
    REQUIRE(yaml.validate() == "concurrency must not be negative");

    auto json = RunConfig::parse(R"({"max_host_connections": -1})");
    REQUIRE(json.http.max_host_connections == 10);
    REQUIRE(json.validate() == "max_host_connections must not be negative");
}

TEST_CASE("Loading from a file", "[config]") {
    std::string path = "test_authcheck.yaml";
    {
        std::ofstream out(path);
        out << "concurrency: 2\n";
    }

    bool ok = false;
    auto c = RunConfig::load(path, ok);
    REQUIRE(ok);
    REQUIRE(c.scheduler.concurrency == 2);
    fs::remove(path);

    auto missing = RunConfig::load("no_such_config.yaml", ok);
    REQUIRE_FALSE(ok);
    REQUIRE(missing.scheduler.concurrency == 20);
}
