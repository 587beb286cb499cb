/**
 * @file test_end_to_end.cpp
 * @brief Full runs against an in-process HTTP server
 *
 * Starts a cpp-httplib server on a free loopback port and drives the real
 * libcurl client, scheduler and reporter against it.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "httplib.h"
#include "core/auth_context.h"
#include "core/http_client.h"
#include "core/prober.h"
#include "core/scheduler.h"
#include "report/console.h"
#include "report/run_reporter.h"
#include <chrono>
#include <sstream>
#include <thread>

using namespace report;

namespace {

class TestServer {
public:
    TestServer() {
        server_.Get("/public", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("{\"items\":[1,2,3]}", "application/json");
        });
        server_.Post("/public", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("{\"items\":[1,2,3]}", "application/json");
        });
        server_.Get("/account", [](const httplib::Request& req, httplib::Response& res) {
            if (!req.has_header("Cookie")) {
                res.status = 403;
                res.set_content("forbidden", "text/plain");
                return;
            }
            res.set_content("{\"account\":\"demo\"}", "application/json");
        });
        server_.Post("/redirect", [](const httplib::Request&, httplib::Response& res) {
            res.set_redirect("/login", 302);
        });
        server_.Get("/redirect", [](const httplib::Request&, httplib::Response& res) {
            res.set_redirect("/login", 302);
        });
        // Only reachable with GET, so a POST kept across the redirect fails
        server_.Get("/login", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("login page", "text/html");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    ~TestServer() {
        server_.stop();
        thread_.join();
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

private:
    httplib::Server server_;
    int port_;
    std::thread thread_;
};

} // namespace

TEST_CASE("Real client reports status and body size", "[e2e]") {
    TestServer server;
    HttpClient client;
    HttpProber prober(client);

    auto with = prober.probe(server.url("/account"), "GET", {{"Cookie", "session=abc"}});
    REQUIRE(with.ok);
    REQUIRE(with.status == 200);
    REQUIRE(with.body_size == std::string("{\"account\":\"demo\"}").size());

    auto without = prober.probe(server.url("/account"), "GET", {});
    REQUIRE(without.ok);
    REQUIRE(without.status == 403);
    REQUIRE(without.body_size == 9);

    auto missing = prober.probe(server.url("/nowhere"), "GET", {});
    REQUIRE(missing.ok);
    REQUIRE(missing.status == 404);
}

TEST_CASE("POST is sent without a body", "[e2e]") {
    TestServer server;
    HttpClient client;
    HttpProber prober(client);

    auto post = prober.probe(server.url("/public"), "POST", {});
    REQUIRE(post.ok);
    REQUIRE(post.status == 200);
}

TEST_CASE("POST follows a 302 redirect as GET", "[e2e]") {
    TestServer server;
    HttpClient client;
    HttpProber prober(client);

    auto get = prober.probe(server.url("/redirect"), "GET", {});
    auto post = prober.probe(server.url("/redirect"), "POST", {});
    REQUIRE(get.ok);
    REQUIRE(post.ok);
    REQUIRE(get.status == 200);
    REQUIRE(post.status == 200);
    REQUIRE(post.body_size == get.body_size);
    REQUIRE(post.body_size == std::string("login page").size());
}

TEST_CASE("Full run finds only the unprotected endpoint", "[e2e]") {
    TestServer server;

    AuthCredentials creds;
    creds.cookie1 = "session=abc123";
    auto contexts = make_auth_contexts(AuthMode::COOKIE_VS_NONE, creds);

    HttpClient client;
    HttpProber http(client);
    RetryingProber prober(http);
    FanoutScheduler scheduler(prober);

    std::ostringstream out;
    std::ostringstream err;
    Console console(out, err, false);
    RunReporter reporter(console, nullptr);

    std::vector<std::string> endpoints = {
        server.url("/public"),
        server.url("/account"),
        server.url("/static/app.js"),
    };

    size_t delivered = scheduler.run(endpoints, contexts.first, contexts.second, reporter);
    reporter.finish();

    REQUIRE(delivered == 6);
    REQUIRE(reporter.summary().skipped == 2);
    REQUIRE(reporter.summary().completed == 4);

    // GET /public and POST /public match; /account GET differs and POST is 404/404
    REQUIRE(reporter.findings().size() == 2);
    for (const auto& f : reporter.findings()) {
        REQUIRE(f.url == server.url("/public"));
        REQUIRE(f.status_a == 200);
    }

    std::string s = out.str();
    REQUIRE(s.find("Endpoint: " + server.url("/public") + " [GET]") != std::string::npos);
    REQUIRE(s.find("Endpoint: " + server.url("/public") + " [POST]") != std::string::npos);
    REQUIRE(s.find(server.url("/account")) == std::string::npos);
    REQUIRE(s.find("Done.\n") != std::string::npos);
}
