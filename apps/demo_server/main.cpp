#include "httplib.h"
#include <iostream>
#include <string>
#include <cstdlib>

using namespace httplib;

// Demo target for authcheck runs. Each path behaves like a different class
// of endpoint with respect to the credential the client sends:
//   /public        same 200 response for everyone (reported as a finding)
//   /account       200 with a credential, 403 without
//   /profile       200 for everyone, body depends on the credential
//   /app.js        static asset, skipped by authcheck

static bool has_credential(const Request& req) {
  return req.has_header("Cookie") || req.has_header("Authorization");
}

static std::string credential_of(const Request& req) {
  if (req.has_header("Authorization")) return req.get_header_value("Authorization");
  return req.get_header_value("Cookie");
}

static void handle_public(const Request&, Response& res) {
  res.status = 200;
  res.set_content("{\"status\":\"ok\",\"items\":[1,2,3]}", "application/json");
}

static void handle_account(const Request& req, Response& res) {
  if (!has_credential(req)) {
    res.status = 403;
    res.set_content("forbidden", "text/plain");
    return;
  }
  res.status = 200;
  res.set_content("{\"account\":\"demo\",\"plan\":\"pro\"}", "application/json");
}

static void handle_profile(const Request& req, Response& res) {
  res.status = 200;
  if (!has_credential(req)) {
    res.set_content("{\"user\":null}", "application/json");
    return;
  }
  res.set_content("{\"user\":\"" + credential_of(req) + "\"}", "application/json");
}

int main(int argc, char** argv) {
  int port = 8080;
  if (argc > 1) port = std::atoi(argv[1]);

  Server svr;

  svr.Get("/healthz", [](const Request&, Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  svr.Get("/public", handle_public);
  svr.Post("/public", handle_public);
  svr.Get("/account", handle_account);
  svr.Post("/account", handle_account);
  svr.Get("/profile", handle_profile);
  svr.Post("/profile", handle_profile);

  svr.Get("/app.js", [](const Request&, Response& res) {
    res.status = 200;
    res.set_content("console.log('demo');", "application/javascript");
  });

  std::cout << "authcheck demo server on http://127.0.0.1:" << port << "\n";
  if (!svr.listen("127.0.0.1", port)) {
    std::cerr << "Failed to bind 127.0.0.1:" << port << "\n";
    return 1;
  }
  return 0;
}
