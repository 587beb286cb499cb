#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @file finding.h
 * @brief Data structure representing a potential authentication bypass
 *
 * A finding is a comparison whose two authentication contexts produced the
 * same status code (200) and the same body size for one endpoint and method.
 */

struct Finding {
    std::string url;
    std::string method;
    std::string label_a;
    std::string label_b;
    long status_a;
    long status_b;
    size_t size_a;
    size_t size_b;

    Finding()
        : status_a(0),
          status_b(0),
          size_a(0),
          size_b(0)
    {}

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["url"] = url;
        j["method"] = method;
        j["context_a"] = {{"label", label_a}, {"status", status_a}, {"size", size_a}};
        j["context_b"] = {{"label", label_b}, {"status", status_b}, {"size", size_b}};
        return j;
    }
};
