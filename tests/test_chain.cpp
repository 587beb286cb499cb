/**
 * @file test_chain.cpp
 * @brief Unit tests for the hash-chained audit log
 *
 * Covers chaining across instances, tamper detection and the finding and
 * inconclusive records written during a run.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "logging/chain.h"
#include <filesystem>
#include <fstream>

using namespace logging;
namespace fs = std::filesystem;

static std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

static void write_lines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream out(path, std::ios::trunc);
    for (const auto& l : lines) {
        out << l << "\n";
    }
}

TEST_CASE("AuditChain appends chained entries", "[chain]") {
    std::string test_log = "test_audit.jsonl";
    fs::remove(test_log);

    SECTION("Basic append and verify") {
        {
            AuditChain chain(test_log, "run_1");
            REQUIRE(chain.is_open());
            REQUIRE(chain.append("run_start", {{"endpoints", 3}}));
            REQUIRE(chain.append("run_complete", {{"findings", 0}}));
            REQUIRE(chain.last_hash().rfind("sha256:", 0) == 0);
        }

        auto result = AuditChain::verify(test_log);
        REQUIRE(result.intact);
        REQUIRE(result.entries == 2);

        auto entries = AuditChain::load(test_log);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].event_type == "run_start");
        REQUIRE(entries[0].run_id == "run_1");
        REQUIRE(entries[0].prev_hash == AuditChain::kGenesis);
        REQUIRE(entries[1].prev_hash == entries[0].entry_hash);
    }

    SECTION("A second run continues the chain") {
        std::string first_hash;
        {
            AuditChain chain(test_log, "run_1");
            chain.append("run_start", nlohmann::json::object());
            first_hash = chain.last_hash();
        }
        {
            AuditChain chain(test_log, "run_2");
            chain.append("run_start", nlohmann::json::object());
        }

        REQUIRE(AuditChain::verify(test_log).intact);
        auto entries = AuditChain::load(test_log);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[1].prev_hash == first_hash);
        REQUIRE(entries[1].run_id == "run_2");
    }

    SECTION("Edited payload is detected") {
        {
            AuditChain chain(test_log, "run");
            chain.append("event", {{"value", 42}});
            chain.append("event", {{"value", 42}});
        }

        auto lines = read_lines(test_log);
        REQUIRE(lines.size() == 2);
        auto j = nlohmann::json::parse(lines[1]);
        j["payload"]["value"] = 999;
        lines[1] = j.dump();
        write_lines(test_log, lines);

        auto result = AuditChain::verify(test_log);
        REQUIRE_FALSE(result.intact);
        REQUIRE(result.failed_index == 1);
        REQUIRE(result.reason.find("hash mismatch") != std::string::npos);
    }

    SECTION("Removed entry is detected") {
        {
            AuditChain chain(test_log, "run");
            chain.append("a", nlohmann::json::object());
            chain.append("b", nlohmann::json::object());
            chain.append("c", nlohmann::json::object());
        }

        auto lines = read_lines(test_log);
        lines.erase(lines.begin() + 1);
        write_lines(test_log, lines);

        auto result = AuditChain::verify(test_log);
        REQUIRE_FALSE(result.intact);
        REQUIRE(result.failed_index == 1);
        REQUIRE(result.reason == "chain break");
    }

    SECTION("Garbage line is detected") {
        {
            AuditChain chain(test_log, "run");
            chain.append("a", nlohmann::json::object());
        }
        auto lines = read_lines(test_log);
        lines.push_back("{not json");
        write_lines(test_log, lines);

        auto result = AuditChain::verify(test_log);
        REQUIRE_FALSE(result.intact);
        REQUIRE(result.failed_index == 1);
    }

    fs::remove(test_log);
}

TEST_CASE("Invalid UTF-8 text is stored and still verifies", "[chain]") {
    std::string test_log = "test_audit_utf8.jsonl";
    fs::remove(test_log);

    {
        AuditChain chain(test_log, "run_u");
        nlohmann::json payload;
        payload["url"] = "https://x.test/caf\xe9";
        REQUIRE_NOTHROW(chain.append("comparison_inconclusive", payload));
        REQUIRE(chain.append("run_complete", nlohmann::json::object()));
    }

    auto result = AuditChain::verify(test_log);
    REQUIRE(result.intact);
    REQUIRE(result.entries == 2);
    fs::remove(test_log);
}

TEST_CASE("Missing log verifies as empty", "[chain]") {
    auto result = AuditChain::verify("does_not_exist.jsonl");
    REQUIRE(result.intact);
    REQUIRE(result.entries == 0);
}

TEST_CASE("Run records", "[chain]") {
    std::string test_log = "test_audit_records.jsonl";
    fs::remove(test_log);

    {
        AuditChain chain(test_log, "run_r");

        Finding f;
        f.url = "https://x.test/admin";
        f.method = "POST";
        f.label_a = "With Cookie";
        f.label_b = "Without Cookie";
        f.status_a = 200;
        f.status_b = 200;
        f.size_a = 12;
        f.size_b = 12;
        REQUIRE(chain.record_finding(f));

        ComparisonOutcome o;
        o.kind = OutcomeKind::INCONCLUSIVE;
        o.endpoint = "https://x.test/down";
        o.method = "GET";
        o.label_a = "With Cookie";
        o.label_b = "Without Cookie";
        o.probe_a = ProbeOutcome::completed(200, 5);
        o.probe_b = ProbeOutcome::inconclusive("connection refused");
        REQUIRE(chain.record_inconclusive(o));
    }

    auto entries = AuditChain::load(test_log);
    REQUIRE(entries.size() == 2);

    REQUIRE(entries[0].event_type == "finding_recorded");
    REQUIRE(entries[0].payload["url"] == "https://x.test/admin");
    REQUIRE(entries[0].payload["method"] == "POST");
    REQUIRE(entries[0].payload["context_b"]["label"] == "Without Cookie");
    REQUIRE(entries[0].payload["context_b"]["status"] == 200);

    REQUIRE(entries[1].event_type == "comparison_inconclusive");
    REQUIRE(entries[1].payload["failed_context"] == "Without Cookie");
    REQUIRE(entries[1].payload["error"] == "connection refused");

    REQUIRE(AuditChain::verify(test_log).intact);
    fs::remove(test_log);
}

TEST_CASE("LogEntry JSON serialization", "[chain]") {
    LogEntry entry;
    entry.event_type = "test";
    entry.run_id = "run123";
    entry.timestamp = "2025-01-01T00:00:00.000Z";
    entry.prev_hash = "sha256:prev";
    entry.entry_hash = "sha256:current";
    entry.payload = {{"key", "value"}};

    auto restored = LogEntry::from_json(entry.to_json());
    REQUIRE(restored.event_type == entry.event_type);
    REQUIRE(restored.run_id == entry.run_id);
    REQUIRE(restored.timestamp == entry.timestamp);
    REQUIRE(restored.prev_hash == entry.prev_hash);
    REQUIRE(restored.entry_hash == entry.entry_hash);
    REQUIRE(restored.payload == entry.payload);

    REQUIRE(AuditChain::compute_hash(entry) == AuditChain::compute_hash(restored));
}

TEST_CASE("Run identifier format", "[chain]") {
    std::string id = AuditChain::make_run_id();
    REQUIRE(id.rfind("run_", 0) == 0);
    REQUIRE(id.size() == std::string("run_20250101_000000").size());
}
