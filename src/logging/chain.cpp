/**
 * @file chain.cpp
 * @brief Hash-chained JSONL audit log
 */

#include "chain.h"
#include <openssl/evp.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace logging {

using json = nlohmann::json;

json LogEntry::to_json() const {
    json j;
    j["event_type"] = event_type;
    j["run_id"] = run_id;
    j["timestamp"] = timestamp;
    j["prev_hash"] = prev_hash;
    j["entry_hash"] = entry_hash;
    j["payload"] = payload;
    return j;
}

LogEntry LogEntry::from_json(const json& j) {
    LogEntry entry;
    entry.event_type = j.value("event_type", "");
    entry.run_id = j.value("run_id", "");
    entry.timestamp = j.value("timestamp", "");
    entry.prev_hash = j.value("prev_hash", "");
    entry.entry_hash = j.value("entry_hash", "");
    entry.payload = j.value("payload", json::object());
    return entry;
}

AuditChain::AuditChain(const std::string& log_path, const std::string& run_id)
    : run_id_(run_id) {
    auto entries = load(log_path);
    if (!entries.empty()) {
        last_hash_ = entries.back().entry_hash;
    }
    stream_.open(log_path, std::ios::app);
}

std::string AuditChain::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string AuditChain::make_run_id() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << "run_" << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::string AuditChain::compute_hash(const LogEntry& entry) {
    // dump() sorts object keys, which makes the payload text canonical
    std::string data = entry.prev_hash + entry.timestamp + entry.event_type + entry.run_id +
                       entry.payload.dump(-1, ' ', false, json::error_handler_t::replace);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
    EVP_DigestUpdate(ctx, data.data(), data.size());
    EVP_DigestFinal_ex(ctx, digest, &digest_len);
    EVP_MD_CTX_free(ctx);

    std::ostringstream hex;
    hex << "sha256:" << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; i++) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

bool AuditChain::append(const std::string& event_type, const json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stream_.is_open()) {
        return false;
    }

    LogEntry entry;
    entry.event_type = event_type;
    entry.run_id = run_id_;
    entry.timestamp = timestamp();
    entry.prev_hash = last_hash_.empty() ? kGenesis : last_hash_;
    entry.payload = payload;
    entry.entry_hash = compute_hash(entry);

    // Endpoints and error texts may hold invalid UTF-8; replace it the same
    // way compute_hash does so the stored entry still verifies.
    stream_ << entry.to_json().dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    stream_.flush();
    if (!stream_) {
        return false;
    }

    last_hash_ = entry.entry_hash;
    return true;
}

bool AuditChain::record_finding(const Finding& finding) {
    return append("finding_recorded", finding.to_json());
}

bool AuditChain::record_inconclusive(const ComparisonOutcome& outcome) {
    json payload;
    payload["url"] = outcome.endpoint;
    payload["method"] = outcome.method;
    payload["failed_context"] = outcome.probe_a.ok ? outcome.label_b : outcome.label_a;
    payload["error"] = outcome.error();
    return append("comparison_inconclusive", payload);
}

std::string AuditChain::last_hash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_hash_;
}

std::vector<LogEntry> AuditChain::load(const std::string& log_path) {
    std::vector<LogEntry> entries;
    std::ifstream in(log_path);
    if (!in.is_open()) {
        return entries;
    }

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded()) {
            // An unparseable line cannot be hashed; keep a placeholder so
            // verify() reports the break at the right index.
            LogEntry broken;
            broken.event_type = "<unparseable>";
            entries.push_back(broken);
            continue;
        }
        entries.push_back(LogEntry::from_json(j));
    }
    return entries;
}

VerifyResult AuditChain::verify(const std::string& log_path) {
    VerifyResult result;
    auto entries = load(log_path);
    result.entries = entries.size();

    for (size_t i = 0; i < entries.size(); i++) {
        const auto& entry = entries[i];
        const std::string expected_prev = i == 0 ? std::string(kGenesis) : entries[i - 1].entry_hash;

        if (entry.prev_hash != expected_prev) {
            result.intact = false;
            result.failed_index = i;
            result.reason = i == 0 ? "first entry does not start the chain" : "chain break";
            return result;
        }
        if (compute_hash(entry) != entry.entry_hash) {
            result.intact = false;
            result.failed_index = i;
            result.reason = "hash mismatch (" + entry.event_type + ")";
            return result;
        }
    }
    return result;
}

} // namespace logging
